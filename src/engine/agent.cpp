// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/core/uuid.h>
#include <sortie/engine/agent.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sortie::engine {

const char* agentStateName(AgentState state) noexcept {
    switch (state) {
        case AgentState::Active:
            return "ACTIVE";
        case AgentState::Stale:
            return "STALE";
        case AgentState::Dead:
            return "DEAD";
    }
    return "UNKNOWN";
}

std::optional<AgentState> parseAgentState(std::string_view name) {
    for (auto s : {AgentState::Active, AgentState::Stale, AgentState::Dead}) {
        if (name == agentStateName(s))
            return s;
    }
    return std::nullopt;
}

uint64_t missedBeaconWindows(const AgentInfo& agent, TimePoint now) {
    if (now <= agent.lastSeen)
        return 0;
    auto window = std::chrono::duration_cast<std::chrono::milliseconds>(agent.beaconInterval +
                                                                        agent.jitter);
    // A zero window would make every agent DEAD immediately.
    if (window.count() <= 0)
        window = std::chrono::milliseconds{1000};
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - agent.lastSeen);
    return static_cast<uint64_t>(elapsed.count() / window.count());
}

AgentState evaluateLiveness(const AgentInfo& agent, TimePoint now, uint32_t deadAfter) {
    auto missed = missedBeaconWindows(agent, now);
    if (missed >= std::max<uint32_t>(deadAfter, 1))
        return AgentState::Dead;
    if (missed >= 1)
        return AgentState::Stale;
    return AgentState::Active;
}

Result<AgentInfo> AgentRegistry::checkIn(const BeaconInfo& beacon, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);

    AgentId id = beacon.agentId.empty() ? core::generateUUID() : beacon.agentId;
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        if (beacon.platform.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "First beacon of agent '" + id + "' must declare a platform"};
        }
        AgentInfo agent;
        agent.id = id;
        agent.platform = beacon.platform;
        agent.hostname = beacon.hostname;
        agent.group = beacon.group;
        agent.executors = beacon.executors;
        agent.beaconInterval = beacon.beaconInterval.value_or(defaultInterval_);
        agent.jitter = beacon.jitter.value_or(defaultJitter_);
        agent.firstSeen = now;
        agent.lastSeen = now;
        it = agents_.emplace(id, std::move(agent)).first;
        spdlog::info("[AgentRegistry] registered agent {} platform={} host={} group='{}'", id,
                     it->second.platform, it->second.hostname, it->second.group);
        return it->second;
    }

    auto& agent = it->second;
    if (now > agent.lastSeen)
        agent.lastSeen = now;
    if (beacon.beaconInterval)
        agent.beaconInterval = *beacon.beaconInterval;
    if (beacon.jitter)
        agent.jitter = *beacon.jitter;
    return agent;
}

void AgentRegistry::restore(AgentInfo agent) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = agent.id;
    agents_[id] = std::move(agent);
}

std::optional<AgentInfo> AgentRegistry::find(const AgentId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end())
        return std::nullopt;
    return it->second;
}

std::vector<AgentInfo> AgentRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentInfo> out;
    out.reserve(agents_.size());
    for (const auto& [id, agent] : agents_)
        out.push_back(agent);
    std::sort(out.begin(), out.end(),
              [](const AgentInfo& a, const AgentInfo& b) { return a.firstSeen < b.firstSeen; });
    return out;
}

std::size_t AgentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.size();
}

} // namespace sortie::engine
