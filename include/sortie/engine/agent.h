// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sortie::engine {

enum class AgentState { Active, Stale, Dead };

const char* agentStateName(AgentState state) noexcept;
std::optional<AgentState> parseAgentState(std::string_view name);

// Identity and reachability metadata. Identity persists across operations.
struct AgentInfo {
    AgentId id;
    std::string platform;
    std::string hostname;
    std::string group;
    // Empty means the agent accepts any executor kind.
    std::set<std::string> executors;
    std::chrono::seconds beaconInterval{60};
    std::chrono::seconds jitter{0};
    TimePoint firstSeen{};
    TimePoint lastSeen{};

    bool acceptsExecutor(const std::string& kind) const {
        return executors.empty() || executors.count(kind) > 0;
    }
};

// What an agent declares on check-in. Metadata is only applied at first registration, except
// for the beacon timing which the agent may renegotiate.
struct BeaconInfo {
    AgentId agentId;
    std::string platform;
    std::string hostname;
    std::string group;
    std::set<std::string> executors;
    std::optional<std::chrono::seconds> beaconInterval;
    std::optional<std::chrono::seconds> jitter;
};

// Whole expected beacon windows elapsed since the agent was last seen.
uint64_t missedBeaconWindows(const AgentInfo& agent, TimePoint now);

// ACTIVE below one missed window, STALE from one, DEAD from `deadAfter`.
AgentState evaluateLiveness(const AgentInfo& agent, TimePoint now, uint32_t deadAfter);

/**
 * @brief Server-wide agent identity registry.
 *
 * Owned by the OperationManager; there is no process-global instance. Thread-safe.
 */
class AgentRegistry {
public:
    AgentRegistry(std::chrono::seconds defaultInterval, std::chrono::seconds defaultJitter)
        : defaultInterval_(defaultInterval), defaultJitter_(defaultJitter) {}

    // Registers the agent on first contact (generating an id when none is given) and
    // refreshes lastSeen. Returns a copy of the stored record.
    Result<AgentInfo> checkIn(const BeaconInfo& beacon, TimePoint now);

    // Reinstates a persisted record without touching lastSeen.
    void restore(AgentInfo agent);

    std::optional<AgentInfo> find(const AgentId& id) const;
    std::vector<AgentInfo> all() const;
    std::size_t size() const;

private:
    std::chrono::seconds defaultInterval_;
    std::chrono::seconds defaultJitter_;
    mutable std::mutex mutex_;
    std::unordered_map<AgentId, AgentInfo> agents_;
};

} // namespace sortie::engine
