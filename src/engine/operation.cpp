// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/engine/executor_capability.h>
#include <sortie/engine/operation.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace sortie::engine {

const char* operationStateName(OperationState state) noexcept {
    switch (state) {
        case OperationState::Running:
            return "RUNNING";
        case OperationState::Finished:
            return "FINISHED";
        case OperationState::Cancelled:
            return "CANCELLED";
        case OperationState::Errored:
            return "ERRORED";
    }
    return "UNKNOWN";
}

std::optional<OperationState> parseOperationState(std::string_view name) {
    for (auto s : {OperationState::Running, OperationState::Finished, OperationState::Cancelled,
                   OperationState::Errored}) {
        if (name == operationStateName(s))
            return s;
    }
    return std::nullopt;
}

Operation::Operation(OperationId id, std::string name,
                     std::shared_ptr<const AbilityCatalog> catalog, AdversaryProfile profile,
                     OperationOptions options, OperationJournal& journal, TimePoint created)
    : id_(std::move(id)), name_(std::move(name)), catalog_(std::move(catalog)),
      options_(std::move(options)), journal_(journal), created_(created),
      stateMachine_(*catalog_, links_, facts_, journal_),
      scheduler_(*catalog_, std::move(profile), id_, options_.linkTimeout),
      queue_(links_, stateMachine_) {
    std::lock_guard<std::mutex> lock(mutex_);
    publishLocked();
}

Result<void> Operation::start(const SeedFacts& seeds, const std::vector<AgentInfo>& agents,
                              TimePoint now) {
    for (const auto& [key, value] : seeds) {
        if (key.empty()) {
            return Error{ErrorCode::InvalidArgument, "Seed fact with empty key"};
        }
        if (containsPlaceholder(value)) {
            return Error{ErrorCode::InvalidArgument,
                         "Seed fact '" + key + "' must not contain placeholder syntax"};
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        return Error{ErrorCode::InvalidState, "Operation " + id_ + " already started"};
    }
    started_ = true;

    auto result = [&]() -> Result<void> {
        if (auto r = persistStateLocked(); !r)
            return r;
        for (const auto& [key, value] : seeds) {
            auto fact = facts_.put(key, value, Provenance::seed(), now);
            if (!fact)
                return fact.error();
            if (auto r = journal_.appendFact(id_, fact.value()); !r)
                return r;
        }
        for (const auto& agent : agents) {
            if (!participates(agent))
                continue;
            if (evaluateLiveness(agent, now, options_.deadAfterMissedBeacons) == AgentState::Dead)
                continue;
            if (auto r = admitLocked(agent); !r)
                return r;
        }
        return stepLocked(now);
    }();

    if (!result)
        failLocked(result.error());
    else
        spdlog::info("[Operation] {} '{}' started: profile={} seeds={} agents={} frontier={}",
                     id_, name_, scheduler_.profile().id, seeds.size(), participants_.size(),
                     scheduler_.frontierSize());
    publishLocked();
    return result;
}

std::vector<Instruction> Operation::beacon(const AgentInfo& agent, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!participates(agent) || isTerminal(state_))
        return {};

    auto result = [&]() -> Result<std::vector<Instruction>> {
        if (auto r = admitLocked(agent); !r)
            return r.error();
        if (state_ != OperationState::Running)
            return std::vector<Instruction>{};
        if (auto r = stepLocked(now); !r)
            return r.error();
        if (state_ != OperationState::Running)
            return std::vector<Instruction>{};
        return queue_.pickup(agent.id, now);
    }();

    std::vector<Instruction> out;
    if (result) {
        out = std::move(result).value();
        if (!out.empty())
            spdlog::debug("[Operation] {} dispatched {} link(s) to {}", id_, out.size(), agent.id);
    } else {
        failLocked(result.error());
    }
    publishLocked();
    return out;
}

ResultAck Operation::report(const AgentId& agentId, const LinkId& linkId, std::string output,
                            bool success, std::optional<int> exitCode, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == OperationState::Errored) {
        spdlog::warn("[Operation] {} rejected result for link {} from {}: operation errored", id_,
                     linkId, agentId);
        return ResultAck::rejected("operation errored: " + stateReason_);
    }

    auto ack = queue_.accept(agentId, linkId, std::move(output), success, exitCode, now);
    if (!ack) {
        failLocked(ack.error());
        publishLocked();
        return ResultAck::rejected("operation errored: " + ack.error().message);
    }

    const auto& value = ack.value();
    switch (value.disposition) {
        case ResultDisposition::Rejected:
            spdlog::warn("[Operation] {} rejected result for link {} from {}: {}", id_, linkId,
                         agentId, value.reason);
            break;
        case ResultDisposition::Duplicate:
            spdlog::debug("[Operation] {} duplicate result for link {} ignored", id_, linkId);
            break;
        case ResultDisposition::Accepted:
            scheduler_.markDirty();
            if (auto r = stepLocked(now); !r)
                failLocked(r.error());
            break;
    }
    publishLocked();
    return value;
}

void Operation::sweep(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != OperationState::Running)
        return;

    auto result = [&]() -> Result<void> {
        if (auto r = sweepLivenessLocked(now); !r)
            return r;
        if (auto r = sweepTimeoutsLocked(now); !r)
            return r;
        return stepLocked(now);
    }();
    if (!result)
        failLocked(result.error());
    publishLocked();
}

void Operation::step(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = stepLocked(now); !r)
        failLocked(r.error());
    publishLocked();
}

Result<void> Operation::cancel(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isTerminal(state_)) {
        return Error{ErrorCode::InvalidState, std::string("Operation ") + id_ + " is already " +
                                                  operationStateName(state_)};
    }

    // Cancellation always takes effect; the first journal error is reported afterwards.
    Result<void> firstError;
    for (Link* link : links_.nonTerminal()) {
        auto r = stateMachine_.discard(*link, "operation cancelled", now);
        if (!r && firstError)
            firstError = r;
    }
    scheduler_.clear();
    state_ = OperationState::Cancelled;
    stateReason_ = "cancelled by operator";
    finished_ = now;
    if (auto r = persistStateLocked(); !r && firstError)
        firstError = r;

    spdlog::info("[Operation] {} cancelled; {} link(s) discarded in total", id_,
                 links_.count(LinkStatus::Discarded));
    if (!firstError)
        spdlog::error("[Operation] {} cancel not fully persisted: {}", id_,
                      firstError.error().message);
    publishLocked();
    return firstError;
}

Result<void> Operation::resume(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != OperationState::Errored) {
        return Error{ErrorCode::InvalidState, std::string("Operation ") + id_ + " is " +
                                                  operationStateName(state_) + ", not ERRORED"};
    }

    auto previousReason = stateReason_;
    state_ = OperationState::Running;
    stateReason_.clear();
    quietRounds_ = 0;
    scheduler_.markDirty();

    auto result = [&]() -> Result<void> {
        if (auto r = persistStateLocked(); !r)
            return r;
        return stepLocked(now);
    }();
    if (!result) {
        failLocked(result.error());
    } else {
        spdlog::info("[Operation] {} resumed after error: {}", id_, previousReason);
    }
    publishLocked();
    return result;
}

Result<void> Operation::updateProfile(AdversaryProfile profile, TimePoint now) {
    if (auto valid = catalog_->validateProfile(profile); !valid)
        return valid;

    std::lock_guard<std::mutex> lock(mutex_);
    if (isTerminal(state_)) {
        return Error{ErrorCode::InvalidState, std::string("Operation ") + id_ + " is already " +
                                                  operationStateName(state_)};
    }

    auto removed = scheduler_.setProfile(std::move(profile), links_);
    std::set<AbilityId> removedSet(removed.begin(), removed.end());

    auto result = [&]() -> Result<void> {
        for (Link* link : links_.nonTerminal()) {
            if (!removedSet.count(link->abilityId))
                continue;
            if (auto r = stateMachine_.discard(*link, "ability removed from profile", now); !r)
                return r;
        }
        if (auto r = persistStateLocked(); !r)
            return r;
        return stepLocked(now);
    }();
    if (!result)
        failLocked(result.error());
    publishLocked();
    return result;
}

bool Operation::ownsLink(const LinkId& linkId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return links_.find(linkId) != nullptr;
}

std::optional<Link> Operation::findLink(const LinkId& linkId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Link* link = links_.find(linkId);
    if (!link)
        return std::nullopt;
    return *link;
}

std::vector<Link> Operation::links() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Link>(links_.all().begin(), links_.all().end());
}

std::vector<Fact> Operation::facts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return facts_.all();
}

std::shared_ptr<const OperationStatus> Operation::status() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return snapshot_;
}

OperationState Operation::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

OperationRecord Operation::record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recordLocked();
}

Result<void> Operation::stepLocked(TimePoint now) {
    if (state_ != OperationState::Running || !started_)
        return {};

    auto created = scheduler_.evaluate(facts_, links_, stateMachine_, now);
    if (!created)
        return created.error();

    if (!created.value().empty() || !quiescentLocked()) {
        quietRounds_ = 0;
        return {};
    }
    if (++quietRounds_ < kFixedPointRounds) {
        // Force a full re-evaluation next round even if no fact arrives.
        scheduler_.markDirty();
        return {};
    }

    state_ = OperationState::Finished;
    finished_ = now;
    stateReason_ = "all abilities exhausted";
    spdlog::info("[Operation] {} finished: {} link(s), {} fact(s)", id_, links_.size(),
                 facts_.size());
    return persistStateLocked();
}

Result<void> Operation::admitLocked(const AgentInfo& agent) {
    auto it = participants_.find(agent.id);
    if (it == participants_.end()) {
        it = participants_.emplace(agent.id, Participant{agent, AgentState::Active}).first;
        if (auto r = journal_.saveParticipant(id_, agent.id, AgentState::Active); !r)
            return r;
        scheduler_.addAgent(agent, links_);
        spdlog::info("[Operation] {} agent {} ({}) joined", id_, agent.id, agent.platform);
        return {};
    }

    auto& participant = it->second;
    auto previous = participant.state;
    participant.info = agent;
    if (previous == AgentState::Active)
        return {};

    participant.state = AgentState::Active;
    if (auto r = journal_.saveParticipant(id_, agent.id, AgentState::Active); !r)
        return r;
    if (previous == AgentState::Dead) {
        auto added = scheduler_.addAgent(agent, links_);
        spdlog::info("[Operation] {} agent {} revived; {} pair(s) back in the frontier", id_,
                     agent.id, added);
    }
    return {};
}

Result<void> Operation::killAgentLocked(Participant& participant, TimePoint now) {
    participant.state = AgentState::Dead;
    const auto& agentId = participant.info.id;
    if (auto r = journal_.saveParticipant(id_, agentId, AgentState::Dead); !r)
        return r;

    std::size_t discarded = 0;
    for (auto status : {LinkStatus::Queued, LinkStatus::Dispatched}) {
        for (Link* link : links_.byAgent(agentId, status)) {
            if (auto r = stateMachine_.discard(*link, "agent dead", now); !r)
                return r;
            ++discarded;
        }
    }
    scheduler_.removeAgent(agentId);
    spdlog::warn("[Operation] {} agent {} is DEAD ({} missed windows); {} link(s) discarded", id_,
                 agentId, missedBeaconWindows(participant.info, now), discarded);
    return {};
}

Result<void> Operation::sweepLivenessLocked(TimePoint now) {
    for (auto& [agentId, participant] : participants_) {
        if (participant.state == AgentState::Dead)
            continue;
        auto next = evaluateLiveness(participant.info, now, options_.deadAfterMissedBeacons);
        if (next == participant.state)
            continue;
        if (next == AgentState::Dead) {
            if (auto r = killAgentLocked(participant, now); !r)
                return r;
            continue;
        }
        spdlog::debug("[Operation] {} agent {} {} -> {}", id_, agentId,
                      agentStateName(participant.state), agentStateName(next));
        participant.state = next;
        if (auto r = journal_.saveParticipant(id_, agentId, next); !r)
            return r;
    }
    return {};
}

Result<void> Operation::sweepTimeoutsLocked(TimePoint now) {
    for (Link* link : links_.withStatus(LinkStatus::Dispatched)) {
        auto limit = link->timeout.count() > 0 ? link->timeout : options_.linkTimeout;
        if (!link->dispatched || now - *link->dispatched < limit)
            continue;
        spdlog::info("[Operation] {} link {} ({} on {}) timed out", id_, link->id,
                     link->abilityId, link->agentId);
        auto outcome = stateMachine_.expire(*link, now);
        if (!outcome)
            return outcome.error();
        scheduler_.markDirty();
    }
    return {};
}

bool Operation::quiescentLocked() const {
    if (scheduler_.frontierSize() > 0)
        return false;
    if (links_.count(LinkStatus::Created) > 0 || links_.count(LinkStatus::Queued) > 0 ||
        links_.count(LinkStatus::Dispatched) > 0)
        return false;
    // Without a live participant nothing was attempted; keep waiting for agents.
    return std::any_of(participants_.begin(), participants_.end(), [](const auto& entry) {
        return entry.second.state != AgentState::Dead;
    });
}

OperationRecord Operation::recordLocked() const {
    OperationRecord record;
    record.id = id_;
    record.name = name_;
    record.profileId = scheduler_.profile().id;
    record.group = options_.group;
    record.state = state_;
    record.stateReason = stateReason_;
    record.created = created_;
    record.finished = finished_;
    return record;
}

Result<void> Operation::persistStateLocked() {
    return journal_.saveOperation(recordLocked());
}

void Operation::failLocked(const Error& error) {
    state_ = OperationState::Errored;
    stateReason_ = error.message;
    spdlog::error("[Operation] {} entered ERRORED: {} ({})", id_, error.message, error.code);
    if (auto r = persistStateLocked(); !r) {
        spdlog::critical("[Operation] {} could not persist ERRORED state: {}", id_,
                         r.error().message);
    }
}

void Operation::publishLocked() {
    auto status = std::make_shared<OperationStatus>();
    status->id = id_;
    status->name = name_;
    status->profileId = scheduler_.profile().id;
    status->group = options_.group;
    status->state = state_;
    status->stateReason = stateReason_;
    status->created = created_;
    status->finished = finished_;
    status->linkCounts = links_.counts();
    status->frontierSize = scheduler_.frontierSize();
    status->factCount = facts_.size();
    status->factVersion = facts_.snapshotVersion();
    if (state_ == OperationState::Running || state_ == OperationState::Errored)
        status->blocked = scheduler_.blocked(facts_, links_);

    for (const auto& [agentId, participant] : participants_) {
        AgentProgress progress;
        progress.agentId = agentId;
        progress.state = participant.state;
        progress.lastSeen = participant.info.lastSeen;
        for (const auto& link : links_.all()) {
            if (link.agentId == agentId)
                ++progress.links[link.status];
        }
        status->agents.push_back(std::move(progress));
    }

    std::lock_guard<std::mutex> lock(snapshotMutex_);
    snapshot_ = std::move(status);
}

} // namespace sortie::engine
