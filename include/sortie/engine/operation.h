// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/engine/ability_catalog.h>
#include <sortie/engine/agent.h>
#include <sortie/engine/dispatch_queue.h>
#include <sortie/engine/fact_store.h>
#include <sortie/engine/link.h>
#include <sortie/engine/link_scheduler.h>
#include <sortie/engine/link_state_machine.h>
#include <sortie/engine/operation_journal.h>
#include <sortie/engine/operation_status.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sortie::engine {

using SeedFacts = std::vector<std::pair<std::string, std::string>>;

struct OperationOptions {
    // Empty: every agent participates.
    std::string group;
    std::chrono::seconds linkTimeout{300};
    uint32_t deadAfterMissedBeacons{3};
};

/**
 * @brief Aggregate root of one running campaign.
 *
 * Owns the fact store, link table, frontier and participating agents. Every mutation runs
 * under one mutex (single writer per operation); status() serves the last published snapshot
 * without taking that mutex. Operations share no mutable state with each other.
 *
 * Per-link and per-agent problems are absorbed and only show up in status. A journal or fact
 * store failure is fatal: the operation enters ERRORED and stops scheduling and dispatching
 * until resume() is called.
 */
class Operation {
public:
    // Consecutive quiet re-evaluations required before the operation may finish.
    static constexpr uint32_t kFixedPointRounds = 2;

    Operation(OperationId id, std::string name, std::shared_ptr<const AbilityCatalog> catalog,
              AdversaryProfile profile, OperationOptions options, OperationJournal& journal,
              TimePoint created);

    Operation(const Operation&) = delete;
    Operation& operator=(const Operation&) = delete;

    // Persists the record, seeds facts, admits the given agents and computes the first links.
    Result<void> start(const SeedFacts& seeds, const std::vector<AgentInfo>& agents,
                       TimePoint now);

    bool participates(const AgentInfo& agent) const {
        return options_.group.empty() || options_.group == agent.group;
    }

    // Marks the agent ACTIVE (joining or reviving it as needed) and returns its QUEUED links.
    // Never fails; an empty result means no current work.
    std::vector<Instruction> beacon(const AgentInfo& agent, TimePoint now);

    ResultAck report(const AgentId& agentId, const LinkId& linkId, std::string output,
                     bool success, std::optional<int> exitCode, TimePoint now);

    // Liveness first, then link timeouts, then re-evaluation.
    void sweep(TimePoint now);

    // Re-evaluates eligibility and detects termination.
    void step(TimePoint now);

    Result<void> cancel(TimePoint now);
    Result<void> resume(TimePoint now);
    Result<void> updateProfile(AdversaryProfile profile, TimePoint now);

    bool ownsLink(const LinkId& linkId) const;
    std::optional<Link> findLink(const LinkId& linkId) const;
    std::vector<Link> links() const;
    std::vector<Fact> facts() const;

    std::shared_ptr<const OperationStatus> status() const;
    OperationState state() const;
    OperationRecord record() const;

    const OperationId& id() const noexcept { return id_; }
    const std::string& name() const noexcept { return name_; }

private:
    struct Participant {
        AgentInfo info;
        AgentState state{AgentState::Active};
    };

    Result<void> stepLocked(TimePoint now);
    Result<void> admitLocked(const AgentInfo& agent);
    Result<void> killAgentLocked(Participant& participant, TimePoint now);
    Result<void> sweepLivenessLocked(TimePoint now);
    Result<void> sweepTimeoutsLocked(TimePoint now);
    bool quiescentLocked() const;
    OperationRecord recordLocked() const;
    Result<void> persistStateLocked();
    void failLocked(const Error& error);
    void publishLocked();

    const OperationId id_;
    const std::string name_;
    std::shared_ptr<const AbilityCatalog> catalog_;
    const OperationOptions options_;
    OperationJournal& journal_;
    const TimePoint created_;

    mutable std::mutex mutex_;
    FactStore facts_;
    LinkTable links_;
    LinkStateMachine stateMachine_;
    LinkScheduler scheduler_;
    DispatchQueue queue_;
    std::map<AgentId, Participant> participants_;

    OperationState state_{OperationState::Running};
    std::string stateReason_;
    std::optional<TimePoint> finished_;
    uint32_t quietRounds_{0};
    bool started_{false};

    mutable std::mutex snapshotMutex_;
    std::shared_ptr<const OperationStatus> snapshot_;
};

} // namespace sortie::engine
