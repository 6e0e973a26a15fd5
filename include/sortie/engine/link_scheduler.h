// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/engine/ability_catalog.h>
#include <sortie/engine/agent.h>
#include <sortie/engine/fact_store.h>
#include <sortie/engine/link.h>
#include <sortie/engine/link_state_machine.h>
#include <sortie/engine/operation_status.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sortie::engine {

/**
 * @brief Turns the frontier of unattempted (ability, agent) pairs into QUEUED links.
 *
 * A pair leaves the frontier when its link is created. Eligibility is a pure function of the
 * ability's required facts, the fact snapshot and the tactic-phase gate, so the scheduler only
 * re-evaluates when the fact store version moved or something structural changed (agent
 * joined or died, a link reached an outcome, the profile was edited); see markDirty().
 *
 * Phase gate: a pair in phase p is eligible only when every non-optional phase q < p is
 * satisfied, i.e. every ability of q that at least one participating agent can run has at
 * least one SUCCESS link.
 *
 * Not internally synchronized; used under the owning operation's lock.
 */
class LinkScheduler {
public:
    LinkScheduler(const AbilityCatalog& catalog, AdversaryProfile profile, OperationId operationId,
                  std::chrono::seconds defaultTimeout);

    // Adds frontier pairs for an agent. Pairs the agent can never run (platform or executor
    // mismatch) are skipped for good; pairs that already have an active link or an outcome
    // are left out. Returns the number of pairs added.
    std::size_t addAgent(const AgentInfo& agent, const LinkTable& links);

    // Drops the agent's pairs; it no longer counts towards the phase gate.
    void removeAgent(const AgentId& agentId);

    // Swaps in an edited profile. Pairs of removed abilities leave the frontier and the removed
    // ids are returned; added abilities get pairs for every current agent.
    std::vector<AbilityId> setProfile(AdversaryProfile profile, const LinkTable& links);

    // Creates links for every newly eligible pair. Returns the ids of the created links.
    Result<std::vector<LinkId>> evaluate(const FactStore& facts, const LinkTable& links,
                                         LinkStateMachine& stateMachine, TimePoint now);

    std::vector<BlockedPair> blocked(const FactStore& facts, const LinkTable& links) const;

    void markDirty() noexcept { dirty_ = true; }
    void clear();

    const AdversaryProfile& profile() const noexcept { return profile_; }
    std::size_t frontierSize() const noexcept { return frontier_.size(); }
    bool inFrontier(const AbilityId& abilityId, const AgentId& agentId) const {
        return frontier_.count({abilityId, agentId}) > 0;
    }
    std::size_t skippedCount() const noexcept { return skipped_.size(); }
    bool hasAgent(const AgentId& agentId) const { return agents_.count(agentId) > 0; }

private:
    using Pair = std::pair<AbilityId, AgentId>;

    struct Position {
        std::size_t phase{0};
        std::size_t order{0};
    };

    void indexProfile();
    bool canRun(const Ability& ability, const AgentInfo& agent) const;
    bool addPair(const Ability& ability, const AgentInfo& agent, const LinkTable& links);
    // Name of the first unsatisfied non-optional phase before `phase`, if any.
    std::optional<std::string> unmetPhase(std::size_t phase, const LinkTable& links) const;
    std::vector<Pair> orderedFrontier() const;

    const AbilityCatalog& catalog_;
    AdversaryProfile profile_;
    OperationId operationId_;
    std::chrono::seconds defaultTimeout_;

    std::unordered_map<AbilityId, Position> positions_;
    std::map<AgentId, AgentInfo> agents_;
    std::set<Pair> frontier_;
    std::set<Pair> skipped_;

    uint64_t lastVersion_{0};
    bool dirty_{true};
};

} // namespace sortie::engine
