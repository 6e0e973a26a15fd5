// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/engine/agent.h>
#include <sortie/engine/link.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sortie::engine {

enum class OperationState { Running, Finished, Cancelled, Errored };

const char* operationStateName(OperationState state) noexcept;
std::optional<OperationState> parseOperationState(std::string_view name);

constexpr bool isTerminal(OperationState s) noexcept {
    return s == OperationState::Finished || s == OperationState::Cancelled;
}

// An (ability, agent) pair left in the frontier, with why it cannot be scheduled yet.
struct BlockedPair {
    AbilityId abilityId;
    AgentId agentId;
    std::vector<std::string> missingFacts;
    // Set when an earlier tactic phase has not been satisfied.
    std::string waitingOnPhase;
};

struct AgentProgress {
    AgentId agentId;
    AgentState state{AgentState::Active};
    TimePoint lastSeen{};
    std::map<LinkStatus, std::size_t> links;
};

/**
 * @brief Read-only projection of one operation, published after every mutation.
 *
 * Readers take a shared_ptr to an immutable snapshot and never block the operation's writer.
 */
struct OperationStatus {
    OperationId id;
    std::string name;
    std::string profileId;
    std::string group;
    OperationState state{OperationState::Running};
    std::string stateReason;
    TimePoint created{};
    std::optional<TimePoint> finished;

    std::map<LinkStatus, std::size_t> linkCounts;
    std::vector<AgentProgress> agents;
    std::vector<BlockedPair> blocked;
    std::size_t frontierSize{0};
    std::size_t factCount{0};
    uint64_t factVersion{0};

    std::size_t count(LinkStatus status) const {
        auto it = linkCounts.find(status);
        return it == linkCounts.end() ? 0 : it->second;
    }
};

} // namespace sortie::engine
