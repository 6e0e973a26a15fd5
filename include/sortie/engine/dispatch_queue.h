// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/engine/link.h>
#include <sortie/engine/link_state_machine.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sortie::engine {

// One unit of work handed to an agent on beacon.
struct Instruction {
    LinkId linkId;
    OperationId operationId;
    AbilityId abilityId;
    std::string command;
    std::string executor;
    std::chrono::seconds timeout{0};
};

enum class ResultDisposition {
    Accepted,
    // Repeat of a result for a link that already reached an outcome; no state change.
    Duplicate,
    Rejected
};

const char* resultDispositionName(ResultDisposition disposition) noexcept;

struct ResultAck {
    ResultDisposition disposition{ResultDisposition::Accepted};
    std::string reason;
    // Filled for Accepted results.
    std::optional<CompletionOutcome> outcome;

    static ResultAck accepted(CompletionOutcome outcome) {
        return ResultAck{ResultDisposition::Accepted, {}, std::move(outcome)};
    }
    static ResultAck duplicate() { return ResultAck{ResultDisposition::Duplicate, {}, {}}; }
    static ResultAck rejected(std::string reason) {
        return ResultAck{ResultDisposition::Rejected, std::move(reason), {}};
    }
};

/**
 * @brief Pull-protocol endpoint of one operation.
 *
 * pickup() hands an agent all of its QUEUED links in tie-break order (tactic phase, catalog
 * order, creation time) and marks them DISPATCHED. accept() validates a reported result and
 * forwards it to the state machine. Protocol violations never mutate state.
 *
 * Not internally synchronized; used under the owning operation's lock.
 */
class DispatchQueue {
public:
    DispatchQueue(LinkTable& links, LinkStateMachine& stateMachine)
        : links_(links), stateMachine_(stateMachine) {}

    Result<std::vector<Instruction>> pickup(const AgentId& agentId, TimePoint now);

    Result<ResultAck> accept(const AgentId& agentId, const LinkId& linkId, std::string output,
                             bool success, std::optional<int> exitCode, TimePoint now);

private:
    LinkTable& links_;
    LinkStateMachine& stateMachine_;
};

} // namespace sortie::engine
