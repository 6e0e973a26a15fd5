// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/engine/agent.h>
#include <sortie/engine/fact_store.h>
#include <sortie/engine/link.h>
#include <sortie/engine/operation_status.h>

#include <optional>
#include <string>

namespace sortie::engine {

struct OperationRecord {
    OperationId id;
    std::string name;
    std::string profileId;
    std::string group;
    OperationState state{OperationState::Running};
    std::string stateReason;
    TimePoint created{};
    std::optional<TimePoint> finished;
    bool archived{false};
};

/**
 * @brief Durable write-through surface for operation state.
 *
 * Every call is made under the owning operation's lock. A failed write is fatal to that
 * operation (it moves to ERRORED), so implementations must not report success for a write
 * that did not land.
 */
class OperationJournal {
public:
    virtual ~OperationJournal() = default;

    virtual Result<void> saveOperation(const OperationRecord& record) = 0;
    virtual Result<void> saveAgent(const AgentInfo& agent) = 0;
    virtual Result<void> saveParticipant(const OperationId& operationId, const AgentId& agentId,
                                         AgentState state) = 0;
    virtual Result<void> saveLink(const Link& link) = 0;
    virtual Result<void> appendFact(const OperationId& operationId, const Fact& fact) = 0;
    virtual Result<void> archiveOperation(const OperationId& operationId) = 0;
};

// Used when no database is configured.
class NullJournal final : public OperationJournal {
public:
    Result<void> saveOperation(const OperationRecord&) override { return {}; }
    Result<void> saveAgent(const AgentInfo&) override { return {}; }
    Result<void> saveParticipant(const OperationId&, const AgentId&, AgentState) override {
        return {};
    }
    Result<void> saveLink(const Link&) override { return {}; }
    Result<void> appendFact(const OperationId&, const Fact&) override { return {}; }
    Result<void> archiveOperation(const OperationId&) override { return {}; }
};

} // namespace sortie::engine
