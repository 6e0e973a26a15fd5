// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/engine/operation_journal.h>
#include <sortie/storage/database.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sortie::storage {

struct ParticipantRow {
    OperationId operationId;
    AgentId agentId;
    engine::AgentState state{engine::AgentState::Active};
};

/**
 * @brief SQLite-backed OperationJournal.
 *
 * Writes are upserts keyed by id, so repeated saves of the same record are idempotent. All
 * access goes through one mutex; operations call in under their own locks and may run on
 * different threads.
 */
class SqliteJournal final : public engine::OperationJournal {
public:
    // Opens (creating if needed) and migrates the database. ":memory:" gives a private
    // in-memory journal.
    static Result<std::unique_ptr<SqliteJournal>> open(const std::string& path);

    Result<void> saveOperation(const engine::OperationRecord& record) override;
    Result<void> saveAgent(const engine::AgentInfo& agent) override;
    Result<void> saveParticipant(const OperationId& operationId, const AgentId& agentId,
                                 engine::AgentState state) override;
    Result<void> saveLink(const engine::Link& link) override;
    Result<void> appendFact(const OperationId& operationId, const engine::Fact& fact) override;
    Result<void> archiveOperation(const OperationId& operationId) override;

    // Read side, used at startup and by audit tooling.
    Result<std::vector<engine::OperationRecord>> loadOperations(bool includeArchived = false);
    // Scheduling tie-break keys are not journaled; loaded links carry only the sequence.
    Result<std::vector<engine::Link>> loadLinks(const OperationId& operationId);
    Result<std::vector<engine::Fact>> loadFacts(const OperationId& operationId);
    Result<std::vector<engine::AgentInfo>> loadAgents();
    Result<std::vector<ParticipantRow>> loadParticipants(const OperationId& operationId);

    Result<int> schemaVersion();

private:
    explicit SqliteJournal(Database db) : db_(std::move(db)) {}

    std::mutex mutex_;
    Database db_;
};

} // namespace sortie::storage
