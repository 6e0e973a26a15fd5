// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/core/uuid.h>
#include <sortie/storage/migration.h>
#include <sortie/storage/sqlite_journal.h>

#include <spdlog/spdlog.h>

#include <sstream>

namespace sortie::storage {

using core::fromEpochMillis;
using core::toEpochMillis;

namespace {

constexpr std::chrono::milliseconds kBusyTimeout{5000};

std::string joinExecutors(const std::set<std::string>& executors) {
    std::string out;
    for (const auto& kind : executors) {
        if (!out.empty())
            out += ',';
        out += kind;
    }
    return out;
}

std::set<std::string> splitExecutors(const std::string& joined) {
    std::set<std::string> out;
    std::stringstream ss(joined);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty())
            out.insert(item);
    }
    return out;
}

Result<void> bindOptionalTime(Statement& stmt, int index, const std::optional<TimePoint>& tp) {
    if (!tp)
        return stmt.bind(index, nullptr);
    return stmt.bind(index, toEpochMillis(*tp));
}

std::optional<TimePoint> optionalTime(const Statement& stmt, int column) {
    if (stmt.isNull(column))
        return std::nullopt;
    return fromEpochMillis(stmt.getInt64(column));
}

template <typename Row, typename Read>
Result<std::vector<Row>> collect(Statement& stmt, Read read) {
    std::vector<Row> rows;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        auto row = read(stmt);
        if (!row)
            return row.error();
        rows.push_back(std::move(row).value());
    }
    return rows;
}

} // namespace

Result<std::unique_ptr<SqliteJournal>> SqliteJournal::open(const std::string& path) {
    Database db;
    auto mode = path == ":memory:" ? ConnectionMode::Memory : ConnectionMode::Create;
    if (auto r = db.open(path, mode); !r)
        return r.error();
    // Another connection to the same file may hold the write lock briefly.
    if (auto r = db.setBusyTimeout(kBusyTimeout); !r)
        return r.error();
    if (mode != ConnectionMode::Memory) {
        if (auto r = db.enableWAL(); !r)
            spdlog::warn("[SqliteJournal] WAL unavailable for {}: {}", path, r.error().message);
    }

    MigrationManager migrations(db);
    if (auto r = migrations.initialize(); !r)
        return r.error();
    migrations.registerMigrations(JournalMigrations::getAllMigrations());
    if (auto r = migrations.migrate(); !r) {
        spdlog::error("[SqliteJournal] schema migration failed for {}: {}", path,
                      r.error().message);
        return r.error();
    }

    spdlog::info("[SqliteJournal] opened {} (sqlite {})", path, Database::version());
    return std::unique_ptr<SqliteJournal>(new SqliteJournal(std::move(db)));
}

Result<void> SqliteJournal::saveOperation(const engine::OperationRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(R"(
        INSERT INTO operations
            (id, name, profile_id, agent_group, state, state_reason, created_at, finished_at,
             archived)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            profile_id = excluded.profile_id,
            agent_group = excluded.agent_group,
            state = excluded.state,
            state_reason = excluded.state_reason,
            finished_at = excluded.finished_at,
            archived = excluded.archived
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bound = stmt.bindAll(record.id, record.name, record.profileId, record.group,
                              engine::operationStateName(record.state), record.stateReason,
                              toEpochMillis(record.created));
    if (!bound)
        return bound;
    if (auto r = bindOptionalTime(stmt, 8, record.finished); !r)
        return r;
    if (auto r = stmt.bind(9, record.archived ? 1 : 0); !r)
        return r;
    return stmt.execute();
}

Result<void> SqliteJournal::saveAgent(const engine::AgentInfo& agent) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(R"(
        INSERT INTO agents
            (id, platform, hostname, agent_group, executors, beacon_interval_s, jitter_s,
             first_seen, last_seen)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            platform = excluded.platform,
            hostname = excluded.hostname,
            agent_group = excluded.agent_group,
            executors = excluded.executors,
            beacon_interval_s = excluded.beacon_interval_s,
            jitter_s = excluded.jitter_s,
            last_seen = excluded.last_seen
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    int64_t interval = agent.beaconInterval.count();
    int64_t jitter = agent.jitter.count();
    auto bound = stmt.bindAll(agent.id, agent.platform, agent.hostname, agent.group,
                              joinExecutors(agent.executors), interval, jitter,
                              toEpochMillis(agent.firstSeen), toEpochMillis(agent.lastSeen));
    if (!bound)
        return bound;
    return stmt.execute();
}

Result<void> SqliteJournal::saveParticipant(const OperationId& operationId,
                                            const AgentId& agentId, engine::AgentState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(R"(
        INSERT INTO operation_agents (operation_id, agent_id, state) VALUES (?, ?, ?)
        ON CONFLICT(operation_id, agent_id) DO UPDATE SET state = excluded.state
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bound = stmt.bindAll(operationId, agentId, engine::agentStateName(state));
    if (!bound)
        return bound;
    return stmt.execute();
}

Result<void> SqliteJournal::saveLink(const engine::Link& link) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(R"(
        INSERT INTO links
            (id, operation_id, ability_id, agent_id, executor, command, status, created_at,
             dispatched_at, completed_at, output, exit_code, attempt, retry_of, timeout_s,
             sequence, discard_reason)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            status = excluded.status,
            dispatched_at = excluded.dispatched_at,
            completed_at = excluded.completed_at,
            output = excluded.output,
            exit_code = excluded.exit_code,
            discard_reason = excluded.discard_reason
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bound = stmt.bindAll(link.id, link.operationId, link.abilityId, link.agentId,
                              link.executor, link.command, engine::linkStatusName(link.status),
                              toEpochMillis(link.created));
    if (!bound)
        return bound;
    if (auto r = bindOptionalTime(stmt, 9, link.dispatched); !r)
        return r;
    if (auto r = bindOptionalTime(stmt, 10, link.completed); !r)
        return r;
    if (auto r = stmt.bind(11, link.output); !r)
        return r;
    auto exitBound = link.exitCode ? stmt.bind(12, *link.exitCode) : stmt.bind(12, nullptr);
    if (!exitBound)
        return exitBound;
    int64_t attempt = link.attempt;
    int64_t timeout = link.timeout.count();
    int64_t sequence = static_cast<int64_t>(link.sequence);
    if (auto r = stmt.bind(13, attempt); !r)
        return r;
    if (auto r = stmt.bind(14, link.retryOf); !r)
        return r;
    if (auto r = stmt.bind(15, timeout); !r)
        return r;
    if (auto r = stmt.bind(16, sequence); !r)
        return r;
    if (auto r = stmt.bind(17, link.discardReason); !r)
        return r;
    return stmt.execute();
}

Result<void> SqliteJournal::appendFact(const OperationId& operationId, const engine::Fact& fact) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(R"(
        INSERT INTO facts (operation_id, sequence, fact_key, fact_value, source, observed_at)
        VALUES (?, ?, ?, ?, ?, ?)
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bound = stmt.bindAll(operationId, static_cast<int64_t>(fact.sequence), fact.key,
                              fact.value, fact.provenance.toString(),
                              toEpochMillis(fact.observedAt));
    if (!bound)
        return bound;
    return stmt.execute();
}

Result<void> SqliteJournal::archiveOperation(const OperationId& operationId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("UPDATE operations SET archived = 1 WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, operationId); !r)
        return r;
    if (auto r = stmt.execute(); !r)
        return r;
    if (db_.changes() == 0)
        return Error{ErrorCode::NotFound, "No journaled operation '" + operationId + "'"};
    return {};
}

Result<std::vector<engine::OperationRecord>> SqliteJournal::loadOperations(bool includeArchived) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "SELECT id, name, profile_id, agent_group, state, state_reason, created_at, "
                      "finished_at, archived FROM operations";
    if (!includeArchived)
        sql += " WHERE archived = 0";
    sql += " ORDER BY created_at, id";

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();

    return collect<engine::OperationRecord>(
        stmt, [](const Statement& row) -> Result<engine::OperationRecord> {
            engine::OperationRecord record;
            record.id = row.getString(0);
            record.name = row.getString(1);
            record.profileId = row.getString(2);
            record.group = row.getString(3);
            auto state = engine::parseOperationState(row.getString(4));
            if (!state)
                return Error{ErrorCode::InvalidData, "Operation " + record.id +
                                                         " has unknown state '" +
                                                         row.getString(4) + "'"};
            record.state = *state;
            record.stateReason = row.getString(5);
            record.created = fromEpochMillis(row.getInt64(6));
            record.finished = optionalTime(row, 7);
            record.archived = row.getInt(8) != 0;
            return record;
        });
}

Result<std::vector<engine::Link>> SqliteJournal::loadLinks(const OperationId& operationId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(R"(
        SELECT id, operation_id, ability_id, agent_id, executor, command, status, created_at,
               dispatched_at, completed_at, output, exit_code, attempt, retry_of, timeout_s,
               sequence, discard_reason
        FROM links WHERE operation_id = ? ORDER BY sequence
    )");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, operationId); !r)
        return r.error();

    return collect<engine::Link>(stmt, [](const Statement& row) -> Result<engine::Link> {
        engine::Link link;
        link.id = row.getString(0);
        link.operationId = row.getString(1);
        link.abilityId = row.getString(2);
        link.agentId = row.getString(3);
        link.executor = row.getString(4);
        link.command = row.getString(5);
        auto status = engine::parseLinkStatus(row.getString(6));
        if (!status)
            return Error{ErrorCode::InvalidData,
                         "Link " + link.id + " has unknown status '" + row.getString(6) + "'"};
        link.status = *status;
        link.created = fromEpochMillis(row.getInt64(7));
        link.dispatched = optionalTime(row, 8);
        link.completed = optionalTime(row, 9);
        link.output = row.getString(10);
        if (!row.isNull(11))
            link.exitCode = row.getInt(11);
        link.attempt = static_cast<uint32_t>(row.getInt64(12));
        link.retryOf = row.getString(13);
        link.timeout = std::chrono::seconds{row.getInt64(14)};
        link.sequence = static_cast<uint64_t>(row.getInt64(15));
        link.discardReason = row.getString(16);
        return link;
    });
}

Result<std::vector<engine::Fact>> SqliteJournal::loadFacts(const OperationId& operationId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("SELECT sequence, fact_key, fact_value, source, observed_at "
                                  "FROM facts WHERE operation_id = ? ORDER BY sequence");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, operationId); !r)
        return r.error();

    return collect<engine::Fact>(stmt, [](const Statement& row) -> Result<engine::Fact> {
        engine::Fact fact;
        fact.sequence = static_cast<uint64_t>(row.getInt64(0));
        fact.key = row.getString(1);
        fact.value = row.getString(2);
        auto source = row.getString(3);
        fact.provenance = source == "seed" ? engine::Provenance::seed()
                                           : engine::Provenance::link(std::move(source));
        fact.observedAt = fromEpochMillis(row.getInt64(4));
        return fact;
    });
}

Result<std::vector<engine::AgentInfo>> SqliteJournal::loadAgents() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(R"(
        SELECT id, platform, hostname, agent_group, executors, beacon_interval_s, jitter_s,
               first_seen, last_seen
        FROM agents ORDER BY first_seen, id
    )");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();

    return collect<engine::AgentInfo>(stmt, [](const Statement& row) -> Result<engine::AgentInfo> {
        engine::AgentInfo agent;
        agent.id = row.getString(0);
        agent.platform = row.getString(1);
        agent.hostname = row.getString(2);
        agent.group = row.getString(3);
        agent.executors = splitExecutors(row.getString(4));
        agent.beaconInterval = std::chrono::seconds{row.getInt64(5)};
        agent.jitter = std::chrono::seconds{row.getInt64(6)};
        agent.firstSeen = fromEpochMillis(row.getInt64(7));
        agent.lastSeen = fromEpochMillis(row.getInt64(8));
        return agent;
    });
}

Result<std::vector<ParticipantRow>>
SqliteJournal::loadParticipants(const OperationId& operationId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("SELECT operation_id, agent_id, state FROM operation_agents "
                                  "WHERE operation_id = ? ORDER BY agent_id");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, operationId); !r)
        return r.error();

    return collect<ParticipantRow>(stmt, [](const Statement& row) -> Result<ParticipantRow> {
        ParticipantRow participant;
        participant.operationId = row.getString(0);
        participant.agentId = row.getString(1);
        auto state = engine::parseAgentState(row.getString(2));
        if (!state)
            return Error{ErrorCode::InvalidData, "Participant " + participant.agentId +
                                                     " has unknown state '" + row.getString(2) +
                                                     "'"};
        participant.state = *state;
        return participant;
    });
}

Result<int> SqliteJournal::schemaVersion() {
    std::lock_guard<std::mutex> lock(mutex_);
    MigrationManager migrations(db_);
    return migrations.getCurrentVersion();
}

} // namespace sortie::storage
