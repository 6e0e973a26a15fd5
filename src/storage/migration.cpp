// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/storage/migration.h>

#include <spdlog/spdlog.h>

namespace sortie::storage {

MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT
        )
    )");
}

void MigrationManager::registerMigration(Migration migration) {
    auto version = migration.version;
    migrations_[version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM schema_migrations WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }
    return 0;
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();
    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();
    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion)
            continue;

        spdlog::debug("[MigrationManager] applying migration {} '{}'", version, migration.name);
        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            if (auto recorded =
                    recordMigration(version, migration.name, duration, false, result.error().message);
                !recorded) {
                spdlog::warn("[MigrationManager] could not record failed migration {}: {}",
                             version, recorded.error().message);
            }
            return result;
        }
        if (auto recorded = recordMigration(version, migration.name, duration, true); !recorded)
            return recorded;
        currentVersion = version;
    }

    spdlog::debug("[MigrationManager] schema at version {}", currentVersion);
    return {};
}

Result<std::vector<MigrationHistory>> MigrationManager::getHistory() {
    auto stmtResult = db_.prepare("SELECT version, name, applied_at, duration_ms, success, error "
                                  "FROM schema_migrations ORDER BY id");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<MigrationHistory> history;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        MigrationHistory entry;
        entry.version = stmt.getInt(0);
        entry.name = stmt.getString(1);
        entry.appliedAt =
            std::chrono::system_clock::time_point(std::chrono::milliseconds(stmt.getInt64(2)));
        entry.duration = std::chrono::milliseconds(stmt.getInt64(3));
        entry.success = stmt.getInt(4) != 0;
        entry.error = stmt.getString(5);
        history.push_back(std::move(entry));
    }
    return history;
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        if (migration.upFunc) {
            return migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            return db_.execute(migration.upSQL);
        }
        return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT INTO schema_migrations "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    int64_t appliedAt = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    int64_t durationMs = duration.count();
    auto bindResult = stmt.bindAll(version, name, appliedAt, durationMs, success ? 1 : 0, error);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

std::vector<Migration> JournalMigrations::getAllMigrations() {
    return {createInitialSchema(), createAuditIndexes()};
}

Migration JournalMigrations::createInitialSchema() {
    Migration m;
    m.version = 1;
    m.name = "Initial journal schema";
    m.upSQL = R"(
        CREATE TABLE IF NOT EXISTS operations (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            profile_id TEXT NOT NULL,
            agent_group TEXT NOT NULL DEFAULT '',
            state TEXT NOT NULL,
            state_reason TEXT NOT NULL DEFAULT '',
            created_at INTEGER NOT NULL,
            finished_at INTEGER,
            archived INTEGER NOT NULL DEFAULT 0
        );

        CREATE TABLE IF NOT EXISTS agents (
            id TEXT PRIMARY KEY,
            platform TEXT NOT NULL,
            hostname TEXT NOT NULL DEFAULT '',
            agent_group TEXT NOT NULL DEFAULT '',
            executors TEXT NOT NULL DEFAULT '',
            beacon_interval_s INTEGER NOT NULL,
            jitter_s INTEGER NOT NULL,
            first_seen INTEGER NOT NULL,
            last_seen INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS operation_agents (
            operation_id TEXT NOT NULL,
            agent_id TEXT NOT NULL,
            state TEXT NOT NULL,
            PRIMARY KEY (operation_id, agent_id)
        );

        CREATE TABLE IF NOT EXISTS links (
            id TEXT PRIMARY KEY,
            operation_id TEXT NOT NULL,
            ability_id TEXT NOT NULL,
            agent_id TEXT NOT NULL,
            executor TEXT NOT NULL,
            command TEXT NOT NULL,
            status TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            dispatched_at INTEGER,
            completed_at INTEGER,
            output TEXT NOT NULL DEFAULT '',
            exit_code INTEGER,
            attempt INTEGER NOT NULL DEFAULT 0,
            retry_of TEXT NOT NULL DEFAULT '',
            timeout_s INTEGER NOT NULL DEFAULT 0,
            sequence INTEGER NOT NULL,
            discard_reason TEXT NOT NULL DEFAULT ''
        );

        CREATE TABLE IF NOT EXISTS facts (
            operation_id TEXT NOT NULL,
            sequence INTEGER NOT NULL,
            fact_key TEXT NOT NULL,
            fact_value TEXT NOT NULL,
            source TEXT NOT NULL,
            observed_at INTEGER NOT NULL,
            PRIMARY KEY (operation_id, sequence)
        );
    )";
    return m;
}

Migration JournalMigrations::createAuditIndexes() {
    Migration m;
    m.version = 2;
    m.name = "Audit indexes";
    m.upSQL = R"(
        CREATE INDEX IF NOT EXISTS idx_links_operation ON links(operation_id, sequence);
        CREATE INDEX IF NOT EXISTS idx_links_agent ON links(agent_id);
        CREATE INDEX IF NOT EXISTS idx_facts_key ON facts(operation_id, fact_key);
        CREATE INDEX IF NOT EXISTS idx_operations_archived ON operations(archived);
    )";
    return m;
}

} // namespace sortie::storage
