// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/storage/database.h>

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace sortie::storage {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version{0};    ///< Migration version number
    std::string name;  ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for migrations SQL alone cannot express)
     */
    std::function<Result<void>(Database&)> upFunc;
};

struct MigrationHistory {
    int version{0};
    std::string name;
    std::chrono::system_clock::time_point appliedAt;
    std::chrono::milliseconds duration{0};
    bool success{false};
    std::string error;
};

/**
 * @brief Applies versioned schema migrations, recording each in `schema_migrations`.
 *
 * Forward-only: the journal never rolls a schema back.
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Create the schema_migrations table if needed
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    Result<int> getCurrentVersion();
    int getLatestVersion() const;
    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations, each in its own transaction
     */
    Result<void> migrate();

    Result<std::vector<MigrationHistory>> getHistory();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);
    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");
};

/**
 * @brief Schema of the operation journal
 */
class JournalMigrations {
public:
    static std::vector<Migration> getAllMigrations();

private:
    // Version 1: operations, agents, operation_agents, links, facts
    static Migration createInitialSchema();

    // Version 2: lookup indexes for audit queries
    static Migration createAuditIndexes();
};

} // namespace sortie::storage
