// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace sortie::storage {

enum class ConnectionMode {
    Create, ///< Read-write file, created when missing
    Memory  ///< Private in-memory database
};

/**
 * @brief Owns one prepared sqlite3_stmt.
 *
 * Columns are 0-based, bind indexes 1-based, as in the SQLite C API.
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    // Binds `args` to consecutive parameters starting at 1.
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 0;
        Result<void> bound;
        ((bound ? (void)(bound = bind(++index, std::forward<Args>(args))) : (void)0), ...);
        return bound;
    }

    // Runs a statement that returns no rows.
    Result<void> execute();

    // Advances to the next row; false once the result set is exhausted.
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief One SQLite connection.
 *
 * Not synchronized; SqliteJournal serializes access with its own mutex.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::Create);
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    // Runs one or more statements that return no rows.
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    // Runs `func` between BEGIN and COMMIT; rolls back when it returns an error.
    template <typename Func> Result<void> transaction(Func&& func) {
        if (auto begun = beginTransaction(); !begun)
            return begun;
        Result<void> result;
        try {
            result = func();
        } catch (...) {
            (void)rollback();
            throw;
        }
        if (result)
            return commit();
        if (auto rb = rollback(); !rb) {
            return Error{result.error().code,
                         result.error().message + " (rollback failed: " + rb.error().message + ")"};
        }
        return result;
    }

    // Rows touched by the last INSERT, UPDATE or DELETE.
    int changes() const;
    Result<bool> tableExists(const std::string& table);
    // How long a statement waits on another connection's lock before failing with SQLITE_BUSY.
    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

    static std::string version();

private:
    sqlite3* db_ = nullptr;
    bool inTransaction_ = false;
};

} // namespace sortie::storage
