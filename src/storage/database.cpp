// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/storage/database.h>

#include <spdlog/spdlog.h>

namespace sortie::storage {

namespace {

Error sqliteError(std::string_view what, int rc) {
    return Error{ErrorCode::DatabaseError, std::string(what) + ": " + sqlite3_errstr(rc)};
}

} // namespace

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    if (int rc = sqlite3_bind_null(stmt_, index); rc != SQLITE_OK)
        return sqliteError("bind null", rc);
    return {};
}

Result<void> Statement::bind(int index, int value) {
    if (int rc = sqlite3_bind_int(stmt_, index, value); rc != SQLITE_OK)
        return sqliteError("bind int", rc);
    return {};
}

Result<void> Statement::bind(int index, int64_t value) {
    if (int rc = sqlite3_bind_int64(stmt_, index, value); rc != SQLITE_OK)
        return sqliteError("bind int64", rc);
    return {};
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
        return sqliteError("bind text", rc);
    return {};
}

Result<void> Statement::execute() {
    auto more = step();
    if (!more)
        return more.error();
    if (more.value())
        return Error{ErrorCode::DatabaseError, "Statement returned rows where none were expected"};
    return {};
}

Result<bool> Statement::step() {
    // Lock waits are handled by the connection's busy timeout.
    switch (int rc = sqlite3_step(stmt_)) {
        case SQLITE_ROW:
            return true;
        case SQLITE_DONE:
            return false;
        default: {
            const char* sql = sqlite3_sql(stmt_);
            spdlog::debug("[Database] step failed ({}): {}", sqlite3_errstr(rc), sql ? sql : "");
            return sqliteError("step", rc);
        }
    }
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::getString(int column) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return {};
    return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)),
      inTransaction_(std::exchange(other.inTransaction_, false)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        inTransaction_ = std::exchange(other.inTransaction_, false);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    close();
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (mode == ConnectionMode::Memory)
        flags |= SQLITE_OPEN_MEMORY;

    if (int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr); rc != SQLITE_OK) {
        std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        return Error{ErrorCode::DatabaseError, "Cannot open " + path + ": " + reason};
    }
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Database not open"};
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     std::string("Cannot prepare statement: ") + sqlite3_errmsg(db_)};
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Database not open"};

    char* message = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
        std::string reason = message ? message : sqlite3_errmsg(db_);
        sqlite3_free(message);
        spdlog::error("[Database] exec failed ({}): {}", reason, sql);
        return Error{ErrorCode::DatabaseError, reason};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (inTransaction_)
        return Error{ErrorCode::InvalidState, "Transaction already open"};
    auto r = execute("BEGIN");
    inTransaction_ = static_cast<bool>(r);
    return r;
}

Result<void> Database::commit() {
    if (!inTransaction_)
        return Error{ErrorCode::InvalidState, "No open transaction"};
    auto r = execute("COMMIT");
    if (r)
        inTransaction_ = false;
    return r;
}

Result<void> Database::rollback() {
    if (!inTransaction_)
        return Error{ErrorCode::InvalidState, "No open transaction"};
    inTransaction_ = false;
    return execute("ROLLBACK");
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    if (!stmt)
        return stmt.error();
    Statement query = std::move(stmt).value();
    if (auto bound = query.bind(1, table); !bound)
        return bound.error();
    return query.step();
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Database not open"};
    if (int rc = sqlite3_busy_timeout(db_, static_cast<int>(timeout.count())); rc != SQLITE_OK)
        return sqliteError("busy timeout", rc);
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

std::string Database::version() {
    return sqlite3_libversion();
}

} // namespace sortie::storage
