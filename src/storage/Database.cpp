#include "storage/Database.hpp"
#include "utils/Logger.hpp"

namespace ZenFeed {

namespace {

ErrorCode storageCode(int rc) {
    switch (rc & 0xFF) {
        case SQLITE_CONSTRAINT:
            return ErrorCode::ConstraintViolation;
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_ABORT:
            return ErrorCode::TransactionFailure;
        default:
            return ErrorCode::IoFailure;
    }
}

}

void throwSqliteError(sqlite3* db, int rc, const std::string& context) {
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    throw StorageError(storageCode(rc), context + ": " + detail);
}

// Statement

Statement::Statement(sqlite3* db, const std::string& sql)
    : db_(db), stmt_(nullptr), sql_(sql) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) throwSqliteError(db_, rc, "prepare");
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_), sql_(std::move(other.sql_)) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        db_ = other.db_;
        stmt_ = other.stmt_;
        sql_ = std::move(other.sql_);
        other.stmt_ = nullptr;
    }
    return *this;
}

Statement& Statement::bind(int index, std::int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK) throwSqliteError(db_, rc, "bind");
    return *this;
}

Statement& Statement::bind(int index, int value) {
    return bind(index, static_cast<std::int64_t>(value));
}

Statement& Statement::bind(int index, bool value) {
    return bind(index, static_cast<std::int64_t>(value ? 1 : 0));
}

Statement& Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) throwSqliteError(db_, rc, "bind");
    return *this;
}

Statement& Statement::bind(int index, const char* value) {
    return value ? bind(index, std::string(value)) : bindNull(index);
}

Statement& Statement::bindNull(int index) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) throwSqliteError(db_, rc, "bind");
    return *this;
}

Statement& Statement::bind(int index, const std::optional<std::int64_t>& value) {
    return value ? bind(index, *value) : bindNull(index);
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    return value ? bind(index, *value) : bindNull(index);
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throwSqliteError(db_, rc, "step");
}

void Statement::run() {
    while (step()) {
    }
}

std::int64_t Statement::columnInt64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

bool Statement::columnBool(int col) const {
    return sqlite3_column_int64(stmt_, col) != 0;
}

std::string Statement::columnText(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

bool Statement::columnIsNull(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::optional<std::int64_t> Statement::columnOptionalInt64(int col) const {
    if (columnIsNull(col)) return std::nullopt;
    return columnInt64(col);
}

std::optional<std::string> Statement::columnOptionalText(int col) const {
    if (columnIsNull(col)) return std::nullopt;
    return columnText(col);
}

// Database

Database::Database(const std::string& path, int busyTimeoutMs)
    : db_(nullptr), path_(path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(ErrorCode::IoFailure, "open " + path + ": " + detail);
    }
    sqlite3_busy_timeout(db_, busyTimeoutMs);
    try {
        exec("PRAGMA foreign_keys = ON");
        exec("PRAGMA journal_mode = WAL");
        exec("PRAGMA synchronous = NORMAL");
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

void Database::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string detail = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw StorageError(storageCode(rc), "exec: " + detail);
    }
}

Statement Database::prepare(const std::string& sql) {
    return Statement(db_, sql);
}

std::int64_t Database::lastInsertId() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

bool Database::inTransaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

// Transaction

Transaction::Transaction(Database& db) : db_(db), done_(false) {
    db_.exec("BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
    if (done_) return;
    try {
        db_.exec("ROLLBACK");
    } catch (const StorageError& e) {
        LOG_E("Database", "Rollback failed on {}: {}", db_.path(), e.what());
    }
}

void Transaction::commit() {
    db_.exec("COMMIT");
    done_ = true;
}

}
