#pragma once
#include "core/Errors.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <sqlite3.h>

namespace ZenFeed {

// Throws StorageError with the code mapped from an sqlite result code.
[[noreturn]] void throwSqliteError(sqlite3* db, int rc, const std::string& context);

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Parameters are 1-based, as in sqlite.
    Statement& bind(int index, std::int64_t value);
    Statement& bind(int index, int value);
    Statement& bind(int index, bool value);
    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const char* value);
    Statement& bindNull(int index);
    Statement& bind(int index, const std::optional<std::int64_t>& value);
    Statement& bind(int index, const std::optional<std::string>& value);

    // True while a row is available.
    bool step();
    // For statements that produce no rows.
    void run();

    std::int64_t columnInt64(int col) const;
    bool columnBool(int col) const;
    std::string columnText(int col) const;
    bool columnIsNull(int col) const;
    std::optional<std::int64_t> columnOptionalInt64(int col) const;
    std::optional<std::string> columnOptionalText(int col) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
    std::string sql_;
};

// One sqlite connection. Not shared between threads without external locking.
class Database {
public:
    explicit Database(const std::string& path, int busyTimeoutMs = 5000);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void exec(const std::string& sql);
    Statement prepare(const std::string& sql);

    std::int64_t lastInsertId() const;
    int changes() const;
    bool inTransaction() const;

    const std::string& path() const { return path_; }

private:
    sqlite3* db_;
    std::string path_;
};

// BEGIN IMMEDIATE on construction; rolls back unless commit() was called.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_;
};

}
