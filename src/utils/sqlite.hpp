#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "sqlite3.h"

namespace osintpipe::utils {

class SqliteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SqliteDatabase {
public:
    SqliteDatabase() = default;
    ~SqliteDatabase();
    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    // ":memory:" opens a private in-memory database.
    void Open(const std::filesystem::path& path);
    void Close();
    bool IsOpen() const { return db_ != nullptr; }

    void Exec(const std::string& sql);
    long long LastInsertRowId() const;
    int Changes() const;

    sqlite3* Handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
};

class SqliteStatement {
public:
    SqliteStatement(const SqliteDatabase& db, const std::string& sql);
    ~SqliteStatement();
    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    SqliteStatement& Bind(int index, const std::string& value);
    SqliteStatement& Bind(int index, const char* value);
    SqliteStatement& Bind(int index, int value);
    SqliteStatement& Bind(int index, long long value);
    SqliteStatement& Bind(int index, double value);
    SqliteStatement& Bind(int index, const std::optional<std::string>& value);
    SqliteStatement& BindNull(int index);

    // True while a row is available; false once the statement is done.
    bool Step();
    void Reset();

    std::string ColumnText(int index) const;
    long long ColumnInt64(int index) const;
    double ColumnDouble(int index) const;
    bool ColumnIsNull(int index) const;

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDatabase& db);
    ~SqliteTransaction();
    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void Commit();

private:
    SqliteDatabase& db_;
    bool done_ = false;
};

}  // namespace osintpipe::utils
