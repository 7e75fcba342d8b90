#include "utils/sqlite.hpp"

#include "utils/logging.hpp"

namespace osintpipe::utils {
namespace {

std::string ErrorText(sqlite3* db) {
    return db ? std::string(sqlite3_errmsg(db)) : std::string("database not open");
}

}  // namespace

SqliteDatabase::~SqliteDatabase() {
    Close();
}

void SqliteDatabase::Open(const std::filesystem::path& path) {
    if (db_) {
        return;
    }
    const auto text = path.string();
    if (text != ":memory:" && path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    if (sqlite3_open(text.c_str(), &db_) != SQLITE_OK) {
        const auto message = ErrorText(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw SqliteError("failed to open sqlite db " + text + ": " + message);
    }
    sqlite3_busy_timeout(db_, 5000);
    if (text != ":memory:") {
        Exec("PRAGMA journal_mode=WAL;");
    }
}

void SqliteDatabase::Close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteDatabase::Exec(const std::string& sql) {
    if (!db_) {
        throw SqliteError("database not open");
    }
    char* err = nullptr;
    const auto rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : ErrorText(db_);
        if (err) {
            sqlite3_free(err);
        }
        throw SqliteError("sqlite exec error: " + message);
    }
}

long long SqliteDatabase::LastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int SqliteDatabase::Changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

SqliteStatement::SqliteStatement(const SqliteDatabase& db, const std::string& sql)
    : db_(db.Handle()) {
    if (!db_) {
        throw SqliteError("database not open");
    }
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        const auto message = ErrorText(db_);
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw SqliteError("sqlite prepare error: " + message);
    }
}

SqliteStatement::~SqliteStatement() {
    sqlite3_finalize(stmt_);
}

SqliteStatement& SqliteStatement::Bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    return *this;
}

SqliteStatement& SqliteStatement::Bind(int index, const char* value) {
    return Bind(index, std::string(value ? value : ""));
}

SqliteStatement& SqliteStatement::Bind(int index, int value) {
    return Bind(index, static_cast<long long>(value));
}

SqliteStatement& SqliteStatement::Bind(int index, long long value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    return *this;
}

SqliteStatement& SqliteStatement::Bind(int index, double value) {
    sqlite3_bind_double(stmt_, index, value);
    return *this;
}

SqliteStatement& SqliteStatement::Bind(int index, const std::optional<std::string>& value) {
    if (value.has_value()) {
        return Bind(index, *value);
    }
    return BindNull(index);
}

SqliteStatement& SqliteStatement::BindNull(int index) {
    sqlite3_bind_null(stmt_, index);
    return *this;
}

bool SqliteStatement::Step() {
    const auto rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw SqliteError("sqlite step error: " + ErrorText(db_));
}

void SqliteStatement::Reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string SqliteStatement::ColumnText(int index) const {
    const auto* text = sqlite3_column_text(stmt_, index);
    if (!text) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
}

long long SqliteStatement::ColumnInt64(int index) const {
    return static_cast<long long>(sqlite3_column_int64(stmt_, index));
}

double SqliteStatement::ColumnDouble(int index) const {
    return sqlite3_column_double(stmt_, index);
}

bool SqliteStatement::ColumnIsNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

SqliteTransaction::SqliteTransaction(SqliteDatabase& db)
    : db_(db) {
    db_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
    if (done_) {
        return;
    }
    try {
        db_.Exec("ROLLBACK;");
    } catch (const SqliteError& ex) {
        Log(LogLevel::kError, "sqlite", "rollback failed", {{"error", ex.what()}});
    }
}

void SqliteTransaction::Commit() {
    db_.Exec("COMMIT;");
    done_ = true;
}

}  // namespace osintpipe::utils
