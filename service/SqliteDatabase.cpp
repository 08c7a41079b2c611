#include "SqliteDatabase.hpp"

SqliteDatabase::~SqliteDatabase() { close(); }

bool SqliteDatabase::open(const std::string &path, std::string &err) {
    std::lock_guard<std::recursive_mutex> lk(mtx_);
    if (db_) {
        err = "Database already open";
        return false;
    }
    const int flags =
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        err = "Cannot open SQLite database " + path + ": " +
              (db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_)
            sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    sqlite3_busy_timeout(db_, 5000);
    return exec("PRAGMA foreign_keys = ON;", err);
}

void SqliteDatabase::close() {
    std::lock_guard<std::recursive_mutex> lk(mtx_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteDatabase::exec(const char *sql, std::string &err) {
    if (!db_) {
        err = "Database is not open";
        return false;
    }
    char *errmsg = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        err = errmsg ? errmsg : "Unknown SQLite error";
        if (errmsg)
            sqlite3_free(errmsg);
        return false;
    }
    return true;
}

std::string SqliteDatabase::lastError() const {
    return db_ ? sqlite3_errmsg(db_) : "Database is not open";
}

SqliteStatement::SqliteStatement(sqlite3 *db, const char *sql) {
    if (db && sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

SqliteStatement::~SqliteStatement() {
    if (stmt_)
        sqlite3_finalize(stmt_);
}

void SqliteStatement::bindText(int idx, const std::string &v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

void SqliteStatement::bindOptionalText(int idx, const std::string &v) {
    if (v.empty())
        bindNull(idx);
    else
        bindText(idx, v);
}

void SqliteStatement::bindInt64(int idx, sqlite3_int64 v) {
    sqlite3_bind_int64(stmt_, idx, v);
}

void SqliteStatement::bindNull(int idx) { sqlite3_bind_null(stmt_, idx); }

void SqliteStatement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string SqliteStatement::columnText(int col) const {
    const unsigned char *t = sqlite3_column_text(stmt_, col);
    if (!t)
        return {};
    return std::string(reinterpret_cast<const char *>(t),
                       (std::size_t)sqlite3_column_bytes(stmt_, col));
}

sqlite3_int64 SqliteStatement::columnInt64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

bool SqliteStatement::columnIsNull(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}
