// One SQLite connection shared by the task and policy stores.
#pragma once
#include <mutex>
#include <sqlite3.h>
#include <string>

class SqliteDatabase {
public:
    SqliteDatabase() = default;
    ~SqliteDatabase();
    SqliteDatabase(const SqliteDatabase &) = delete;
    SqliteDatabase &operator=(const SqliteDatabase &) = delete;

    // ":memory:" opens a private in-memory database.
    bool open(const std::string &path, std::string &err);
    void close();
    bool isOpen() const { return db_ != nullptr; }

    // Runs one or more statements without results.
    bool exec(const char *sql, std::string &err);

    sqlite3 *handle() const { return db_; }
    std::string lastError() const;

    // Serializes multi-statement work (transactions) across threads.
    std::recursive_mutex &mutex() { return mtx_; }

private:
    sqlite3 *db_ = nullptr;
    std::recursive_mutex mtx_;
};

// Finalizes a prepared statement when it goes out of scope.
class SqliteStatement {
public:
    SqliteStatement(sqlite3 *db, const char *sql);
    ~SqliteStatement();
    SqliteStatement(const SqliteStatement &) = delete;
    SqliteStatement &operator=(const SqliteStatement &) = delete;

    bool ok() const { return stmt_ != nullptr; }
    sqlite3_stmt *get() const { return stmt_; }

    void bindText(int idx, const std::string &v);
    void bindOptionalText(int idx, const std::string &v); // empty binds NULL
    void bindInt64(int idx, sqlite3_int64 v);
    void bindNull(int idx);

    int step() { return sqlite3_step(stmt_); }
    void reset();

    std::string columnText(int col) const;
    sqlite3_int64 columnInt64(int col) const;
    bool columnIsNull(int col) const;

private:
    sqlite3_stmt *stmt_ = nullptr;
};
