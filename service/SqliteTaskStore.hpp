// TaskStore on SQLite: tables tasks and sub_tasks, payload kept as JSON text.
#pragma once
#include "SqliteDatabase.hpp"
#include "TaskStore.hpp"

class SqliteTaskStore : public TaskStore {
public:
    // db must be open and outlive the store.
    explicit SqliteTaskStore(SqliteDatabase &db) : db_(db) {}

    bool initSchema(std::string &err);

    bool saveTask(const openfleet::Task &task, std::string &err) override;
    bool loadTasks(std::vector<openfleet::Task> &out, std::string &err) override;
    bool deleteTask(const std::string &taskId, std::string &err) override;
    bool purgeFinishedBefore(std::int64_t cutoffMs, int &removed,
                             std::string &err) override;

private:
    SqliteDatabase &db_;

    bool loadSubTasks(openfleet::Task &task, std::string &err);
};
