// Persistence seam for task history. The orchestrator works without one;
// history is then lost on restart.
#pragma once
#include "openfleet/TaskTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

class TaskStore {
public:
    virtual ~TaskStore() = default;

    // Inserts or replaces the task together with all its SubTasks.
    virtual bool saveTask(const openfleet::Task &task, std::string &err) = 0;
    // Every stored task, oldest first.
    virtual bool loadTasks(std::vector<openfleet::Task> &out,
                           std::string &err) = 0;
    virtual bool deleteTask(const std::string &taskId, std::string &err) = 0;
    // Drops terminal tasks that ended before cutoffMs.
    virtual bool purgeFinishedBefore(std::int64_t cutoffMs, int &removed,
                                     std::string &err) = 0;
};
