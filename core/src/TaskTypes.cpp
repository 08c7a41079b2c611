// Task model helpers: names, validation and the status aggregation rule.
#include "openfleet/TaskTypes.hpp"
#include "openfleet/ShellCommand.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>

namespace openfleet {

const char *taskKindName(TaskKind kind) {
    switch (kind) {
    case TaskKind::Batch:
        return "batch";
    case TaskKind::Transfer:
        return "transfer";
    }
    return "unknown";
}

const char *taskStatusName(TaskStatus status) {
    switch (status) {
    case TaskStatus::Queued:
        return "queued";
    case TaskStatus::InProgress:
        return "in-progress";
    case TaskStatus::PartiallyCompleted:
        return "partially-completed";
    case TaskStatus::Completed:
        return "completed";
    case TaskStatus::Failed:
        return "failed";
    case TaskStatus::Cancelling:
        return "cancelling";
    case TaskStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char *subTaskStatusName(SubTaskStatus status) {
    switch (status) {
    case SubTaskStatus::Queued:
        return "queued";
    case SubTaskStatus::Connecting:
        return "connecting";
    case SubTaskStatus::Running:
        return "running";
    case SubTaskStatus::Transferring:
        return "transferring";
    case SubTaskStatus::Completed:
        return "completed";
    case SubTaskStatus::Failed:
        return "failed";
    case SubTaskStatus::Cancelling:
        return "cancelling";
    case SubTaskStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char *transferMethodName(TransferMethod method) {
    switch (method) {
    case TransferMethod::Auto:
        return "auto";
    case TransferMethod::Rsync:
        return "rsync";
    case TransferMethod::Scp:
        return "scp";
    }
    return "unknown";
}

const char *sourceItemTypeName(SourceItemType type) {
    switch (type) {
    case SourceItemType::File:
        return "file";
    case SourceItemType::Directory:
        return "directory";
    }
    return "unknown";
}

std::optional<TaskKind> parseTaskKind(const std::string &name) {
    for (TaskKind k : {TaskKind::Batch, TaskKind::Transfer}) {
        if (name == taskKindName(k))
            return k;
    }
    return std::nullopt;
}

std::optional<TaskStatus> parseTaskStatus(const std::string &name) {
    for (TaskStatus s :
         {TaskStatus::Queued, TaskStatus::InProgress,
          TaskStatus::PartiallyCompleted, TaskStatus::Completed,
          TaskStatus::Failed, TaskStatus::Cancelling, TaskStatus::Cancelled}) {
        if (name == taskStatusName(s))
            return s;
    }
    return std::nullopt;
}

std::optional<SubTaskStatus> parseSubTaskStatus(const std::string &name) {
    for (SubTaskStatus s :
         {SubTaskStatus::Queued, SubTaskStatus::Connecting,
          SubTaskStatus::Running, SubTaskStatus::Transferring,
          SubTaskStatus::Completed, SubTaskStatus::Failed,
          SubTaskStatus::Cancelling, SubTaskStatus::Cancelled}) {
        if (name == subTaskStatusName(s))
            return s;
    }
    return std::nullopt;
}

std::optional<TransferMethod> parseTransferMethod(const std::string &name) {
    for (TransferMethod m :
         {TransferMethod::Auto, TransferMethod::Rsync, TransferMethod::Scp}) {
        if (name == transferMethodName(m))
            return m;
    }
    return std::nullopt;
}

std::optional<SourceItemType> parseSourceItemType(const std::string &name) {
    if (name == "file")
        return SourceItemType::File;
    if (name == "directory")
        return SourceItemType::Directory;
    return std::nullopt;
}

bool isTerminal(TaskStatus status) {
    switch (status) {
    case TaskStatus::Queued:
    case TaskStatus::InProgress:
    case TaskStatus::Cancelling:
        return false;
    case TaskStatus::PartiallyCompleted:
    case TaskStatus::Completed:
    case TaskStatus::Failed:
    case TaskStatus::Cancelled:
        return true;
    }
    return false;
}

bool isTerminal(SubTaskStatus status) {
    switch (status) {
    case SubTaskStatus::Queued:
    case SubTaskStatus::Connecting:
    case SubTaskStatus::Running:
    case SubTaskStatus::Transferring:
    case SubTaskStatus::Cancelling:
        return false;
    case SubTaskStatus::Completed:
    case SubTaskStatus::Failed:
    case SubTaskStatus::Cancelled:
        return true;
    }
    return false;
}

int clampProgress(int progress) { return std::min(100, std::max(0, progress)); }

std::int64_t currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string randomHex(std::size_t bytes) {
    static const char kDigits[] = "0123456789abcdef";
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);
    std::string out;
    out.reserve(bytes * 2);
    for (std::size_t i = 0; i < bytes; ++i) {
        const int b = dist(gen);
        out.push_back(kDigits[(b >> 4) & 0xF]);
        out.push_back(kDigits[b & 0xF]);
    }
    return out;
}

static bool validateConnectionIds(const std::vector<std::int64_t> &ids,
                                  std::string &err) {
    if (ids.empty()) {
        err = "connectionIds must not be empty";
        return false;
    }
    for (std::int64_t id : ids) {
        if (id <= 0) {
            err = "connectionIds must contain positive integers";
            return false;
        }
    }
    return true;
}

static bool validateConcurrency(int limit, std::string &err) {
    if (limit < 1 || limit > kMaxConcurrencyLimit) {
        err = "concurrencyLimit must be between 1 and " +
              std::to_string(kMaxConcurrencyLimit);
        return false;
    }
    return true;
}

bool validateBatchRequest(const BatchRequest &req, std::string &err) {
    if (req.command.find_first_not_of(" \t\r\n") == std::string::npos) {
        err = "command must not be empty";
        return false;
    }
    if (!validateConnectionIds(req.connectionIds, err))
        return false;
    if (!validateConcurrency(req.concurrencyLimit, err))
        return false;
    if (req.timeoutSeconds < 1) {
        err = "timeoutSeconds must be positive";
        return false;
    }
    for (const auto &kv : req.env) {
        if (!isValidEnvName(kv.first)) {
            err = "invalid environment variable name: " + kv.first;
            return false;
        }
    }
    if (req.workdir.has_value() && req.workdir->empty()) {
        err = "workdir must not be empty when given";
        return false;
    }
    return true;
}

bool validateTransferRequest(const TransferRequest &req, std::string &err) {
    if (req.sourceConnectionId <= 0) {
        err = "sourceConnectionId must be a positive integer";
        return false;
    }
    if (!validateConnectionIds(req.connectionIds, err))
        return false;
    if (!validateConcurrency(req.concurrencyLimit, err))
        return false;
    if (req.remoteTargetPath.empty()) {
        err = "remoteTargetPath must not be empty";
        return false;
    }
    for (const auto &item : req.sourceItems) {
        if (item.name.empty()) {
            err = "source item name must not be empty";
            return false;
        }
        if (item.path.empty()) {
            err = "source item path must not be empty: " + item.name;
            return false;
        }
    }
    return true;
}

bool refreshAggregate(Task &task, std::int64_t nowMs) {
    if (isTerminal(task.status))
        return false;

    int completed = 0;
    int failed = 0;
    int cancelled = 0;
    int pending = 0;
    long long progressSum = 0;
    for (const auto &st : task.subTasks) {
        progressSum += st.progress;
        switch (st.status) {
        case SubTaskStatus::Completed:
            ++completed;
            break;
        case SubTaskStatus::Failed:
            ++failed;
            break;
        case SubTaskStatus::Cancelled:
            ++cancelled;
            break;
        case SubTaskStatus::Queued:
        case SubTaskStatus::Connecting:
        case SubTaskStatus::Running:
        case SubTaskStatus::Transferring:
        case SubTaskStatus::Cancelling:
            ++pending;
            break;
        }
    }

    const int total = static_cast<int>(task.subTasks.size());
    task.totalSubTasks = total;
    task.completedSubTasks = completed;
    task.failedSubTasks = failed;
    task.cancelledSubTasks = cancelled;
    task.overallProgress =
        total > 0 ? static_cast<int>(std::lround(
                        static_cast<double>(progressSum) / total))
                  : 0;

    TaskStatus next = task.status;
    if (task.status == TaskStatus::Cancelling) {
        next = pending == 0 ? TaskStatus::Cancelled : TaskStatus::Cancelling;
    } else if (pending > 0) {
        next = TaskStatus::InProgress;
    } else if (completed == total) {
        next = TaskStatus::Completed;
    } else if (completed == 0) {
        next = failed > 0 ? TaskStatus::Failed : TaskStatus::Cancelled;
    } else {
        next = TaskStatus::PartiallyCompleted;
    }

    task.updatedAtMs = nowMs;
    if (next == task.status)
        return false;
    task.status = next;
    if (isTerminal(next) && task.endedAtMs == 0)
        task.endedAtMs = nowMs;
    return true;
}

} // namespace openfleet
