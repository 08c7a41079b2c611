// Task and SubTask model for batch command runs and multi-target transfers.
// Plain copyable structures: the orchestrator hands out snapshots by value.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace openfleet {

constexpr int kDefaultConcurrencyLimit = 5;
constexpr int kMaxConcurrencyLimit = 64;
constexpr int kDefaultCommandTimeoutSeconds = 300;
constexpr std::size_t kMaxSubTaskOutputBytes = 1024 * 1024;

enum class TaskKind { Batch, Transfer };

enum class TaskStatus {
    Queued,
    InProgress,
    PartiallyCompleted,
    Completed,
    Failed,
    Cancelling,
    Cancelled
};

enum class SubTaskStatus {
    Queued,
    Connecting,
    Running,      // batch command executing
    Transferring, // copy in progress
    Completed,
    Failed,
    Cancelling,
    Cancelled
};

enum class TransferMethod { Auto, Rsync, Scp };

enum class SourceItemType { File, Directory };

struct SourceItem {
    std::string name;
    std::string path;
    SourceItemType type = SourceItemType::File;
    std::optional<std::uint64_t> size; // bytes, when the caller knows it
};

struct BatchRequest {
    std::string command;
    std::vector<std::int64_t> connectionIds;
    int concurrencyLimit = kDefaultConcurrencyLimit;
    int timeoutSeconds = kDefaultCommandTimeoutSeconds;
    // Kept in insertion order; rendered as `env K='v' ...`.
    std::vector<std::pair<std::string, std::string>> env;
    std::optional<std::string> workdir;
    bool sudo = false;
};

struct TransferRequest {
    std::int64_t sourceConnectionId = 0;
    std::vector<std::int64_t> connectionIds;
    std::vector<SourceItem> sourceItems;
    std::string remoteTargetPath;
    TransferMethod transferMethod = TransferMethod::Auto;
    int concurrencyLimit = kDefaultConcurrencyLimit;
    // Group memberships of the requesting user, for policy scope resolution.
    std::vector<std::int64_t> userGroupIds;
};

// Value copy of the request a Task was created from.
struct TaskPayload {
    TaskKind kind = TaskKind::Batch;
    BatchRequest batch;
    TransferRequest transfer;
};

struct SubTask {
    std::string id;
    std::string taskId;
    std::int64_t connectionId = 0;
    std::string label;        // source item name or target connection name
    int sourceItemIndex = -1; // index into TransferRequest::sourceItems
    SubTaskStatus status = SubTaskStatus::Queued;
    int progress = 0;         // 0..100
    std::optional<int> exitCode;
    std::string output;
    std::string message;
    std::optional<TransferMethod> transferMethodUsed; // Rsync or Scp
    std::int64_t startedAtMs = 0;
    std::int64_t endedAtMs = 0;
};

struct Task {
    std::string id;
    std::string userId;
    TaskKind kind = TaskKind::Batch;
    TaskStatus status = TaskStatus::Queued;
    int concurrencyLimit = kDefaultConcurrencyLimit;
    int totalSubTasks = 0;
    int completedSubTasks = 0;
    int failedSubTasks = 0;
    int cancelledSubTasks = 0;
    int overallProgress = 0; // derived, never set directly
    std::string message;
    TaskPayload payload;
    std::vector<SubTask> subTasks;
    std::int64_t createdAtMs = 0;
    std::int64_t updatedAtMs = 0;
    std::int64_t startedAtMs = 0;
    std::int64_t endedAtMs = 0;
};

const char *taskKindName(TaskKind kind);
const char *taskStatusName(TaskStatus status);
const char *subTaskStatusName(SubTaskStatus status);
const char *transferMethodName(TransferMethod method);
const char *sourceItemTypeName(SourceItemType type);

std::optional<TaskKind> parseTaskKind(const std::string &name);
std::optional<TaskStatus> parseTaskStatus(const std::string &name);
std::optional<SubTaskStatus> parseSubTaskStatus(const std::string &name);
std::optional<TransferMethod> parseTransferMethod(const std::string &name);
std::optional<SourceItemType> parseSourceItemType(const std::string &name);

bool isTerminal(TaskStatus status);
bool isTerminal(SubTaskStatus status);

int clampProgress(int progress);

// Milliseconds since the Unix epoch.
std::int64_t currentTimeMs();

// Random lowercase hex string of 2*bytes characters.
std::string randomHex(std::size_t bytes);

// Shape validation; false with a human-readable err on the first problem.
bool validateBatchRequest(const BatchRequest &req, std::string &err);
bool validateTransferRequest(const TransferRequest &req, std::string &err);

// Recomputes counters, overallProgress and status from the SubTask snapshot.
// Returns true when the Task status changed. A terminal Task is left as is.
bool refreshAggregate(Task &task, std::int64_t nowMs);

} // namespace openfleet
