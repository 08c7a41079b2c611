// Lock order: registryMutex_, then a TaskEntry mutex, then workersMutex_.
// Signals are emitted with no lock held.
#include "TaskOrchestrator.hpp"
#include "LogCategories.hpp"
#include "openfleet/RuntimeLogging.hpp"
#include <QUuid>
#include <algorithm>
#include <chrono>
#include <system_error>

using namespace openfleet;

static std::string newId() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

// Event copies leave the (possibly large) output behind.
static SubTask eventCopy(const SubTask &sub) {
    SubTask c = sub;
    c.output.clear();
    return c;
}

static SubTask *findSubTask(Task &task, const std::string &subTaskId) {
    for (auto &sub : task.subTasks) {
        if (sub.id == subTaskId)
            return &sub;
    }
    return nullptr;
}

static QString qs(const std::string &s) { return QString::fromStdString(s); }

TaskOrchestrator::TaskOrchestrator(const SubTaskRunner &runner,
                                   CredentialResolver &resolver,
                                   Options options, QObject *parent)
    : QObject(parent), runner_(runner), resolver_(resolver), options_(options) {
    if (options_.cancelGraceMs < 0)
        options_.cancelGraceMs = 0;
}

TaskOrchestrator::~TaskOrchestrator() { shutdown(); }

void TaskOrchestrator::shutdown() {
    {
        std::lock_guard<std::mutex> lk(shutdownMtx_);
        shuttingDown_ = true;
    }
    shutdownCv_.notify_all();

    std::vector<std::shared_ptr<CancelToken>> tokens;
    {
        std::lock_guard<std::mutex> lk(registryMutex_);
        for (auto &kv : tasks_) {
            std::lock_guard<std::mutex> tl(kv.second->mtx);
            for (auto &t : kv.second->tokens)
                tokens.push_back(t.second);
        }
    }
    if (!tokens.empty())
        qCInfo(ofOrch) << "shutdown cancelling workers" << "count=" << tokens.size();
    for (auto &t : tokens)
        t->cancel();

    // Workers finishing now may still be appending; drain until empty.
    for (;;) {
        std::list<WorkerThread> toJoin;
        {
            std::lock_guard<std::mutex> lk(workersMutex_);
            toJoin.swap(workers_);
        }
        if (toJoin.empty())
            break;
        for (auto &w : toJoin) {
            if (w.thread.joinable())
                w.thread.join();
        }
    }
}

void TaskOrchestrator::spawn(std::function<void()> fn) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lk(workersMutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable())
                it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
    WorkerThread w;
    w.done = done;
    w.thread = std::thread([fn = std::move(fn), done] {
        fn();
        done->store(true);
    });
    workers_.push_back(std::move(w));
}

std::shared_ptr<TaskOrchestrator::TaskEntry>
TaskOrchestrator::findEntry(const std::string &taskId) const {
    std::lock_guard<std::mutex> lk(registryMutex_);
    auto it = tasks_.find(taskId);
    return it == tasks_.end() ? nullptr : it->second;
}

std::size_t TaskOrchestrator::taskCount() const {
    std::lock_guard<std::mutex> lk(registryMutex_);
    return tasks_.size();
}

bool TaskOrchestrator::restore(std::string &err) {
    if (!store_)
        return true;
    std::vector<Task> loaded;
    if (!store_->loadTasks(loaded, err))
        return false;

    int interrupted = 0;
    for (auto &t : loaded) {
        if (!isTerminal(t.status)) {
            const std::int64_t now = currentTimeMs();
            for (auto &sub : t.subTasks) {
                if (isTerminal(sub.status))
                    continue;
                sub.status = SubTaskStatus::Failed;
                sub.message = "interrupted by restart";
                sub.endedAtMs = now;
            }
            // Recount, then record the interruption as a failure of the Task.
            t.status = TaskStatus::InProgress;
            refreshAggregate(t, now);
            t.status = TaskStatus::Failed;
            t.message = "interrupted by restart";
            t.endedAtMs = now;
            std::string saveErr;
            if (!store_->saveTask(t, saveErr))
                qCWarning(ofStore) << "could not mark task interrupted"
                                   << "taskId=" << qs(t.id)
                                   << "error=" << qs(saveErr);
            ++interrupted;
        }
        auto e = std::make_shared<TaskEntry>();
        e->nextIndex = t.subTasks.size();
        const std::string id = t.id;
        e->task = std::move(t);
        std::lock_guard<std::mutex> lk(registryMutex_);
        tasks_.emplace(id, std::move(e));
    }
    qCInfo(ofStore) << "history restored" << "tasks=" << loaded.size()
                    << "interrupted=" << interrupted;
    return true;
}

std::optional<Task> TaskOrchestrator::submitBatch(const BatchRequest &req,
                                                  const std::string &userId,
                                                  std::string &err) {
    if (userId.empty()) {
        err = "userId must not be empty";
        return std::nullopt;
    }
    if (!validateBatchRequest(req, err)) {
        qCInfo(ofOrch) << "batch request rejected" << "reason=" << qs(err);
        return std::nullopt;
    }

    Task task;
    task.id = newId();
    task.userId = userId;
    task.kind = TaskKind::Batch;
    task.concurrencyLimit = req.concurrencyLimit;
    task.payload.kind = TaskKind::Batch;
    task.payload.batch = req;
    for (std::int64_t id : req.connectionIds) {
        SubTask sub;
        sub.id = newId();
        sub.taskId = task.id;
        sub.connectionId = id;
        ConnectionCredentials creds;
        std::string resolveErr;
        if (resolver_.resolve(id, creds, resolveErr) == ResolveStatus::Ok)
            sub.label = creds.name;
        else
            sub.label = "connection " + std::to_string(id);
        task.subTasks.push_back(std::move(sub));
    }
    qCDebug(ofOrch) << "batch command" << "taskId=" << qs(task.id)
                    << "command=" << qs(redactCommand(req.command));
    return start(std::move(task));
}

std::optional<Task> TaskOrchestrator::submitTransfer(const TransferRequest &req,
                                                     const std::string &userId,
                                                     std::string &err) {
    if (userId.empty()) {
        err = "userId must not be empty";
        return std::nullopt;
    }
    if (!validateTransferRequest(req, err)) {
        qCInfo(ofOrch) << "transfer request rejected" << "reason=" << qs(err);
        return std::nullopt;
    }

    ConnectionCredentials source;
    std::string resolveErr;
    if (resolver_.resolve(req.sourceConnectionId, source, resolveErr) ==
        ResolveStatus::UnknownConnection) {
        err = "Source connection " + std::to_string(req.sourceConnectionId) +
              " not found";
        return std::nullopt;
    }

    if (policies_) {
        for (std::int64_t target : req.connectionIds) {
            for (const auto &item : req.sourceItems) {
                TransferContext ctx;
                ctx.userId = userId;
                ctx.connectionId = target;
                ctx.groupIds = req.userGroupIds;
                ctx.direction = TransferDirection::Upload;
                ctx.fileName = item.name;
                ctx.fileSize = item.size.value_or(0);
                const PolicyDecision d = policies_->evaluate(ctx);
                if (d.allowed)
                    continue;
                err = "Transfer of " + item.name + " to connection " +
                      std::to_string(target) + " denied: " + d.reason;
                qCInfo(ofPolicy)
                    << "transfer denied" << "user=" << qs(userId)
                    << "connectionId=" << target << "file=" << qs(item.name)
                    << "policy="
                    << (d.policy ? qs(d.policy->name) : QStringLiteral("-"));
                return std::nullopt;
            }
        }
    }

    Task task;
    task.id = newId();
    task.userId = userId;
    task.kind = TaskKind::Transfer;
    task.concurrencyLimit = req.concurrencyLimit;
    task.payload.kind = TaskKind::Transfer;
    task.payload.transfer = req;
    for (std::int64_t target : req.connectionIds) {
        for (std::size_t i = 0; i < req.sourceItems.size(); ++i) {
            SubTask sub;
            sub.id = newId();
            sub.taskId = task.id;
            sub.connectionId = target;
            sub.label = req.sourceItems[i].name;
            sub.sourceItemIndex = static_cast<int>(i);
            task.subTasks.push_back(std::move(sub));
        }
    }
    return start(std::move(task));
}

std::optional<Task> TaskOrchestrator::start(Task task) {
    const std::int64_t now = currentTimeMs();
    task.status = TaskStatus::Queued;
    task.totalSubTasks = static_cast<int>(task.subTasks.size());
    task.createdAtMs = now;
    task.updatedAtMs = now;

    auto e = std::make_shared<TaskEntry>();
    const std::string taskId = task.id;
    e->task = std::move(task);
    {
        std::lock_guard<std::mutex> lk(registryMutex_);
        tasks_[taskId] = e;
    }

    Events ev;
    Task snapshot;
    {
        std::lock_guard<std::mutex> lk(e->mtx);
        e->task.status = TaskStatus::InProgress;
        e->task.startedAtMs = now;
        ev.started = true;
        ev.concurrency = e->task.concurrencyLimit;
        dispatch(e, ev);
        afterChange(*e, true, ev);
        snapshot = e->task;
    }
    qCInfo(ofOrch) << "task started" << "taskId=" << qs(taskId)
                   << "kind=" << taskKindName(snapshot.kind)
                   << "user=" << qs(snapshot.userId)
                   << "subTasks=" << snapshot.totalSubTasks
                   << "concurrency=" << snapshot.concurrencyLimit;
    emitEvents(ev);
    return snapshot;
}

void TaskOrchestrator::dispatch(const std::shared_ptr<TaskEntry> &e,
                                Events &ev) {
    Task &t = e->task;
    if (shuttingDown_ || t.status == TaskStatus::Cancelling ||
        isTerminal(t.status))
        return;
    while (e->active < t.concurrencyLimit && e->nextIndex < t.subTasks.size()) {
        SubTask &sub = t.subTasks[e->nextIndex++];
        if (sub.status != SubTaskStatus::Queued)
            continue;
        auto token = std::make_shared<CancelToken>();
        sub.status = SubTaskStatus::Connecting;
        sub.startedAtMs = currentTimeMs();
        e->tokens[sub.id] = token;
        ++e->active;
        try {
            spawn([this, e, id = sub.id, token] { runSubTask(e, id, token); });
        } catch (const std::system_error &ex) {
            e->tokens.erase(sub.id);
            --e->active;
            sub.status = SubTaskStatus::Failed;
            sub.message = std::string("Could not start worker: ") + ex.what();
            sub.endedAtMs = currentTimeMs();
            qCWarning(ofOrch) << "worker start failed" << "taskId=" << qs(t.id)
                              << "error=" << ex.what();
        }
        ev.subTasks.push_back(eventCopy(sub));
    }
}

bool TaskOrchestrator::applyTransition(SubTask &sub, SubTaskStatus status,
                                       std::optional<int> progress,
                                       const std::string &message,
                                       bool &statusChanged, Events &ev) {
    statusChanged = false;
    if (isTerminal(sub.status))
        return false;
    std::string text = message;
    if (sub.status == SubTaskStatus::Cancelling) {
        if (!isTerminal(status))
            return false;
        status = SubTaskStatus::Cancelled;
        text = "Cancelled by user";
    }

    const std::int64_t now = currentTimeMs();
    statusChanged = sub.status != status;
    sub.status = status;
    if (progress) {
        const int p = clampProgress(*progress);
        const bool exact =
            status == SubTaskStatus::Completed || status == SubTaskStatus::Failed;
        sub.progress = exact ? p : std::max(sub.progress, p);
    }
    if (!text.empty())
        sub.message = text;
    if (sub.startedAtMs == 0 && status != SubTaskStatus::Queued)
        sub.startedAtMs = now;
    if (isTerminal(status))
        sub.endedAtMs = now;
    ev.subTasks.push_back(eventCopy(sub));
    return true;
}

void TaskOrchestrator::afterChange(TaskEntry &e, bool save, Events &ev) {
    Task &t = e.task;
    const bool wasTerminal = isTerminal(t.status);
    const bool statusChanged = refreshAggregate(t, currentTimeMs());

    ev.taskId = t.id;
    ev.overall = true;
    ev.status = t.status;
    ev.progress = t.overallProgress;
    ev.completed = t.completedSubTasks;
    ev.failed = t.failedSubTasks;
    ev.cancelled = t.cancelledSubTasks;
    ev.total = t.totalSubTasks;

    if (!wasTerminal && isTerminal(t.status)) {
        ev.finished = true;
        e.cv.notify_all();
        qCInfo(ofOrch) << "task finished" << "taskId=" << qs(t.id)
                       << "status=" << taskStatusName(t.status)
                       << "completed=" << t.completedSubTasks
                       << "failed=" << t.failedSubTasks
                       << "cancelled=" << t.cancelledSubTasks;
    }
    if (save || statusChanged)
        persist(e);
}

void TaskOrchestrator::persist(const TaskEntry &e) {
    if (!store_ || e.removed)
        return;
    std::string err;
    if (!store_->saveTask(e.task, err))
        qCWarning(ofStore) << "saving task failed" << "taskId=" << qs(e.task.id)
                           << "error=" << qs(err);
}

void TaskOrchestrator::runSubTask(std::shared_ptr<TaskEntry> e,
                                  std::string subTaskId,
                                  std::shared_ptr<CancelToken> token) {
    TaskPayload payload;
    std::int64_t connectionId = 0;
    int itemIndex = -1;
    std::string taskId;
    {
        std::lock_guard<std::mutex> lk(e->mtx);
        payload = e->task.payload;
        taskId = e->task.id;
        if (SubTask *sub = findSubTask(e->task, subTaskId)) {
            connectionId = sub->connectionId;
            itemIndex = sub->sourceItemIndex;
        }
    }
    const QString qTaskId = qs(taskId);
    const QString qSubId = qs(subTaskId);

    SubTaskReporter report;
    report.status = [&](SubTaskStatus status, int progress,
                        const std::string &message) {
        Events ev;
        {
            std::lock_guard<std::mutex> lk(e->mtx);
            SubTask *sub = findSubTask(e->task, subTaskId);
            bool changed = false;
            if (!sub || !applyTransition(*sub, status, progress, message,
                                         changed, ev))
                return;
            afterChange(*e, changed, ev);
        }
        emitEvents(ev);
    };
    report.output = [&](const std::string &chunk, bool isStderr) {
        if (!shuttingDown_)
            emit subTaskOutput(qTaskId, qSubId,
                               QString::fromUtf8(chunk.data(), (int)chunk.size()),
                               isStderr);
    };
    report.method = [&](TransferMethod method) {
        std::lock_guard<std::mutex> lk(e->mtx);
        SubTask *sub = findSubTask(e->task, subTaskId);
        if (sub && !isTerminal(sub->status))
            sub->transferMethodUsed = method;
    };

    SubTaskOutcome outcome;
    try {
        if (payload.kind == TaskKind::Batch) {
            outcome = runner_.runBatch(payload.batch, connectionId, *token, report);
        } else if (itemIndex >= 0 &&
                   itemIndex < (int)payload.transfer.sourceItems.size()) {
            outcome = runner_.runTransfer(payload.transfer,
                                          payload.transfer.sourceItems[itemIndex],
                                          connectionId, *token, report);
        } else {
            outcome.status = SubTaskStatus::Failed;
            outcome.message = "Source item not found";
        }
    } catch (const std::exception &ex) {
        outcome = SubTaskOutcome{};
        outcome.status = SubTaskStatus::Failed;
        outcome.message = std::string("Internal error: ") + ex.what();
        qCWarning(ofOrch) << "worker threw" << "taskId=" << qTaskId
                          << "subTaskId=" << qSubId << "error=" << ex.what();
    }
    finishSubTask(e, subTaskId, outcome);
}

void TaskOrchestrator::finishSubTask(const std::shared_ptr<TaskEntry> &e,
                                     const std::string &subTaskId,
                                     const SubTaskOutcome &outcome) {
    Events ev;
    {
        std::lock_guard<std::mutex> lk(e->mtx);
        e->tokens.erase(subTaskId);
        --e->active;
        SubTask *sub = findSubTask(e->task, subTaskId);
        if (sub && !isTerminal(sub->status)) {
            sub->exitCode = outcome.exitCode;
            sub->output = outcome.output;
            if (outcome.methodUsed)
                sub->transferMethodUsed = outcome.methodUsed;
            bool changed = false;
            applyTransition(*sub, outcome.status, outcome.progress,
                            outcome.message, changed, ev);
            qCInfo(ofOrch) << "sub task finished" << "taskId=" << qs(e->task.id)
                           << "subTaskId=" << qs(subTaskId)
                           << "connectionId=" << sub->connectionId
                           << "status=" << subTaskStatusName(sub->status)
                           << "exitCode=" << (sub->exitCode ? *sub->exitCode : -1);
        }
        dispatch(e, ev);
        afterChange(*e, true, ev);
    }
    emitEvents(ev);
}

TaskOrchestrator::CancelResult
TaskOrchestrator::cancelTask(const std::string &taskId, const std::string &userId) {
    auto e = findEntry(taskId);
    if (!e)
        return CancelResult::NotFound;

    std::vector<std::shared_ptr<CancelToken>> toCancel;
    bool waitForWorkers = false;
    Events ev;
    {
        std::lock_guard<std::mutex> lk(e->mtx);
        Task &t = e->task;
        if (t.userId != userId) {
            qCWarning(ofOrch) << "cancel refused: not the owner"
                              << "taskId=" << qs(taskId) << "user=" << qs(userId);
            return CancelResult::Forbidden;
        }
        if (isTerminal(t.status))
            return CancelResult::AlreadyFinished;
        if (t.status == TaskStatus::Cancelling)
            return CancelResult::Accepted;

        t.status = TaskStatus::Cancelling;
        t.message = "Cancelled by user";
        const std::int64_t now = currentTimeMs();
        for (auto &sub : t.subTasks) {
            switch (sub.status) {
            case SubTaskStatus::Queued:
                sub.status = SubTaskStatus::Cancelled;
                sub.message = "Cancelled before start";
                sub.endedAtMs = now;
                ev.subTasks.push_back(eventCopy(sub));
                break;
            case SubTaskStatus::Connecting:
            case SubTaskStatus::Running:
            case SubTaskStatus::Transferring:
                sub.status = SubTaskStatus::Cancelling;
                sub.message = "Cancelling";
                ev.subTasks.push_back(eventCopy(sub));
                waitForWorkers = true;
                break;
            case SubTaskStatus::Cancelling:
                waitForWorkers = true;
                break;
            case SubTaskStatus::Completed:
            case SubTaskStatus::Failed:
            case SubTaskStatus::Cancelled:
                break;
            }
        }
        for (auto &kv : e->tokens)
            toCancel.push_back(kv.second);
        afterChange(*e, true, ev);
    }
    qCInfo(ofOrch) << "task cancel accepted" << "taskId=" << qs(taskId)
                   << "inFlight=" << toCancel.size();
    emitEvents(ev);

    for (auto &token : toCancel)
        token->cancel();

    if (waitForWorkers) {
        try {
            spawn([this, e] {
                {
                    std::unique_lock<std::mutex> lk(shutdownMtx_);
                    if (shutdownCv_.wait_for(
                            lk, std::chrono::milliseconds(options_.cancelGraceMs),
                            [this] { return shuttingDown_.load(); }))
                        return;
                }
                forceCancel(e);
            });
        } catch (const std::system_error &ex) {
            qCWarning(ofOrch) << "grace timer unavailable; forcing cancel"
                              << "error=" << ex.what();
            forceCancel(e);
        }
    }
    return CancelResult::Accepted;
}

void TaskOrchestrator::forceCancel(const std::shared_ptr<TaskEntry> &e) {
    Events ev;
    int forced = 0;
    {
        std::lock_guard<std::mutex> lk(e->mtx);
        const std::int64_t now = currentTimeMs();
        for (auto &sub : e->task.subTasks) {
            if (sub.status != SubTaskStatus::Cancelling)
                continue;
            sub.status = SubTaskStatus::Cancelled;
            sub.message = "Cancelled (worker did not stop in time)";
            sub.endedAtMs = now;
            ev.subTasks.push_back(eventCopy(sub));
            ++forced;
        }
        if (forced == 0)
            return;
        afterChange(*e, true, ev);
    }
    qCWarning(ofOrch) << "grace period expired; sub tasks forced to cancelled"
                      << "taskId=" << qs(ev.taskId) << "count=" << forced;
    emitEvents(ev);
}

void TaskOrchestrator::updateSubTaskStatus(const std::string &taskId,
                                           const std::string &subTaskId,
                                           SubTaskStatus status,
                                           std::optional<int> progress,
                                           const std::string &message) {
    auto e = findEntry(taskId);
    if (!e)
        return;
    Events ev;
    {
        std::lock_guard<std::mutex> lk(e->mtx);
        SubTask *sub = findSubTask(e->task, subTaskId);
        bool changed = false;
        if (!sub || !applyTransition(*sub, status, progress, message, changed, ev))
            return;
        afterChange(*e, changed, ev);
    }
    emitEvents(ev);
}

std::optional<Task> TaskOrchestrator::getDetails(const std::string &taskId,
                                                 const std::string &userId) const {
    auto e = findEntry(taskId);
    if (!e)
        return std::nullopt;
    std::lock_guard<std::mutex> lk(e->mtx);
    if (e->task.userId != userId)
        return std::nullopt;
    return e->task;
}

std::vector<Task> TaskOrchestrator::listForUser(const std::string &userId) const {
    std::vector<Task> out;
    {
        std::lock_guard<std::mutex> lk(registryMutex_);
        for (const auto &kv : tasks_) {
            std::lock_guard<std::mutex> tl(kv.second->mtx);
            if (kv.second->task.userId == userId)
                out.push_back(kv.second->task);
        }
    }
    std::sort(out.begin(), out.end(), [](const Task &a, const Task &b) {
        if (a.createdAtMs != b.createdAtMs)
            return a.createdAtMs > b.createdAtMs;
        return a.id < b.id;
    });
    return out;
}

bool TaskOrchestrator::deleteTask(const std::string &taskId,
                                  const std::string &userId, std::string &err) {
    auto e = findEntry(taskId);
    if (!e) {
        err = "Task not found: " + taskId;
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(e->mtx);
        if (e->task.userId != userId) {
            err = "Task " + taskId + " belongs to another user";
            return false;
        }
    }
    if (cancelTask(taskId, userId) == CancelResult::Accepted)
        qCInfo(ofOrch) << "running task cancelled before delete"
                       << "taskId=" << qs(taskId);
    {
        std::lock_guard<std::mutex> lk(registryMutex_);
        tasks_.erase(taskId);
    }
    {
        std::lock_guard<std::mutex> lk(e->mtx);
        e->removed = true;
    }
    if (store_ && !store_->deleteTask(taskId, err)) {
        qCWarning(ofStore) << "deleting task failed" << "taskId=" << qs(taskId)
                           << "error=" << qs(err);
        return false;
    }
    qCInfo(ofOrch) << "task deleted" << "taskId=" << qs(taskId);
    return true;
}

int TaskOrchestrator::purgeFinishedOlderThan(int days) {
    if (days < 0)
        days = 0;
    const std::int64_t cutoff =
        currentTimeMs() - static_cast<std::int64_t>(days) * 24 * 3600 * 1000;
    int removed = 0;
    {
        std::lock_guard<std::mutex> lk(registryMutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            bool drop = false;
            {
                std::lock_guard<std::mutex> tl(it->second->mtx);
                const Task &t = it->second->task;
                drop = isTerminal(t.status) && t.endedAtMs > 0 &&
                       t.endedAtMs < cutoff;
            }
            if (drop) {
                it = tasks_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (store_) {
        int stored = 0;
        std::string err;
        if (!store_->purgeFinishedBefore(cutoff, stored, err))
            qCWarning(ofStore) << "purge failed" << "error=" << qs(err);
        else
            qCInfo(ofStore) << "purged finished tasks" << "rows=" << stored;
    }
    qCInfo(ofOrch) << "purged finished tasks" << "days=" << days
                   << "removed=" << removed;
    return removed;
}

bool TaskOrchestrator::waitUntilFinished(const std::string &taskId,
                                         int timeoutMs) const {
    auto e = findEntry(taskId);
    if (!e)
        return false;
    std::unique_lock<std::mutex> lk(e->mtx);
    return e->cv.wait_for(lk, std::chrono::milliseconds(timeoutMs),
                          [&] { return isTerminal(e->task.status); });
}

void TaskOrchestrator::emitEvents(const Events &ev) {
    if (shuttingDown_ || ev.taskId.empty())
        return;
    const QString id = qs(ev.taskId);
    if (ev.started)
        emit taskStarted(id, ev.total, ev.concurrency);
    for (const auto &sub : ev.subTasks) {
        emit subTaskUpdated(id, qs(sub.id),
                            QString::fromLatin1(subTaskStatusName(sub.status)),
                            sub.progress, qs(sub.message),
                            sub.exitCode ? QVariant(*sub.exitCode) : QVariant());
    }
    if (ev.overall)
        emit overallUpdated(id, QString::fromLatin1(taskStatusName(ev.status)),
                            ev.progress, ev.completed, ev.failed, ev.cancelled,
                            ev.total);
    if (ev.finished)
        emit taskFinished(id, QString::fromLatin1(taskStatusName(ev.status)));
}
