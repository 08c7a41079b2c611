// Task registry and dispatcher: expands requests into SubTasks, runs them on
// worker threads under each Task's concurrency limit, aggregates outcomes and
// reports every transition through Qt signals.
#pragma once
#include "TaskStore.hpp"
#include "openfleet/CancelToken.hpp"
#include "openfleet/CredentialResolver.hpp"
#include "openfleet/SubTaskRunner.hpp"
#include "openfleet/TaskTypes.hpp"
#include "openfleet/TransferPolicy.hpp"
#include <QObject>
#include <QString>
#include <QVariant>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class TaskOrchestrator : public QObject {
    Q_OBJECT
public:
    enum class CancelResult { Accepted, NotFound, Forbidden, AlreadyFinished };

    struct Options {
        int cancelGraceMs = 5000; // then Cancelling SubTasks are forced to Cancelled
    };

    // runner and resolver must outlive the orchestrator.
    TaskOrchestrator(const openfleet::SubTaskRunner &runner,
                     openfleet::CredentialResolver &resolver, Options options,
                     QObject *parent = nullptr);
    ~TaskOrchestrator();

    // Optional collaborators (not owned). Set them before submitting.
    void setPolicyRegistry(const openfleet::PolicyRegistry *registry) {
        policies_ = registry;
    }
    void setTaskStore(TaskStore *store) { store_ = store; }

    // Loads the stored history. Tasks that were still running when the
    // process stopped are marked failed.
    bool restore(std::string &err);

    // Validates, expands and starts dispatch. Returns a snapshot taken right
    // after dispatch began, or nullopt with err.
    std::optional<openfleet::Task> submitBatch(const openfleet::BatchRequest &req,
                                               const std::string &userId,
                                               std::string &err);
    // Also rejects the request when any (item, target) pair is denied by the
    // attached policy registry; no Task is created then.
    std::optional<openfleet::Task>
    submitTransfer(const openfleet::TransferRequest &req,
                   const std::string &userId, std::string &err);

    CancelResult cancelTask(const std::string &taskId, const std::string &userId);
    bool cancel(const std::string &taskId, const std::string &userId) {
        return cancelTask(taskId, userId) == CancelResult::Accepted;
    }

    // External status report for a SubTask. Ignored for unknown ids and for
    // SubTasks that are already terminal. An empty message keeps the old one.
    void updateSubTaskStatus(const std::string &taskId,
                             const std::string &subTaskId,
                             openfleet::SubTaskStatus status,
                             std::optional<int> progress = std::nullopt,
                             const std::string &message = {});

    std::optional<openfleet::Task> getDetails(const std::string &taskId,
                                              const std::string &userId) const;
    // Newest first.
    std::vector<openfleet::Task> listForUser(const std::string &userId) const;

    // Owner only; a running Task is cancelled first.
    bool deleteTask(const std::string &taskId, const std::string &userId,
                    std::string &err);
    // Removes terminal Tasks that ended more than days ago. Returns how many
    // left the registry.
    int purgeFinishedOlderThan(int days);

    // True once the Task is terminal; false on timeout or unknown id.
    bool waitUntilFinished(const std::string &taskId, int timeoutMs) const;

    std::size_t taskCount() const;

signals:
    void taskStarted(const QString &taskId, int total, int concurrency);
    // exitCode is null until the remote side reported one.
    void subTaskUpdated(const QString &taskId, const QString &subTaskId,
                        const QString &status, int progress,
                        const QString &message, const QVariant &exitCode);
    void subTaskOutput(const QString &taskId, const QString &subTaskId,
                       const QString &chunk, bool isStderr);
    void overallUpdated(const QString &taskId, const QString &status,
                        int overallProgress, int completed, int failed,
                        int cancelled, int total);
    void taskFinished(const QString &taskId, const QString &status);

private:
    struct TaskEntry {
        mutable std::mutex mtx;
        mutable std::condition_variable cv;
        openfleet::Task task;
        // In-flight SubTasks by id.
        std::map<std::string, std::shared_ptr<openfleet::CancelToken>> tokens;
        std::size_t nextIndex = 0;
        int active = 0;
        bool removed = false; // deleted while workers were still running
    };

    // Collected under a Task lock, emitted after it is released.
    struct Events {
        std::string taskId;
        bool started = false;
        int concurrency = 0;
        std::vector<openfleet::SubTask> subTasks;
        bool overall = false;
        openfleet::TaskStatus status = openfleet::TaskStatus::Queued;
        int progress = 0;
        int completed = 0;
        int failed = 0;
        int cancelled = 0;
        int total = 0;
        bool finished = false;
    };

    struct WorkerThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    const openfleet::SubTaskRunner &runner_;
    openfleet::CredentialResolver &resolver_;
    Options options_;
    const openfleet::PolicyRegistry *policies_ = nullptr;
    TaskStore *store_ = nullptr;

    mutable std::mutex registryMutex_;
    std::map<std::string, std::shared_ptr<TaskEntry>> tasks_;

    std::mutex workersMutex_;
    std::list<WorkerThread> workers_;

    std::atomic<bool> shuttingDown_{false};
    std::mutex shutdownMtx_;
    std::condition_variable shutdownCv_;

    std::shared_ptr<TaskEntry> findEntry(const std::string &taskId) const;
    std::optional<openfleet::Task> start(openfleet::Task task);

    // All of these expect e.mtx to be held.
    void dispatch(const std::shared_ptr<TaskEntry> &e, Events &ev);
    // False when the update was dropped (terminal or cancelling SubTask).
    bool applyTransition(openfleet::SubTask &sub, openfleet::SubTaskStatus status,
                         std::optional<int> progress, const std::string &message,
                         bool &statusChanged, Events &ev);
    void afterChange(TaskEntry &e, bool save, Events &ev);
    void persist(const TaskEntry &e);

    void runSubTask(std::shared_ptr<TaskEntry> e, std::string subTaskId,
                    std::shared_ptr<openfleet::CancelToken> token);
    void finishSubTask(const std::shared_ptr<TaskEntry> &e,
                       const std::string &subTaskId,
                       const openfleet::SubTaskOutcome &outcome);
    void forceCancel(const std::shared_ptr<TaskEntry> &e);

    void spawn(std::function<void()> fn);
    void emitEvents(const Events &ev);
    void shutdown();
};
