// Executes one SubTask against live sessions: a batch command on one target,
// or one source item pushed from the source host to one target.
#pragma once
#include "CancelToken.hpp"
#include "CredentialResolver.hpp"
#include "RemoteSession.hpp"
#include "TaskTypes.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace openfleet {

// Where the runner reports while it works. All callbacks are optional and
// are invoked on the worker thread.
struct SubTaskReporter {
    std::function<void(SubTaskStatus, int progress, const std::string &message)>
        status;
    std::function<void(const std::string &chunk, bool isStderr)> output;
    std::function<void(TransferMethod)> method;
};

// Final state of a SubTask run; status is Completed, Failed or Cancelled.
struct SubTaskOutcome {
    SubTaskStatus status = SubTaskStatus::Failed;
    int progress = 0;
    std::optional<int> exitCode;
    std::string output; // stdout and stderr in arrival order, capped
    std::string message;
    std::optional<TransferMethod> methodUsed;
};

struct RunnerOptions {
    SessionOptions sessionBase; // known_hosts policy and timeouts
    std::size_t maxOutputBytes = kMaxSubTaskOutputBytes;
    int transferTimeoutSeconds = kDefaultCommandTimeoutSeconds;
    int connectAttempts = 3;
    int retryBackoffMs = 500; // doubled on each attempt
};

class SubTaskRunner {
public:
    // prototype only creates sessions (newSessionLike); it is never connected.
    SubTaskRunner(const RemoteSession &prototype, CredentialResolver &resolver,
                  RunnerOptions options = {});

    SubTaskOutcome runBatch(const BatchRequest &req, std::int64_t connectionId,
                            CancelToken &cancel,
                            const SubTaskReporter &report) const;

    SubTaskOutcome runTransfer(const TransferRequest &req,
                               const SourceItem &item,
                               std::int64_t targetConnectionId,
                               CancelToken &cancel,
                               const SubTaskReporter &report) const;

    const RunnerOptions &options() const { return options_; }

private:
    const RemoteSession &prototype_;
    CredentialResolver &resolver_;
    RunnerOptions options_;

    // Connected session or nullptr with err; retries with backoff and gives
    // up early once the token is canceled.
    std::unique_ptr<RemoteSession> openSession(const ConnectionCredentials &creds,
                                               CancelToken &cancel,
                                               int attempts,
                                               std::string &err) const;

    // Sets path to what `command -v` printed, or leaves it empty when the
    // tool is missing. False with err when the probe itself could not run.
    bool probeCommand(RemoteSession &session, const std::string &tool,
                      CancelToken &cancel, std::optional<std::string> &path,
                      std::string &err) const;

    // Deletes the uploaded target key, through a fresh source session when
    // the worker's own session was interrupted.
    bool removeTempKey(RemoteSession &session, bool interrupted,
                       const ConnectionCredentials &source,
                       const std::string &path, std::string &err) const;
};

} // namespace openfleet
