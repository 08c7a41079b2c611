#include "openfleet/SubTaskRunner.hpp"
#include "openfleet/ShellCommand.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace openfleet {

namespace {

constexpr int kProbeTimeoutSeconds = 30;
constexpr int kMkdirTimeoutSeconds = 60;
constexpr std::uint32_t kTempKeyMode = 0600;
const char *const kTempKeyPrefix = "/tmp/openfleet_target_key_";

// Keeps stdout/stderr in arrival order up to a byte limit and forwards the
// kept part to the reporter.
class OutputCollector {
public:
    OutputCollector(std::size_t limit, const SubTaskReporter &report)
        : limit_(limit), report_(report) {}

    void add(const std::string &chunk, bool isStderr) {
        if (text_.size() >= limit_) {
            truncated_ = truncated_ || !chunk.empty();
            return;
        }
        const std::size_t room = limit_ - text_.size();
        const std::string kept = chunk.substr(0, room);
        if (kept.size() < chunk.size())
            truncated_ = true;
        text_ += kept;
        if (report_.output && !kept.empty())
            report_.output(kept, isStderr);
    }

    std::string text() const {
        return truncated_ ? text_ + "\n[output truncated]" : text_;
    }

private:
    std::size_t limit_;
    const SubTaskReporter &report_;
    std::string text_;
    bool truncated_ = false;
};

SubTaskOutcome failedOutcome(const std::string &message, int progress = 0) {
    SubTaskOutcome o;
    o.status = SubTaskStatus::Failed;
    o.progress = progress;
    o.message = message;
    return o;
}

SubTaskOutcome cancelledOutcome(const std::string &message = "Canceled") {
    SubTaskOutcome o;
    o.status = SubTaskStatus::Cancelled;
    o.message = message;
    return o;
}

std::string trimmed(const std::string &s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

void sleepUnlessCanceled(int ms, const CancelToken &cancel) {
    const auto until =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (!cancel.isCanceled() && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
}

std::string credentialError(const char *role, std::int64_t id,
                            ResolveStatus status, const std::string &err) {
    std::string msg = std::string(role) + " connection " + std::to_string(id) +
                      ": " + resolveStatusName(status);
    if (!err.empty())
        msg += " (" + err + ")";
    return msg;
}

} // namespace

SubTaskRunner::SubTaskRunner(const RemoteSession &prototype,
                             CredentialResolver &resolver,
                             RunnerOptions options)
    : prototype_(prototype), resolver_(resolver), options_(std::move(options)) {
    if (options_.connectAttempts < 1)
        options_.connectAttempts = 1;
}

std::unique_ptr<RemoteSession>
SubTaskRunner::openSession(const ConnectionCredentials &creds,
                           CancelToken &cancel, int attempts,
                           std::string &err) const {
    const SessionOptions opt = sessionOptionsFor(creds, options_.sessionBase);
    std::string lastErr;
    for (int i = 0; i < attempts; ++i) {
        if (cancel.isCanceled()) {
            err = "Canceled";
            return nullptr;
        }
        std::unique_ptr<RemoteSession> session = prototype_.newSessionLike();
        bool ok = false;
        {
            CancelRegistration reg(cancel,
                                   [s = session.get()] { s->interrupt(); });
            ok = session->connect(opt, lastErr);
        }
        if (ok)
            return session;
        if (i + 1 < attempts)
            sleepUnlessCanceled((1 << i) * options_.retryBackoffMs, cancel);
    }
    err = lastErr.empty() ? "Could not connect to " + creds.host : lastErr;
    return nullptr;
}

bool SubTaskRunner::removeTempKey(RemoteSession &session, bool interrupted,
                                  const ConnectionCredentials &source,
                                  const std::string &path,
                                  std::string &err) const {
    if (!interrupted && session.isConnected() && session.removeFile(path, err))
        return true;
    // The worker session was interrupted; use a short-lived one.
    auto fresh = prototype_.newSessionLike();
    if (!fresh->connect(sessionOptionsFor(source, options_.sessionBase), err))
        return false;
    const bool removed = fresh->removeFile(path, err);
    fresh->disconnect();
    return removed;
}

bool SubTaskRunner::probeCommand(RemoteSession &session,
                                 const std::string &tool, CancelToken &cancel,
                                 std::optional<std::string> &path,
                                 std::string &err) const {
    path.reset();
    ExecResult res;
    std::string execErr;
    const bool ok = session.exec(
        commandProbeLine(tool), res, execErr, {},
        [&cancel] { return cancel.isCanceled(); }, kProbeTimeoutSeconds);
    if (!ok || res.canceled || res.timed_out) {
        if (res.canceled || cancel.isCanceled())
            err = "Canceled";
        else if (res.timed_out)
            err = "Probe for " + tool + " timed out";
        else
            err = "Probe for " + tool + " failed: " + execErr;
        return false;
    }
    if (res.exit_code != 0)
        return true;
    std::string found = res.stdout_text;
    const auto nl = found.find('\n');
    if (nl != std::string::npos)
        found.resize(nl);
    found = trimmed(found);
    if (!found.empty())
        path = found;
    return true;
}

SubTaskOutcome SubTaskRunner::runBatch(const BatchRequest &req,
                                       std::int64_t connectionId,
                                       CancelToken &cancel,
                                       const SubTaskReporter &report) const {
    auto status = [&](SubTaskStatus s, int p, const std::string &m) {
        if (report.status)
            report.status(s, p, m);
    };

    status(SubTaskStatus::Connecting, 0, "Connecting");
    ConnectionCredentials creds;
    std::string err;
    const ResolveStatus rs = resolver_.resolve(connectionId, creds, err);
    if (rs != ResolveStatus::Ok)
        return failedOutcome(credentialError("Target", connectionId, rs, err));

    auto session =
        openSession(creds, cancel, options_.connectAttempts, err);
    if (!session) {
        if (cancel.isCanceled())
            return cancelledOutcome();
        return failedOutcome("Connection to " + creds.host + " failed: " + err);
    }
    CancelRegistration reg(cancel, [s = session.get()] { s->interrupt(); });

    status(SubTaskStatus::Running, 10, "Running");
    OutputCollector collect(options_.maxOutputBytes, report);
    ExecResult res;
    const bool ok = session->exec(
        buildBatchCommand(req), res, err,
        [&collect](const std::string &chunk, bool isStderr) {
            collect.add(chunk, isStderr);
        },
        [&cancel] { return cancel.isCanceled(); }, req.timeoutSeconds);

    SubTaskOutcome out;
    out.output = collect.text();
    if (cancel.isCanceled() || res.canceled) {
        out.status = SubTaskStatus::Cancelled;
        out.message = "Canceled";
        return out;
    }
    if (!ok) {
        out.status = SubTaskStatus::Failed;
        out.message = err;
        return out;
    }
    if (res.timed_out) {
        out.status = SubTaskStatus::Failed;
        out.message =
            "timed out after " + std::to_string(req.timeoutSeconds) + " s";
        return out;
    }

    session->disconnect();
    out.progress = 100;
    out.exitCode = res.exit_code;
    if (res.exit_code == 0) {
        out.status = SubTaskStatus::Completed;
        out.message = "Command completed";
    } else {
        out.status = SubTaskStatus::Failed;
        out.message = res.exit_signal.empty()
                          ? "Command exited with code " +
                                std::to_string(res.exit_code)
                          : "Command terminated by signal " + res.exit_signal;
    }
    return out;
}

SubTaskOutcome SubTaskRunner::runTransfer(const TransferRequest &req,
                                          const SourceItem &item,
                                          std::int64_t targetConnectionId,
                                          CancelToken &cancel,
                                          const SubTaskReporter &report) const {
    auto status = [&](SubTaskStatus s, int p, const std::string &m) {
        if (report.status)
            report.status(s, p, m);
    };
    auto shouldCancel = [&cancel] { return cancel.isCanceled(); };

    status(SubTaskStatus::Connecting, 0, "Connecting to source");
    ConnectionCredentials target;
    ConnectionCredentials source;
    std::string err;
    ResolveStatus rs = resolver_.resolve(targetConnectionId, target, err);
    if (rs != ResolveStatus::Ok)
        return failedOutcome(
            credentialError("Target", targetConnectionId, rs, err));
    rs = resolver_.resolve(req.sourceConnectionId, source, err);
    if (rs != ResolveStatus::Ok)
        return failedOutcome(
            credentialError("Source", req.sourceConnectionId, rs, err));

    auto src = openSession(source, cancel, options_.connectAttempts, err);
    if (!src) {
        if (cancel.isCanceled())
            return cancelledOutcome();
        return failedOutcome("Connection to source " + source.host +
                             " failed: " + err);
    }
    std::atomic<bool> srcInterrupted{false};
    CancelRegistration srcReg(cancel, [&srcInterrupted, s = src.get()] {
        srcInterrupted.store(true);
        s->interrupt();
    });

    status(SubTaskStatus::Transferring, 0,
           "Initializing transfer of " + item.name);
    std::optional<std::string> sshpassPath;
    std::optional<std::string> rsyncOnSource;
    std::optional<std::string> scpOnSource;
    if (!probeCommand(*src, "sshpass", cancel, sshpassPath, err) ||
        !probeCommand(*src, "rsync", cancel, rsyncOnSource, err) ||
        !probeCommand(*src, "scp", cancel, scpOnSource, err)) {
        if (cancel.isCanceled())
            return cancelledOutcome();
        return failedOutcome("Source host " + source.host + ": " + err);
    }
    if (cancel.isCanceled())
        return cancelledOutcome();

    SubTaskOutcome out;
    TransferMethod method = TransferMethod::Scp;
    std::string executable;
    {
        auto tgt = openSession(target, cancel, options_.connectAttempts, err);
        if (!tgt) {
            if (cancel.isCanceled())
                return cancelledOutcome();
            return failedOutcome("Connection to target " + target.host +
                                 " failed: " + err);
        }
        CancelRegistration tgtReg(cancel,
                                  [t = tgt.get()] { t->interrupt(); });

        auto probeTargetRsync = [&](bool &present) {
            std::optional<std::string> found;
            const bool ok = probeCommand(*tgt, "rsync", cancel, found, err);
            present = ok && found.has_value();
            return ok;
        };
        auto probeFailed = [&] {
            if (cancel.isCanceled())
                return cancelledOutcome();
            return failedOutcome("Target host " + target.host + ": " + err);
        };

        bool chosen = false;
        bool rsyncOnTarget = false;
        switch (req.transferMethod) {
        case TransferMethod::Auto:
            if (rsyncOnSource && !probeTargetRsync(rsyncOnTarget))
                return probeFailed();
            if (rsyncOnSource && rsyncOnTarget) {
                method = TransferMethod::Rsync;
                executable = *rsyncOnSource;
                chosen = true;
            } else if (scpOnSource) {
                method = TransferMethod::Scp;
                executable = *scpOnSource;
                chosen = true;
            } else if (!cancel.isCanceled()) {
                return failedOutcome(
                    "Neither rsync nor scp is available on the source host");
            }
            break;
        case TransferMethod::Rsync:
            if (!rsyncOnSource)
                return failedOutcome(
                    "rsync is not available on the source host");
            if (!probeTargetRsync(rsyncOnTarget))
                return probeFailed();
            if (!rsyncOnTarget)
                return failedOutcome(
                    "rsync is not available on the target host");
            method = TransferMethod::Rsync;
            executable = *rsyncOnSource;
            chosen = true;
            break;
        case TransferMethod::Scp:
            if (!scpOnSource)
                return failedOutcome("scp is not available on the source host");
            method = TransferMethod::Scp;
            executable = *scpOnSource;
            chosen = true;
            break;
        }
        if (!chosen || cancel.isCanceled())
            return cancelledOutcome();

        out.methodUsed = method;
        if (report.method)
            report.method(method);
        status(SubTaskStatus::Transferring, 5,
               std::string("Using ") + transferMethodName(method));

        ExecResult mk;
        const bool ok = tgt->exec(mkdirLine(req.remoteTargetPath), mk, err, {},
                                  shouldCancel, kMkdirTimeoutSeconds);
        if (cancel.isCanceled() || mk.canceled) {
            auto c = cancelledOutcome();
            c.methodUsed = method;
            return c;
        }
        if (!ok || mk.exit_code != 0) {
            auto f = failedOutcome(
                "Failed to create target directory " + req.remoteTargetPath +
                " on " + target.host + ": " +
                (ok ? "exit code " + std::to_string(mk.exit_code) + " " +
                          trimmed(mk.stderr_text)
                    : err));
            f.methodUsed = method;
            return f;
        }
        tgt->disconnect();
    }
    status(SubTaskStatus::Transferring, 8, "Target directory ready");

    TransferCommandOptions cmd;
    cmd.targetUserAndHost = target.username + "@" + target.host;
    cmd.port = target.port;

    std::string tempKeyPath;
    SubTaskOutcome result = [&]() -> SubTaskOutcome {
        auto fail = [&](const std::string &message) {
            auto f = failedOutcome(message, 8);
            f.methodUsed = method;
            return f;
        };

        if (target.auth_method == AuthMethod::Key) {
            if (!target.private_key.has_value() || target.private_key->empty())
                return fail("Target connection " + target.name +
                            " is key-based but has no private key");
            if (target.passphrase.has_value() && !sshpassPath)
                return fail("Target key has a passphrase but sshpass is not "
                            "available on the source host");
            const std::string keyPath = kTempKeyPrefix + randomHex(6);
            if (!src->writeFile(keyPath, *target.private_key, kTempKeyMode, err)) {
                if (cancel.isCanceled())
                    return cancelledOutcome();
                return fail("Could not upload the target key to the source: " +
                            err);
            }
            tempKeyPath = keyPath;
            cmd.identityFile = keyPath;
            if (target.passphrase.has_value()) {
                cmd.sshpassPrefix = escapeShellArg(*sshpassPath) +
                                    " -P passphrase -p " +
                                    escapeShellArg(*target.passphrase);
            }
        } else if (target.password.has_value()) {
            if (!sshpassPath)
                return fail("Target uses password authentication but sshpass is "
                            "not available on the source host");
            cmd.sshpassPrefix =
                escapeShellArg(*sshpassPath) + " -p " +
                escapeShellArg(*target.password);
        }
        if (cancel.isCanceled())
            return cancelledOutcome();

        OutputCollector collect(options_.maxOutputBytes, report);
        const bool isDir = item.type == SourceItemType::Directory;
        for (;;) {
            status(SubTaskStatus::Transferring, 10,
                   std::string("Executing ") + transferMethodName(method));
            bool scpReported = false;
            const TransferMethod running = method;
            ExecResult res;
            const bool ok = src->exec(
                buildTransferCommand(item.path, isDir, req.remoteTargetPath,
                                     executable, method, cmd),
                res, err,
                [&](const std::string &chunk, bool isStderr) {
                    collect.add(chunk, isStderr);
                    if (isStderr)
                        return;
                    if (running == TransferMethod::Rsync) {
                        const int pct = parseRsyncPercent(chunk);
                        if (pct >= 0)
                            status(SubTaskStatus::Transferring, pct, "");
                    } else if (!scpReported) {
                        scpReported = true;
                        status(SubTaskStatus::Transferring, 50, "scp in progress");
                    }
                },
                shouldCancel, options_.transferTimeoutSeconds,
                cmd.sshpassPrefix.has_value());

            out.output = collect.text();
            out.methodUsed = method;
            if (cancel.isCanceled() || res.canceled) {
                out.status = SubTaskStatus::Cancelled;
                out.message = "Canceled";
                return out;
            }
            if (!ok) {
                out.status = SubTaskStatus::Failed;
                out.message = err;
                return out;
            }
            if (res.timed_out) {
                out.status = SubTaskStatus::Failed;
                out.message = std::string(transferMethodName(method)) +
                              " timed out after " +
                              std::to_string(options_.transferTimeoutSeconds) +
                              " s";
                return out;
            }
            if (res.exit_code == 0) {
                out.status = SubTaskStatus::Completed;
                out.progress = 100;
                out.exitCode = 0;
                out.message = std::string(transferMethodName(method)) +
                              " completed: " + item.name;
                return out;
            }
            if (req.transferMethod == TransferMethod::Auto &&
                method == TransferMethod::Rsync && scpOnSource &&
                isRsyncMissingSignature(res.exit_code, res.stderr_text)) {
                method = TransferMethod::Scp;
                executable = *scpOnSource;
                if (report.method)
                    report.method(method);
                status(SubTaskStatus::Transferring, 10,
                       "rsync not found, falling back to scp");
                continue;
            }
            out.status = SubTaskStatus::Failed;
            out.exitCode = res.exit_code;
            const std::string stderrText = trimmed(res.stderr_text);
            out.message = std::string(transferMethodName(method)) +
                          " failed with exit code " +
                          std::to_string(res.exit_code) +
                          (stderrText.empty() ? std::string() : ": " + stderrText);
            return out;
        }
    }();

    if (!tempKeyPath.empty()) {
        std::string rmErr;
        if (!removeTempKey(*src, srcInterrupted.load(), source, tempKeyPath,
                           rmErr))
            result.message += " (temporary key " + tempKeyPath +
                              " was not removed: " + rmErr + ")";
    }
    return result;
}

} // namespace openfleet
