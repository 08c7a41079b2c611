// Core unit tests without external framework (run via CTest).
#include "openfleet/CancelToken.hpp"
#include "openfleet/MockRemoteSession.hpp"
#include "openfleet/RuntimeLogging.hpp"
#include "openfleet/ShellCommand.hpp"
#include "openfleet/SubTaskRunner.hpp"
#include "openfleet/TaskTypes.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

// Connection table for the runners.
class MapResolver : public openfleet::CredentialResolver {
public:
    void add(openfleet::ConnectionCredentials c) { conns_[c.id] = std::move(c); }

    openfleet::ResolveStatus resolve(std::int64_t id,
                                     openfleet::ConnectionCredentials &out,
                                     std::string &err) override {
        auto it = conns_.find(id);
        if (it == conns_.end()) {
            err = "no connection " + std::to_string(id);
            return openfleet::ResolveStatus::UnknownConnection;
        }
        out = it->second;
        return openfleet::ResolveStatus::Ok;
    }

private:
    std::map<std::int64_t, openfleet::ConnectionCredentials> conns_;
};

openfleet::ConnectionCredentials passwordConn(std::int64_t id,
                                              const std::string &host) {
    openfleet::ConnectionCredentials c;
    c.id = id;
    c.name = host;
    c.host = host;
    c.username = "deploy";
    c.password = "s3cret";
    return c;
}

openfleet::RunnerOptions fastOptions() {
    openfleet::RunnerOptions o;
    o.retryBackoffMs = 1;
    return o;
}

openfleet::MockExecRule probeFound(const std::string &tool) {
    openfleet::MockExecRule r;
    r.match = "command -v '" + tool + "'";
    r.stdout_text = "/usr/bin/" + tool + "\n";
    return r;
}

openfleet::SessionOptions validOptions() {
    openfleet::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

// Records everything a runner reports.
struct Recorder {
    std::vector<openfleet::SubTaskStatus> statuses;
    std::vector<int> progress;
    std::vector<std::string> messages;
    std::string output;
    std::vector<openfleet::TransferMethod> methods;

    openfleet::SubTaskReporter reporter() {
        openfleet::SubTaskReporter r;
        r.status = [this](openfleet::SubTaskStatus s, int p,
                          const std::string &m) {
            statuses.push_back(s);
            progress.push_back(p);
            messages.push_back(m);
        };
        r.output = [this](const std::string &chunk, bool) { output += chunk; };
        r.method = [this](openfleet::TransferMethod m) { methods.push_back(m); };
        return r;
    }
};

void test_session_defaults(TestContext &t) {
    openfleet::SessionOptions o;
    t.check(o.port == 22, "default port should be 22");
    t.check(o.known_hosts_policy == openfleet::KnownHostsPolicy::Strict,
            "default known_hosts_policy should be Strict");
    t.check(!o.password.has_value(), "password should be empty by default");
    openfleet::ExecResult r;
    t.check(r.exit_code == -1, "exit_code should be -1 until reported");
}

void test_mock_connect_validation(TestContext &t) {
    openfleet::MockRemoteSession s;
    std::string err;
    openfleet::SessionOptions opt;
    opt.username = "user";
    t.check(!s.connect(opt, err), "connect should fail when host is empty");

    opt.host = "example.test";
    opt.username.clear();
    err.clear();
    t.check(!s.connect(opt, err), "connect should fail when username is empty");

    err.clear();
    t.check(s.connect(validOptions(), err),
            "connect should succeed with host+username");
    t.check(s.isConnected(), "session should report connected");
    s.disconnect();
    t.check(!s.isConnected(), "disconnect should flip isConnected to false");

    openfleet::ExecResult res;
    t.check(!s.exec("uptime", res, err), "exec should fail after disconnect");
}

void test_mock_refuse_and_rules(TestContext &t) {
    auto state = std::make_shared<openfleet::MockRemoteState>();
    openfleet::MockHostScript refused;
    refused.refuse_connect = true;
    state->setHost("down.test", refused);
    openfleet::MockExecRule rule;
    rule.match = "uptime";
    rule.exit_code = 3;
    rule.chunks = {"a", "b"};
    rule.stdout_text = "c";
    rule.stderr_text = "warn";
    state->addRule("example.test", rule);

    openfleet::MockRemoteSession s(state);
    std::string err;
    auto down = validOptions();
    down.host = "down.test";
    t.check(!s.connect(down, err), "refused host should not connect");
    t.checkContains(err, "down.test", "refusal should name the host");
    t.check(state->connectCount("down.test") == 1, "attempt should be counted");

    auto other = s.newSessionLike();
    err.clear();
    t.check(other->connect(validOptions(), err), "second session should connect");
    openfleet::ExecResult res;
    std::string streamed;
    t.check(other->exec("uptime -p", res, err,
                        [&streamed](const std::string &c, bool) { streamed += c; }),
            "matched exec should start");
    t.check(res.exit_code == 3, "rule exit code should be reported");
    t.check(res.stdout_text == "abc", "chunks then stdout_text form stdout");
    t.check(res.stderr_text == "warn", "stderr should be reported");
    t.check(streamed == "abcwarn", "output callback should see every chunk");

    t.check(other->exec("hostname", res, err), "unmatched exec should succeed");
    t.check(res.exit_code == 0 && res.stdout_text.empty(),
            "unmatched command exits 0 with no output");
    t.check(state->commandsOn("example.test").size() == 2,
            "executed commands should be recorded per host");
}

void test_mock_files(TestContext &t) {
    auto state = std::make_shared<openfleet::MockRemoteState>();
    openfleet::MockRemoteSession s(state);
    std::string err;
    t.check(!s.writeFile("/tmp/k", "x", 0600, err),
            "writeFile should require a connection");
    t.check(s.connect(validOptions(), err), "connect should succeed");
    t.check(s.writeFile("/tmp/k", "KEY", 0600, err), "writeFile should succeed");
    auto files = state->files();
    t.check(files.count("example.test:/tmp/k") == 1, "file should be recorded");
    if (files.count("example.test:/tmp/k"))
        t.check(files["example.test:/tmp/k"].mode == 0600,
                "file mode should be kept");
    t.check(s.removeFile("/tmp/k", err), "removeFile should succeed");
    t.check(!s.removeFile("/tmp/k", err), "second removeFile should fail");
    t.check(state->removedFiles().size() == 1, "removal should be recorded");
}

void test_mock_block_connect_interrupt(TestContext &t) {
    auto state = std::make_shared<openfleet::MockRemoteState>();
    openfleet::MockHostScript blocked;
    blocked.block_connect = true;
    state->setHost("example.test", blocked);
    openfleet::MockRemoteSession s(state);

    std::thread breaker([&s] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        s.interrupt();
    });
    std::string err;
    const bool ok = s.connect(validOptions(), err);
    breaker.join();
    t.check(!ok, "interrupted connect should fail");
    t.checkContains(err, "interrupted", "error should mention the interruption");
}

void test_cancel_token(TestContext &t) {
    openfleet::CancelToken token;
    int calls = 0;
    {
        openfleet::CancelRegistration reg(token, [&calls] { ++calls; });
        token.cancel();
        token.cancel();
    }
    t.check(token.isCanceled(), "token should stay canceled");
    t.check(calls == 1, "callback should run exactly once");
    const int id = token.onCancel([&calls] { ++calls; });
    t.check(id == 0 && calls == 2,
            "callback registered after cancel should run immediately");
}

void test_escape_shell_arg(TestContext &t) {
    t.check(openfleet::escapeShellArg("plain") == "'plain'",
            "plain text should be single-quoted");
    t.check(openfleet::escapeShellArg("it's") == "'it'\\''s'",
            "embedded quote should be closed, escaped and reopened");
    t.check(openfleet::escapeShellArg("") == "''", "empty arg should be ''");
    t.check(openfleet::escapeShellArg("$(rm -rf /)") == "'$(rm -rf /)'",
            "substitutions should stay literal");
}

void test_env_names(TestContext &t) {
    t.check(openfleet::isValidEnvName("PATH"), "PATH is valid");
    t.check(openfleet::isValidEnvName("_x1"), "_x1 is valid");
    t.check(!openfleet::isValidEnvName("1X"), "leading digit is invalid");
    t.check(!openfleet::isValidEnvName("A-B"), "dash is invalid");
    t.check(!openfleet::isValidEnvName(""), "empty name is invalid");
}

void test_batch_command_line(TestContext &t) {
    openfleet::BatchRequest req;
    req.command = "uptime";
    t.check(openfleet::buildBatchCommand(req) == "uptime",
            "bare command should pass through");

    req.env = {{"A", "1"}, {"B", "x y"}};
    req.sudo = true;
    req.workdir = std::string("/srv/app's");
    t.check(openfleet::buildBatchCommand(req) ==
                "cd '/srv/app'\\''s' && sudo -n env A='1' B='x y' uptime",
            "workdir wraps sudo which wraps env");
}

void test_transfer_command_lines(TestContext &t) {
    openfleet::TransferCommandOptions opts;
    opts.targetUserAndHost = "bob@h2";
    opts.port = 2222;
    opts.identityFile = std::string("/tmp/key");

    const std::string rsync = openfleet::buildTransferCommand(
        "/data/dir", true, "/srv/in", "/usr/bin/rsync",
        openfleet::TransferMethod::Rsync, opts);
    t.checkContains(rsync, "'/usr/bin/rsync' -avz --progress",
                    "rsync should run with progress");
    t.checkContains(rsync, "-p 2222", "rsync ssh should carry the port");
    t.checkContains(rsync, "-i '/tmp/key'", "rsync ssh should carry the key");
    t.checkContains(rsync, "'/data/dir/'",
                    "directory source should get a trailing slash");
    t.checkContains(rsync, "bob@h2:'/srv/in/'", "destination should be quoted");

    opts.sshpassPrefix = std::string("'/usr/bin/sshpass' -p 'pw'");
    const std::string scp = openfleet::buildTransferCommand(
        "/data/a b.txt", false, "/srv/in/", "/usr/bin/scp",
        openfleet::TransferMethod::Scp, opts);
    t.check(scp.rfind("'/usr/bin/sshpass' -p 'pw' '/usr/bin/scp'", 0) == 0,
            "sshpass should prefix the scp call");
    t.checkContains(scp, "-P 2222", "scp should use -P for the port");
    t.check(scp.find(" -r ") == std::string::npos, "file copy should not use -r");
    t.checkContains(scp, "'/data/a b.txt' bob@h2:'/srv/in/'",
                    "source and destination should be quoted");
}

void test_rsync_percent(TestContext &t) {
    t.check(openfleet::parseRsyncPercent("  1,024  45%  1.2MB/s") == 45,
            "percent should be parsed");
    t.check(openfleet::parseRsyncPercent("10%\r 57%\r") == 57,
            "last percent should win");
    t.check(openfleet::parseRsyncPercent("100%") == 100, "100% should parse");
    t.check(openfleet::parseRsyncPercent("sending incremental file list") == -1,
            "no percent should give -1");
}

void test_rsync_missing_signature(TestContext &t) {
    t.check(openfleet::isRsyncMissingSignature(127, ""), "127 is missing rsync");
    t.check(openfleet::isRsyncMissingSignature(
                12, "bash: rsync: command not found"),
            "12 with command not found is missing rsync");
    t.check(!openfleet::isRsyncMissingSignature(12, "connection unexpectedly closed"),
            "12 alone is a real failure");
    t.check(!openfleet::isRsyncMissingSignature(23, "command not found"),
            "other exit codes are real failures");
}

void test_format_bytes(TestContext &t) {
    t.check(openfleet::formatBytes(512) == "512 B", "bytes");
    t.check(openfleet::formatBytes(1536) == "1.5 KB", "kilobytes");
    t.check(openfleet::formatBytes(2 * 1024 * 1024) == "2.0 MB", "megabytes");
}

void test_redact_command(TestContext &t) {
    ::unsetenv("OPEN_FLEET_ENV");
    ::unsetenv("OPEN_FLEET_LOG_SENSITIVE");
    t.check(openfleet::redactCommand("'/usr/bin/sshpass' -p 'pw' rsync -avz a b") ==
                "'/usr/bin/sshpass' -p <redacted>",
            "password after -p is hidden");
    t.check(openfleet::redactCommand("sshpass -P passphrase -p 'k' scp a b") ==
                "sshpass -P <redacted>",
            "passphrase prompt form is hidden too");
    t.check(openfleet::redactCommand("uptime -p") == "uptime -p",
            "commands without sshpass are untouched");

    ::setenv("OPEN_FLEET_ENV", "dev", 1);
    ::setenv("OPEN_FLEET_LOG_SENSITIVE", " Yes ", 1);
    t.check(openfleet::sensitiveLoggingEnabled(), "dev plus flag enables it");
    t.check(openfleet::redactCommand("sshpass -p 'pw' x") == "sshpass -p 'pw' x",
            "sensitive logging keeps the full line");
    ::setenv("OPEN_FLEET_ENV", "production", 1);
    t.check(!openfleet::sensitiveLoggingEnabled(), "the flag alone is not enough");
    ::unsetenv("OPEN_FLEET_ENV");
    ::unsetenv("OPEN_FLEET_LOG_SENSITIVE");
    t.check(!openfleet::sensitiveLoggingEnabled(), "off outside dev");
}

void test_request_validation(TestContext &t) {
    openfleet::BatchRequest b;
    b.command = "uptime";
    b.connectionIds = {1};
    std::string err;
    t.check(openfleet::validateBatchRequest(b, err), "valid batch accepted");

    auto bad = b;
    bad.command = "   ";
    t.check(!openfleet::validateBatchRequest(bad, err), "blank command rejected");
    bad = b;
    bad.connectionIds.clear();
    t.check(!openfleet::validateBatchRequest(bad, err), "no targets rejected");
    bad = b;
    bad.connectionIds = {0};
    t.check(!openfleet::validateBatchRequest(bad, err), "id 0 rejected");
    bad = b;
    bad.concurrencyLimit = openfleet::kMaxConcurrencyLimit + 1;
    t.check(!openfleet::validateBatchRequest(bad, err), "concurrency over cap");
    bad = b;
    bad.env = {{"1BAD", "x"}};
    t.check(!openfleet::validateBatchRequest(bad, err), "bad env name rejected");
    t.checkContains(err, "1BAD", "error should name the variable");

    openfleet::TransferRequest tr;
    tr.sourceConnectionId = 1;
    tr.connectionIds = {2};
    tr.remoteTargetPath = "/srv";
    tr.sourceItems = {{"a.txt", "/data/a.txt", openfleet::SourceItemType::File, {}}};
    t.check(openfleet::validateTransferRequest(tr, err), "valid transfer accepted");
    auto badTr = tr;
    badTr.remoteTargetPath.clear();
    t.check(!openfleet::validateTransferRequest(badTr, err),
            "missing target path rejected");
    badTr = tr;
    badTr.sourceConnectionId = 0;
    t.check(!openfleet::validateTransferRequest(badTr, err),
            "missing source rejected");
}

openfleet::Task taskWith(std::vector<openfleet::SubTaskStatus> statuses) {
    openfleet::Task task;
    task.status = openfleet::TaskStatus::InProgress;
    for (auto s : statuses) {
        openfleet::SubTask sub;
        sub.status = s;
        sub.progress = s == openfleet::SubTaskStatus::Completed ? 100 : 0;
        task.subTasks.push_back(sub);
    }
    return task;
}

void test_aggregate(TestContext &t) {
    using S = openfleet::SubTaskStatus;
    auto all = taskWith({S::Completed, S::Completed});
    t.check(openfleet::refreshAggregate(all, 10), "status should change");
    t.check(all.status == openfleet::TaskStatus::Completed, "all completed");
    t.check(all.overallProgress == 100 && all.endedAtMs == 10,
            "progress 100 and end time set");

    auto mixed = taskWith({S::Completed, S::Failed});
    openfleet::refreshAggregate(mixed, 10);
    t.check(mixed.status == openfleet::TaskStatus::PartiallyCompleted,
            "completed + failed is partially completed");
    t.check(mixed.overallProgress == 50, "progress is the mean");

    auto pending = taskWith({S::Completed, S::Queued});
    t.check(!openfleet::refreshAggregate(pending, 10),
            "in-progress stays in-progress");
    t.check(pending.endedAtMs == 0, "no end time while pending");

    auto failed = taskWith({S::Failed, S::Cancelled});
    openfleet::refreshAggregate(failed, 10);
    t.check(failed.status == openfleet::TaskStatus::Failed,
            "no completion with a failure is failed");

    auto cancelled = taskWith({S::Cancelled});
    openfleet::refreshAggregate(cancelled, 10);
    t.check(cancelled.status == openfleet::TaskStatus::Cancelled,
            "only cancelled is cancelled");

    auto cancelling = taskWith({S::Completed, S::Cancelling});
    cancelling.status = openfleet::TaskStatus::Cancelling;
    openfleet::refreshAggregate(cancelling, 10);
    t.check(cancelling.status == openfleet::TaskStatus::Cancelling,
            "cancelling waits for in-flight sub tasks");
    cancelling.subTasks[1].status = S::Cancelled;
    openfleet::refreshAggregate(cancelling, 20);
    t.check(cancelling.status == openfleet::TaskStatus::Cancelled,
            "cancelling ends as cancelled");

    all.subTasks[0].status = S::Failed;
    t.check(!openfleet::refreshAggregate(all, 30), "terminal task is frozen");
    t.check(all.status == openfleet::TaskStatus::Completed,
            "terminal status never changes");
    t.check(openfleet::clampProgress(150) == 100 &&
                openfleet::clampProgress(-10) == 0,
            "progress is clamped to 0..100");
}

void test_enum_names(TestContext &t) {
    t.check(std::string(openfleet::taskStatusName(
                openfleet::TaskStatus::PartiallyCompleted)) ==
                "partially-completed",
            "task status name");
    t.check(openfleet::parseSubTaskStatus("transferring") ==
                openfleet::SubTaskStatus::Transferring,
            "sub task status parse");
    t.check(!openfleet::parseTransferMethod("ftp").has_value(),
            "unknown method should not parse");
}

void test_run_batch_success(TestContext &t) {
    auto state = std::make_shared<openfleet::MockRemoteState>();
    openfleet::MockExecRule rule;
    rule.match = "uptime";
    rule.stdout_text = "up 3 days\n";
    state->addRule("web1", rule);
    openfleet::MockRemoteSession proto(state);
    MapResolver resolver;
    resolver.add(passwordConn(1, "web1"));
    openfleet::SubTaskRunner runner(proto, resolver, fastOptions());

    openfleet::BatchRequest req;
    req.command = "uptime";
    req.connectionIds = {1};
    req.env = {{"LANG", "C"}};
    req.workdir = std::string("/srv");
    openfleet::CancelToken cancel;
    Recorder rec;
    const auto out = runner.runBatch(req, 1, cancel, rec.reporter());
    t.check(out.status == openfleet::SubTaskStatus::Completed,
            "batch should complete");
    t.check(out.exitCode == 0 && out.progress == 100, "exit 0 and progress 100");
    t.check(out.output == "up 3 days\n", "output should be captured");
    t.check(rec.output == "up 3 days\n", "output should be streamed");
    t.check(!rec.statuses.empty() &&
                rec.statuses.front() == openfleet::SubTaskStatus::Connecting,
            "first report should be connecting");
    const auto cmds = state->commandsOn("web1");
    t.check(cmds.size() == 1 && cmds[0] == "cd '/srv' && env LANG='C' uptime",
            "composed command should run on the target");
    t.check(state->connectedNow() == 0, "session should be closed afterwards");
}

void test_run_batch_failure_and_truncation(TestContext &t) {
    auto state = std::make_shared<openfleet::MockRemoteState>();
    openfleet::MockExecRule rule;
    rule.match = "false";
    rule.exit_code = 3;
    rule.stdout_text = "abcdefgh";
    state->addRule("web1", rule);
    openfleet::MockRemoteSession proto(state);
    MapResolver resolver;
    resolver.add(passwordConn(1, "web1"));
    auto opts = fastOptions();
    opts.maxOutputBytes = 4;
    openfleet::SubTaskRunner runner(proto, resolver, opts);

    openfleet::BatchRequest req;
    req.command = "false";
    openfleet::CancelToken cancel;
    const auto out = runner.runBatch(req, 1, cancel, {});
    t.check(out.status == openfleet::SubTaskStatus::Failed,
            "non-zero exit should fail");
    t.check(out.exitCode == 3, "exit code should be kept");
    t.checkContains(out.message, "exited with code 3", "message names the code");
    t.check(out.output == "abcd\n[output truncated]",
            "output should be capped and marked");
}

void test_run_batch_connect_and_resolve_errors(TestContext &t) {
    auto state = std::make_shared<openfleet::MockRemoteState>();
    openfleet::MockHostScript refused;
    refused.refuse_connect = true;
    state->setHost("down", refused);
    openfleet::MockRemoteSession proto(state);
    MapResolver resolver;
    resolver.add(passwordConn(1, "down"));
    openfleet::SubTaskRunner runner(proto, resolver, fastOptions());

    openfleet::BatchRequest req;
    req.command = "uptime";
    openfleet::CancelToken cancel;
    auto out = runner.runBatch(req, 1, cancel, {});
    t.check(out.status == openfleet::SubTaskStatus::Failed,
            "refused connection should fail");
    t.checkContains(out.message, "Connection to down failed",
                    "message should name the host");
    t.check(state->connectCount("down") == 3, "connect should be retried");

    out = runner.runBatch(req, 99, cancel, {});
    t.check(out.status == openfleet::SubTaskStatus::Failed,
            "unknown connection should fail");
    t.checkContains(out.message, "Target connection 99: unknown-connection",
                    "message should carry the resolve failure");
}

void test_run_batch_timeout(TestContext &t) {
    auto state = std::make_shared<openfleet::MockRemoteState>();
    openfleet::MockExecRule rule;
    rule.match = "sleep";
    rule.block_until_cancel = true;
    state->addRule("web1", rule);
    openfleet::MockRemoteSession proto(state);
    MapResolver resolver;
    resolver.add(passwordConn(1, "web1"));
    openfleet::SubTaskRunner runner(proto, resolver, fastOptions());

    openfleet::BatchRequest req;
    req.command = "sleep 600";
    req.timeoutSeconds = 1;
    openfleet::CancelToken cancel;
    const auto out = runner.runBatch(req, 1, cancel, {});
    t.check(out.status == openfleet::SubTaskStatus::Failed, "timeout fails");
    t.check(out.message == "timed out after 1 s", "timeout message");
    t.check(!out.exitCode.has_value(), "no exit code after a timeout");
}

void test_run_batch_cancel(TestContext &t) {
    auto state = std::make_shared<openfleet::MockRemoteState>();
    openfleet::MockExecRule rule;
    rule.match = "tail";
    rule.block_until_cancel = true;
    rule.chunks = {"line\n"};
    state->addRule("web1", rule);
    openfleet::MockRemoteSession proto(state);
    MapResolver resolver;
    resolver.add(passwordConn(1, "web1"));
    openfleet::SubTaskRunner runner(proto, resolver, fastOptions());

    openfleet::BatchRequest req;
    req.command = "tail -f /var/log/syslog";
    openfleet::CancelToken cancel;
    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel();
    });
    const auto out = runner.runBatch(req, 1, cancel, {});
    canceller.join();
    t.check(out.status == openfleet::SubTaskStatus::Cancelled,
            "cancel should end the command");
    t.check(out.output == "line\n", "output before the cancel should be kept");
}

// Source 1 (src) pushes to target 2 (dst).
struct TransferFixture {
    std::shared_ptr<openfleet::MockRemoteState> state =
        std::make_shared<openfleet::MockRemoteState>();
    openfleet::MockRemoteSession proto{state};
    MapResolver resolver;
    openfleet::TransferRequest req;

    TransferFixture() {
        resolver.add(passwordConn(1, "src"));
        resolver.add(passwordConn(2, "dst"));
        req.sourceConnectionId = 1;
        req.connectionIds = {2};
        req.remoteTargetPath = "/srv/in";
        req.sourceItems = {
            {"report.pdf", "/data/report.pdf", openfleet::SourceItemType::File, {}}};
    }
};

void test_transfer_rsync(TestContext &t) {
    TransferFixture f;
    f.state->addRule("src", probeFound("sshpass"));
    f.state->addRule("src", probeFound("rsync"));
    f.state->addRule("src", probeFound("scp"));
    f.state->addRule("dst", probeFound("rsync"));
    openfleet::MockExecRule copy;
    copy.match = "-avz --progress";
    copy.chunks = {"report.pdf\n", "  512  40%\r", " 1024 100%\n"};
    f.state->addRule("src", copy);
    openfleet::SubTaskRunner runner(f.proto, f.resolver, fastOptions());

    openfleet::CancelToken cancel;
    Recorder rec;
    const auto out =
        runner.runTransfer(f.req, f.req.sourceItems[0], 2, cancel, rec.reporter());
    t.check(out.status == openfleet::SubTaskStatus::Completed,
            "rsync transfer should complete");
    t.check(out.methodUsed == openfleet::TransferMethod::Rsync, "rsync used");
    t.check(rec.methods.size() == 1, "method reported once");
    bool saw40 = false;
    for (int p : rec.progress)
        saw40 = saw40 || p == 40;
    t.check(saw40, "rsync percentages should be reported");

    const auto dstCmds = f.state->commandsOn("dst");
    bool mkdir = false;
    for (const auto &c : dstCmds)
        mkdir = mkdir || c == "mkdir -p '/srv/in'";
    t.check(mkdir, "target directory should be created");

    bool pty = false;
    for (const auto &r : f.state->executed()) {
        if (r.command.find("-avz") != std::string::npos) {
            pty = r.pty;
            t.checkContains(r.command, "'/usr/bin/sshpass' -p 's3cret'",
                            "password target should go through sshpass");
            t.checkContains(r.command, "deploy@dst:'/srv/in/'",
                            "destination should be the target");
        }
    }
    t.check(pty, "sshpass needs a pty");
}

void test_transfer_auto_falls_back_to_scp(TestContext &t) {
    TransferFixture f;
    f.state->addRule("src", probeFound("sshpass"));
    f.state->addRule("src", probeFound("rsync"));
    f.state->addRule("src", probeFound("scp"));
    f.state->addRule("dst", probeFound("rsync"));
    openfleet::MockExecRule rsync;
    rsync.match = "-avz";
    rsync.exit_code = 127;
    rsync.stderr_text = "bash: rsync: command not found\n";
    f.state->addRule("src", rsync);
    openfleet::MockExecRule scp;
    scp.match = "'/usr/bin/scp' -o";
    f.state->addRule("src", scp);
    openfleet::SubTaskRunner runner(f.proto, f.resolver, fastOptions());

    openfleet::CancelToken cancel;
    Recorder rec;
    const auto out =
        runner.runTransfer(f.req, f.req.sourceItems[0], 2, cancel, rec.reporter());
    t.check(out.status == openfleet::SubTaskStatus::Completed,
            "fallback transfer should complete");
    t.check(out.methodUsed == openfleet::TransferMethod::Scp, "scp used last");
    t.check(rec.methods.size() == 2 &&
                rec.methods[0] == openfleet::TransferMethod::Rsync &&
                rec.methods[1] == openfleet::TransferMethod::Scp,
            "both methods should be reported in order");
}

void test_transfer_broken_probe_does_not_fall_back(TestContext &t) {
    TransferFixture f;
    f.state->addRule("src", probeFound("sshpass"));
    f.state->addRule("src", probeFound("rsync"));
    f.state->addRule("src", probeFound("scp"));
    openfleet::MockExecRule broken = probeFound("rsync");
    broken.fail_to_start = true;
    f.state->addRule("dst", broken);
    openfleet::SubTaskRunner runner(f.proto, f.resolver, fastOptions());

    openfleet::CancelToken cancel;
    Recorder rec;
    const auto out =
        runner.runTransfer(f.req, f.req.sourceItems[0], 2, cancel, rec.reporter());
    t.check(out.status == openfleet::SubTaskStatus::Failed,
            "a probe that cannot run must fail the transfer");
    t.check(!out.methodUsed.has_value() && rec.methods.empty(),
            "no method should be chosen");
    t.checkContains(out.message, "Probe for rsync failed", "probe error message");
    t.checkContains(out.message, "dst", "message names the target host");
    bool copied = false;
    for (const auto &c : f.state->commandsOn("src"))
        copied = copied || c.find("StrictHostKeyChecking") != std::string::npos;
    t.check(!copied, "nothing should be copied");

    TransferFixture g;
    openfleet::MockExecRule srcBroken = probeFound("sshpass");
    srcBroken.fail_to_start = true;
    g.state->addRule("src", srcBroken);
    openfleet::SubTaskRunner runner2(g.proto, g.resolver, fastOptions());
    openfleet::CancelToken cancel2;
    const auto out2 = runner2.runTransfer(g.req, g.req.sourceItems[0], 2, cancel2, {});
    t.check(out2.status == openfleet::SubTaskStatus::Failed,
            "a broken source probe fails too");
    t.checkContains(out2.message, "Source host src", "source probe error");
}

void test_transfer_real_rsync_failure_does_not_fall_back(TestContext &t) {
    TransferFixture f;
    f.state->addRule("src", probeFound("sshpass"));
    f.state->addRule("src", probeFound("rsync"));
    f.state->addRule("src", probeFound("scp"));
    f.state->addRule("dst", probeFound("rsync"));
    openfleet::MockExecRule rsync;
    rsync.match = "-avz";
    rsync.exit_code = 23;
    rsync.stderr_text = "rsync error: some files could not be transferred";
    f.state->addRule("src", rsync);
    openfleet::SubTaskRunner runner(f.proto, f.resolver, fastOptions());

    openfleet::CancelToken cancel;
    const auto out = runner.runTransfer(f.req, f.req.sourceItems[0], 2, cancel, {});
    t.check(out.status == openfleet::SubTaskStatus::Failed,
            "a real rsync error should fail");
    t.check(out.exitCode == 23, "rsync exit code should be kept");
    t.checkContains(out.message, "rsync failed with exit code 23",
                    "message should name rsync and the code");
    for (const auto &c : f.state->commandsOn("src"))
        t.check(c.find("'/usr/bin/scp' -o") == std::string::npos,
                "scp must not be tried");
}

void test_transfer_auto_without_target_rsync_uses_scp(TestContext &t) {
    TransferFixture f;
    f.state->addRule("src", probeFound("sshpass"));
    f.state->addRule("src", probeFound("rsync"));
    f.state->addRule("src", probeFound("scp"));
    openfleet::SubTaskRunner runner(f.proto, f.resolver, fastOptions());

    openfleet::CancelToken cancel;
    const auto out = runner.runTransfer(f.req, f.req.sourceItems[0], 2, cancel, {});
    t.check(out.status == openfleet::SubTaskStatus::Completed,
            "transfer should complete through scp");
    t.check(out.methodUsed == openfleet::TransferMethod::Scp,
            "missing rsync on the target selects scp");
}

void test_transfer_explicit_rsync_missing(TestContext &t) {
    TransferFixture f;
    f.state->addRule("src", probeFound("sshpass"));
    f.state->addRule("src", probeFound("scp"));
    f.req.transferMethod = openfleet::TransferMethod::Rsync;
    openfleet::SubTaskRunner runner(f.proto, f.resolver, fastOptions());

    openfleet::CancelToken cancel;
    const auto out = runner.runTransfer(f.req, f.req.sourceItems[0], 2, cancel, {});
    t.check(out.status == openfleet::SubTaskStatus::Failed,
            "explicit rsync without rsync should fail");
    t.checkContains(out.message, "rsync is not available on the source host",
                    "message names the missing tool");
}

void test_transfer_key_target_uses_temp_key(TestContext &t) {
    TransferFixture f;
    openfleet::ConnectionCredentials key = passwordConn(2, "dst");
    key.auth_method = openfleet::AuthMethod::Key;
    key.password.reset();
    key.private_key = std::string("-----BEGIN KEY-----");
    f.resolver.add(key);
    f.state->addRule("src", probeFound("scp"));
    f.req.transferMethod = openfleet::TransferMethod::Scp;
    openfleet::SubTaskRunner runner(f.proto, f.resolver, fastOptions());

    openfleet::CancelToken cancel;
    const auto out = runner.runTransfer(f.req, f.req.sourceItems[0], 2, cancel, {});
    t.check(out.status == openfleet::SubTaskStatus::Completed,
            "key based transfer should complete");
    const auto removed = f.state->removedFiles();
    t.check(removed.size() == 1, "temporary key should be removed");
    if (!removed.empty())
        t.checkContains(removed[0], "src:/tmp/openfleet_target_key_",
                        "key should live on the source host");
    t.check(f.state->files().empty(), "no key should be left behind");
    bool identity = false;
    for (const auto &c : f.state->commandsOn("src"))
        identity = identity ||
                   c.find("-i '/tmp/openfleet_target_key_") != std::string::npos;
    t.check(identity, "scp should use the uploaded key");
}

void test_transfer_sshpass_requirements(TestContext &t) {
    {
        TransferFixture f;
        f.state->addRule("src", probeFound("scp"));
        openfleet::SubTaskRunner runner(f.proto, f.resolver, fastOptions());
        openfleet::CancelToken cancel;
        const auto out =
            runner.runTransfer(f.req, f.req.sourceItems[0], 2, cancel, {});
        t.check(out.status == openfleet::SubTaskStatus::Failed,
                "password target without sshpass should fail");
        t.checkContains(out.message, "sshpass", "message should name sshpass");
    }
    {
        TransferFixture f;
        openfleet::ConnectionCredentials key = passwordConn(2, "dst");
        key.auth_method = openfleet::AuthMethod::Key;
        key.private_key = std::string("KEY");
        key.passphrase = std::string("pp");
        f.resolver.add(key);
        f.state->addRule("src", probeFound("scp"));
        openfleet::SubTaskRunner runner(f.proto, f.resolver, fastOptions());
        openfleet::CancelToken cancel;
        const auto out =
            runner.runTransfer(f.req, f.req.sourceItems[0], 2, cancel, {});
        t.check(out.status == openfleet::SubTaskStatus::Failed,
                "key passphrase without sshpass should fail");
        t.checkContains(out.message, "passphrase", "message should name it");
        t.check(f.state->files().empty(), "no key should be uploaded");
    }
}

void test_transfer_unknown_target(TestContext &t) {
    TransferFixture f;
    openfleet::SubTaskRunner runner(f.proto, f.resolver, fastOptions());
    openfleet::CancelToken cancel;
    const auto out = runner.runTransfer(f.req, f.req.sourceItems[0], 42, cancel, {});
    t.check(out.status == openfleet::SubTaskStatus::Failed,
            "unknown target should fail");
    t.checkContains(out.message, "Target connection 42", "message names it");
    t.check(f.state->executed().empty(), "nothing should run");
}

} // namespace

int main() {
    TestContext t;
    test_session_defaults(t);
    test_mock_connect_validation(t);
    test_mock_refuse_and_rules(t);
    test_mock_files(t);
    test_mock_block_connect_interrupt(t);
    test_cancel_token(t);
    test_escape_shell_arg(t);
    test_env_names(t);
    test_batch_command_line(t);
    test_transfer_command_lines(t);
    test_rsync_percent(t);
    test_rsync_missing_signature(t);
    test_format_bytes(t);
    test_redact_command(t);
    test_request_validation(t);
    test_aggregate(t);
    test_enum_names(t);
    test_run_batch_success(t);
    test_run_batch_failure_and_truncation(t);
    test_run_batch_connect_and_resolve_errors(t);
    test_run_batch_timeout(t);
    test_run_batch_cancel(t);
    test_transfer_rsync(t);
    test_transfer_auto_falls_back_to_scp(t);
    test_transfer_real_rsync_failure_does_not_fall_back(t);
    test_transfer_broken_probe_does_not_fall_back(t);
    test_transfer_auto_without_target_rsync_uses_scp(t);
    test_transfer_explicit_rsync_missing(t);
    test_transfer_key_target_uses_temp_key(t);
    test_transfer_sshpass_requirements(t);
    test_transfer_unknown_target(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] openfleet_core_tests\n";
    return EXIT_SUCCESS;
}
