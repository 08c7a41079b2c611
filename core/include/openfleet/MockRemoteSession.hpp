// Scriptable in-process session used by the tests. Sessions created through
// newSessionLike share one MockRemoteState, so a test can script every host
// up front and inspect what ran afterwards.
#pragma once
#include "RemoteSession.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace openfleet {

// First rule whose match is a substring of the command wins. Commands that
// match nothing succeed with exit code 0 and no output.
struct MockExecRule {
    std::string match;
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
    std::vector<std::string> chunks; // streamed as stdout before stdout_text
    bool fail_to_start = false;      // exec() returns false
    bool block_until_cancel = false; // returns only on cancel, interrupt or timeout
    std::string gate;                // blocks until MockRemoteState::openGate(gate)
    int delay_ms = 0;
};

struct MockHostScript {
    bool refuse_connect = false;
    bool block_connect = false; // connect() waits for interrupt()
    std::vector<MockExecRule> rules;
};

struct MockExecRecord {
    std::string host;
    std::string command;
    bool pty = false;
};

struct MockFileRecord {
    std::string content;
    std::uint32_t mode = 0;
};

class MockRemoteState {
public:
    void setHost(const std::string &host, MockHostScript script);
    void addRule(const std::string &host, MockExecRule rule);

    void openGate(const std::string &gate);
    bool gateOpen(const std::string &gate) const;

    std::vector<MockExecRecord> executed() const;
    std::vector<std::string> commandsOn(const std::string &host) const;
    // host + ":" + path -> file; removed files are dropped from here
    std::map<std::string, MockFileRecord> files() const;
    std::vector<std::string> removedFiles() const;
    int connectCount(const std::string &host) const;
    int connectedNow() const;
    int peakConnected() const;

private:
    friend class MockRemoteSession;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::map<std::string, MockHostScript> hosts_;
    std::set<std::string> openGates_;
    std::vector<MockExecRecord> executed_;
    std::map<std::string, MockFileRecord> files_;
    std::vector<std::string> removed_;
    std::map<std::string, int> connects_;
    int connectedNow_ = 0;
    int peakConnected_ = 0;

    MockHostScript scriptFor(const std::string &host) const;
    void wake();
};

class MockRemoteSession : public RemoteSession {
public:
    MockRemoteSession();
    explicit MockRemoteSession(std::shared_ptr<MockRemoteState> state);
    ~MockRemoteSession() override;

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool exec(const std::string &command, ExecResult &out, std::string &err,
              OutputCB onOutput = {}, std::function<bool()> shouldCancel = {},
              int timeoutSeconds = 0, bool pty = false) override;

    bool writeFile(const std::string &remote_path, const std::string &content,
                   std::uint32_t mode, std::string &err) override;
    bool removeFile(const std::string &remote_path, std::string &err) override;

    void interrupt() override;

    std::unique_ptr<RemoteSession> newSessionLike() const override;

    const std::shared_ptr<MockRemoteState> &state() const { return state_; }
    const SessionOptions &lastOptions() const { return lastOpt_; }

private:
    std::shared_ptr<MockRemoteState> state_;
    bool connected_ = false;
    std::atomic<bool> interrupted_{false};
    SessionOptions lastOpt_{};
};

} // namespace openfleet
