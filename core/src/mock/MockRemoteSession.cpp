#include "openfleet/MockRemoteSession.hpp"

#include <algorithm>
#include <chrono>

namespace openfleet {

void MockRemoteState::setHost(const std::string &host, MockHostScript script) {
    std::lock_guard<std::mutex> lk(mtx_);
    hosts_[host] = std::move(script);
}

void MockRemoteState::addRule(const std::string &host, MockExecRule rule) {
    std::lock_guard<std::mutex> lk(mtx_);
    hosts_[host].rules.push_back(std::move(rule));
}

void MockRemoteState::openGate(const std::string &gate) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        openGates_.insert(gate);
    }
    cv_.notify_all();
}

bool MockRemoteState::gateOpen(const std::string &gate) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return openGates_.count(gate) > 0;
}

std::vector<MockExecRecord> MockRemoteState::executed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return executed_;
}

std::vector<std::string>
MockRemoteState::commandsOn(const std::string &host) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> out;
    for (const auto &r : executed_) {
        if (r.host == host)
            out.push_back(r.command);
    }
    return out;
}

std::map<std::string, MockFileRecord> MockRemoteState::files() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return files_;
}

std::vector<std::string> MockRemoteState::removedFiles() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return removed_;
}

int MockRemoteState::connectCount(const std::string &host) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = connects_.find(host);
    return it == connects_.end() ? 0 : it->second;
}

int MockRemoteState::connectedNow() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return connectedNow_;
}

int MockRemoteState::peakConnected() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return peakConnected_;
}

MockHostScript MockRemoteState::scriptFor(const std::string &host) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = hosts_.find(host);
    return it == hosts_.end() ? MockHostScript{} : it->second;
}

void MockRemoteState::wake() { cv_.notify_all(); }

MockRemoteSession::MockRemoteSession()
    : state_(std::make_shared<MockRemoteState>()) {}

MockRemoteSession::MockRemoteSession(std::shared_ptr<MockRemoteState> state)
    : state_(std::move(state)) {}

MockRemoteSession::~MockRemoteSession() { disconnect(); }

bool MockRemoteSession::connect(const SessionOptions &opt, std::string &err) {
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and username are required";
        return false;
    }
    if (connected_) {
        err = "Already connected";
        return false;
    }
    const MockHostScript script = state_->scriptFor(opt.host);
    {
        std::lock_guard<std::mutex> lk(state_->mtx_);
        state_->connects_[opt.host]++;
    }
    if (script.block_connect) {
        std::unique_lock<std::mutex> lk(state_->mtx_);
        while (!interrupted_.load())
            state_->cv_.wait_for(lk, std::chrono::milliseconds(5));
    }
    if (interrupted_.load()) {
        err = "Connection interrupted";
        return false;
    }
    if (script.refuse_connect) {
        err = "Could not connect to " + opt.host + ":" +
              std::to_string(opt.port);
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(state_->mtx_);
        state_->connectedNow_++;
        state_->peakConnected_ =
            std::max(state_->peakConnected_, state_->connectedNow_);
    }
    connected_ = true;
    lastOpt_ = opt;
    return true;
}

void MockRemoteSession::disconnect() {
    if (!connected_)
        return;
    connected_ = false;
    std::lock_guard<std::mutex> lk(state_->mtx_);
    state_->connectedNow_--;
}

bool MockRemoteSession::exec(const std::string &command, ExecResult &out,
                             std::string &err, OutputCB onOutput,
                             std::function<bool()> shouldCancel,
                             int timeoutSeconds, bool pty) {
    out = ExecResult{};
    if (!connected_) {
        err = "Not connected";
        return false;
    }

    MockExecRule rule;
    bool matched = false;
    {
        std::lock_guard<std::mutex> lk(state_->mtx_);
        state_->executed_.push_back({lastOpt_.host, command, pty});
        auto it = state_->hosts_.find(lastOpt_.host);
        if (it != state_->hosts_.end()) {
            for (const auto &r : it->second.rules) {
                if (command.find(r.match) != std::string::npos) {
                    rule = r;
                    matched = true;
                    break;
                }
            }
        }
    }
    if (!matched) {
        out.exit_code = 0;
        return true;
    }
    if (rule.fail_to_start) {
        err = "Remote exec failed";
        return false;
    }

    using clock = std::chrono::steady_clock;
    const auto started = clock::now();
    const auto deadline = started + std::chrono::seconds(timeoutSeconds);
    const auto delayUntil = started + std::chrono::milliseconds(rule.delay_ms);
    auto stopRequested = [&]() {
        if (interrupted_.load() || (shouldCancel && shouldCancel())) {
            out.canceled = true;
            return true;
        }
        if (timeoutSeconds > 0 && clock::now() >= deadline) {
            out.timed_out = true;
            return true;
        }
        return false;
    };

    for (const auto &c : rule.chunks) {
        if (onOutput)
            onOutput(c, false);
        out.stdout_text += c;
    }

    {
        std::unique_lock<std::mutex> lk(state_->mtx_);
        for (;;) {
            const bool gated =
                !rule.gate.empty() && state_->openGates_.count(rule.gate) == 0;
            const bool delayed = clock::now() < delayUntil;
            if (!gated && !delayed && !rule.block_until_cancel)
                break;
            lk.unlock();
            const bool stop = stopRequested();
            lk.lock();
            if (stop)
                break;
            state_->cv_.wait_for(lk, std::chrono::milliseconds(5));
        }
    }
    if (out.canceled || out.timed_out) {
        err = out.canceled ? "Canceled"
                           : "Timed out after " +
                                 std::to_string(timeoutSeconds) + " s";
        return true;
    }

    if (!rule.stdout_text.empty()) {
        if (onOutput)
            onOutput(rule.stdout_text, false);
        out.stdout_text += rule.stdout_text;
    }
    if (!rule.stderr_text.empty()) {
        if (onOutput)
            onOutput(rule.stderr_text, true);
        out.stderr_text += rule.stderr_text;
    }
    out.exit_code = rule.exit_code;
    return true;
}

bool MockRemoteSession::writeFile(const std::string &remote_path,
                                  const std::string &content,
                                  std::uint32_t mode, std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(state_->mtx_);
    state_->files_[lastOpt_.host + ":" + remote_path] = {content, mode};
    return true;
}

bool MockRemoteSession::removeFile(const std::string &remote_path,
                                   std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(state_->mtx_);
    const std::string key = lastOpt_.host + ":" + remote_path;
    if (state_->files_.erase(key) == 0) {
        err = "No such file: " + remote_path;
        return false;
    }
    state_->removed_.push_back(key);
    return true;
}

void MockRemoteSession::interrupt() {
    interrupted_.store(true);
    state_->wake();
}

std::unique_ptr<RemoteSession> MockRemoteSession::newSessionLike() const {
    return std::make_unique<MockRemoteSession>(state_);
}

} // namespace openfleet
