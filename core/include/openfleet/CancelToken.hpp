// Cooperative cancellation shared between the orchestrator and one worker.
#pragma once
#include <atomic>
#include <functional>
#include <map>
#include <mutex>

namespace openfleet {

class CancelToken {
public:
    bool isCanceled() const { return canceled_.load(); }

    // Marks the token canceled and runs every registered callback once.
    void cancel() {
        std::lock_guard<std::mutex> run(runMtx_);
        std::map<int, std::function<void()>> callbacks;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (canceled_.exchange(true))
                return;
            callbacks.swap(callbacks_);
        }
        for (auto &kv : callbacks)
            kv.second();
    }

    // Registers a callback; runs it immediately when already canceled.
    // Returns an id for removeCallback (0 if it already ran).
    int onCancel(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (!canceled_.load()) {
                const int id = nextId_++;
                callbacks_.emplace(id, std::move(cb));
                return id;
            }
        }
        cb();
        return 0;
    }

    // Blocks while cancel() is running callbacks, so the owner may destroy
    // whatever the callback touches right after this returns.
    void removeCallback(int id) {
        std::lock_guard<std::mutex> run(runMtx_);
        std::lock_guard<std::mutex> lk(mtx_);
        callbacks_.erase(id);
    }

private:
    std::atomic<bool> canceled_{false};
    mutable std::mutex mtx_;
    std::mutex runMtx_;
    std::map<int, std::function<void()>> callbacks_;
    int nextId_ = 1;
};

// Keeps a cancel callback registered for the lifetime of a scope.
class CancelRegistration {
public:
    CancelRegistration(CancelToken &token, std::function<void()> cb)
        : token_(token), id_(token.onCancel(std::move(cb))) {}
    ~CancelRegistration() {
        if (id_ != 0)
            token_.removeCallback(id_);
    }
    CancelRegistration(const CancelRegistration &) = delete;
    CancelRegistration &operator=(const CancelRegistration &) = delete;

private:
    CancelToken &token_;
    int id_ = 0;
};

} // namespace openfleet
