// Abstract interface for one SSH session to one host. Concrete backends
// (libssh2, mock) implement it so the orchestration stays transport-agnostic.
#pragma once
#include "SessionTypes.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace openfleet {

class RemoteSession {
public:
    // Receives output as it arrives; isStderr tells the two streams apart.
    using OutputCB =
        std::function<void(const std::string & /*chunk*/, bool /*isStderr*/)>;

    virtual ~RemoteSession() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions &opt, std::string &err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Run a shell command to completion. Returns false only when the command
    // could not be started or the channel broke; a non-zero exit is reported
    // through out.exit_code with a true return. timeoutSeconds <= 0 waits
    // forever. pty requests a pseudo terminal (needed by sshpass).
    virtual bool exec(const std::string &command, ExecResult &out,
                      std::string &err, OutputCB onOutput = {},
                      std::function<bool()> shouldCancel = {},
                      int timeoutSeconds = 0, bool pty = false) = 0;

    // Write a small file (e.g. a temporary key) with the given POSIX mode.
    virtual bool writeFile(const std::string &remote_path,
                           const std::string &content, std::uint32_t mode,
                           std::string &err) = 0;

    virtual bool removeFile(const std::string &remote_path,
                            std::string &err) = 0;

    // Break any blocking call in progress from another thread. The session
    // is unusable afterwards.
    virtual void interrupt() = 0;

    // Create a new, unconnected session of the same backend.
    virtual std::unique_ptr<RemoteSession> newSessionLike() const = 0;
};

} // namespace openfleet
