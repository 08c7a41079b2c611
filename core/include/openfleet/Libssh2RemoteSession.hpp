#pragma once
#include "RemoteSession.hpp"
#include <atomic>
#include <mutex>
#include <string>

// Forward declarations of libssh2's internal types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace openfleet {

class Libssh2RemoteSession : public RemoteSession {
public:
    Libssh2RemoteSession();
    ~Libssh2RemoteSession() override;

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

private:
    bool connected_ = false;
    std::atomic<bool> interrupted_{false};
    std::mutex sockMtx_; // guards sock_ against interrupt() racing close()
    int sock_ = -1;
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;

    bool tcpConnect(const std::string &host, std::uint16_t port, int timeoutMs,
                    std::string &err);
    bool sshHandshake(const SessionOptions &opt, std::string &err);
    bool verifyHostKey(const SessionOptions &opt, std::string &err);
    bool authenticate(const SessionOptions &opt, std::string &err);
    bool ensureSftp(std::string &err);
    bool waitSocket(int timeoutMs);
    std::string lastError() const;
};

} // namespace openfleet
