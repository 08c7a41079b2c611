// libssh2 backend: owns the TCP socket and the SSH session, runs commands on
// exec channels and writes small files over SFTP. Validates known_hosts.
#include "openfleet/Libssh2RemoteSession.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace openfleet {

// Upper bound on captured stdout/stderr per exec; callbacks still see all.
static constexpr std::size_t kExecCaptureLimit = 4 * 1024 * 1024;

static std::once_flag g_libssh2_once;

// Context for keyboard-interactive: answers user or password by prompt text.
struct KbdIntCtx {
    const char *user;
    const char *pass;
};

static void kbint_password_callback(const char *name, int name_len,
                                    const char *instruction,
                                    int instruction_len, int num_prompts,
                                    const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                                    LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                                    void **abstract) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text)
                                 ? std::string(reinterpret_cast<const char *>(
                                                   prompts[i].text),
                                               prompts[i].length)
                                 : std::string();
        for (auto &c : prompt) {
            if (c >= 'A' && c <= 'Z')
                c = (char)(c - 'A' + 'a');
        }
        // Prompts mentioning "user" or "name" get the user name.
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char *ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        if (alen == 0) {
            responses[i].text = nullptr;
            responses[i].length = 0;
            continue;
        }
        // libssh2 frees the response with its allocator (malloc by default).
        char *buf = static_cast<char *>(std::malloc(alen + 1));
        if (!buf) {
            responses[i].text = nullptr;
            responses[i].length = 0;
            continue;
        }
        std::memcpy(buf, ans, alen);
        buf[alen] = '\0';
        responses[i].text = buf;
        responses[i].length = (unsigned int)alen;
    }
}

static int knownHostAlgorithm(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

static const char *hostKeyTypeName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "DSA";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ECDSA-521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ED25519";
#endif
    default:
        return "UNKNOWN";
    }
}

Libssh2RemoteSession::Libssh2RemoteSession() {
    std::call_once(g_libssh2_once, [] { (void)libssh2_init(0); });
}

Libssh2RemoteSession::~Libssh2RemoteSession() { disconnect(); }

std::string Libssh2RemoteSession::lastError() const {
    if (!session_)
        return {};
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, (size_t)len) : std::string();
}

bool Libssh2RemoteSession::tcpConnect(const std::string &host,
                                      std::uint16_t port, int timeoutMs,
                                      std::string &err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect so the timeout and interrupt() are honored.
        const int fl = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, fl | O_NONBLOCK);
        bool ok = ::connect(s, rp->ai_addr, rp->ai_addrlen) == 0;
        if (!ok && errno == EINPROGRESS) {
            const auto deadline = std::chrono::steady_clock::now() +
                                  std::chrono::milliseconds(timeoutMs);
            while (!interrupted_.load() &&
                   std::chrono::steady_clock::now() < deadline) {
                struct pollfd pfd{s, POLLOUT, 0};
                int pr = ::poll(&pfd, 1, 100);
                if (pr < 0 && errno != EINTR)
                    break;
                if (pr > 0) {
                    int soerr = 0;
                    socklen_t slen = sizeof(soerr);
                    ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen);
                    ok = soerr == 0;
                    break;
                }
            }
        }
        if (ok) {
            ::fcntl(s, F_SETFL, fl);
            std::lock_guard<std::mutex> lk(sockMtx_);
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
        if (interrupted_.load())
            break;
    }
    freeaddrinfo(res);
    err = interrupted_.load() ? "Connection interrupted"
                              : "Could not connect to " + host + ":" +
                                    std::to_string(port);
    return false;
}

bool Libssh2RemoteSession::verifyHostKey(const SessionOptions &opt,
                                         std::string &err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char *home = std::getenv("HOME");
        if (home)
            khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(),
                                              LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not read the server host key";
        return false;
    }

    const int alg = knownHostAlgorithm(keytype);
    struct libssh2_knownhost *host = nullptr;
    int check = libssh2_knownhost_checkp(
        nh, opt.host.c_str(), opt.port, hostkey, keylen,
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(
            nh, opt.host.c_str(), opt.port, hostkey, keylen,
            LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
            &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        std::string fpStr;
        const unsigned char *h = reinterpret_cast<const unsigned char *>(
            libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
        if (h) {
            std::ostringstream oss;
            oss << "SHA256:";
            for (int i = 0; i < 32; ++i) {
                if (i)
                    oss << ':';
                char b[4];
                std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
                oss << b;
            }
            fpStr = oss.str();
        }
        if (opt.hostkey_confirm_cb &&
            !opt.hostkey_confirm_cb(opt.host, opt.port,
                                    hostKeyTypeName(keytype), fpStr)) {
            libssh2_knownhost_free(nh);
            err = "Unknown host: fingerprint not confirmed";
            return false;
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path is not defined";
            return false;
        }
        const int addMask =
            LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                           hostkey, keylen, nullptr, 0,
                                           addMask, nullptr);
        if (addrc != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(),
                                        LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Could not add the host to known_hosts";
            return false;
        }
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "Host key does not match known_hosts"
              : "Host not found in known_hosts";
    return false;
}

bool Libssh2RemoteSession::authenticate(const SessionOptions &opt,
                                        std::string &err) {
    const char *passphrase =
        opt.private_key_passphrase ? opt.private_key_passphrase->c_str()
                                   : nullptr;

    // 1) Explicit key, as text or as a path.
    if (opt.private_key.has_value()) {
        int rc = libssh2_userauth_publickey_frommemory(
            session_, opt.username.c_str(), opt.username.size(), nullptr, 0,
            opt.private_key->data(), opt.private_key->size(), passphrase);
        if (rc != 0) {
            err = "Public key authentication failed: " + lastError();
            return false;
        }
        return true;
    }
    if (opt.private_key_path.has_value()) {
        int rc = libssh2_userauth_publickey_fromfile(
            session_, opt.username.c_str(), nullptr,
            opt.private_key_path->c_str(), passphrase);
        if (rc != 0) {
            err = "Public key authentication failed: " + lastError();
            return false;
        }
        return true;
    }

    std::string authlist;
    auto loadAuthList = [&]() {
        if (!authlist.empty())
            return;
        char *methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                              (unsigned)opt.username.size());
        authlist = methods ? std::string(methods) : std::string();
    };
    auto hasMethod = [&](const char *m) {
        return authlist.find(m) != std::string::npos;
    };

    // 2) Password first, then keyboard-interactive with the same secret.
    if (opt.password.has_value()) {
        int rc_pw = libssh2_userauth_password(session_, opt.username.c_str(),
                                              opt.password->c_str());
        if (rc_pw == 0)
            return true;
        if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
            rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after the password attempt";
            return false;
        }
        const std::string pwErr = lastError();
        loadAuthList();
        if (hasMethod("keyboard-interactive")) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str()};
            void **abs = libssh2_session_abstract(session_);
            if (abs)
                *abs = &ctx;
            int rc_kbd = libssh2_userauth_keyboard_interactive(
                session_, opt.username.c_str(), kbint_password_callback);
            if (abs)
                *abs = nullptr;
            if (rc_kbd == 0)
                return true;
        }
        err = "Password authentication failed" +
              (authlist.empty() ? std::string()
                                : " (methods: " + authlist + ")") +
              (pwErr.empty() ? std::string() : ": " + pwErr);
        return false;
    }

    // 3) No credentials: try a few ssh-agent identities.
    loadAuthList();
    bool authed = false;
    if (hasMethod("publickey")) {
        LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
        if (agent && libssh2_agent_connect(agent) == 0 &&
            libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey *identity = nullptr;
            struct libssh2_agent_publickey *prev = nullptr;
            int tries = 0;
            const int kMaxAgentTries = 3;
            while (tries < kMaxAgentTries &&
                   libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                prev = identity;
                ++tries;
                if (libssh2_agent_userauth(agent, opt.username.c_str(),
                                           identity) == 0) {
                    authed = true;
                    break;
                }
            }
        }
        if (agent) {
            libssh2_agent_disconnect(agent);
            libssh2_agent_free(agent);
        }
    }
    if (!authed) {
        err = "No credentials: key, agent and password unavailable";
        return false;
    }
    return true;
}

bool Libssh2RemoteSession::sshHandshake(const SessionOptions &opt,
                                        std::string &err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, opt.connect_timeout_ms);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastError();
        return false;
    }
    if (opt.keepalive_interval_s > 0)
        libssh2_keepalive_config(session_, 1, (unsigned)opt.keepalive_interval_s);

    if (!verifyHostKey(opt, err))
        return false;
    if (!authenticate(opt, err))
        return false;

    // Commands manage their own deadlines.
    libssh2_session_set_timeout(session_, 0);
    return true;
}

bool Libssh2RemoteSession::connect(const SessionOptions &opt,
                                   std::string &err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (interrupted_.load()) {
        err = "Connection interrupted";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, opt.connect_timeout_ms, err))
        return false;
    if (!sshHandshake(opt, err)) {
        if (interrupted_.load())
            err = "Connection interrupted";
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2RemoteSession::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    std::lock_guard<std::mutex> lk(sockMtx_);
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

void Libssh2RemoteSession::interrupt() {
    interrupted_.store(true);
    std::lock_guard<std::mutex> lk(sockMtx_);
    if (sock_ != -1)
        ::shutdown(sock_, SHUT_RDWR);
}

bool Libssh2RemoteSession::waitSocket(int timeoutMs) {
    struct pollfd pfd{};
    pfd.fd = sock_;
    const int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)
        pfd.events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND)
        pfd.events |= POLLOUT;
    if (pfd.events == 0)
        pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, timeoutMs);
    return rc >= 0 || errno == EINTR;
}

bool Libssh2RemoteSession::exec(const std::string &command, ExecResult &out,
                                std::string &err, OutputCB onOutput,
                                std::function<bool()> shouldCancel,
                                int timeoutSeconds, bool pty) {
    out = ExecResult{};
    if (!connected_ || !session_) {
        err = "Not connected";
        return false;
    }

    using clock = std::chrono::steady_clock;
    const bool hasDeadline = timeoutSeconds > 0;
    const auto deadline = clock::now() + std::chrono::seconds(timeoutSeconds);
    auto stopRequested = [&]() {
        if (interrupted_.load() || (shouldCancel && shouldCancel())) {
            out.canceled = true;
            return true;
        }
        if (hasDeadline && clock::now() >= deadline) {
            out.timed_out = true;
            return true;
        }
        return false;
    };

    libssh2_session_set_blocking(session_, 0);
    struct BlockingRestore {
        LIBSSH2_SESSION *s;
        ~BlockingRestore() { libssh2_session_set_blocking(s, 1); }
    } restore{session_};

    LIBSSH2_CHANNEL *ch = nullptr;
    while ((ch = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            err = "Could not open channel: " + lastError();
            return false;
        }
        if (stopRequested()) {
            err = out.canceled ? "Canceled" : "Timed out";
            return true;
        }
        waitSocket(100);
    }

    auto freeChannel = [&]() {
        while (libssh2_channel_close(ch) == LIBSSH2_ERROR_EAGAIN)
            waitSocket(100);
        libssh2_channel_free(ch);
        ch = nullptr;
    };

    int rc = 0;
    if (pty) {
        while ((rc = libssh2_channel_request_pty(ch, "vt100")) ==
               LIBSSH2_ERROR_EAGAIN)
            waitSocket(100);
        if (rc != 0) {
            err = "PTY request failed: " + lastError();
            freeChannel();
            return false;
        }
    }
    while ((rc = libssh2_channel_exec(ch, command.c_str())) ==
           LIBSSH2_ERROR_EAGAIN)
        waitSocket(100);
    if (rc != 0) {
        err = "Remote exec failed: " + lastError();
        freeChannel();
        return false;
    }

    std::vector<char> buf(16 * 1024);
    bool broken = false;
    for (;;) {
        bool gotData = false;
        for (int stream : {0, SSH_EXTENDED_DATA_STDERR}) {
            for (;;) {
                ssize_t n = libssh2_channel_read_ex(ch, stream, buf.data(),
                                                    buf.size());
                if (n == LIBSSH2_ERROR_EAGAIN || n == 0)
                    break;
                if (n < 0) {
                    broken = true;
                    break;
                }
                gotData = true;
                std::string chunk(buf.data(), (size_t)n);
                const bool isErr = stream != 0;
                std::string &dst = isErr ? out.stderr_text : out.stdout_text;
                if (dst.size() < kExecCaptureLimit)
                    dst.append(chunk, 0, kExecCaptureLimit - dst.size());
                if (onOutput)
                    onOutput(chunk, isErr);
            }
            if (broken)
                break;
        }
        if (broken || libssh2_channel_eof(ch))
            break;
        if (stopRequested())
            break;
        if (!gotData)
            waitSocket(100);
    }

    if (broken && !interrupted_.load()) {
        err = "Channel read failed: " + lastError();
        freeChannel();
        return false;
    }
    if (broken)
        out.canceled = true;
    if (out.canceled || out.timed_out) {
        // Closing the channel hangs up the remote command.
        freeChannel();
        err = out.canceled ? "Canceled" : "Timed out after " +
                                              std::to_string(timeoutSeconds) +
                                              " s";
        return true;
    }

    while (libssh2_channel_close(ch) == LIBSSH2_ERROR_EAGAIN)
        waitSocket(100);
    while (libssh2_channel_wait_closed(ch) == LIBSSH2_ERROR_EAGAIN)
        waitSocket(100);
    out.exit_code = libssh2_channel_get_exit_status(ch);
    char *sig = nullptr;
    size_t siglen = 0;
    libssh2_channel_get_exit_signal(ch, &sig, &siglen, nullptr, nullptr,
                                    nullptr, nullptr);
    if (sig) {
        out.exit_signal.assign(sig, siglen);
        out.exit_code = -1;
        libssh2_free(session_, sig);
    }
    libssh2_channel_free(ch);
    return true;
}

bool Libssh2RemoteSession::ensureSftp(std::string &err) {
    if (sftp_)
        return true;
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not initialize SFTP: " + lastError();
        return false;
    }
    return true;
}

bool Libssh2RemoteSession::writeFile(const std::string &remote_path,
                                     const std::string &content,
                                     std::uint32_t mode, std::string &err) {
    if (!connected_ || !session_) {
        err = "Not connected";
        return false;
    }
    if (!ensureSftp(err))
        return false;

    LIBSSH2_SFTP_HANDLE *wh = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, (long)mode,
        LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        err = "Could not open remote file for writing: " + remote_path;
        return false;
    }
    const char *p = content.data();
    size_t remain = content.size();
    while (remain > 0) {
        ssize_t w = libssh2_sftp_write(wh, p, remain);
        if (w < 0) {
            err = "Remote write failed: " + remote_path;
            libssh2_sftp_close(wh);
            return false;
        }
        remain -= (size_t)w;
        p += w;
    }
    libssh2_sftp_close(wh);
    return true;
}

bool Libssh2RemoteSession::removeFile(const std::string &remote_path,
                                      std::string &err) {
    if (!connected_ || !session_) {
        err = "Not connected";
        return false;
    }
    if (!ensureSftp(err))
        return false;
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        err = "sftp_unlink failed: " + remote_path;
        return false;
    }
    return true;
}

std::unique_ptr<RemoteSession> Libssh2RemoteSession::newSessionLike() const {
    return std::make_unique<Libssh2RemoteSession>();
}

} // namespace openfleet
