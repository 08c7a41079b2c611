// Basic types shared by the remote sessions and the runners that drive them.
// Keep these structures plain so the service layer can copy them across threads.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace openfleet {

// Validation policy for the server host key against known_hosts.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: accepts and stores new hosts; rejects changed keys.
    Off        // No verification.
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    // Private key either as PEM/OpenSSH text or as a path on the local disk.
    std::optional<std::string> private_key;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    int connect_timeout_ms = 20000;
    int keepalive_interval_s = 10;

    // Called for unknown hosts under AcceptNew. Returning false rejects the host.
    // Without a callback AcceptNew stores the key unattended.
    std::function<bool(const std::string &host, std::uint16_t port,
                       const std::string &algorithm,
                       const std::string &fingerprint)>
        hostkey_confirm_cb;
};

// Result of a remote command. exit_code is -1 when the remote side did not
// report one (killed, timed out, canceled).
struct ExecResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::string exit_signal; // e.g. "KILL" when terminated by a signal
    bool timed_out = false;
    bool canceled = false;
};

} // namespace openfleet
