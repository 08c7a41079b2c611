// Source of connection parameters and decrypted secrets for a connection id.
// Storage and decryption live outside the engine; it only consumes this API.
#pragma once
#include "SessionTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace openfleet {

enum class AuthMethod { Password, Key };

struct ConnectionCredentials {
    std::int64_t id = 0;
    std::string name;
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    AuthMethod auth_method = AuthMethod::Password;
    std::optional<std::string> password;
    std::optional<std::string> private_key; // key text, not a path
    std::optional<std::string> passphrase;
};

enum class ResolveStatus {
    Ok,
    UnknownConnection, // no connection with that id
    DecryptionFailed,  // the connection exists but its secrets are unusable
    StoreUnavailable   // the credential store could not be read at all
};

const char *resolveStatusName(ResolveStatus status);

class CredentialResolver {
public:
    virtual ~CredentialResolver() = default;

    // Fills out and returns Ok, or returns the failure kind with err set.
    virtual ResolveStatus resolve(std::int64_t connectionId,
                                  ConnectionCredentials &out,
                                  std::string &err) = 0;
};

// Session options for a resolved connection, starting from base (known_hosts
// policy, timeouts) and filling host, user and the secret for its auth method.
SessionOptions sessionOptionsFor(const ConnectionCredentials &creds,
                                 const SessionOptions &base);

} // namespace openfleet
