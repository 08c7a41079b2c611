#include "openfleet/CredentialResolver.hpp"

namespace openfleet {

const char *resolveStatusName(ResolveStatus status) {
    switch (status) {
    case ResolveStatus::Ok:
        return "ok";
    case ResolveStatus::UnknownConnection:
        return "unknown-connection";
    case ResolveStatus::DecryptionFailed:
        return "decryption-failed";
    case ResolveStatus::StoreUnavailable:
        return "store-unavailable";
    }
    return "unknown";
}

SessionOptions sessionOptionsFor(const ConnectionCredentials &creds,
                                 const SessionOptions &base) {
    SessionOptions opt = base;
    opt.host = creds.host;
    opt.port = creds.port;
    opt.username = creds.username;
    opt.password.reset();
    opt.private_key.reset();
    opt.private_key_path.reset();
    opt.private_key_passphrase.reset();
    if (creds.auth_method == AuthMethod::Key) {
        opt.private_key = creds.private_key;
        opt.private_key_passphrase = creds.passphrase;
    } else {
        opt.password = creds.password;
    }
    return opt;
}

} // namespace openfleet
