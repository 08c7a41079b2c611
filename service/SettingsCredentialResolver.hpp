// CredentialResolver backed by an INI file: a `connections` array plus a
// `Secrets` group holding base64 encoded secrets.
#pragma once
#include "openfleet/CredentialResolver.hpp"
#include <QString>

class SettingsCredentialResolver : public openfleet::CredentialResolver {
public:
    explicit SettingsCredentialResolver(QString settingsPath);

    // Thread-safe: every call opens its own QSettings.
    openfleet::ResolveStatus resolve(std::int64_t connectionId,
                                     openfleet::ConnectionCredentials &out,
                                     std::string &err) override;

    const QString &settingsPath() const { return path_; }

private:
    QString path_;
};
