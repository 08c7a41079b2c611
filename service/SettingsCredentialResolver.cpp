// Layout:
//   [connections]
//   1\id=2
//   1\host=10.0.0.2
//   1\authMethod=key
//   1\secretKey=web-01
//   size=1
//   [Secrets]
//   web-01\privateKey=<base64>
#include "SettingsCredentialResolver.hpp"
#include <QByteArray>
#include <QFileInfo>
#include <QSettings>
#include <utility>

using openfleet::ResolveStatus;

SettingsCredentialResolver::SettingsCredentialResolver(QString settingsPath)
    : path_(std::move(settingsPath)) {}

static bool decodeSecret(QSettings &s, const QString &key,
                         std::optional<std::string> &out) {
    if (!s.contains(key))
        return true;
    const QByteArray raw = s.value(key).toString().toLatin1();
    auto decoded = QByteArray::fromBase64Encoding(
        raw, QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded)
        return false;
    out = decoded->toStdString();
    return true;
}

ResolveStatus SettingsCredentialResolver::resolve(
    std::int64_t connectionId, openfleet::ConnectionCredentials &out,
    std::string &err) {
    QFileInfo fi(path_);
    if (!fi.exists() || !fi.isReadable()) {
        err = "Credential store not readable: " + path_.toStdString();
        return ResolveStatus::StoreUnavailable;
    }
    QSettings s(path_, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        err = "Credential store could not be parsed: " + path_.toStdString();
        return ResolveStatus::StoreUnavailable;
    }

    bool found = false;
    QString secretKey;
    QString authMethod;
    const int n = s.beginReadArray("connections");
    for (int i = 0; i < n; ++i) {
        s.setArrayIndex(i);
        if (s.value("id").toLongLong() != connectionId)
            continue;
        out = openfleet::ConnectionCredentials{};
        out.id = connectionId;
        out.name = s.value("name").toString().toStdString();
        out.host = s.value("host").toString().toStdString();
        out.port = (std::uint16_t)s.value("port", 22).toUInt();
        out.username = s.value("username").toString().toStdString();
        authMethod = s.value("authMethod", "password").toString().toLower();
        secretKey = s.value("secretKey").toString();
        found = true;
        break;
    }
    s.endArray();

    if (!found) {
        err = "Unknown connection id " + std::to_string(connectionId);
        return ResolveStatus::UnknownConnection;
    }
    if (out.name.empty())
        out.name = out.host;
    if (out.host.empty() || out.username.empty()) {
        err = "Connection " + std::to_string(connectionId) +
              " has no host or username";
        return ResolveStatus::UnknownConnection;
    }

    if (authMethod == QLatin1String("key"))
        out.auth_method = openfleet::AuthMethod::Key;
    else if (authMethod == QLatin1String("password"))
        out.auth_method = openfleet::AuthMethod::Password;
    else {
        err = "Unsupported auth method: " + authMethod.toStdString();
        return ResolveStatus::DecryptionFailed;
    }

    if (secretKey.isEmpty())
        secretKey = QString::number(connectionId);
    const QString prefix = QStringLiteral("Secrets/%1/").arg(secretKey);
    if (!decodeSecret(s, prefix + "password", out.password) ||
        !decodeSecret(s, prefix + "privateKey", out.private_key) ||
        !decodeSecret(s, prefix + "passphrase", out.passphrase)) {
        err = "Secret for connection " + std::to_string(connectionId) +
              " is not valid base64";
        return ResolveStatus::DecryptionFailed;
    }
    if (out.auth_method == openfleet::AuthMethod::Key && !out.private_key) {
        err = "No private key stored for connection " +
              std::to_string(connectionId);
        return ResolveStatus::DecryptionFailed;
    }
    if (out.passphrase && out.passphrase->empty())
        out.passphrase.reset();
    return ResolveStatus::Ok;
}
