#include "ServiceConfig.hpp"
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QStandardPaths>

const char *knownHostsPolicyName(openfleet::KnownHostsPolicy policy) {
    switch (policy) {
    case openfleet::KnownHostsPolicy::Strict:
        return "strict";
    case openfleet::KnownHostsPolicy::AcceptNew:
        return "accept-new";
    case openfleet::KnownHostsPolicy::Off:
        return "off";
    }
    return "strict";
}

QString defaultConfigPath() {
    QString base =
        QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (base.isEmpty())
        base = QDir::homePath() + QStringLiteral("/.config");
    return base + QStringLiteral("/OpenFleet/openfleetd.ini");
}

static bool readInt(QSettings &s, const char *key, int minValue, int maxValue,
                    int &out, QString &err) {
    if (!s.contains(QLatin1String(key)))
        return true;
    bool ok = false;
    const int v = s.value(QLatin1String(key)).toInt(&ok);
    if (!ok || v < minValue || v > maxValue) {
        err = QStringLiteral("%1 must be an integer in [%2, %3]")
                  .arg(QLatin1String(key))
                  .arg(minValue)
                  .arg(maxValue);
        return false;
    }
    out = v;
    return true;
}

bool loadServiceConfig(const QString &path, ServiceConfig &cfg, QString &err) {
    cfg.sourcePath = path;
    if (!QFileInfo::exists(path))
        return true;

    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        err = QStringLiteral("Could not read config file: %1").arg(path);
        return false;
    }

    if (!readInt(s, "Orchestrator/concurrencyLimit", 1,
                 openfleet::kMaxConcurrencyLimit, cfg.concurrencyLimit, err))
        return false;
    if (!readInt(s, "Orchestrator/cancelGraceMs", 0, 600000, cfg.cancelGraceMs,
                 err))
        return false;
    if (!readInt(s, "Orchestrator/commandTimeoutSeconds", 1, 86400,
                 cfg.commandTimeoutSeconds, err))
        return false;
    if (s.contains("Orchestrator/maxOutputBytes")) {
        bool ok = false;
        const qint64 v = s.value("Orchestrator/maxOutputBytes").toLongLong(&ok);
        if (!ok || v < 1024) {
            err = QStringLiteral("Orchestrator/maxOutputBytes must be at least 1024");
            return false;
        }
        cfg.maxOutputBytes = v;
    }

    cfg.databasePath = s.value("Storage/databasePath", cfg.databasePath).toString();
    if (!readInt(s, "Storage/purgeAfterDays", 0, 3650, cfg.purgeAfterDays, err))
        return false;

    if (s.contains("Ssh/knownHostsPolicy")) {
        const QString v =
            s.value("Ssh/knownHostsPolicy").toString().trimmed().toLower();
        if (v == QLatin1String("strict"))
            cfg.knownHostsPolicy = openfleet::KnownHostsPolicy::Strict;
        else if (v == QLatin1String("accept-new"))
            cfg.knownHostsPolicy = openfleet::KnownHostsPolicy::AcceptNew;
        else if (v == QLatin1String("off"))
            cfg.knownHostsPolicy = openfleet::KnownHostsPolicy::Off;
        else {
            err = QStringLiteral("Unknown Ssh/knownHostsPolicy: %1").arg(v);
            return false;
        }
    }
    cfg.knownHostsPath = s.value("Ssh/knownHostsPath", cfg.knownHostsPath).toString();
    if (!readInt(s, "Ssh/connectTimeoutMs", 1000, 600000, cfg.connectTimeoutMs,
                 err))
        return false;

    cfg.credentialsPath =
        s.value("Credentials/path", cfg.credentialsPath).toString();
    // QSettings turns comma separated rules into a list.
    const QVariant rules = s.value("Logging/rules");
    if (rules.canConvert<QStringList>() && rules.toStringList().size() > 1)
        cfg.loggingRules = rules.toStringList().join(QLatin1Char('\n'));
    else
        cfg.loggingRules = rules.toString();
    return true;
}

void applyLoggingRules(const ServiceConfig &cfg) {
    if (cfg.loggingRules.trimmed().isEmpty())
        return;
    QString rules = cfg.loggingRules;
    rules.replace(QLatin1Char(';'), QLatin1Char('\n'));
    QLoggingCategory::setFilterRules(rules);
}

openfleet::RunnerOptions ServiceConfig::runnerOptions() const {
    openfleet::RunnerOptions opt;
    opt.sessionBase.known_hosts_policy = knownHostsPolicy;
    if (!knownHostsPath.isEmpty())
        opt.sessionBase.known_hosts_path = knownHostsPath.toStdString();
    opt.sessionBase.connect_timeout_ms = connectTimeoutMs;
    opt.maxOutputBytes = static_cast<std::size_t>(maxOutputBytes);
    opt.transferTimeoutSeconds = commandTimeoutSeconds;
    return opt;
}
