// Daemon settings loaded from an INI file (QSettings).
#pragma once
#include "openfleet/SessionTypes.hpp"
#include "openfleet/SubTaskRunner.hpp"
#include <QString>

struct ServiceConfig {
    int concurrencyLimit = openfleet::kDefaultConcurrencyLimit;
    int cancelGraceMs = 5000;
    int commandTimeoutSeconds = openfleet::kDefaultCommandTimeoutSeconds;
    qint64 maxOutputBytes = static_cast<qint64>(openfleet::kMaxSubTaskOutputBytes);

    QString databasePath; // empty: history is kept in memory only
    int purgeAfterDays = 7;

    openfleet::KnownHostsPolicy knownHostsPolicy =
        openfleet::KnownHostsPolicy::Strict;
    QString knownHostsPath; // empty: ~/.ssh/known_hosts
    int connectTimeoutMs = 20000;

    QString credentialsPath; // empty: connections live in the config file
    QString loggingRules;

    QString sourcePath; // file the values were read from

    openfleet::RunnerOptions runnerOptions() const;
};

// ~/.config/OpenFleet/openfleetd.ini (platform config location).
QString defaultConfigPath();

// Reads path into cfg. A missing file leaves the defaults in place; values
// out of range or an unknown known_hosts policy fail with err.
bool loadServiceConfig(const QString &path, ServiceConfig &cfg, QString &err);

// Applies cfg.loggingRules to QLoggingCategory (no-op when empty).
void applyLoggingRules(const ServiceConfig &cfg);

const char *knownHostsPolicyName(openfleet::KnownHostsPolicy policy);
