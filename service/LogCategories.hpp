// Logging categories shared by the service layer.
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ofOrch)
Q_DECLARE_LOGGING_CATEGORY(ofPolicy)
Q_DECLARE_LOGGING_CATEGORY(ofStore)
Q_DECLARE_LOGGING_CATEGORY(ofDaemon)
