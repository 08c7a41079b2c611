#include "LogCategories.hpp"

Q_LOGGING_CATEGORY(ofOrch, "openfleet.orchestrator")
Q_LOGGING_CATEGORY(ofPolicy, "openfleet.policy")
Q_LOGGING_CATEGORY(ofStore, "openfleet.store")
Q_LOGGING_CATEGORY(ofDaemon, "openfleet.daemon")
