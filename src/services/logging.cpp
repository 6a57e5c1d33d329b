#include "soakmon/logging.hpp"

Q_LOGGING_CATEGORY(soakmonSession, "soakmon.session")
Q_LOGGING_CATEGORY(soakmonCollector, "soakmon.collector")
Q_LOGGING_CATEGORY(soakmonTracker, "soakmon.tracker")
Q_LOGGING_CATEGORY(soakmonAlerts, "soakmon.alerts")
Q_LOGGING_CATEGORY(soakmonReport, "soakmon.report")
