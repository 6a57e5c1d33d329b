#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(soakmonSession)
Q_DECLARE_LOGGING_CATEGORY(soakmonCollector)
Q_DECLARE_LOGGING_CATEGORY(soakmonTracker)
Q_DECLARE_LOGGING_CATEGORY(soakmonAlerts)
Q_DECLARE_LOGGING_CATEGORY(soakmonReport)
