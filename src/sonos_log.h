#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(storeLog)
Q_DECLARE_LOGGING_CATEGORY(registryLog)
Q_DECLARE_LOGGING_CATEGORY(renewalLog)
Q_DECLARE_LOGGING_CATEGORY(callbackLog)
Q_DECLARE_LOGGING_CATEGORY(eventsLog)
Q_DECLARE_LOGGING_CATEGORY(pollingLog)
Q_DECLARE_LOGGING_CATEGORY(firewallLog)
Q_DECLARE_LOGGING_CATEGORY(demandLog)
Q_DECLARE_LOGGING_CATEGORY(upnpLog)
Q_DECLARE_LOGGING_CATEGORY(managerLog)
