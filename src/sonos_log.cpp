#include "sonos_log.h"

Q_LOGGING_CATEGORY(storeLog, "sonoswatch.store")
Q_LOGGING_CATEGORY(registryLog, "sonoswatch.registry")
Q_LOGGING_CATEGORY(renewalLog, "sonoswatch.renewal")
Q_LOGGING_CATEGORY(callbackLog, "sonoswatch.callback")
Q_LOGGING_CATEGORY(eventsLog, "sonoswatch.events")
Q_LOGGING_CATEGORY(pollingLog, "sonoswatch.polling")
Q_LOGGING_CATEGORY(firewallLog, "sonoswatch.firewall")
Q_LOGGING_CATEGORY(demandLog, "sonoswatch.demand")
Q_LOGGING_CATEGORY(upnpLog, "sonoswatch.upnp")
Q_LOGGING_CATEGORY(managerLog, "sonoswatch.manager")
