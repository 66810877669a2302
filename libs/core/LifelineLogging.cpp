#include "LifelineLogging.hpp"

// =============================================================================
// LOGGING CATEGORY DEFINITIONS
// =============================================================================

Q_LOGGING_CATEGORY(logApp, "lifeline.app")                 // Application: init, lifecycle, config
Q_LOGGING_CATEGORY(logConn, "lifeline.conn")               // Connection: reconnect loop, heartbeat
Q_LOGGING_CATEGORY(logNet, "lifeline.net")                 // Network: online/offline, transport
Q_LOGGING_CATEGORY(logDebug, "lifeline.debug", QtWarningMsg) // Debug: off unless enabled by rules
