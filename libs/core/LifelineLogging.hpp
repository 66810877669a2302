#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// LIFELINE LOGGING CATEGORIES
// =============================================================================
// Four categories, each with per-call-site atomic throttling for chatty paths

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: init, lifecycle, config
Q_DECLARE_LOGGING_CATEGORY(logConn)     // Connection: reconnect loop, backoff, heartbeat
Q_DECLARE_LOGGING_CATEGORY(logNet)      // Network: online/offline, transport, reachability
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING
// =============================================================================

namespace lifeline::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp   = 1;    // Every app event
    inline constexpr int kConn  = 1;    // Every reconnect event (low frequency by nature)
    inline constexpr int kNet   = 1;    // Every network transition
    inline constexpr int kDebug = 10;   // Every 10th debug message
}

// Atomic throttling macro with runtime env var override
#define LLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("LIFELINE_LOG_" #cat "_INTERVAL");        \
            const int parsed = env ? std::atoi(env) : (defaultInterval);            \
            return parsed > 0 ? parsed : 1;                                          \
        }();                                                                         \
        if (_interval == 1 || (++_counter % static_cast<uint32_t>(_interval)) == 1) { \
            qCInfo(log##cat) << __VA_ARGS__;                                         \
        }                                                                            \
    } while(false)

// =============================================================================
// LOGGING MACROS
// =============================================================================

#define lLog_App(...)     LLOG_THROTTLED(App, lifeline::log_throttle::kApp, __VA_ARGS__)
#define lLog_Conn(...)    LLOG_THROTTLED(Conn, lifeline::log_throttle::kConn, __VA_ARGS__)
#define lLog_Net(...)     LLOG_THROTTLED(Net, lifeline::log_throttle::kNet, __VA_ARGS__)
#define lLog_Debug(...)   LLOG_THROTTLED(Debug, lifeline::log_throttle::kDebug, __VA_ARGS__)

#define lLog_AppN(n, ...)    LLOG_THROTTLED(App, n, __VA_ARGS__)
#define lLog_ConnN(n, ...)   LLOG_THROTTLED(Conn, n, __VA_ARGS__)
#define lLog_NetN(n, ...)    LLOG_THROTTLED(Net, n, __VA_ARGS__)
#define lLog_DebugN(n, ...)  LLOG_THROTTLED(Debug, n, __VA_ARGS__)

// Always-on macros (no throttling for critical messages)
#define lLog_Warning(...)  qCWarning(logConn) << __VA_ARGS__
#define lLog_Error(...)    qCCritical(logConn) << __VA_ARGS__

// =============================================================================
// RUNTIME CONTROL
// =============================================================================
//   export LIFELINE_LOG_Conn_INTERVAL=1     # every reconnect event
//   export LIFELINE_LOG_Debug_INTERVAL=1    # every debug message
//   export QT_LOGGING_RULES="lifeline.debug=true"
