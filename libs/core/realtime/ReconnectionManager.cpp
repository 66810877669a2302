/*
Lifeline — ReconnectionManager
Role: Implements the DISCONNECTED → RECONNECTING ⇄ CONNECTED state machine.
Observability: Lifecycle and failures go to logConn, connectivity changes to logNet;
               exhausted attempts are logged as errors.
*/
#include "ReconnectionManager.hpp"
#include "LifelineLogging.hpp"
#include <exception>
#include <stdexcept>
#include <utility>
#include <QString>

namespace {

ReconnectConfig validated(ReconnectConfig config) {
    if (!config.onReconnect) {
        throw std::invalid_argument("ReconnectionManager: onReconnect callback is required");
    }
    config.options.validate();
    return config;
}

QString describeMax(const std::optional<std::uint32_t>& maxAttempts) {
    return maxAttempts ? QString::number(*maxAttempts) : QStringLiteral("unbounded");
}

} // namespace

template <class Fn>
void ReconnectionManager::invokeGuarded(const char* what, Fn&& fn) {
    try {
        std::forward<Fn>(fn)();
    } catch (const std::exception& e) {
        lLog_Error(what << "threw:" << e.what());
    } catch (...) {
        lLog_Error(what << "threw a non-standard exception");
    }
}

ReconnectionManager::ReconnectionManager(ReconnectConfig config,
                                         TimerService& timers,
                                         NetworkMonitor* network)
    : m_config(validated(std::move(config)))
    , m_timers(timers)
    , m_backoff(m_config.options.initialDelay, m_config.options.maxDelay, m_config.options.backoffMultiplier)
    , m_heartbeat(*this, timers, m_config.options.heartbeatInterval)
    , m_network(*this, network)
    , m_lastSuccessAt(timers.now())
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_network.attach();
    lLog_App("ReconnectionManager initialized (initialDelay:" << m_config.options.initialDelay.count()
             << "ms maxDelay:" << m_config.options.maxDelay.count()
             << "ms maxAttempts:" << describeMax(m_config.options.maxAttempts)
             << "heartbeat:" << (m_config.options.enableHeartbeat ? "on" : "off") << ")");
}

ReconnectionManager::~ReconnectionManager() {
    dispose();
}

// =============================================================================
// Public API
// =============================================================================

void ReconnectionManager::handleStatusChange(RealtimeStatus status) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_disposed) {
        lLog_Debug("Status" << toString(status) << "ignored: manager disposed");
        return;
    }

    m_lastStatus = status;

    if (status == RealtimeStatus::Subscribed) {
        lLog_Conn("Real-time connection established after" << m_attemptCount << "attempt(s)");

        cancelRetryTimer();
        m_attemptCount = 0;
        m_backoff.reset();
        m_isReconnecting = false;
        m_disconnectNotified = false;
        m_lastSuccessAt = m_timers.now();
        m_state = ConnectionState::Connected;
        emitEvent(ReconnectEventKind::Connected);

        if (m_config.options.enableHeartbeat) {
            m_heartbeat.start();
        }
        return;
    }

    lLog_Warning("Real-time connection lost:" << toString(status)
                 << "(" << sinceLastSuccess().count() << "ms since last success)");

    m_heartbeat.stop();
    if (m_state == ConnectionState::Connected) {
        m_state = ConnectionState::Disconnected;
    }
    emitEvent(ReconnectEventKind::ConnectionLost, toString(status));
    notifyDisconnect();

    if (m_disposed) return; // onDisconnect may tear us down

    if (!m_isReconnecting) {
        m_isReconnecting = true;
        m_state = ConnectionState::Reconnecting;
        attemptReconnect();
    }
}

void ReconnectionManager::forceReconnect() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_disposed) {
        lLog_Debug("forceReconnect ignored: manager disposed");
        return;
    }

    lLog_Conn("Manual reconnection triggered");
    emitEvent(ReconnectEventKind::ManualReconnect);

    m_attemptCount = 0;
    m_backoff.reset();

    if (m_inAttempt) {
        // Called from inside onReconnect: the running attempt schedules the next retry
        lLog_Debug("forceReconnect during an in-flight attempt: counters reset only");
        return;
    }

    cancelRetryTimer();
    m_heartbeat.stop();
    m_isReconnecting = false;
    m_state = ConnectionState::Disconnected;
    attemptReconnect();
}

void ReconnectionManager::dispose() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_disposed) return;
    m_disposed = true;

    cancelRetryTimer();
    m_heartbeat.stop();
    m_network.detach();
    m_isReconnecting = false;
    m_state = ConnectionState::Disconnected;

    lLog_App("ReconnectionManager disposed");
    emitEvent(ReconnectEventKind::Disposed);
}

void ReconnectionManager::recordActivity() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_disposed) return;
    m_lastActivityAt = m_timers.now();
}

bool ReconnectionManager::isReconnecting() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_isReconnecting;
}

std::uint32_t ReconnectionManager::attemptCount() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_attemptCount;
}

bool ReconnectionManager::isOnline() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_network.isOnline();
}

bool ReconnectionManager::isDisposed() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_disposed;
}

std::chrono::milliseconds ReconnectionManager::currentDelay() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_backoff.current();
}

ConnectionState ReconnectionManager::connectionState() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_state;
}

std::optional<RealtimeStatus> ReconnectionManager::lastStatus() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_lastStatus;
}

ReconnectionManager::Clock::time_point ReconnectionManager::lastSuccessfulConnectionAt() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_lastSuccessAt;
}

bool ReconnectionManager::hasPendingRetry() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_retryTimer != TimerService::kNullTimer;
}

bool ReconnectionManager::isHeartbeatRunning() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_heartbeat.isRunning();
}

// =============================================================================
// Retry loop
// =============================================================================

void ReconnectionManager::attemptReconnect() {
    if (m_inAttempt) {
        lLog_Debug("attemptReconnect ignored: attempt already in flight");
        return;
    }

    cancelRetryTimer();

    const auto& maxAttempts = m_config.options.maxAttempts;
    if (maxAttempts && m_attemptCount >= *maxAttempts) {
        lLog_Error("Max reconnection attempts reached:" << m_attemptCount << "/" << *maxAttempts);
        emitEvent(ReconnectEventKind::AttemptsExhausted);
        m_isReconnecting = false;
        m_state = ConnectionState::Disconnected;
        return;
    }

    if (!m_network.isOnline()) {
        lLog_Net("Skipping reconnect: host is offline (loop paused at attempt" << m_attemptCount << ")");
        // Paused, not abandoned: the online event resumes from here
        m_isReconnecting = true;
        m_state = ConnectionState::Reconnecting;
        emitEvent(ReconnectEventKind::SkippedOffline);
        return;
    }

    ++m_attemptCount;
    m_isReconnecting = true;
    m_state = ConnectionState::Reconnecting;

    lLog_Conn("Attempting reconnection (attempt" << m_attemptCount << "of"
              << describeMax(maxAttempts) << ")");
    emitEvent(ReconnectEventKind::AttemptStarted);

    m_inAttempt = true;
    const std::uint32_t attempt = m_attemptCount;
    if (m_config.onReconnecting) {
        invokeGuarded("onReconnecting", [&] { m_config.onReconnecting(attempt); });
    }
    invokeGuarded("onReconnect", [&] { m_config.onReconnect(); });
    m_inAttempt = false;

    // onReconnect may have reported SUBSCRIBED synchronously, or disposed us
    if (m_disposed || !m_isReconnecting) return;

    const auto delay = m_backoff.next();
    const std::uint64_t token = ++m_retryToken;
    m_retryTimer = m_timers.scheduleOnce(delay, [this, token] { onRetryTimer(token); });

    if (m_retryTimer == TimerService::kNullTimer) {
        lLog_Error("Timer service refused the retry timer; automatic reconnection halted");
        m_isReconnecting = false;
        m_state = ConnectionState::Disconnected;
        return;
    }

    lLog_Conn("Next reconnection attempt in" << delay.count() << "ms");
}

void ReconnectionManager::onRetryTimer(std::uint64_t token) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    // Stale: cancelled, superseded or disposed after the timer had already fired
    if (m_disposed || token != m_retryToken || m_retryTimer == TimerService::kNullTimer) return;
    m_retryTimer = TimerService::kNullTimer;

    if (m_isReconnecting) {
        attemptReconnect();
    }
}

void ReconnectionManager::cancelRetryTimer() {
    if (m_retryTimer == TimerService::kNullTimer) return;
    m_timers.cancel(m_retryTimer);
    m_retryTimer = TimerService::kNullTimer;
}

// =============================================================================
// Heartbeat / network hooks
// =============================================================================

ReconnectionManager::Clock::time_point ReconnectionManager::lastLivenessAt() const {
    if (m_lastActivityAt && *m_lastActivityAt > m_lastSuccessAt) {
        return *m_lastActivityAt;
    }
    return m_lastSuccessAt;
}

void ReconnectionManager::onHeartbeatTimeout(std::chrono::milliseconds silentFor) {
    lLog_Warning("Heartbeat timeout - connection appears dead (silent for" << silentFor.count()
                 << "ms, threshold" << m_heartbeat.threshold().count() << "ms)");
    emitEvent(ReconnectEventKind::HeartbeatTimeout, std::to_string(silentFor.count()) + "ms");
    handleStatusChange(RealtimeStatus::TimedOut);
}

void ReconnectionManager::handleOffline() {
    lLog_Net("Host went offline");
    emitEvent(ReconnectEventKind::WentOffline);

    cancelRetryTimer();
    m_heartbeat.stop();
    if (m_state == ConnectionState::Connected) {
        m_state = ConnectionState::Disconnected;
    }
    notifyDisconnect();
}

void ReconnectionManager::handleOnline() {
    lLog_Net("Host came online");
    emitEvent(ReconnectEventKind::WentOnline);

    if (m_state != ConnectionState::Connected) {
        lLog_Conn("Triggering reconnect after coming online");
        attemptReconnect();
    }
}

// =============================================================================
// Notifications
// =============================================================================

void ReconnectionManager::notifyDisconnect() {
    if (m_disconnectNotified) return;
    m_disconnectNotified = true;
    if (m_config.onDisconnect) {
        invokeGuarded("onDisconnect", [&] { m_config.onDisconnect(); });
    }
}

void ReconnectionManager::emitEvent(ReconnectEventKind kind, std::string detail) {
    ReconnectEvent event;
    event.kind = kind;
    event.attempt = m_attemptCount;
    event.maxAttempts = m_config.options.maxAttempts;
    event.sinceLastSuccess = sinceLastSuccess();
    event.detail = std::move(detail);

    try {
        lLog_Debug(QString::fromStdString(event.toJson().dump()));
    } catch (const std::exception& e) {
        lLog_Warning("Failed to serialise diagnostic event:" << e.what());
    }

    if (m_config.onDiagnostic) {
        invokeGuarded("onDiagnostic", [&] { m_config.onDiagnostic(event); });
    }
}

std::chrono::milliseconds ReconnectionManager::sinceLastSuccess() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(m_timers.now() - m_lastSuccessAt);
}
