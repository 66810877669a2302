/*
Lifeline — ReconnectionManager
Role: State machine that keeps one server-pushed subscription alive across failures.
Inputs/Outputs: Channel status events, online/offline transitions and manual triggers in;
                onReconnect / onDisconnect / onReconnecting callbacks and diagnostics out.
Threading: All state is guarded by one recursive mutex so callbacks may re-enter the public API
           (e.g. onReconnect reporting SUBSCRIBED synchronously). Callbacks run with the lock held.
Performance: O(1) per event; at most one retry timer and one heartbeat timer are ever pending.
Integration: Created once per subscription; ReconnectingSubscription wires it to a ChannelProvider.
Observability: Every transition is logged (logConn/logNet) and mirrored to onDiagnostic as a ReconnectEvent.
Related: ReconnectionManager.cpp, BackoffCalculator.hpp, HeartbeatMonitor.hpp, NetworkStatusWatcher.hpp.
Assumptions: TimerService and NetworkMonitor outlive the manager; callbacks never block on another
             thread that is itself waiting to call into this manager.
*/
#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include "ReconnectConfig.hpp"
#include "RealtimeStatus.hpp"
#include "BackoffCalculator.hpp"
#include "HeartbeatMonitor.hpp"
#include "NetworkStatusWatcher.hpp"
#include "host/TimerService.hpp"
#include "host/NetworkMonitor.hpp"

class ReconnectionManager {
public:
    using Clock = TimerService::Clock;

    /// Throws std::invalid_argument when onReconnect is missing or options are invalid.
    /// A null network monitor is tolerated: the host is then assumed to be always online.
    ReconnectionManager(ReconnectConfig config,
                        TimerService& timers,
                        NetworkMonitor* network = nullptr);
    ~ReconnectionManager();

    // Sole ingress for channel-provider events
    void handleStatusChange(RealtimeStatus status);

    // User-initiated "retry now": resets attempts and backoff, then attempts immediately
    void forceReconnect();

    // Cancels every timer and detaches every listener. Safe to call repeatedly.
    void dispose();

    // Optional liveness signal (message or pong received) consulted by the heartbeat
    void recordActivity();

    [[nodiscard]] bool isReconnecting() const;
    [[nodiscard]] std::uint32_t attemptCount() const;
    [[nodiscard]] bool isOnline() const;
    [[nodiscard]] bool isDisposed() const;
    [[nodiscard]] std::chrono::milliseconds currentDelay() const;
    [[nodiscard]] ConnectionState connectionState() const;
    [[nodiscard]] std::optional<RealtimeStatus> lastStatus() const;
    [[nodiscard]] Clock::time_point lastSuccessfulConnectionAt() const;
    [[nodiscard]] bool hasPendingRetry() const;
    [[nodiscard]] bool isHeartbeatRunning() const;
    [[nodiscard]] const ReconnectOptions& options() const { return m_config.options; }

    // Non-copyable, non-movable (timers capture this)
    ReconnectionManager(const ReconnectionManager&) = delete;
    ReconnectionManager& operator=(const ReconnectionManager&) = delete;
    ReconnectionManager(ReconnectionManager&&) = delete;
    ReconnectionManager& operator=(ReconnectionManager&&) = delete;

private:
    friend class HeartbeatMonitor;
    friend class NetworkStatusWatcher;

    // Retry loop
    void attemptReconnect();
    void onRetryTimer(std::uint64_t token);
    void cancelRetryTimer();

    // Driven by HeartbeatMonitor / NetworkStatusWatcher with m_mutex held
    Clock::time_point lastLivenessAt() const;
    void onHeartbeatTimeout(std::chrono::milliseconds silentFor);
    void handleOffline();
    void handleOnline();

    // Notification helpers (never let user code break the control flow)
    void notifyDisconnect();
    void emitEvent(ReconnectEventKind kind, std::string detail = {});
    template <class Fn>
    void invokeGuarded(const char* what, Fn&& fn);

    std::chrono::milliseconds sinceLastSuccess() const;

    const ReconnectConfig m_config;
    TimerService& m_timers;

    mutable std::recursive_mutex m_mutex;

    BackoffCalculator m_backoff;
    HeartbeatMonitor m_heartbeat;
    NetworkStatusWatcher m_network;

    ConnectionState m_state{ConnectionState::Disconnected};
    std::optional<RealtimeStatus> m_lastStatus;
    std::uint32_t m_attemptCount{0};
    bool m_isReconnecting{false};
    bool m_inAttempt{false};            // onReconnect/onReconnecting currently running
    bool m_disconnectNotified{false};   // onDisconnect already sent for this episode
    bool m_disposed{false};

    Clock::time_point m_lastSuccessAt;
    std::optional<Clock::time_point> m_lastActivityAt;

    TimerService::TimerId m_retryTimer{TimerService::kNullTimer};
    std::uint64_t m_retryToken{0};
};
