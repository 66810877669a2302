#include "HeartbeatMonitor.hpp"
#include "ReconnectionManager.hpp"
#include "LifelineLogging.hpp"
#include <algorithm>
#include <mutex>

HeartbeatMonitor::HeartbeatMonitor(ReconnectionManager& owner,
                                   TimerService& timers,
                                   std::chrono::milliseconds interval)
    : m_owner(owner)
    , m_timers(timers)
    , m_interval(interval)
{}

HeartbeatMonitor::~HeartbeatMonitor() {
    stop();
}

void HeartbeatMonitor::start() {
    stop();
    scheduleTick();
    if (isRunning()) {
        lLog_Debug("Heartbeat monitor started (interval" << m_interval.count() << "ms)");
    }
}

void HeartbeatMonitor::stop() {
    if (m_timer == TimerService::kNullTimer) return;
    m_timers.cancel(m_timer);
    m_timer = TimerService::kNullTimer;
}

void HeartbeatMonitor::scheduleTick() {
    // Tick on the fixed interval, but never later than just past the dead-connection
    // deadline so a silent connection is caught within 1ms of crossing it.
    const auto now = m_timers.now();
    const auto deadline = m_owner.lastLivenessAt() + threshold();
    const auto untilExpired = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
                              + std::chrono::milliseconds(1);
    const auto delay = std::clamp(untilExpired, std::chrono::milliseconds(1), m_interval);

    const std::uint64_t token = ++m_token;
    m_timer = m_timers.scheduleOnce(delay, [this, token] { onTimer(token); });
    if (m_timer == TimerService::kNullTimer) {
        lLog_Warning("Timer service unavailable; running without heartbeat detection");
    }
}

void HeartbeatMonitor::onTimer(std::uint64_t token) {
    std::lock_guard<std::recursive_mutex> lock(m_owner.m_mutex);
    if (token != m_token || m_timer == TimerService::kNullTimer) return;
    m_timer = TimerService::kNullTimer;
    tick();
}

void HeartbeatMonitor::tick() {
    if (m_owner.m_disposed || m_owner.m_state != ConnectionState::Connected) return;

    const auto silentFor = std::chrono::duration_cast<std::chrono::milliseconds>(
        m_timers.now() - m_owner.lastLivenessAt());

    if (silentFor > threshold()) {
        m_owner.onHeartbeatTimeout(silentFor);
        return;
    }
    scheduleTick();
}
