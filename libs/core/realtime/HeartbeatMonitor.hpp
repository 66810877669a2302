#pragma once
#include <chrono>
#include <cstdint>
#include "host/TimerService.hpp"

class ReconnectionManager;

// Detects connections that die without a close event.
// Only ever touched with the owning manager's lock held.
class HeartbeatMonitor {
public:
    HeartbeatMonitor(ReconnectionManager& owner,
                     TimerService& timers,
                     std::chrono::milliseconds interval);
    ~HeartbeatMonitor();

    void start();
    void stop();

    [[nodiscard]] bool isRunning() const { return m_timer != TimerService::kNullTimer; }
    [[nodiscard]] std::chrono::milliseconds interval() const { return m_interval; }
    [[nodiscard]] std::chrono::milliseconds threshold() const { return m_interval * 2; }

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

private:
    void scheduleTick();
    void onTimer(std::uint64_t token);
    void tick();

    ReconnectionManager& m_owner;
    TimerService& m_timers;
    const std::chrono::milliseconds m_interval;

    TimerService::TimerId m_timer{TimerService::kNullTimer};
    std::uint64_t m_token{0};
};
