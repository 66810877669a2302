#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

// Host-runtime timer contract (no scheduling policy, no reconnect logic)
class TimerService {
public:
    using Clock    = std::chrono::steady_clock;
    using TimerId  = std::uint64_t;
    using Callback = std::function<void()>;

    static constexpr TimerId kNullTimer = 0;

    TimerService() = default;
    virtual ~TimerService() = default;

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    [[nodiscard]] virtual Clock::time_point now() const = 0;

    // Returns kNullTimer when the runtime cannot schedule; callers must degrade.
    virtual TimerId scheduleOnce(std::chrono::milliseconds delay, Callback cb) = 0;

    // Cancelling an unknown or already-fired id is a no-op. cancel() does not wait for a
    // callback that is already running; cancel from the thread that runs callbacks, or join
    // that thread, before destroying anything the callback captures.
    virtual void cancel(TimerId id) = 0;

    [[nodiscard]] virtual std::size_t pendingCount() const = 0;
};
