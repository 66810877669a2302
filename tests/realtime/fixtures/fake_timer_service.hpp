#pragma once
#include "host/TimerService.hpp"
#include <chrono>
#include <map>
#include <vector>

/// Deterministic TimerService: time only moves when advance() is called.
/// Callbacks fire in deadline order (ties in scheduling order) on the calling thread.
class FakeTimerService : public TimerService {
public:
    Clock::time_point now() const override { return now_; }

    TimerId scheduleOnce(std::chrono::milliseconds delay, Callback cb) override {
        if (refuse_) return kNullTimer;
        const TimerId id = ++nextId_;
        timers_.emplace(id, Entry{now_ + delay, std::move(cb)});
        scheduledDelays_.push_back(delay);
        return id;
    }

    void cancel(TimerId id) override {
        timers_.erase(id);
    }

    std::size_t pendingCount() const override { return timers_.size(); }

    /// Move the clock forward, firing every timer that comes due on the way.
    void advance(std::chrono::milliseconds by) {
        const auto target = now_ + by;
        for (;;) {
            auto due = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                if (it->second.when <= target && (due == timers_.end() || it->second.when < due->second.when)) {
                    due = it;
                }
            }
            if (due == timers_.end()) break;

            now_ = due->second.when;
            Callback cb = std::move(due->second.cb);
            timers_.erase(due);
            cb();
        }
        now_ = target;
    }

    /// Milliseconds since the fake epoch
    long long elapsedMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now_ - Clock::time_point{}).count();
    }

    // Simulate a host runtime that cannot schedule
    void setRefuse(bool refuse) { refuse_ = refuse; }

    const std::vector<std::chrono::milliseconds>& scheduledDelays() const { return scheduledDelays_; }
    void clearScheduledDelays() { scheduledDelays_.clear(); }

private:
    struct Entry {
        Clock::time_point when;
        Callback cb;
    };

    Clock::time_point now_{};
    std::map<TimerId, Entry> timers_;
    std::vector<std::chrono::milliseconds> scheduledDelays_;
    TimerId nextId_{kNullTimer};
    bool refuse_{false};
};
