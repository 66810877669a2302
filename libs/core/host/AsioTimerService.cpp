#include "AsioTimerService.hpp"
#include "LifelineLogging.hpp"
#include <boost/asio/error.hpp>

AsioTimerService::~AsioTimerService() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, timer] : timers_) {
        timer->cancel();
    }
    timers_.clear();
}

TimerService::TimerId AsioTimerService::scheduleOnce(std::chrono::milliseconds delay, Callback cb) {
    if (ioc_.stopped()) {
        lLog_Warning("AsioTimerService: io_context stopped, refusing to schedule" << delay.count() << "ms timer");
        return kNullTimer;
    }

    auto timer = std::make_shared<net::steady_timer>(strand_, delay);
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = ++nextId_;
        timers_.emplace(id, timer);
    }

    timer->async_wait([this, id, cb = std::move(cb)](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // Cancelled between expiry and dispatch
            if (timers_.erase(id) == 0) return;
        }
        if (cb) cb();
    });
    return id;
}

void AsioTimerService::cancel(TimerId id) {
    if (id == kNullTimer) return;
    std::shared_ptr<net::steady_timer> timer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timers_.find(id);
        if (it == timers_.end()) return;
        timer = std::move(it->second);
        timers_.erase(it);
    }
    timer->cancel();
}

std::size_t AsioTimerService::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}
