/*
Lifeline — AsioTimerService
Role: TimerService backed by boost::asio::steady_timer.
Inputs/Outputs: Callbacks are scheduled with a delay and run on the io_context thread.
Threading: Every timer is bound to one strand, so callbacks never run concurrently.
Integration: Host runtime for ReconnectionManager / HeartbeatMonitor in the CLI.
Observability: Logs when scheduling is refused because the io_context has stopped.
Related: AsioTimerService.cpp, TimerService.hpp.
Assumptions: The io_context is stopped (or its thread joined) before this object is destroyed.
*/
#pragma once
#include "TimerService.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace net = boost::asio;

class AsioTimerService : public TimerService {
public:
    explicit AsioTimerService(net::io_context& ioc)
        : ioc_(ioc)
        , strand_(ioc.get_executor())
    {}
    ~AsioTimerService() override;

    Clock::time_point now() const override { return Clock::now(); }
    TimerId scheduleOnce(std::chrono::milliseconds delay, Callback cb) override;
    void cancel(TimerId id) override;
    std::size_t pendingCount() const override;

    net::strand<net::io_context::executor_type>& strand() { return strand_; }

private:
    net::io_context& ioc_;
    net::strand<net::io_context::executor_type> strand_;

    mutable std::mutex mutex_;
    std::unordered_map<TimerId, std::shared_ptr<net::steady_timer>> timers_;
    TimerId nextId_{kNullTimer};
};
