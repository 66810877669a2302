/*
Lifeline — Host Runtime Tests
Role: Verify the Asio-backed TimerService and ReachabilityMonitor bookkeeping
Testing Strategy: Real io_context with short delays; reachability runs against a loopback acceptor
Coverage: Firing, cancellation, ordering, refusal after stop, listener registration, transitions
*/
#include <gtest/gtest.h>
#include "host/AsioTimerService.hpp"
#include "host/ReachabilityMonitor.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using tcp = net::ip::tcp;

namespace {

bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

// =============================================================================
// AsioTimerService
// =============================================================================

TEST(AsioTimerService, FiresScheduledCallback) {
    net::io_context ioc;
    AsioTimerService timers(ioc);
    int fired = 0;

    auto id = timers.scheduleOnce(5ms, [&] { ++fired; });
    EXPECT_NE(id, TimerService::kNullTimer);
    EXPECT_EQ(timers.pendingCount(), 1u);

    ioc.run();

    EXPECT_EQ(fired, 1);
    EXPECT_EQ(timers.pendingCount(), 0u);
}

TEST(AsioTimerService, CancelledCallbackNeverRuns) {
    net::io_context ioc;
    AsioTimerService timers(ioc);
    int fired = 0;

    auto id = timers.scheduleOnce(5ms, [&] { ++fired; });
    timers.cancel(id);
    timers.cancel(id);
    ioc.run();

    EXPECT_EQ(fired, 0);
    EXPECT_EQ(timers.pendingCount(), 0u);
}

TEST(AsioTimerService, FiresInDeadlineOrder) {
    net::io_context ioc;
    AsioTimerService timers(ioc);
    std::vector<int> order;

    timers.scheduleOnce(30ms, [&] { order.push_back(30); });
    timers.scheduleOnce(1ms, [&] { order.push_back(1); });
    timers.scheduleOnce(15ms, [&] { order.push_back(15); });
    ioc.run();

    EXPECT_EQ(order, (std::vector<int>{1, 15, 30}));
}

TEST(AsioTimerService, CallbackMayScheduleAnother) {
    net::io_context ioc;
    AsioTimerService timers(ioc);
    int fired = 0;

    timers.scheduleOnce(1ms, [&] {
        ++fired;
        timers.scheduleOnce(1ms, [&] { ++fired; });
    });
    ioc.run();

    EXPECT_EQ(fired, 2);
}

TEST(AsioTimerService, CancelFromEarlierCallbackSuppressesLaterOne) {
    net::io_context ioc;
    AsioTimerService timers(ioc);
    int late = 0;

    TimerService::TimerId second = TimerService::kNullTimer;
    timers.scheduleOnce(1ms, [&] { timers.cancel(second); });
    second = timers.scheduleOnce(20ms, [&] { ++late; });
    ioc.run();

    EXPECT_EQ(late, 0);
    EXPECT_EQ(timers.pendingCount(), 0u);
}

TEST(AsioTimerService, CancelOnIoThreadThenJoinLeavesNothingRunning) {
    net::io_context ioc;
    auto work = net::make_work_guard(ioc);
    AsioTimerService timers(ioc);
    std::mutex mutex;
    int fired = 0;

    auto id = timers.scheduleOnce(50ms, [&] {
        std::lock_guard<std::mutex> lock(mutex);
        ++fired;
    });
    std::thread ioThread([&ioc] { ioc.run(); });

    net::post(ioc, [&] { timers.cancel(id); });
    work.reset();
    ioThread.join();

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(timers.pendingCount(), 0u);
}

TEST(AsioTimerService, RefusesAfterIoContextStopped) {
    net::io_context ioc;
    AsioTimerService timers(ioc);
    ioc.stop();

    EXPECT_EQ(timers.scheduleOnce(1ms, [] {}), TimerService::kNullTimer);
    EXPECT_EQ(timers.pendingCount(), 0u);
}

TEST(AsioTimerService, CancelUnknownIdIsNoop) {
    net::io_context ioc;
    AsioTimerService timers(ioc);
    EXPECT_NO_THROW(timers.cancel(TimerService::kNullTimer));
    EXPECT_NO_THROW(timers.cancel(12345));
}

// =============================================================================
// ReachabilityMonitor
// =============================================================================

TEST(ReachabilityMonitor, ReportsInitialState) {
    net::io_context ioc;
    ReachabilityMonitor online(ioc, ReachabilityMonitor::Target{});
    ReachabilityMonitor offline(ioc, ReachabilityMonitor::Target{}, false);

    EXPECT_TRUE(online.isOnline());
    EXPECT_FALSE(offline.isOnline());
}

TEST(ReachabilityMonitor, TracksListeners) {
    net::io_context ioc;
    ReachabilityMonitor monitor(ioc, ReachabilityMonitor::Target{});

    auto a = monitor.addListener([](bool) {});
    auto b = monitor.addListener([](bool) {});
    EXPECT_NE(a, b);
    EXPECT_EQ(monitor.listenerCount(), 2u);

    monitor.removeListener(a);
    monitor.removeListener(a);
    EXPECT_EQ(monitor.listenerCount(), 1u);
}

TEST(ReachabilityMonitor, StopWithoutStartIsSafe) {
    net::io_context ioc;
    ReachabilityMonitor monitor(ioc, ReachabilityMonitor::Target{});
    EXPECT_NO_THROW(monitor.stop());
}

TEST(ReachabilityMonitor, RejectsNonPositiveIntervalOrTimeout) {
    net::io_context ioc;
    ReachabilityMonitor::Target zeroInterval;
    zeroInterval.interval = 0ms;
    ReachabilityMonitor::Target zeroTimeout;
    zeroTimeout.timeout = 0ms;

    EXPECT_THROW({ ReachabilityMonitor monitor(ioc, zeroInterval); }, std::invalid_argument);
    EXPECT_THROW({ ReachabilityMonitor monitor(ioc, zeroTimeout); }, std::invalid_argument);
}

TEST(ReachabilityMonitor, ReportsOneTransitionPerListenerStateChange) {
    // The listener side lives on its own io_context that is never run; the kernel
    // completes handshakes from the backlog, which is all a reachability check needs.
    net::io_context listenerIoc;
    auto acceptor = std::make_unique<tcp::acceptor>(listenerIoc, tcp::endpoint(net::ip::address_v4::loopback(), 0));
    const auto port = acceptor->local_endpoint().port();

    ReachabilityMonitor::Target target;
    target.host = "127.0.0.1";
    target.port = std::to_string(port);
    target.interval = 20ms;
    target.timeout = 200ms;

    net::io_context ioc;
    auto work = net::make_work_guard(ioc);
    ReachabilityMonitor monitor(ioc, target);

    std::mutex mutex;
    std::vector<bool> events;
    monitor.addListener([&](bool online) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(online);
    });
    auto eventCount = [&] {
        std::lock_guard<std::mutex> lock(mutex);
        return events.size();
    };

    monitor.start();
    std::thread ioThread([&ioc] { ioc.run(); });

    // Several successful checks against a reachable endpoint change nothing
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(eventCount(), 0u);
    EXPECT_TRUE(monitor.isOnline());

    acceptor.reset();
    EXPECT_TRUE(waitUntil([&] { return eventCount() >= 1; }, 2000ms));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(eventCount(), 1u);
    EXPECT_FALSE(monitor.isOnline());

    acceptor = std::make_unique<tcp::acceptor>(listenerIoc);
    acceptor->open(tcp::v4());
    acceptor->set_option(tcp::acceptor::reuse_address(true));
    acceptor->bind(tcp::endpoint(net::ip::address_v4::loopback(), port));
    acceptor->listen();

    EXPECT_TRUE(waitUntil([&] { return eventCount() >= 2; }, 2000ms));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(eventCount(), 2u);
    EXPECT_TRUE(monitor.isOnline());

    net::post(ioc, [&] { monitor.stop(); });
    work.reset();
    ioThread.join();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_FALSE(events[0]);
    EXPECT_TRUE(events[1]);
}
