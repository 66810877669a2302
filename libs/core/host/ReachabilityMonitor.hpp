/*
Lifeline — ReachabilityMonitor
Role: NetworkMonitor that infers online/offline by periodically opening a TCP connection to a known endpoint.
Inputs/Outputs: Target host/port/interval/timeout in; online/offline transitions out to listeners.
Threading: Checks run on the io_context strand; listener registration is mutex-protected.
Performance: One resolve + connect per interval; the socket is closed immediately.
Integration: Host runtime for the CLI; tests use FakeNetworkMonitor instead.
Observability: Logs every transition through the logNet category.
Related: ReachabilityMonitor.cpp, NetworkMonitor.hpp.
Assumptions: start(), stop() and listener removal run on the io_context thread, or after it has
             been joined; the io_context is stopped before destruction.
*/
#pragma once
#include "NetworkMonitor.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>

namespace net = boost::asio;

class ReachabilityMonitor : public NetworkMonitor {
public:
    struct Target {
        std::string host = "1.1.1.1";
        std::string port = "443";
        std::chrono::milliseconds interval{5000};
        std::chrono::milliseconds timeout{3000};
    };

    // Throws std::invalid_argument when the interval or timeout is not positive.
    ReachabilityMonitor(net::io_context& ioc, Target target, bool initiallyOnline = true);
    ~ReachabilityMonitor() override;

    void start();
    void stop();

    bool isOnline() const override { return m_online.load(); }
    ListenerId addListener(Listener listener) override;
    void removeListener(ListenerId id) override;
    std::size_t listenerCount() const override;

    ReachabilityMonitor(const ReachabilityMonitor&) = delete;
    ReachabilityMonitor& operator=(const ReachabilityMonitor&) = delete;

private:
    void scheduleCheck(std::chrono::milliseconds delay);
    void runCheck();
    void setOnline(bool online);

    Target m_target;
    net::strand<net::io_context::executor_type> m_strand;
    net::ip::tcp::resolver m_resolver;
    net::steady_timer m_checkTimer;

    std::atomic<bool> m_online;
    std::atomic<bool> m_running{false};

    mutable std::mutex m_listenersMutex;
    std::map<ListenerId, Listener> m_listeners;
    ListenerId m_nextListener{kNullListener};
};
