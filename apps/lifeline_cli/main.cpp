/*
Lifeline — CLI
Role: Keeps one TLS WebSocket subscription alive and prints every message it receives.
Inputs/Outputs: JSON config path on argv[1]; messages on stdout, lifecycle on the Qt log.
Threading: One io_context thread runs transports, timers and the reachability checks, and also
           starts and stops them; main waits for the stop, then joins the thread before teardown.
Related: config/lifeline.example.json, ReconnectingSubscription.hpp.
*/
#include "ConfigFile.hpp"
#include "LifelineLogging.hpp"
#include "realtime/ReconnectConfig.hpp"
#include "realtime/ReconnectingSubscription.hpp"
#include "channel/WsChannelProvider.hpp"
#include "host/AsioTimerService.hpp"
#include "host/ReachabilityMonitor.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>
#include <nlohmann/json.hpp>
#include <csignal>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <QString>

namespace {

struct CliConfig {
    WsChannelProvider::Endpoint endpoint;
    std::vector<std::string> frames;
    ReconnectOptions reconnect;
    ReachabilityMonitor::Target reachability;
};

CliConfig loadCliConfig(const std::string& path) {
    const auto j = loadJsonFile(path);

    CliConfig cfg;
    const auto& ep = j.at("endpoint");
    cfg.endpoint.host = ep.at("host").get<std::string>();
    cfg.endpoint.port = ep.value("port", cfg.endpoint.port);
    cfg.endpoint.target = ep.value("target", cfg.endpoint.target);

    if (j.contains("subscribe")) {
        for (const auto& frame : j.at("subscribe")) {
            // Frames are opaque to the channel; strings go out verbatim, objects are serialised
            cfg.frames.push_back(frame.is_string() ? frame.get<std::string>() : frame.dump());
        }
    }
    if (j.contains("reconnect")) {
        cfg.reconnect = ReconnectOptions::fromJson(j.at("reconnect"));
    }
    if (j.contains("reachability")) {
        const auto& r = j.at("reachability");
        cfg.reachability.host = r.value("host", cfg.reachability.host);
        cfg.reachability.port = r.value("port", cfg.reachability.port);
        cfg.reachability.interval = std::chrono::milliseconds(
            r.value("intervalMs", static_cast<std::int64_t>(cfg.reachability.interval.count())));
        cfg.reachability.timeout = std::chrono::milliseconds(
            r.value("timeoutMs", static_cast<std::int64_t>(cfg.reachability.timeout.count())));
    }
    return cfg;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: lifeline_cli <config.json>" << std::endl;
        return 2;
    }

    CliConfig cfg;
    try {
        cfg = loadCliConfig(argv[1]);
        cfg.reconnect.validate();
    } catch (const std::exception& e) {
        std::cerr << "[lifeline] invalid config: " << e.what() << std::endl;
        return 1;
    }

    lLog_App("Lifeline starting for" << QString::fromStdString(cfg.endpoint.host)
             << "(" << static_cast<int>(cfg.frames.size()) << "subscribe frame(s))");

    net::io_context ioc;
    auto work = net::make_work_guard(ioc);

    boost::asio::ssl::context sslCtx{boost::asio::ssl::context::tlsv12_client};
    sslCtx.set_default_verify_paths();
    sslCtx.set_verify_mode(boost::asio::ssl::verify_peer);

    AsioTimerService timers(ioc);
    WsChannelProvider provider(ioc, sslCtx, cfg.endpoint, cfg.frames);

    ReconnectingSubscription::Callbacks callbacks;
    callbacks.onMessage = [](std::string payload) {
        std::cout << payload << std::endl;
    };
    callbacks.onStatus = [](RealtimeStatus status) {
        std::cerr << "[lifeline] status " << toString(status) << std::endl;
    };
    callbacks.onDisconnect = [] {
        std::cerr << "[lifeline] connection lost" << std::endl;
    };
    callbacks.onReconnecting = [](std::uint32_t attempt) {
        std::cerr << "[lifeline] reconnecting (attempt " << attempt << ")" << std::endl;
    };

    std::unique_ptr<ReachabilityMonitor> reachability;
    std::unique_ptr<ReconnectingSubscription> subscription;
    try {
        reachability = std::make_unique<ReachabilityMonitor>(ioc, cfg.reachability);
        subscription = std::make_unique<ReconnectingSubscription>(
            provider, timers, reachability.get(), cfg.reconnect, std::move(callbacks));
    } catch (const std::exception& e) {
        std::cerr << "[lifeline] " << e.what() << std::endl;
        return 1;
    }

    // Everything that touches io objects runs on the io thread: start, and stop from the signal handler
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    std::promise<void> stopRequested;
    auto stopped = stopRequested.get_future();
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (!ec) {
            lLog_App("Signal" << sig << "received, shutting down");
        }
        // Subscription first (disposes timers and listeners, closes its channel), then reachability
        subscription->stop();
        reachability->stop();
        stopRequested.set_value();
    });

    net::post(ioc, [&] {
        reachability->start();
        subscription->start();
    });

    std::thread ioThread([&ioc] { ioc.run(); });

    stopped.wait();

    // Join before destroying anything a queued completion could still reach
    work.reset();
    ioc.stop();
    ioThread.join();
    subscription.reset();
    reachability.reset();

    lLog_App("Lifeline stopped");
    return 0;
}
