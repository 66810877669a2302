#include "ReachabilityMonitor.hpp"
#include "LifelineLogging.hpp"
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/core/error.hpp>
#include <memory>
#include <stdexcept>
#include <vector>
#include <QString>

namespace beast = boost::beast;
using tcp = net::ip::tcp;

ReachabilityMonitor::ReachabilityMonitor(net::io_context& ioc, Target target, bool initiallyOnline)
    : m_target(std::move(target))
    , m_strand(ioc.get_executor())
    , m_resolver(m_strand)
    , m_checkTimer(m_strand)
    , m_online(initiallyOnline)
{
    if (m_target.interval.count() <= 0) {
        throw std::invalid_argument("reachability interval must be > 0 ms");
    }
    if (m_target.timeout.count() <= 0) {
        throw std::invalid_argument("reachability timeout must be > 0 ms");
    }
}

ReachabilityMonitor::~ReachabilityMonitor() {
    stop();
}

void ReachabilityMonitor::start() {
    if (m_running.exchange(true)) return;
    lLog_Net("Reachability checks started:" << QString::fromStdString(m_target.host)
             << QString::fromStdString(m_target.port) << "every" << m_target.interval.count() << "ms");
    scheduleCheck(std::chrono::milliseconds(0));
}

void ReachabilityMonitor::stop() {
    if (!m_running.exchange(false)) return;
    m_checkTimer.cancel();
    m_resolver.cancel();
    lLog_Net("Reachability checks stopped");
}

NetworkMonitor::ListenerId ReachabilityMonitor::addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    const ListenerId id = ++m_nextListener;
    m_listeners.emplace(id, std::move(listener));
    return id;
}

void ReachabilityMonitor::removeListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    m_listeners.erase(id);
}

std::size_t ReachabilityMonitor::listenerCount() const {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    return m_listeners.size();
}

void ReachabilityMonitor::scheduleCheck(std::chrono::milliseconds delay) {
    if (!m_running.load()) return;
    m_checkTimer.expires_after(delay);
    m_checkTimer.async_wait([this](beast::error_code ec) {
        if (ec || !m_running.load()) return;
        runCheck();
    });
}

void ReachabilityMonitor::runCheck() {
    m_resolver.async_resolve(m_target.host, m_target.port,
        [this](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec == net::error::operation_aborted || !m_running.load()) return;
            if (ec) {
                lLog_Debug("Reachability resolve failed:" << QString::fromStdString(ec.message()));
                setOnline(false);
                scheduleCheck(m_target.interval);
                return;
            }

            auto stream = std::make_shared<beast::tcp_stream>(m_strand);
            stream->expires_after(m_target.timeout);
            stream->async_connect(results,
                [this, stream](beast::error_code ec2, tcp::resolver::results_type::endpoint_type) {
                    if (!m_running.load()) return;
                    if (ec2) {
                        lLog_Debug("Reachability connect failed:" << QString::fromStdString(ec2.message()));
                    }
                    beast::error_code ignored;
                    stream->socket().shutdown(tcp::socket::shutdown_both, ignored);
                    stream->close();
                    setOnline(!ec2);
                    scheduleCheck(m_target.interval);
                });
        });
}

void ReachabilityMonitor::setOnline(bool online) {
    if (m_online.exchange(online) == online) return;

    lLog_Net("Network reachability changed:" << (online ? "online" : "offline"));

    // Copy so listeners may add/remove themselves while being notified
    std::vector<Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        snapshot.reserve(m_listeners.size());
        for (const auto& [id, listener] : m_listeners) snapshot.push_back(listener);
    }
    for (const auto& listener : snapshot) {
        if (listener) listener(online);
    }
}
