#include "NetworkStatusWatcher.hpp"
#include "ReconnectionManager.hpp"
#include "LifelineLogging.hpp"
#include <mutex>

NetworkStatusWatcher::NetworkStatusWatcher(ReconnectionManager& owner, NetworkMonitor* monitor)
    : m_owner(owner)
    , m_monitor(monitor)
{}

NetworkStatusWatcher::~NetworkStatusWatcher() {
    detach();
}

void NetworkStatusWatcher::attach() {
    if (!m_monitor) {
        lLog_Net("No network monitor available; assuming the host stays online");
        m_online = true;
        return;
    }
    if (isAttached()) return;

    m_online = m_monitor->isOnline();
    m_listener = m_monitor->addListener([this](bool online) { onNetworkEvent(online); });
    if (m_listener == NetworkMonitor::kNullListener) {
        lLog_Warning("Network monitor refused a listener; online/offline transitions will be missed");
    }
    lLog_Net("Watching network status (currently" << (m_online ? "online" : "offline") << ")");
}

void NetworkStatusWatcher::detach() {
    if (!m_monitor || m_listener == NetworkMonitor::kNullListener) return;
    m_monitor->removeListener(m_listener);
    m_listener = NetworkMonitor::kNullListener;
}

void NetworkStatusWatcher::onNetworkEvent(bool online) {
    std::lock_guard<std::recursive_mutex> lock(m_owner.m_mutex);
    if (m_owner.m_disposed || !isAttached()) return;
    if (online == m_online) return; // duplicate notification

    m_online = online;
    if (online) {
        m_owner.handleOnline();
    } else {
        m_owner.handleOffline();
    }
}
