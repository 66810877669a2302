#pragma once
#include "host/NetworkMonitor.hpp"

class ReconnectionManager;

// Bridges host online/offline notifications into the owning manager.
// A null monitor means the host cannot report connectivity: assume online.
class NetworkStatusWatcher {
public:
    NetworkStatusWatcher(ReconnectionManager& owner, NetworkMonitor* monitor);
    ~NetworkStatusWatcher();

    void attach();
    void detach();

    [[nodiscard]] bool isOnline() const { return m_online; }
    [[nodiscard]] bool isAttached() const { return m_listener != NetworkMonitor::kNullListener; }

    NetworkStatusWatcher(const NetworkStatusWatcher&) = delete;
    NetworkStatusWatcher& operator=(const NetworkStatusWatcher&) = delete;

private:
    void onNetworkEvent(bool online);

    ReconnectionManager& m_owner;
    NetworkMonitor* m_monitor;
    NetworkMonitor::ListenerId m_listener{NetworkMonitor::kNullListener};
    bool m_online{true};
};
