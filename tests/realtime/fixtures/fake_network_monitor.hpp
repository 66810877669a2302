#pragma once
#include "host/NetworkMonitor.hpp"
#include <map>

/// Scriptable NetworkMonitor; goOnline()/goOffline() notify only on transitions,
/// emit() delivers a raw event even when nothing changed.
class FakeNetworkMonitor : public NetworkMonitor {
public:
    explicit FakeNetworkMonitor(bool online = true) : online_(online) {}

    bool isOnline() const override { return online_; }

    ListenerId addListener(Listener listener) override {
        const ListenerId id = ++nextId_;
        listeners_.emplace(id, std::move(listener));
        return id;
    }

    void removeListener(ListenerId id) override { listeners_.erase(id); }

    std::size_t listenerCount() const override { return listeners_.size(); }

    void goOnline()  { if (!online_) emit(true); }
    void goOffline() { if (online_) emit(false); }

    void emit(bool online) {
        online_ = online;
        auto snapshot = listeners_;
        for (auto& [id, listener] : snapshot) {
            listener(online);
        }
    }

private:
    bool online_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId nextId_{kNullListener};
};
