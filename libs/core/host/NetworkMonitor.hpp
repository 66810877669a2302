#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>

// Host-runtime online/offline notification contract
class NetworkMonitor {
public:
    using Listener   = std::function<void(bool online)>;
    using ListenerId = std::uint64_t;

    static constexpr ListenerId kNullListener = 0;

    NetworkMonitor() = default;
    virtual ~NetworkMonitor() = default;

    NetworkMonitor(const NetworkMonitor&) = delete;
    NetworkMonitor& operator=(const NetworkMonitor&) = delete;

    [[nodiscard]] virtual bool isOnline() const = 0;

    // Listeners are only told about transitions, never the current state.
    virtual ListenerId addListener(Listener listener) = 0;
    virtual void removeListener(ListenerId id) = 0;

    [[nodiscard]] virtual std::size_t listenerCount() const = 0;
};
