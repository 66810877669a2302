#include "ReconnectingSubscription.hpp"
#include "LifelineLogging.hpp"
#include <exception>
#include <utility>
#include <QString>

ReconnectingSubscription::ReconnectingSubscription(ChannelProvider& provider,
                                                   TimerService& timers,
                                                   NetworkMonitor* network,
                                                   ReconnectOptions options,
                                                   Callbacks callbacks)
    : m_provider(provider)
    , m_callbacks(std::move(callbacks))
{
    ReconnectConfig config;
    config.options = std::move(options);
    config.onReconnect = [this] { setupChannel(); };
    config.onDisconnect = m_callbacks.onDisconnect;
    config.onReconnecting = m_callbacks.onReconnecting;
    config.onDiagnostic = m_callbacks.onDiagnostic;
    m_manager = std::make_unique<ReconnectionManager>(std::move(config), timers, network);
}

ReconnectingSubscription::~ReconnectingSubscription() {
    stop();
}

void ReconnectingSubscription::start() {
    if (m_started.exchange(true)) return;
    lLog_Conn("Starting reconnecting subscription");
    if (!setupChannel()) {
        // No channel means no status will ever arrive; enter the retry loop ourselves
        m_manager->handleStatusChange(RealtimeStatus::ChannelError);
    }
}

void ReconnectingSubscription::stop() {
    if (!m_started.exchange(false)) return;
    m_manager->dispose();
    {
        // Silences the channel being torn down and any setup still inside open()
        std::lock_guard<std::mutex> lock(m_channelMutex);
        ++m_generation;
    }
    teardownChannel("cleanup");
    lLog_Conn("Reconnecting subscription stopped");
}

void ReconnectingSubscription::reconnectNow() {
    if (!m_started.load()) return;
    m_manager->forceReconnect();
}

ChannelProvider::ChannelHandle ReconnectingSubscription::currentChannel() const {
    std::lock_guard<std::mutex> lock(m_channelMutex);
    return m_channel;
}

bool ReconnectingSubscription::setupChannel() {
    if (!m_started.load()) return false;

    // Providers may report status synchronously from open(), re-entering the manager,
    // so no lock of ours is held across provider calls
    ChannelProvider::ChannelHandle previous;
    std::uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(m_channelMutex);
        previous = std::exchange(m_channel, ChannelProvider::kNullChannel);
        generation = ++m_generation;
    }
    closeChannel(previous, "reconnect");

    ChannelProvider::ChannelHandle handle = ChannelProvider::kNullChannel;
    try {
        handle = m_provider.open(
            [this, generation](RealtimeStatus status) { onChannelStatus(generation, status); },
            [this, generation](std::string payload) { onChannelMessage(generation, std::move(payload)); });
    } catch (const std::exception& e) {
        // Surfaces as a failed attempt; the retry timer already covers the next try
        lLog_Error("Channel setup failed:" << e.what());
        return false;
    }

    bool superseded = false;
    {
        std::lock_guard<std::mutex> lock(m_channelMutex);
        if (generation == m_generation.load()) {
            m_channel = handle;
        } else {
            superseded = true;
        }
    }
    if (superseded) {
        // A newer swap (or stop) ran while open() was in progress
        lLog_Debug("Closing channel superseded during setup");
        closeChannel(handle, "superseded setup");
    }
    return true;
}

void ReconnectingSubscription::teardownChannel(const char* reason) {
    ChannelProvider::ChannelHandle handle;
    {
        std::lock_guard<std::mutex> lock(m_channelMutex);
        handle = std::exchange(m_channel, ChannelProvider::kNullChannel);
    }
    closeChannel(handle, reason);
}

void ReconnectingSubscription::closeChannel(ChannelProvider::ChannelHandle handle, const char* reason) {
    if (handle == ChannelProvider::kNullChannel) return;
    try {
        m_provider.close(handle);
    } catch (const std::exception& e) {
        lLog_Warning("Error removing channel during" << reason << ":" << e.what());
    }
}

void ReconnectingSubscription::onChannelStatus(std::uint64_t generation, RealtimeStatus status) {
    if (generation != m_generation.load()) {
        lLog_Debug("Dropping" << toString(status) << "from superseded channel");
        return;
    }
    if (m_callbacks.onStatus) {
        try {
            m_callbacks.onStatus(status);
        } catch (const std::exception& e) {
            lLog_Error("onStatus threw:" << e.what());
        }
    }
    m_manager->handleStatusChange(status);
}

void ReconnectingSubscription::onChannelMessage(std::uint64_t generation, std::string payload) {
    if (generation != m_generation.load()) return;
    m_manager->recordActivity();
    if (m_callbacks.onMessage) {
        try {
            m_callbacks.onMessage(std::move(payload));
        } catch (const std::exception& e) {
            lLog_Error("onMessage threw:" << e.what());
        }
    }
}
