/*
Lifeline — ReconnectingSubscription
Role: Owns one channel plus the ReconnectionManager that keeps it alive.
Inputs/Outputs: ChannelProvider statuses/messages in; user callbacks and a fresh channel per retry out.
Threading: The channel lock guards only the handle and generation; provider open/close and manager
           calls run outside it, so a status reported from open() never waits on it. Whichever swap
           bumped the generation last keeps its channel; the loser closes its own handle.
Integration: The convenience entry point used by the CLI.
Observability: Channel setup/teardown logged via logConn; close failures are logged, never thrown.
Related: ReconnectingSubscription.cpp, ReconnectionManager.hpp, channel/ChannelProvider.hpp.
Assumptions: The provider, timer service and network monitor outlive this object.
*/
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "ReconnectConfig.hpp"
#include "ReconnectionManager.hpp"
#include "channel/ChannelProvider.hpp"

class ReconnectingSubscription {
public:
    struct Callbacks {
        std::function<void(RealtimeStatus)> onStatus;
        std::function<void(std::string)> onMessage;
        std::function<void()> onDisconnect;
        std::function<void(std::uint32_t)> onReconnecting;
        std::function<void(const ReconnectEvent&)> onDiagnostic;
    };

    ReconnectingSubscription(ChannelProvider& provider,
                             TimerService& timers,
                             NetworkMonitor* network,
                             ReconnectOptions options,
                             Callbacks callbacks = {});
    ~ReconnectingSubscription();

    void start();
    void stop();
    void reconnectNow();

    [[nodiscard]] bool isStarted() const { return m_started.load(); }
    [[nodiscard]] ChannelProvider::ChannelHandle currentChannel() const;
    [[nodiscard]] ReconnectionManager& manager() { return *m_manager; }
    [[nodiscard]] const ReconnectionManager& manager() const { return *m_manager; }

    ReconnectingSubscription(const ReconnectingSubscription&) = delete;
    ReconnectingSubscription& operator=(const ReconnectingSubscription&) = delete;

private:
    bool setupChannel();
    void teardownChannel(const char* reason);
    void closeChannel(ChannelProvider::ChannelHandle handle, const char* reason);
    void onChannelStatus(std::uint64_t generation, RealtimeStatus status);
    void onChannelMessage(std::uint64_t generation, std::string payload);

    ChannelProvider& m_provider;
    Callbacks m_callbacks;
    std::unique_ptr<ReconnectionManager> m_manager;

    mutable std::mutex m_channelMutex;
    ChannelProvider::ChannelHandle m_channel{ChannelProvider::kNullChannel};
    std::atomic<std::uint64_t> m_generation{0};
    std::atomic<bool> m_started{false};
};
