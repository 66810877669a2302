#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include "realtime/RealtimeStatus.hpp"

// Channel-provider contract: opens/closes one logical subscription.
// Topic formats and payload decoding belong to the implementation.
class ChannelProvider {
public:
    using ChannelHandle = std::uint64_t;
    using StatusCb  = std::function<void(RealtimeStatus)>;
    using MessageCb = std::function<void(std::string)>; // own the data to avoid dangling views

    static constexpr ChannelHandle kNullChannel = 0;

    ChannelProvider() = default;
    virtual ~ChannelProvider() = default;

    ChannelProvider(const ChannelProvider&) = delete;
    ChannelProvider& operator=(const ChannelProvider&) = delete;

    // Status may be reported from any thread, including synchronously from open().
    virtual ChannelHandle open(StatusCb onStatus, MessageCb onMessage) = 0;

    // Stops all further callbacks for the handle. May throw on provider failure.
    virtual void close(ChannelHandle handle) = 0;
};
