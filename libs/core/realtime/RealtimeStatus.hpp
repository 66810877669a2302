#pragma once
#include <optional>
#include <string_view>

// Status transitions reported by a channel provider
enum class RealtimeStatus {
    Subscribed,
    TimedOut,
    Closed,
    ChannelError,
    SubscriptionError
};

// Manager-side view of the connection
enum class ConnectionState {
    Disconnected,
    Reconnecting,
    Connected
};

inline constexpr const char* toString(RealtimeStatus status) {
    switch (status) {
        case RealtimeStatus::Subscribed:        return "SUBSCRIBED";
        case RealtimeStatus::TimedOut:          return "TIMED_OUT";
        case RealtimeStatus::Closed:            return "CLOSED";
        case RealtimeStatus::ChannelError:      return "CHANNEL_ERROR";
        case RealtimeStatus::SubscriptionError: return "SUBSCRIPTION_ERROR";
    }
    return "UNKNOWN";
}

inline constexpr const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "DISCONNECTED";
        case ConnectionState::Reconnecting: return "RECONNECTING";
        case ConnectionState::Connected:    return "CONNECTED";
    }
    return "UNKNOWN";
}

inline std::optional<RealtimeStatus> parseRealtimeStatus(std::string_view s) {
    if (s == "SUBSCRIBED")         return RealtimeStatus::Subscribed;
    if (s == "TIMED_OUT")          return RealtimeStatus::TimedOut;
    if (s == "CLOSED")             return RealtimeStatus::Closed;
    if (s == "CHANNEL_ERROR")      return RealtimeStatus::ChannelError;
    if (s == "SUBSCRIPTION_ERROR") return RealtimeStatus::SubscriptionError;
    return std::nullopt;
}

inline constexpr bool isFailure(RealtimeStatus status) {
    return status != RealtimeStatus::Subscribed;
}
