#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Structured diagnostics emitted by ReconnectionManager
enum class ReconnectEventKind {
    AttemptStarted,
    AttemptsExhausted,
    SkippedOffline,
    Connected,
    ConnectionLost,
    HeartbeatTimeout,
    WentOnline,
    WentOffline,
    ManualReconnect,
    Disposed
};

const char* toString(ReconnectEventKind kind);

struct ReconnectEvent {
    ReconnectEventKind kind{ReconnectEventKind::AttemptStarted};
    std::uint32_t attempt{0};
    std::optional<std::uint32_t> maxAttempts;          // nullopt = unbounded
    std::chrono::milliseconds sinceLastSuccess{0};
    std::string detail;                                // status name or free text

    [[nodiscard]] nlohmann::json toJson() const;
};
