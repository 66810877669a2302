/*
Lifeline — ReconnectConfig
Role: Immutable per-manager configuration: callbacks plus backoff/heartbeat tuning.
Inputs/Outputs: Built in code, or the numeric part loaded from a JSON file via ReconnectOptions.
Threading: Plain value types; copied into the manager at construction.
Integration: Consumed by ReconnectionManager, ReconnectingSubscription and the CLI.
Observability: Load failures throw std::runtime_error naming the file or offending key.
Related: ReconnectConfig.cpp, ReconnectionManager.hpp.
Assumptions: Callbacks are cheap and do not block; onReconnect is fire-and-forget.
*/
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "ReconnectEvent.hpp"

struct ReconnectOptions {
    std::optional<std::uint32_t> maxAttempts;               // nullopt = retry forever
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{30000};
    double backoffMultiplier{2.0};
    bool enableHeartbeat{true};
    std::chrono::milliseconds heartbeatInterval{30000};

    /// Throws std::invalid_argument on values the state machine cannot honour.
    void validate() const;

    /// Absent keys keep their defaults. Throws std::runtime_error on wrong types.
    static ReconnectOptions fromJson(const nlohmann::json& j);
    static ReconnectOptions loadFile(const std::string& path);
};

struct ReconnectConfig {
    std::function<void()> onReconnect;                      // required: rebuild the subscription
    std::function<void()> onDisconnect;
    std::function<void(std::uint32_t attempt)> onReconnecting;
    std::function<void(const ReconnectEvent&)> onDiagnostic;

    ReconnectOptions options;
};
