/*
Lifeline — ReconnectConfig
Role: Validation and JSON loading for ReconnectOptions.
Observability: Logs the loaded configuration on success; errors are thrown, not logged.
*/
#include "ReconnectConfig.hpp"
#include "ConfigFile.hpp"
#include "LifelineLogging.hpp"
#include <limits>
#include <stdexcept>
#include <QString>

namespace {

std::chrono::milliseconds readDelay(const nlohmann::json& j, const char* key,
                                    std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j.at(key);
    if (!v.is_number_integer()) {
        throw std::runtime_error(std::string("ReconnectOptions: '") + key + "' must be an integer (ms)");
    }
    return std::chrono::milliseconds(v.get<std::int64_t>());
}

} // namespace

void ReconnectOptions::validate() const {
    if (initialDelay.count() <= 0) {
        throw std::invalid_argument("ReconnectOptions: initialDelay must be positive");
    }
    if (maxDelay < initialDelay) {
        throw std::invalid_argument("ReconnectOptions: maxDelay must be >= initialDelay");
    }
    if (!(backoffMultiplier >= 1.0)) {
        throw std::invalid_argument("ReconnectOptions: backoffMultiplier must be >= 1");
    }
    if (heartbeatInterval.count() <= 0) {
        throw std::invalid_argument("ReconnectOptions: heartbeatInterval must be positive");
    }
}

ReconnectOptions ReconnectOptions::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("ReconnectOptions: expected a JSON object");
    }

    ReconnectOptions opts;
    if (j.contains("maxAttempts")) {
        const auto& v = j.at("maxAttempts");
        if (v.is_null()) {
            opts.maxAttempts.reset();
        } else if (v.is_number_integer() && v.get<std::int64_t>() >= 0
                   && v.get<std::int64_t>() <= std::numeric_limits<std::uint32_t>::max()) {
            opts.maxAttempts = static_cast<std::uint32_t>(v.get<std::int64_t>());
        } else {
            throw std::runtime_error("ReconnectOptions: 'maxAttempts' must be a non-negative integer or null");
        }
    }

    opts.initialDelay = readDelay(j, "initialDelayMs", opts.initialDelay);
    opts.maxDelay = readDelay(j, "maxDelayMs", opts.maxDelay);
    opts.heartbeatInterval = readDelay(j, "heartbeatIntervalMs", opts.heartbeatInterval);

    if (j.contains("backoffMultiplier")) {
        const auto& v = j.at("backoffMultiplier");
        if (!v.is_number()) {
            throw std::runtime_error("ReconnectOptions: 'backoffMultiplier' must be a number");
        }
        opts.backoffMultiplier = v.get<double>();
    }
    if (j.contains("enableHeartbeat")) {
        const auto& v = j.at("enableHeartbeat");
        if (!v.is_boolean()) {
            throw std::runtime_error("ReconnectOptions: 'enableHeartbeat' must be a boolean");
        }
        opts.enableHeartbeat = v.get<bool>();
    }
    return opts;
}

ReconnectOptions ReconnectOptions::loadFile(const std::string& path) {
    const auto j = loadJsonFile(path);

    // Accept either a bare options object or a full CLI config with a "reconnect" section
    auto opts = fromJson(j.contains("reconnect") ? j.at("reconnect") : j);
    lLog_App("Loaded reconnect options from" << QString::fromStdString(path)
             << "initialDelay:" << opts.initialDelay.count() << "ms"
             << "maxDelay:" << opts.maxDelay.count() << "ms");
    return opts;
}
