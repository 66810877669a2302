#include "ReconnectEvent.hpp"

const char* toString(ReconnectEventKind kind) {
    switch (kind) {
        case ReconnectEventKind::AttemptStarted:    return "attempt_started";
        case ReconnectEventKind::AttemptsExhausted: return "attempts_exhausted";
        case ReconnectEventKind::SkippedOffline:    return "skipped_offline";
        case ReconnectEventKind::Connected:         return "connected";
        case ReconnectEventKind::ConnectionLost:    return "connection_lost";
        case ReconnectEventKind::HeartbeatTimeout:  return "heartbeat_timeout";
        case ReconnectEventKind::WentOnline:        return "went_online";
        case ReconnectEventKind::WentOffline:       return "went_offline";
        case ReconnectEventKind::ManualReconnect:   return "manual_reconnect";
        case ReconnectEventKind::Disposed:          return "disposed";
    }
    return "unknown";
}

nlohmann::json ReconnectEvent::toJson() const {
    nlohmann::json j;
    j["component"] = "RealtimeReconnection";
    j["event"] = toString(kind);
    j["attempt"] = attempt;
    if (maxAttempts) {
        j["maxAttempts"] = *maxAttempts;
    } else {
        j["maxAttempts"] = nullptr;
    }
    j["sinceLastSuccessMs"] = sinceLastSuccess.count();
    if (!detail.empty()) {
        j["detail"] = detail;
    }
    return j;
}
