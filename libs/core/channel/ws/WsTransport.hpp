#pragma once
#include <functional>
#include <string>

// Pure transport interface (no provider logic)
class WsTransport {
public:
    // Where a connection failed; the channel layer maps this onto RealtimeStatus
    enum class Stage { Resolve, Connect, TlsHandshake, WsHandshake, Read, Write, Ping };

    using MessageCb = std::function<void(std::string)>;
    using OpenCb    = std::function<void()>;
    using ErrorCb   = std::function<void(Stage stage, std::string message, bool timedOut)>;

    WsTransport() = default;
    virtual ~WsTransport() = default;

    virtual void connect(std::string host, std::string port, std::string target) = 0;
    virtual void close() = 0;               // local close: no further callbacks
    virtual void send(std::string msg) = 0; // serialized by implementation

    virtual void onMessage(MessageCb) = 0;
    virtual void onOpen(OpenCb) = 0;
    virtual void onError(ErrorCb) = 0;      // at most once per connect()
};

inline constexpr const char* toString(WsTransport::Stage stage) {
    switch (stage) {
        case WsTransport::Stage::Resolve:      return "resolve";
        case WsTransport::Stage::Connect:      return "connect";
        case WsTransport::Stage::TlsHandshake: return "tls-handshake";
        case WsTransport::Stage::WsHandshake:  return "ws-handshake";
        case WsTransport::Stage::Read:         return "read";
        case WsTransport::Stage::Write:        return "write";
        case WsTransport::Stage::Ping:         return "ping";
    }
    return "unknown";
}
