/*
Lifeline — WsChannelProvider
Role: ChannelProvider over a TLS WebSocket; each open() is a fresh transport that replays the
      configured subscribe frames once the handshake completes.
Inputs/Outputs: Endpoint + opaque subscribe frames in; RealtimeStatus transitions and raw messages out.
Threading: Transport callbacks arrive on the io_context thread; the handle table is mutex-protected.
Integration: Plugged into ReconnectingSubscription by the CLI; tests inject a fake transport factory.
Observability: Logs channel open/close and the status each transport failure maps to (logNet).
Related: WsChannelProvider.cpp, ws/BeastWsTransport.hpp, ChannelProvider.hpp.
Assumptions: The io_context and ssl::context outlive every channel opened here.
*/
#pragma once
#include "ChannelProvider.hpp"
#include "ws/WsTransport.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class WsChannelProvider : public ChannelProvider {
public:
    struct Endpoint {
        std::string host;
        std::string port = "443";
        std::string target = "/";
    };
    using TransportFactory = std::function<std::shared_ptr<WsTransport>()>;

    // Production: BeastWsTransport on the given io_context
    WsChannelProvider(boost::asio::io_context& ioc,
                      boost::asio::ssl::context& sslCtx,
                      Endpoint endpoint,
                      std::vector<std::string> subscribeFrames);

    // Tests / alternative transports
    WsChannelProvider(TransportFactory factory,
                      Endpoint endpoint,
                      std::vector<std::string> subscribeFrames);

    ~WsChannelProvider() override;

    ChannelHandle open(StatusCb onStatus, MessageCb onMessage) override;
    void close(ChannelHandle handle) override;

    [[nodiscard]] std::size_t openChannels() const;

    /// Transport failure → provider status.
    static RealtimeStatus statusFor(WsTransport::Stage stage, bool timedOut);

private:
    TransportFactory m_factory;
    Endpoint m_endpoint;
    std::vector<std::string> m_subscribeFrames;

    mutable std::mutex m_mutex;
    std::map<ChannelHandle, std::shared_ptr<WsTransport>> m_channels;
    ChannelHandle m_nextHandle{kNullChannel};
};
