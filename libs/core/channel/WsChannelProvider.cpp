#include "WsChannelProvider.hpp"
#include "ws/BeastWsTransport.hpp"
#include "LifelineLogging.hpp"
#include <stdexcept>
#include <QString>

WsChannelProvider::WsChannelProvider(boost::asio::io_context& ioc,
                                     boost::asio::ssl::context& sslCtx,
                                     Endpoint endpoint,
                                     std::vector<std::string> subscribeFrames)
    : WsChannelProvider(
          [&ioc, &sslCtx]() -> std::shared_ptr<WsTransport> {
              return std::make_shared<BeastWsTransport>(ioc, sslCtx);
          },
          std::move(endpoint),
          std::move(subscribeFrames))
{}

WsChannelProvider::WsChannelProvider(TransportFactory factory,
                                     Endpoint endpoint,
                                     std::vector<std::string> subscribeFrames)
    : m_factory(std::move(factory))
    , m_endpoint(std::move(endpoint))
    , m_subscribeFrames(std::move(subscribeFrames))
{
    if (!m_factory) {
        throw std::invalid_argument("WsChannelProvider: transport factory is required");
    }
}

WsChannelProvider::~WsChannelProvider() {
    std::map<ChannelHandle, std::shared_ptr<WsTransport>> channels;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        channels.swap(m_channels);
    }
    for (auto& [handle, transport] : channels) {
        transport->close();
    }
}

RealtimeStatus WsChannelProvider::statusFor(WsTransport::Stage stage, bool timedOut) {
    if (timedOut) return RealtimeStatus::TimedOut;
    switch (stage) {
        case WsTransport::Stage::Resolve:
        case WsTransport::Stage::Connect:
        case WsTransport::Stage::TlsHandshake:
        case WsTransport::Stage::WsHandshake:
            return RealtimeStatus::ChannelError;
        case WsTransport::Stage::Read:
            return RealtimeStatus::Closed;
        case WsTransport::Stage::Write:
            return RealtimeStatus::SubscriptionError;
        case WsTransport::Stage::Ping:
            return RealtimeStatus::TimedOut;
    }
    return RealtimeStatus::ChannelError;
}

ChannelProvider::ChannelHandle WsChannelProvider::open(StatusCb onStatus, MessageCb onMessage) {
    auto transport = m_factory();
    if (!transport) {
        throw std::runtime_error("WsChannelProvider: transport factory returned null");
    }

    ChannelHandle handle;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handle = ++m_nextHandle;
        m_channels.emplace(handle, transport);
    }

    // Raw pointer: the transport keeps itself alive while its handlers run
    WsTransport* raw = transport.get();
    const auto frames = m_subscribeFrames;

    transport->onOpen([raw, frames, onStatus, handle]() {
        for (const auto& frame : frames) {
            raw->send(frame);
        }
        lLog_Net("Channel" << handle << "subscribed (" << static_cast<int>(frames.size()) << "frame(s) sent)");
        if (onStatus) onStatus(RealtimeStatus::Subscribed);
    });
    transport->onMessage([onMessage](std::string payload) {
        if (onMessage) onMessage(std::move(payload));
    });
    transport->onError([onStatus, handle](WsTransport::Stage stage, std::string message, bool timedOut) {
        const auto status = statusFor(stage, timedOut);
        lLog_Net("Channel" << handle << toString(stage) << "failure ->" << toString(status)
                 << ":" << QString::fromStdString(message));
        if (onStatus) onStatus(status);
    });

    lLog_Net("Opening channel" << handle << "to" << QString::fromStdString(m_endpoint.host + m_endpoint.target));
    transport->connect(m_endpoint.host, m_endpoint.port, m_endpoint.target);
    return handle;
}

void WsChannelProvider::close(ChannelHandle handle) {
    std::shared_ptr<WsTransport> transport;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_channels.find(handle);
        if (it == m_channels.end()) {
            throw std::out_of_range("WsChannelProvider: unknown channel " + std::to_string(handle));
        }
        transport = std::move(it->second);
        m_channels.erase(it);
    }
    transport->close();
    lLog_Net("Channel" << handle << "closed");
}

std::size_t WsChannelProvider::openChannels() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels.size();
}
