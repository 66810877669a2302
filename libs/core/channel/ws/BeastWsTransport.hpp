#pragma once
#include "WsTransport.hpp"
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>  // ensure tcp_stream is declared
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// One TLS WebSocket connection per connect(); the stream is rebuilt every time
// because a closed beast stream cannot be reopened. Always hold in a shared_ptr.
class BeastWsTransport : public WsTransport,
                         public std::enable_shared_from_this<BeastWsTransport> {
public:
    BeastWsTransport(net::io_context& ioc, ssl::context& sslCtx,
                     std::chrono::seconds connectTimeout = std::chrono::seconds(30),
                     std::chrono::seconds pingInterval = std::chrono::seconds(25))
        : strand_(ioc.get_executor())
        , sslCtx_(sslCtx)
        , resolver_(strand_)
        , pingTimer_(strand_)
        , connectTimeout_(connectTimeout)
        , pingInterval_(pingInterval)
    {}

    void connect(std::string host, std::string port, std::string target) override;
    void close() override;
    void send(std::string msg) override;

    void onMessage(MessageCb cb) override { onMessage_ = std::move(cb); }
    void onOpen(OpenCb cb) override { onOpen_ = std::move(cb); }
    void onError(ErrorCb cb) override { onError_ = std::move(cb); }

private:
    using Stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    // Callbacks
    MessageCb onMessage_;
    OpenCb    onOpen_;
    ErrorCb   onError_;

    // Beast state
    net::strand<net::io_context::executor_type> strand_;
    ssl::context& sslCtx_;
    tcp::resolver resolver_;
    std::unique_ptr<Stream> ws_;
    beast::flat_buffer buf_;
    net::steady_timer pingTimer_;
    std::deque<std::string> writeQueue_;

    // State (strand only)
    std::string host_;
    std::string port_;
    std::string target_;
    bool open_{false};
    bool done_{true};       // closed locally or failed; swallow further completions
    std::chrono::seconds connectTimeout_;
    std::chrono::seconds pingInterval_;

    // Handlers
    void onResolve(beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type);
    void onSslHandshake(beast::error_code ec);
    void onWsHandshake(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void doWrite();
    void schedulePing();
    void fail(Stage stage, beast::error_code ec);
};
