#include "BeastWsTransport.hpp"
#include "LifelineLogging.hpp"
#include <boost/beast/core.hpp>  // covers buffers, flat_buffer, etc.
#include <boost/asio/post.hpp>
#include <openssl/err.h>
#include <QString>

void BeastWsTransport::connect(std::string host, std::string port, std::string target) {
    net::post(strand_, [self = shared_from_this(), h = std::move(host), p = std::move(port),
                        t = std::move(target)]() mutable {
        self->host_ = std::move(h);
        self->port_ = std::move(p);
        self->target_ = std::move(t);
        self->open_ = false;
        self->done_ = false;
        self->writeQueue_.clear();
        self->buf_.consume(self->buf_.size());
        self->ws_ = std::make_unique<Stream>(self->strand_, self->sslCtx_);

        lLog_Net("Connecting to" << QString::fromStdString(self->host_) << ":" << QString::fromStdString(self->port_));
        self->resolver_.async_resolve(self->host_, self->port_,
            [self](beast::error_code ec, tcp::resolver::results_type results) {
                self->onResolve(ec, results);
            });
    });
}

void BeastWsTransport::close() {
    net::post(strand_, [self = shared_from_this()]() {
        if (self->done_) return;
        self->done_ = true;
        self->open_ = false;
        self->pingTimer_.cancel();
        self->resolver_.cancel();
        if (!self->ws_) return;

        if (self->ws_->is_open()) {
            self->ws_->async_close(websocket::close_code::normal, [self](beast::error_code ec) {
                if (ec) lLog_Debug("Close handshake failed:" << QString::fromStdString(ec.message()));
            });
        } else {
            // Aborts a connect or handshake still in progress
            beast::get_lowest_layer(*self->ws_).close();
        }
    });
}

void BeastWsTransport::send(std::string msg) {
    net::post(strand_, [self = shared_from_this(), m = std::move(msg)]() mutable {
        if (self->done_) return;
        self->writeQueue_.emplace_back(std::move(m));
        if (self->open_ && self->writeQueue_.size() == 1) {
            self->doWrite();
        }
    });
}

void BeastWsTransport::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (done_) return;
    if (ec) { fail(Stage::Resolve, ec); return; }
    beast::get_lowest_layer(*ws_).expires_after(connectTimeout_);
    beast::get_lowest_layer(*ws_).async_connect(results,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type ep) {
            self->onConnect(ec, ep);
        });
}

void BeastWsTransport::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (done_) return;
    if (ec) { fail(Stage::Connect, ec); return; }
    if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), host_.c_str())) {
        fail(Stage::TlsHandshake, beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
        return;
    }
    if (!SSL_set1_host(ws_->next_layer().native_handle(), host_.c_str())) {
        fail(Stage::TlsHandshake, beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
        return;
    }
    ws_->next_layer().set_verify_mode(ssl::verify_peer);
    ws_->next_layer().async_handshake(ssl::stream_base::client,
        [self = shared_from_this()](beast::error_code ec) { self->onSslHandshake(ec); });
}

void BeastWsTransport::onSslHandshake(beast::error_code ec) {
    if (done_) return;
    if (ec) { fail(Stage::TlsHandshake, ec); return; }
    beast::get_lowest_layer(*ws_).expires_never();
    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_->async_handshake(host_, target_,
        [self = shared_from_this()](beast::error_code ec) { self->onWsHandshake(ec); });
}

void BeastWsTransport::onWsHandshake(beast::error_code ec) {
    if (done_) return;
    if (ec) { fail(Stage::WsHandshake, ec); return; }
    open_ = true;
    lLog_Net("WebSocket open:" << QString::fromStdString(host_ + target_));
    if (onOpen_) onOpen_();
    doRead();
    schedulePing();
    if (!writeQueue_.empty()) doWrite();
}

void BeastWsTransport::doRead() {
    ws_->async_read(buf_, [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
        self->onRead(ec, bytes);
    });
}

void BeastWsTransport::onRead(beast::error_code ec, std::size_t) {
    if (done_) return;
    if (ec) { fail(Stage::Read, ec); return; }

    if (onMessage_) {
        auto b = buf_.data();
        std::string payload(static_cast<const char*>(b.data()), b.size());
        buf_.consume(buf_.size());
        onMessage_(std::move(payload));
    } else {
        buf_.consume(buf_.size());
    }

    doRead();
}

void BeastWsTransport::doWrite() {
    if (writeQueue_.empty() || !open_) return;
    const auto& front = writeQueue_.front();
    ws_->async_write(net::buffer(front), [self = shared_from_this()](beast::error_code ec, std::size_t) {
        if (self->done_) return;
        if (ec) { self->fail(Stage::Write, ec); return; }
        self->writeQueue_.pop_front();
        if (!self->writeQueue_.empty()) self->doWrite();
    });
}

void BeastWsTransport::schedulePing() {
    pingTimer_.expires_after(pingInterval_);
    pingTimer_.async_wait([self = shared_from_this()](beast::error_code ec) {
        if (ec || self->done_ || !self->open_) return;
        self->ws_->async_ping({}, [self](beast::error_code ec2) {
            if (self->done_) return;
            if (ec2) { self->fail(Stage::Ping, ec2); return; }
            self->schedulePing();
        });
    });
}

void BeastWsTransport::fail(Stage stage, beast::error_code ec) {
    if (done_) return;
    done_ = true;
    open_ = false;
    pingTimer_.cancel();

    const bool timedOut = (ec == beast::error::timeout);
    lLog_Net("Transport failure during" << toString(stage) << ":" << QString::fromStdString(ec.message()));

    beast::error_code ignored;
    beast::get_lowest_layer(*ws_).socket().close(ignored);

    if (onError_) onError_(stage, ec.message(), timedOut);
}
