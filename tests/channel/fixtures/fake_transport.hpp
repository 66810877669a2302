#pragma once
#include "channel/ws/WsTransport.hpp"
#include <string>
#include <vector>

/// Records sends/closes; tests trigger open, messages and failures by hand.
class FakeTransport : public WsTransport {
public:
    void connect(std::string host, std::string port, std::string target) override {
        connects.push_back(host + ":" + port + target);
    }
    void close() override { ++closeCalls; }
    void send(std::string msg) override { sent.push_back(std::move(msg)); }

    void onMessage(MessageCb cb) override { messageCb_ = std::move(cb); }
    void onOpen(OpenCb cb) override { openCb_ = std::move(cb); }
    void onError(ErrorCb cb) override { errorCb_ = std::move(cb); }

    void simulateOpen() { if (openCb_) openCb_(); }
    void simulateMessage(std::string payload) { if (messageCb_) messageCb_(std::move(payload)); }
    void simulateError(Stage stage, bool timedOut = false) {
        if (errorCb_) errorCb_(stage, "simulated", timedOut);
    }

    std::vector<std::string> connects;
    std::vector<std::string> sent;
    int closeCalls{0};

private:
    MessageCb messageCb_;
    OpenCb openCb_;
    ErrorCb errorCb_;
};
