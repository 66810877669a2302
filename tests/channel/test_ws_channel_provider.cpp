/*
Lifeline — WsChannelProvider Tests
Role: Verify transport failures map onto channel statuses and frames are replayed on open
Testing Strategy: Inject FakeTransport through the factory constructor → drive transport events
Coverage: Stage→status mapping, subscribe frames, message forwarding, close semantics
*/
#include <gtest/gtest.h>
#include "channel/WsChannelProvider.hpp"
#include "fixtures/fake_transport.hpp"
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

struct ProviderHarness {
    std::vector<std::shared_ptr<FakeTransport>> transports;

    WsChannelProvider make(std::vector<std::string> frames = {}) {
        return WsChannelProvider(
            [this]() -> std::shared_ptr<WsTransport> {
                auto t = std::make_shared<FakeTransport>();
                transports.push_back(t);
                return t;
            },
            WsChannelProvider::Endpoint{"feed.example.org", "443", "/ws"},
            std::move(frames));
    }
};

} // namespace

// =============================================================================
// Status Mapping
// =============================================================================

TEST(WsChannelProvider, HandshakeStagesMapToChannelError) {
    using Stage = WsTransport::Stage;
    EXPECT_EQ(WsChannelProvider::statusFor(Stage::Resolve, false), RealtimeStatus::ChannelError);
    EXPECT_EQ(WsChannelProvider::statusFor(Stage::Connect, false), RealtimeStatus::ChannelError);
    EXPECT_EQ(WsChannelProvider::statusFor(Stage::TlsHandshake, false), RealtimeStatus::ChannelError);
    EXPECT_EQ(WsChannelProvider::statusFor(Stage::WsHandshake, false), RealtimeStatus::ChannelError);
}

TEST(WsChannelProvider, RuntimeStagesMapToTheirStatus) {
    using Stage = WsTransport::Stage;
    EXPECT_EQ(WsChannelProvider::statusFor(Stage::Read, false), RealtimeStatus::Closed);
    EXPECT_EQ(WsChannelProvider::statusFor(Stage::Write, false), RealtimeStatus::SubscriptionError);
    EXPECT_EQ(WsChannelProvider::statusFor(Stage::Ping, false), RealtimeStatus::TimedOut);
}

TEST(WsChannelProvider, TimeoutWinsOverStage) {
    using Stage = WsTransport::Stage;
    EXPECT_EQ(WsChannelProvider::statusFor(Stage::Connect, true), RealtimeStatus::TimedOut);
    EXPECT_EQ(WsChannelProvider::statusFor(Stage::Read, true), RealtimeStatus::TimedOut);
}

// =============================================================================
// Channel Lifecycle
// =============================================================================

TEST(WsChannelProvider, RequiresFactory) {
    EXPECT_THROW(WsChannelProvider(WsChannelProvider::TransportFactory{},
                                   WsChannelProvider::Endpoint{"h"}, {}),
                 std::invalid_argument);
}

TEST(WsChannelProvider, OpenConnectsToEndpoint) {
    ProviderHarness h;
    auto provider = h.make();

    auto handle = provider.open([](RealtimeStatus) {}, [](std::string) {});

    EXPECT_NE(handle, ChannelProvider::kNullChannel);
    ASSERT_EQ(h.transports.size(), 1u);
    EXPECT_EQ(h.transports[0]->connects, (std::vector<std::string>{"feed.example.org:443/ws"}));
    EXPECT_EQ(provider.openChannels(), 1u);
}

TEST(WsChannelProvider, FramesSentBeforeSubscribedReported) {
    ProviderHarness h;
    auto provider = h.make({R"({"type":"subscribe","channel":"a"})", R"({"type":"subscribe","channel":"b"})"});
    std::vector<RealtimeStatus> statuses;
    std::size_t sentAtSubscribe = 0;

    provider.open([&](RealtimeStatus s) {
        statuses.push_back(s);
        sentAtSubscribe = h.transports[0]->sent.size();
    }, [](std::string) {});
    h.transports[0]->simulateOpen();

    EXPECT_EQ(statuses, (std::vector<RealtimeStatus>{RealtimeStatus::Subscribed}));
    EXPECT_EQ(sentAtSubscribe, 2u);
    EXPECT_EQ(h.transports[0]->sent[0], R"({"type":"subscribe","channel":"a"})");
}

TEST(WsChannelProvider, ErrorsReportMappedStatus) {
    ProviderHarness h;
    auto provider = h.make();
    std::vector<RealtimeStatus> statuses;

    provider.open([&](RealtimeStatus s) { statuses.push_back(s); }, [](std::string) {});
    h.transports[0]->simulateError(WsTransport::Stage::Read);

    EXPECT_EQ(statuses, (std::vector<RealtimeStatus>{RealtimeStatus::Closed}));
}

TEST(WsChannelProvider, MessagesAreForwarded) {
    ProviderHarness h;
    auto provider = h.make();
    std::vector<std::string> messages;

    provider.open([](RealtimeStatus) {}, [&](std::string m) { messages.push_back(std::move(m)); });
    h.transports[0]->simulateMessage(R"({"price":"1"})");

    EXPECT_EQ(messages, (std::vector<std::string>{R"({"price":"1"})"}));
}

TEST(WsChannelProvider, EachOpenGetsFreshTransport) {
    ProviderHarness h;
    auto provider = h.make();

    auto a = provider.open([](RealtimeStatus) {}, [](std::string) {});
    auto b = provider.open([](RealtimeStatus) {}, [](std::string) {});

    EXPECT_NE(a, b);
    EXPECT_EQ(h.transports.size(), 2u);
    EXPECT_EQ(provider.openChannels(), 2u);
}

TEST(WsChannelProvider, CloseClosesTransportOnce) {
    ProviderHarness h;
    auto provider = h.make();
    auto handle = provider.open([](RealtimeStatus) {}, [](std::string) {});

    provider.close(handle);

    EXPECT_EQ(h.transports[0]->closeCalls, 1);
    EXPECT_EQ(provider.openChannels(), 0u);
    EXPECT_THROW(provider.close(handle), std::out_of_range);
}

TEST(WsChannelProvider, DestructorClosesRemainingChannels) {
    ProviderHarness h;
    {
        auto provider = h.make();
        provider.open([](RealtimeStatus) {}, [](std::string) {});
    }
    ASSERT_EQ(h.transports.size(), 1u);
    EXPECT_EQ(h.transports[0]->closeCalls, 1);
}
