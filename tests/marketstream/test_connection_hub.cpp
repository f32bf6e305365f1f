/*
MarketStream — ConnectionHub Tests
Role: Verify socket sharing, fan-out, reconnect backoff, circuit breaker and auth-terminal closes
Testing Strategy: Mock transports + manual clock → drive socket events and assert hub state
Coverage: Sharing by name, async late open, pings, early-failure cooldown, token changes, teardown
*/
#include <gtest/gtest.h>
#include "marketstream/hub/ConnectionHub.hpp"
#include "marketstream/hub/HubProtocol.hpp"
#include "fixtures/manual_scheduler.hpp"
#include "fixtures/mock_transport.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace MarketStream;
using namespace std::chrono_literals;

// =============================================================================
// Test Fixture
// =============================================================================

class ConnectionHubTest : public ::testing::Test {
protected:
    static HubConfig makeConfig() {
        HubConfig config;
        config.host = "gw.example";
        config.port = "443";
        config.defaultPath = "/ws/events";
        config.baseReconnectDelay = 5000ms;
        config.maxReconnectDelay = 60000ms;
        config.failureCooldown = 60000ms;
        config.earlyFailureThreshold = 3;
        config.heartbeatInterval = 30000ms;
        return config;
    }

    // Subscriber that counts callbacks into the given counters
    struct Counters {
        int opens{0};
        int closes{0};
        int errors{0};
        std::vector<std::string> messages;
        CloseInfo lastClose;
    };

    HubSubscriber countingSubscriber(Counters& c) {
        HubSubscriber s;
        s.onOpen = [&c] { ++c.opens; };
        s.onMessage = [&c](const std::string& m) { c.messages.push_back(m); };
        s.onError = [&c](const std::string&) { ++c.errors; };
        s.onClose = [&c](const CloseInfo& info) { ++c.closes; c.lastClose = info; };
        s.tokenProvider = [this] { return token; };
        return s;
    }

    ConnectionSnapshot snapshot(const std::string& name = "ws") {
        auto s = hub.inspect(name);
        if (!s) throw std::runtime_error("no connection named " + name);
        return *s;
    }

    std::string token{"secret-token"};
    fixtures::ManualScheduler scheduler;
    fixtures::MockTransportFactory transports;
    ConnectionHub hub{scheduler, transports.factory(), makeConfig()};
};

// =============================================================================
// Sharing and Fan-out
// =============================================================================

TEST_F(ConnectionHubTest, SubscribersOfOneNameShareASocket) {
    Counters a, b;
    auto subA = hub.subscribe("ws", countingSubscriber(a));
    auto subB = hub.subscribe("ws", countingSubscriber(b));

    EXPECT_EQ(transports.createdCount(), 1);
    EXPECT_EQ(hub.connectionCount(), 1);
    EXPECT_EQ(snapshot().subscriberCount, 2);
    EXPECT_TRUE(snapshot().connecting);
}

TEST_F(ConnectionHubTest, EmptyNameUsesDefaultConnection) {
    Counters a;
    auto sub = hub.subscribe("", countingSubscriber(a));

    EXPECT_TRUE(hub.inspect("ws").has_value());
    EXPECT_EQ(snapshot().path, "/ws/events");
}

TEST_F(ConnectionHubTest, DifferentNamesGetSeparateSockets) {
    Counters a, b;
    auto subA = hub.subscribe("ES", countingSubscriber(a));
    auto subB = hub.subscribe("NQ", countingSubscriber(b));

    EXPECT_EQ(transports.createdCount(), 2);
    EXPECT_EQ(hub.connectionCount(), 2);
}

TEST_F(ConnectionHubTest, TokenTravelsEncodedInTarget) {
    token = "a b/c";
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));

    auto& transport = transports.latest();
    EXPECT_EQ(transport.host(), "gw.example");
    EXPECT_EQ(transport.port(), "443");
    EXPECT_EQ(transport.target(), "/ws/events?token=a%20b%2Fc");
}

TEST_F(ConnectionHubTest, OpenAndMessagesFanOut) {
    Counters a, b;
    auto subA = hub.subscribe("ws", countingSubscriber(a));
    auto subB = hub.subscribe("ws", countingSubscriber(b));

    transports.latest().open();
    transports.latest().receive(R"({"type":"event"})");

    EXPECT_EQ(a.opens, 1);
    EXPECT_EQ(b.opens, 1);
    ASSERT_EQ(a.messages.size(), 1);
    ASSERT_EQ(b.messages.size(), 1);
    EXPECT_TRUE(subA->isOpen());
}

TEST_F(ConnectionHubTest, LateSubscriberOpenIsDeferred) {
    Counters a, late;
    auto subA = hub.subscribe("ws", countingSubscriber(a));
    transports.latest().open();

    auto subLate = hub.subscribe("ws", countingSubscriber(late));
    EXPECT_EQ(late.opens, 0);

    scheduler.runPending();
    EXPECT_EQ(late.opens, 1);
    EXPECT_EQ(a.opens, 1);
    EXPECT_EQ(transports.createdCount(), 1);
}

TEST_F(ConnectionHubTest, DeferredOpenSkippedWhenDisposedFirst) {
    Counters a, late;
    auto subA = hub.subscribe("ws", countingSubscriber(a));
    transports.latest().open();

    auto subLate = hub.subscribe("ws", countingSubscriber(late));
    subLate->dispose();
    scheduler.runPending();

    EXPECT_EQ(late.opens, 0);
}

TEST_F(ConnectionHubTest, ThrowingHandlerDoesNotStarveOthers) {
    Counters b;
    HubSubscriber throwing;
    throwing.onMessage = [](const std::string&) { throw std::runtime_error("handler failed"); };
    throwing.tokenProvider = [this] { return token; };
    auto subA = hub.subscribe("ws", std::move(throwing));
    auto subB = hub.subscribe("ws", countingSubscriber(b));

    transports.latest().open();
    transports.latest().receive("{}");

    EXPECT_EQ(b.messages.size(), 1);
}

// =============================================================================
// Sending and Heartbeat
// =============================================================================

TEST_F(ConnectionHubTest, SendFailsUntilOpen) {
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));
    EXPECT_FALSE(sub->send("hello"));

    transports.latest().open();
    transports.latest().clearSent();
    EXPECT_TRUE(sub->send(nlohmann::json{{"action", "subscribe"}}));

    ASSERT_EQ(transports.latest().sent().size(), 1);
    EXPECT_EQ(transports.latest().sent()[0], R"({"action":"subscribe"})");
}

TEST_F(ConnectionHubTest, PingOnOpenAndEveryInterval) {
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));
    auto& transport = transports.latest();
    transport.open();

    ASSERT_EQ(transport.sent().size(), 1);
    EXPECT_EQ(transport.sent()[0], std::string(HubProtocol::kPingFrame));

    scheduler.advance(29999ms);
    EXPECT_EQ(transport.sent().size(), 1);
    scheduler.advance(1ms);
    EXPECT_EQ(transport.sent().size(), 2);
    scheduler.advance(30000ms);
    EXPECT_EQ(transport.sent().size(), 3);
}

// =============================================================================
// Disposal
// =============================================================================

TEST_F(ConnectionHubTest, LastDisposeClosesSocketAndDropsConnection) {
    Counters a, b;
    auto subA = hub.subscribe("ws", countingSubscriber(a));
    auto subB = hub.subscribe("ws", countingSubscriber(b));
    auto& transport = transports.latest();
    transport.open();

    subA->dispose();
    EXPECT_FALSE(transport.closed());
    EXPECT_EQ(hub.connectionCount(), 1);

    subB->dispose();
    EXPECT_TRUE(transport.closed());
    EXPECT_EQ(hub.connectionCount(), 0);
    EXPECT_EQ(scheduler.pendingTimers(), 0);
}

TEST_F(ConnectionHubTest, DisposeIsIdempotentAndHandleGoesInert) {
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));
    transports.latest().open();

    sub->dispose();
    sub->dispose();
    EXPECT_FALSE(sub->isOpen());
    EXPECT_FALSE(sub->send("late"));
}

TEST_F(ConnectionHubTest, NoCallbacksAfterDispose) {
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));
    auto& transport = transports.latest();
    transport.open();
    sub->dispose();

    transport.receive("{}");
    transport.closeWith(1000);
    EXPECT_TRUE(a.messages.empty());
    EXPECT_EQ(a.closes, 0);
}

TEST_F(ConnectionHubTest, ShutdownClosesEverything) {
    Counters a, b;
    auto subA = hub.subscribe("ES", countingSubscriber(a));
    auto subB = hub.subscribe("NQ", countingSubscriber(b));

    hub.shutdown();

    EXPECT_EQ(hub.connectionCount(), 0);
    EXPECT_TRUE(transports.at(0).closed());
    EXPECT_TRUE(transports.at(1).closed());
    EXPECT_FALSE(subA->send("x"));
}

// =============================================================================
// Reconnect and Circuit Breaker
// =============================================================================

TEST_F(ConnectionHubTest, CloseAfterOpenReconnectsAtBaseDelay) {
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));
    transports.latest().open();
    transports.latest().closeWith(1001, "going away");

    EXPECT_EQ(a.closes, 1);
    EXPECT_EQ(a.lastClose.code, 1001);
    EXPECT_TRUE(snapshot().reconnectPending);
    EXPECT_EQ(snapshot().consecutiveFailures, 0);
    EXPECT_EQ(scheduler.nextDelay(), 5000ms);

    scheduler.advance(5000ms);
    EXPECT_EQ(transports.createdCount(), 2);
}

TEST_F(ConnectionHubTest, EarlyFailuresDoubleTheDelay) {
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));

    transports.latest().closeWith(1006);
    EXPECT_EQ(snapshot().consecutiveFailures, 1);
    EXPECT_EQ(snapshot().reconnectDelay, 10000ms);

    scheduler.advance(10000ms);
    ASSERT_EQ(transports.createdCount(), 2);
    transports.latest().closeWith(1006);
    EXPECT_EQ(snapshot().consecutiveFailures, 2);
    EXPECT_EQ(snapshot().reconnectDelay, 20000ms);
}

TEST_F(ConnectionHubTest, RepeatedEarlyFailuresTripCooldown) {
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));

    transports.latest().closeWith(1006);
    scheduler.advance(10000ms);
    transports.latest().closeWith(1006);
    scheduler.advance(20000ms);
    ASSERT_EQ(transports.createdCount(), 3);
    transports.latest().closeWith(1006);

    auto state = snapshot();
    EXPECT_TRUE(state.inFailureCooldown);
    EXPECT_FALSE(state.shouldReconnect);
    EXPECT_FALSE(state.reconnectPending);

    scheduler.advance(59999ms);
    EXPECT_EQ(transports.createdCount(), 3);

    scheduler.advance(1ms);
    EXPECT_EQ(transports.createdCount(), 4);
    EXPECT_FALSE(snapshot().inFailureCooldown);
    EXPECT_EQ(snapshot().consecutiveFailures, 0);
    EXPECT_EQ(snapshot().reconnectDelay, 5000ms);
}

TEST_F(ConnectionHubTest, SuccessfulOpenResetsBackoff) {
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));
    transports.latest().closeWith(1006);
    scheduler.advance(10000ms);

    transports.latest().open();
    EXPECT_EQ(snapshot().consecutiveFailures, 0);
    EXPECT_EQ(snapshot().reconnectDelay, 5000ms);
}

TEST_F(ConnectionHubTest, FactoryFailureCountsAsEarlyFailure) {
    transports.failNext();
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));

    EXPECT_EQ(transports.createdCount(), 0);
    EXPECT_EQ(snapshot().consecutiveFailures, 1);
    EXPECT_TRUE(snapshot().reconnectPending);

    scheduler.advance(10000ms);
    EXPECT_EQ(transports.createdCount(), 1);
}

TEST_F(ConnectionHubTest, MissingTokenRetriesLater) {
    token.clear();
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));

    EXPECT_EQ(transports.createdCount(), 0);
    EXPECT_TRUE(snapshot().reconnectPending);

    token = "fresh";
    scheduler.advance(5000ms);
    ASSERT_EQ(transports.createdCount(), 1);
    EXPECT_EQ(transports.latest().target(), "/ws/events?token=fresh");
}

TEST_F(ConnectionHubTest, StaleTransportCallbacksAreIgnored) {
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));
    auto& first = transports.latest();
    first.open();
    first.closeWith(1001);
    scheduler.advance(5000ms);
    ASSERT_EQ(transports.createdCount(), 2);

    first.receive("stale");
    first.closeWith(1006);

    EXPECT_TRUE(a.messages.empty());
    EXPECT_EQ(a.closes, 1);
    EXPECT_EQ(snapshot().consecutiveFailures, 0);
}

// =============================================================================
// Authentication-terminal Close
// =============================================================================

TEST_F(ConnectionHubTest, AuthCloseStopsReconnecting) {
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));
    transports.latest().open();
    transports.latest().closeWith(HubProtocol::kUnauthorized);

    EXPECT_EQ(a.closes, 1);
    EXPECT_EQ(a.lastClose.code, 4401);
    EXPECT_FALSE(snapshot().shouldReconnect);
    EXPECT_FALSE(snapshot().reconnectPending);

    scheduler.advance(120000ms);
    EXPECT_EQ(transports.createdCount(), 1);
}

TEST_F(ConnectionHubTest, AuthReasonTextIsTerminal) {
    Counters a;
    auto sub = hub.subscribe("ws", countingSubscriber(a));
    transports.latest().closeWith(1000, "Token Expired");

    EXPECT_FALSE(snapshot().reconnectPending);
    EXPECT_EQ(snapshot().consecutiveFailures, 0);
}

TEST_F(ConnectionHubTest, NewTokenRevivesConnectionAfterAuthFailure) {
    Counters a, b;
    auto subA = hub.subscribe("ws", countingSubscriber(a));
    transports.latest().closeWith(HubProtocol::kForbidden);

    token = "rotated";
    auto subB = hub.subscribe("ws", countingSubscriber(b));

    ASSERT_EQ(transports.createdCount(), 2);
    EXPECT_EQ(transports.latest().target(), "/ws/events?token=rotated");
    EXPECT_TRUE(snapshot().shouldReconnect);
}

// =============================================================================
// Protocol Helpers
// =============================================================================

TEST(HubProtocol, AuthenticationFailureDetection) {
    EXPECT_TRUE(HubProtocol::isAuthenticationFailure(CloseInfo{1008, ""}));
    EXPECT_TRUE(HubProtocol::isAuthenticationFailure(CloseInfo{4403, ""}));
    EXPECT_TRUE(HubProtocol::isAuthenticationFailure(CloseInfo{1000, "Authentication FAILED for user"}));
    EXPECT_TRUE(HubProtocol::isAuthenticationFailure(CloseInfo{1000, "token invalid"}));
    EXPECT_FALSE(HubProtocol::isAuthenticationFailure(CloseInfo{1006, ""}));
    EXPECT_FALSE(HubProtocol::isAuthenticationFailure(CloseInfo{1000, "normal closure"}));
}

TEST(HubProtocol, TargetAppendsToExistingQuery) {
    EXPECT_EQ(HubProtocol::buildTarget("/ws/events?v=2", "t"), "/ws/events?v=2&token=t");
    EXPECT_EQ(HubProtocol::buildTarget("", "t"), "/?token=t");
}

TEST(HubProtocol, RedactsEveryTokenValue) {
    EXPECT_EQ(HubProtocol::redactToken("wss://h/ws?token=abc&x=1"), "wss://h/ws?token=REDACTED&x=1");
    EXPECT_EQ(HubProtocol::redactToken("/ws?x=1&Token=abc#frag"), "/ws?x=1&Token=REDACTED#frag");
    EXPECT_EQ(HubProtocol::redactToken("/ws?mytoken=abc"), "/ws?mytoken=abc");
}

TEST(HubProtocol, PercentEncodeMatchesUriComponentRules) {
    EXPECT_EQ(HubProtocol::percentEncode("A-z_0.9!~*'()"), "A-z_0.9!~*'()");
    EXPECT_EQ(HubProtocol::percentEncode("a+b=c&d"), "a%2Bb%3Dc%26d");
}
