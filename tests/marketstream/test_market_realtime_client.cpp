/*
MarketStream — MarketRealtimeClient Tests
Role: Verify the subscription lifecycle on top of a real ConnectionHub with scripted sockets
Testing Strategy: Mock transports + manual clock + spy sink → drive wire traffic and assert sink/telemetry
Coverage: Subscribe frames, resubscription, symbol guards, heartbeat watchdog, backoff, ACK errors,
          authentication-terminal closes, ACK snapshots, missing token, manual disconnect
*/
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "marketstream/realtime/MarketRealtimeClient.hpp"
#include "fixtures/manual_scheduler.hpp"
#include "fixtures/mock_transport.hpp"
#include "fixtures/spy_sink.hpp"
#include "fixtures/wire_messages.hpp"
#include <algorithm>
#include <map>
#include <memory>

using namespace MarketStream;
using namespace std::chrono_literals;
using nlohmann::json;
using ::testing::ElementsAre;

// =============================================================================
// Test Fixture
// =============================================================================

class MarketRealtimeClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        metrics.subscribe([this](const TelemetryEvent& event) { events.push_back(event); });
    }

    static HubConfig hubConfig() {
        HubConfig config;
        config.host = "gw.example";
        return config;
    }

    MarketRealtimeClient& makeClient(RealtimeConfig config = {}) {
        RealtimeOptions options;
        options.tokenProvider = [this] { return token; };
        options.symbolProvider = [this] { return symbol; };
        options.timeframeProvider = [this] { return timeframe; };
        options.symbolMetadataProvider = [this](const std::string& s) -> std::optional<SymbolInfo> {
            auto it = metadata.find(s);
            if (it == metadata.end()) return std::nullopt;
            return it->second;
        };
        client = std::make_unique<MarketRealtimeClient>(hub, scheduler, sink, metrics, std::move(options), config);
        return *client;
    }

    // Connect and let the current socket open
    void connectAndOpen() {
        client->connect();
        transports.latest().open();
    }

    // Frames the client sent on the latest socket with the given action (hub pings excluded)
    std::vector<json> framesWithAction(const std::string& action) {
        std::vector<json> frames;
        for (const auto& raw : transports.latest().sent()) {
            auto frame = json::parse(raw);
            if (frame.value("action", "") == action) frames.push_back(frame);
        }
        return frames;
    }

    std::vector<TelemetryEvent> eventsOf(TelemetryType type) const {
        std::vector<TelemetryEvent> out;
        for (const auto& e : events) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

    std::vector<std::int64_t> reconnectDelays() const {
        std::vector<std::int64_t> delays;
        for (const auto& e : eventsOf(TelemetryType::ReconnectScheduled)) {
            delays.push_back(e.fields["delayMs"].get<std::int64_t>());
        }
        return delays;
    }

    std::string token{"secret-token"};
    std::string symbol{"ES"};
    std::string timeframe{"1m"};
    std::map<std::string, SymbolInfo> metadata;

    fixtures::ManualScheduler scheduler;
    fixtures::MockTransportFactory transports;
    ConnectionHub hub{scheduler, transports.factory(), hubConfig()};
    fixtures::SpySink sink;
    MetricsBus metrics;
    std::vector<TelemetryEvent> events;
    std::unique_ptr<MarketRealtimeClient> client;
};

// =============================================================================
// Subscription Frames
// =============================================================================

TEST_F(MarketRealtimeClientTest, OpenSendsSubscribeForSymbolAndTimeframe) {
    makeClient();
    connectAndOpen();

    auto frames = framesWithAction("subscribe");
    ASSERT_EQ(frames.size(), 1);
    EXPECT_EQ(frames[0].dump(),
              R"({"action":"subscribe","symbol":"ES","timeframe":"1m",)"
              R"("topics":["market.dom-ES","market.depth-ES","market.ticker-ES","market.bar-ES"]})");

    EXPECT_EQ(sink.lastStatus().first, ConnectionStatus::Connected);
    ASSERT_EQ(sink.pending().size(), 1);
    EXPECT_EQ(sink.pending()[0].symbol.value_or(""), "ES");
    EXPECT_EQ(client->subscribedSymbol().value_or(""), "ES");
    EXPECT_TRUE(client->heartbeatRunning());
}

TEST_F(MarketRealtimeClientTest, ConnectionNamedAfterSymbol) {
    makeClient();
    client->connect();
    EXPECT_TRUE(hub.inspect("ES").has_value());
    EXPECT_EQ(transports.latest().target(), "/ws/events?token=secret-token");
}

TEST_F(MarketRealtimeClientTest, ConnectionNameFallsBackWithoutSymbol) {
    symbol.clear();
    RealtimeConfig config;
    config.connectionName = "feed";
    makeClient(config);
    client->connect();

    EXPECT_TRUE(hub.inspect("feed").has_value());
    transports.latest().open();
    EXPECT_TRUE(framesWithAction("subscribe").empty());
}

TEST_F(MarketRealtimeClientTest, SecondConnectIsNoOpUnlessForced) {
    makeClient();
    connectAndOpen();
    client->connect();
    EXPECT_EQ(transports.createdCount(), 1);

    client->connect(true);
    EXPECT_TRUE(transports.at(0).closed());
    EXPECT_EQ(transports.createdCount(), 2);
}

TEST_F(MarketRealtimeClientTest, RefreshIsIdempotent) {
    makeClient();
    connectAndOpen();
    client->refreshSubscription();
    client->refreshSubscription();

    EXPECT_EQ(framesWithAction("subscribe").size(), 1);
    EXPECT_TRUE(framesWithAction("unsubscribe").empty());
}

TEST_F(MarketRealtimeClientTest, TimeframeChangeUnsubscribesThenResubscribes) {
    makeClient();
    connectAndOpen();
    transports.latest().receive(fixtures::subscribeAck("ES", "1m", fixtures::futuresTopics("ES")));

    timeframe = "5m";
    client->refreshSubscription();
    client->refreshSubscription();

    auto unsubscribes = framesWithAction("unsubscribe");
    auto subscribes = framesWithAction("subscribe");
    ASSERT_EQ(unsubscribes.size(), 1);
    EXPECT_EQ(unsubscribes[0]["topics"].size(), 4);
    ASSERT_EQ(subscribes.size(), 2);
    EXPECT_EQ(subscribes[1]["timeframe"], "5m");
    EXPECT_EQ(client->subscribedTimeframe().value_or(""), "5m");
}

TEST_F(MarketRealtimeClientTest, EquitySymbolSkipsDomTopics) {
    symbol = "AAPL";
    SymbolInfo info;
    info.secType = "STK";
    metadata["AAPL"] = info;
    makeClient();

    EXPECT_EQ(client->defaultTopics("AAPL"), fixtures::equityTopics("AAPL"));

    connectAndOpen();
    auto frames = framesWithAction("subscribe");
    ASSERT_EQ(frames.size(), 1);
    EXPECT_EQ(frames[0]["topics"], json(fixtures::equityTopics("AAPL")));
}

TEST_F(MarketRealtimeClientTest, DomDefaultCanBeTurnedOff) {
    RealtimeConfig config;
    config.assumeDomWhenUnknown = false;
    makeClient(config);

    EXPECT_EQ(client->defaultTopics("ES"), fixtures::equityTopics("ES"));
}

TEST_F(MarketRealtimeClientTest, UnsubscribeAckForCurrentTopicsResets) {
    makeClient();
    connectAndOpen();
    transports.latest().receive(fixtures::subscribeAck("ES", "1m", fixtures::futuresTopics("ES")));

    auto reordered = fixtures::futuresTopics("ES");
    std::reverse(reordered.begin(), reordered.end());
    transports.latest().receive(fixtures::unsubscribeAck(reordered));
    EXPECT_EQ(sink.resets(), 1);

    transports.latest().receive(fixtures::unsubscribeAck({"market.bar-NQ"}));
    EXPECT_EQ(sink.resets(), 1);
}

// =============================================================================
// Subscribe ACK
// =============================================================================

TEST_F(MarketRealtimeClientTest, AckReportsReady) {
    makeClient();
    connectAndOpen();
    transports.latest().receive(fixtures::subscribeAck("ES", "1m", fixtures::futuresTopics("ES"),
                                                       json{{"capabilities", {{"dom", true}}}}));

    ASSERT_EQ(sink.ready().size(), 1);
    EXPECT_EQ(sink.ready()[0].id.value_or(""), "sub-1");
    EXPECT_EQ(sink.ready()[0].topics, fixtures::futuresTopics("ES"));
    EXPECT_TRUE(sink.ready()[0].capabilities.is_object());
    EXPECT_EQ(eventsOf(TelemetryType::SubscribeAck).size(), 1);
}

TEST_F(MarketRealtimeClientTest, AckErrorIsTerminal) {
    makeClient();
    connectAndOpen();
    transports.latest().receive(fixtures::subscribeRejected("ES", "symbol not entitled"));

    ASSERT_EQ(sink.failures().size(), 1);
    EXPECT_EQ(sink.failures()[0].error, "symbol not entitled");
    EXPECT_EQ(sink.lastStatus().first, ConnectionStatus::Failed);
    EXPECT_EQ(sink.lastStatus().second.value_or(""), "symbol not entitled");
    EXPECT_FALSE(client->isStarted());
    EXPECT_TRUE(transports.latest().closed());
    EXPECT_EQ(eventsOf(TelemetryType::SubscribeFailed).size(), 1);

    scheduler.advance(120000ms);
    EXPECT_EQ(transports.createdCount(), 1);
}

TEST_F(MarketRealtimeClientTest, AckLatestBarSeedsKline) {
    makeClient();
    connectAndOpen();
    json snapshot{{"latest_bar", fixtures::barPayload("2024-05-01T12:00:00Z", 5000, 5002, 4999, 5001)}};
    transports.latest().receive(fixtures::subscribeAck("ES", "1m", fixtures::futuresTopics("ES"),
                                                       json{{"snapshot", snapshot}}));

    ASSERT_EQ(sink.klines().size(), 1);
    ASSERT_TRUE(sink.klines()[0].has_value());
    EXPECT_EQ(sink.klines()[0]->symbol, "ES");
    EXPECT_EQ(sink.klines()[0]->timeframe, "1m");
    EXPECT_EQ(sink.klines()[0]->bars.size(), 1);
    EXPECT_EQ(sink.bars().size(), 1);
}

TEST_F(MarketRealtimeClientTest, AckNullKlineClearsChart) {
    makeClient();
    connectAndOpen();
    transports.latest().receive(fixtures::subscribeAck("ES", "1m", fixtures::futuresTopics("ES"),
                                                       json{{"snapshot", {{"kline", nullptr}}}}));

    ASSERT_EQ(sink.klines().size(), 1);
    EXPECT_FALSE(sink.klines()[0].has_value());
}

TEST_F(MarketRealtimeClientTest, AckSnapshotDepthAndAvailability) {
    makeClient();
    connectAndOpen();
    json snapshot{{"depth", fixtures::depthPayload("ES", 5000, 5000.5)}, {"availability", {{"open", true}}}};
    transports.latest().receive(fixtures::subscribeAck("ES", "1m", fixtures::futuresTopics("ES"),
                                                       json{{"snapshot", snapshot}}));

    EXPECT_EQ(sink.depths().size(), 1);
    ASSERT_EQ(sink.availability().size(), 1);
    EXPECT_EQ(sink.availability()[0]["open"], true);
}

// =============================================================================
// Live Events
// =============================================================================

TEST_F(MarketRealtimeClientTest, ContractDepthRelabeledToSelectedSymbol) {
    makeClient();
    connectAndOpen();
    transports.latest().receive(fixtures::event("market.depth-ESM4", fixtures::depthPayload("ESM4", 5000, 5000.5)));

    ASSERT_EQ(sink.depths().size(), 1);
    EXPECT_EQ(sink.depths()[0].symbol, "ES");
    ASSERT_FALSE(sink.prices().empty());
    EXPECT_EQ(sink.prices()[0].first, "ES");
    EXPECT_TRUE(sink.mismatches().empty());
}

TEST_F(MarketRealtimeClientTest, MismatchedEventsDroppedWithOneWarning) {
    makeClient();
    connectAndOpen();
    transports.latest().receive(fixtures::event("market.depth-NQ", fixtures::depthPayload("NQ", 18000, 18000.25)));
    transports.latest().receive(fixtures::event("market.depth-NQ", fixtures::depthPayload("NQ", 18000, 18000.25)));

    EXPECT_TRUE(sink.depths().empty());
    EXPECT_EQ(sink.mismatches().size(), 1);
}

TEST_F(MarketRealtimeClientTest, TickerGetsChangeAndMid) {
    makeClient();
    connectAndOpen();
    transports.latest().receive(fixtures::event("market.ticker-ES", fixtures::tickerPayload("ES", 5001, 5000, 5000.75, 5001.25)));

    ASSERT_EQ(sink.tickers().size(), 1);
    const auto& ticker = sink.tickers()[0];
    EXPECT_DOUBLE_EQ(ticker.change.value_or(0), 1.0);
    EXPECT_DOUBLE_EQ(ticker.midPrice.value_or(0), 5001.0);
    EXPECT_DOUBLE_EQ(ticker.spread.value_or(0), 0.5);
    EXPECT_EQ(sink.prices().size(), 1);
}

TEST_F(MarketRealtimeClientTest, BarEventReachesSink) {
    makeClient();
    connectAndOpen();
    transports.latest().receive(fixtures::event("market.bar-ES", fixtures::barPayload("2024-05-01T12:01:00Z", 1, 2, 0.5, 1.5)));

    ASSERT_EQ(sink.bars().size(), 1);
    EXPECT_EQ(sink.bars()[0].symbol, "ES");
    EXPECT_EQ(sink.bars()[0].timeframe, "1m");
    EXPECT_EQ(sink.bars()[0].intervalSeconds, 60);
}

TEST_F(MarketRealtimeClientTest, ContractBarRelabeledToSelectedSymbol) {
    makeClient();
    connectAndOpen();
    json payload = fixtures::barPayload("2024-05-01T12:01:00Z", 5000, 5002, 4999, 5001);
    payload["symbol"] = "ESM4";
    transports.latest().receive(fixtures::event("market.bar-ESM4", payload));

    ASSERT_EQ(sink.bars().size(), 1);
    EXPECT_EQ(sink.bars()[0].symbol, "ES");
    EXPECT_TRUE(sink.mismatches().empty());
}

TEST_F(MarketRealtimeClientTest, ContractKlineEventRelabeledToSelectedSymbol) {
    makeClient();
    connectAndOpen();
    json payload{
        {"symbol", "ESM4"},
        {"bars", json::array({fixtures::barPayload("2024-05-01T12:00:00Z", 1, 2, 0.5, 1.5),
                              fixtures::barPayload("2024-05-01T12:01:00Z", 1.5, 2, 1, 1.75)})}
    };
    transports.latest().receive(fixtures::event("market.bar-ESM4", payload));

    ASSERT_EQ(sink.klines().size(), 1);
    ASSERT_TRUE(sink.klines()[0].has_value());
    EXPECT_EQ(sink.klines()[0]->symbol, "ES");
    EXPECT_EQ(sink.klines()[0]->bars.size(), 2);
}

TEST_F(MarketRealtimeClientTest, AckHistoryForContractRelabeledToSelectedSymbol) {
    makeClient();
    connectAndOpen();
    json snapshot{
        {"symbol", "ESM4"},
        {"historical_bars", json::array({fixtures::barPayload("2024-05-01T12:00:00Z", 1, 1, 1, 1)})}
    };
    transports.latest().receive(fixtures::subscribeAck("ES", "1m", fixtures::futuresTopics("ES"),
                                                       json{{"snapshot", snapshot}}));

    ASSERT_EQ(sink.klines().size(), 1);
    ASSERT_TRUE(sink.klines()[0].has_value());
    EXPECT_EQ(sink.klines()[0]->symbol, "ES");
}

TEST_F(MarketRealtimeClientTest, SameRootContractsOfOtherSymbolAreDropped) {
    symbol = "NQ";
    makeClient();
    connectAndOpen();
    json payload = fixtures::barPayload("2024-05-01T12:01:00Z", 5000, 5002, 4999, 5001);
    payload["symbol"] = "ESU4";
    transports.latest().receive(fixtures::event("market.bar-ESM4", payload));
    transports.latest().receive(fixtures::event("market.bar-ESM4", payload));

    EXPECT_TRUE(sink.bars().empty());
    EXPECT_TRUE(sink.klines().empty());
    EXPECT_EQ(sink.mismatches().size(), 1);
}

TEST_F(MarketRealtimeClientTest, SameRootContractsOfSelectedSymbolAreKept) {
    makeClient();
    connectAndOpen();
    transports.latest().receive(fixtures::event("market.depth-ESM4", fixtures::depthPayload("ESU4", 5000, 5000.5)));

    ASSERT_EQ(sink.depths().size(), 1);
    EXPECT_EQ(sink.depths()[0].symbol, "ES");
    EXPECT_TRUE(sink.mismatches().empty());
}

TEST_F(MarketRealtimeClientTest, ForeignTickerIsDropped) {
    makeClient();
    connectAndOpen();
    transports.latest().receive(fixtures::event("market.ticker-ES", fixtures::tickerPayload("NQM4", 18001, 18000, 18000.75, 18001.25)));

    EXPECT_TRUE(sink.tickers().empty());
    EXPECT_TRUE(sink.prices().empty());
    EXPECT_EQ(sink.mismatches().size(), 1);
}

TEST_F(MarketRealtimeClientTest, MalformedFrameIsDropped) {
    makeClient();
    connectAndOpen();
    transports.latest().receive("{not json");
    transports.latest().receive("[1,2]");

    EXPECT_TRUE(client->isStarted());
    EXPECT_TRUE(sink.depths().empty());
}

// =============================================================================
// Heartbeat Watchdog
// =============================================================================

TEST_F(MarketRealtimeClientTest, TrafficKeepsWatchdogQuiet) {
    makeClient();
    connectAndOpen();

    scheduler.advance(35000ms);
    transports.latest().receive(fixtures::event("market.bar-ES", fixtures::barPayload("2024-05-01T12:01:00Z", 1, 1, 1, 1)));
    scheduler.advance(35000ms);

    EXPECT_TRUE(eventsOf(TelemetryType::HeartbeatTimeout).empty());
    EXPECT_EQ(client->reconnectAttempt(), 0);
    EXPECT_EQ(transports.createdCount(), 1);
}

TEST_F(MarketRealtimeClientTest, SilenceTriggersSingleReconnect) {
    makeClient();
    connectAndOpen();

    scheduler.advance(40000ms);

    ASSERT_EQ(eventsOf(TelemetryType::HeartbeatTimeout).size(), 1);
    EXPECT_EQ(eventsOf(TelemetryType::HeartbeatTimeout)[0].fields["symbol"], "ES");
    EXPECT_EQ(client->reconnectAttempt(), 1);
    EXPECT_THAT(reconnectDelays(), ElementsAre(1000));
    EXPECT_EQ(sink.lastStatus().first, ConnectionStatus::Reconnecting);
    EXPECT_TRUE(transports.latest().closed());
    EXPECT_FALSE(client->heartbeatRunning());

    scheduler.advance(1000ms);
    EXPECT_EQ(transports.createdCount(), 2);
}

// =============================================================================
// Reconnect Backoff
// =============================================================================

TEST_F(MarketRealtimeClientTest, BackoffDoublesUntilOpen) {
    makeClient();
    connectAndOpen();
    transports.latest().closeWith(1006);
    scheduler.advance(1000ms);
    transports.latest().closeWith(1006);
    scheduler.advance(2000ms);
    transports.latest().closeWith(1006);

    EXPECT_THAT(reconnectDelays(), ElementsAre(1000, 2000, 4000));
    EXPECT_EQ(client->reconnectAttempt(), 3);

    scheduler.advance(4000ms);
    transports.latest().open();
    EXPECT_EQ(client->reconnectAttempt(), 0);
    auto opened = eventsOf(TelemetryType::SocketOpened);
    ASSERT_EQ(opened.size(), 2);
    EXPECT_EQ(opened[1].fields["attempt"], 3);
    EXPECT_EQ(framesWithAction("subscribe").size(), 1);
}

TEST_F(MarketRealtimeClientTest, BackoffIsCapped) {
    RealtimeConfig config;
    config.reconnectMaxDelay = 3000ms;
    makeClient(config);
    connectAndOpen();
    for (int i = 0; i < 4; ++i) {
        transports.latest().closeWith(1006);
        scheduler.advance(3000ms);
    }

    EXPECT_THAT(reconnectDelays(), ElementsAre(1000, 2000, 3000, 3000));
}

TEST_F(MarketRealtimeClientTest, SocketErrorSchedulesReconnect) {
    makeClient();
    connectAndOpen();
    transports.latest().fail("read: connection reset");

    EXPECT_EQ(eventsOf(TelemetryType::SocketError).size(), 1);
    EXPECT_TRUE(client->reconnectPending());
}

// =============================================================================
// Terminal Conditions
// =============================================================================

TEST_F(MarketRealtimeClientTest, AuthenticationCloseStopsClient) {
    makeClient();
    connectAndOpen();
    transports.latest().closeWith(4401, "unauthorized");

    EXPECT_EQ(sink.authFailures(), 1);
    EXPECT_EQ(sink.lastStatus().first, ConnectionStatus::Failed);
    EXPECT_EQ(sink.lastStatus().second.value_or(""), "market data authentication failed");
    EXPECT_FALSE(client->isStarted());
    EXPECT_FALSE(client->reconnectPending());

    auto closed = eventsOf(TelemetryType::SocketClosed);
    ASSERT_EQ(closed.size(), 1);
    EXPECT_EQ(closed[0].fields["reason"], "authentication-failure");

    scheduler.advance(120000ms);
    EXPECT_EQ(transports.createdCount(), 1);
}

TEST_F(MarketRealtimeClientTest, MissingTokenFailsWithoutSocket) {
    token = "   ";
    makeClient();
    client->connect();

    EXPECT_EQ(transports.createdCount(), 0);
    EXPECT_EQ(hub.connectionCount(), 0);
    EXPECT_EQ(sink.resets(), 1);
    EXPECT_EQ(sink.lastStatus().first, ConnectionStatus::Failed);
    EXPECT_EQ(sink.lastStatus().second.value_or(""), "missing market data access token");
    EXPECT_FALSE(client->isStarted());
}

TEST_F(MarketRealtimeClientTest, DisconnectReleasesSocket) {
    makeClient();
    connectAndOpen();
    client->disconnect();

    EXPECT_FALSE(client->isStarted());
    EXPECT_FALSE(client->heartbeatRunning());
    EXPECT_TRUE(transports.latest().closed());
    EXPECT_EQ(hub.connectionCount(), 0);
    EXPECT_EQ(sink.resets(), 1);
    EXPECT_FALSE(client->subscribedSymbol().has_value());

    auto closed = eventsOf(TelemetryType::SocketClosed);
    ASSERT_EQ(closed.size(), 1);
    EXPECT_EQ(closed[0].fields["reason"], "manual");

    scheduler.advance(120000ms);
    EXPECT_EQ(transports.createdCount(), 1);
}

TEST_F(MarketRealtimeClientTest, TwoClientsShareOneSocket) {
    makeClient();
    RealtimeOptions options;
    options.tokenProvider = [this] { return token; };
    options.symbolProvider = [this] { return symbol; };
    options.timeframeProvider = [] { return std::string("5m"); };
    fixtures::SpySink otherSink;
    MarketRealtimeClient other(hub, scheduler, otherSink, metrics, std::move(options));

    client->connect();
    other.connect();
    EXPECT_EQ(transports.createdCount(), 1);

    transports.latest().open();
    scheduler.runPending();
    EXPECT_EQ(otherSink.lastStatus().first, ConnectionStatus::Connected);
    EXPECT_EQ(sink.lastStatus().first, ConnectionStatus::Connected);

    other.disconnect();
    EXPECT_FALSE(transports.latest().closed());
}
