/*
MarketStream — MarketRealtimeClient
Role: Keeps one symbol/timeframe subscription alive over the hub and feeds normalized data to a sink.
Inputs/Outputs: Provider callbacks + hub frames in; IMarketRealtimeSink calls and telemetry events out.
Threading: io_context thread only. Hub callbacks and timers land on the same thread; no locking.
Performance: One JSON parse per inbound frame; normalization is allocation-light and never blocks.
Integration: Built by the application on top of a shared ConnectionHub; the CLI wires it to LoggingSinkAdapter.
Observability: Logs under "realtime"; lifecycle is also emitted as market.realtime.* events on MetricsBus.
Related: ConnectionHub.hpp, SubscriptionProtocol.hpp, AckSnapshot.hpp, Normalizer.hpp, MetricsBus.hpp.
Assumptions: Hub, scheduler, sink and metrics bus outlive the client. Providers are cheap and may throw.
*/
#pragma once
#include "RealtimeTypes.hpp"
#include "IMarketRealtimeSink.hpp"
#include "AckSnapshot.hpp"
#include "../hub/ConnectionHub.hpp"
#include "../telemetry/MetricsBus.hpp"
#include "../ws/Scheduler.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace MarketStream {

class MarketRealtimeClient {
public:
    MarketRealtimeClient(ConnectionHub& hub,
                         Scheduler& scheduler,
                         IMarketRealtimeSink& sink,
                         MetricsBus& metrics,
                         RealtimeOptions options,
                         RealtimeConfig config = {});
    ~MarketRealtimeClient();

    MarketRealtimeClient(const MarketRealtimeClient&) = delete;
    MarketRealtimeClient& operator=(const MarketRealtimeClient&) = delete;

    // No-op when already started unless forced; a forced call drops the current socket first.
    void connect(bool force = false);
    void disconnect();

    // Re-sends the subscription if symbol or timeframe changed since the last request.
    void refreshSubscription();

    // Topics for the symbol; DOM topics only when the instrument is believed to have a book.
    [[nodiscard]] std::vector<std::string> defaultTopics(std::string_view symbol) const;

    [[nodiscard]] bool isStarted() const { return m_started; }
    [[nodiscard]] int reconnectAttempt() const { return m_reconnectAttempt; }
    [[nodiscard]] bool reconnectPending() const { return m_reconnectTimer != Scheduler::kNoTimer; }
    [[nodiscard]] bool heartbeatRunning() const { return m_heartbeatTimer != Scheduler::kNoTimer; }
    [[nodiscard]] const std::vector<std::string>& subscribedTopics() const { return m_lastSubscribedTopics; }
    [[nodiscard]] const std::optional<std::string>& subscribedSymbol() const { return m_lastSubscribedSymbol; }
    [[nodiscard]] const std::optional<std::string>& subscribedTimeframe() const { return m_lastSubscribedTimeframe; }

private:
    struct AckResult {
        bool depthApplied{false};
        bool tickerApplied{false};
        bool barApplied{false};
        bool historyApplied{false};
    };

    // Socket lifecycle
    void openSocket();
    void disposeSocket();
    void handleOpen();
    void handleError(const std::string& error);
    void handleClose(const CloseInfo& info);
    void scheduleReconnect(std::string_view reason, bool immediate = false);
    void clearReconnectTimer();

    // Heartbeat watchdog
    void startHeartbeat();
    void armHeartbeat();
    void stopHeartbeat();
    void checkHeartbeat();
    void touchActivity();

    // Subscription protocol
    void subscribeToTopics(bool force);
    void unsubscribeFromTopics(const std::vector<std::string>& topics);
    void handleMessage(const std::string& raw);
    void handleAck(const nlohmann::json& ack);
    void handleSubscribeAck(const nlohmann::json& ack);
    void resetSubscriptionState();

    // ACK snapshots
    AckResult ingestAckSnapshot(const nlohmann::json& ack);
    AckSnapshot::HistoricalContext buildHistoricalContext(const nlohmann::json* snapshot) const;
    bool handleHistoricalBarsSnapshot(const nlohmann::json& data, const AckSnapshot::HistoricalContext& base);

    // Events
    void handleEvent(const nlohmann::json& message);
    void handleDepthUpdate(const nlohmann::json& data);
    void handleTickerUpdate(const nlohmann::json& data);
    void handleBarUpdate(const nlohmann::json& data);
    TickerSnapshot normalizeTickerPrices(TickerSnapshot ticker, const std::string& targetSymbol) const;
    std::optional<double> derivePriceFromDepth(const DepthSnapshot& depth) const;
    std::optional<double> derivePriceFromTicker(const TickerSnapshot& ticker) const;
    std::optional<double> normalizeRealtimePrice(const std::string& symbol,
                                                 std::optional<double> price,
                                                 std::optional<double> reference) const;

    // DOM preference
    bool shouldIncludeDomTopics(const std::string& symbol) const;
    std::optional<SymbolInfo> resolveSymbolMetadata(const std::string& symbol) const;

    // Providers, trimmed; exceptions from them read as "not available"
    std::string currentToken() const;
    std::string currentSymbol() const;
    std::string currentTimeframe() const;
    std::optional<std::int64_t> requestedDuration() const;

    void updateConnectionStatus(ConnectionStatus status, std::optional<std::string> error = std::nullopt);
    void emitMetric(TelemetryType type, nlohmann::json fields = nlohmann::json::object());

    ConnectionHub&       m_hub;
    Scheduler&           m_scheduler;
    IMarketRealtimeSink& m_sink;
    MetricsBus&          m_metrics;
    RealtimeOptions      m_options;
    RealtimeConfig       m_config;

    std::unique_ptr<HubSubscription> m_socket;
    bool m_started{false};
    int  m_reconnectAttempt{0};
    Scheduler::TimerId m_heartbeatTimer{Scheduler::kNoTimer};
    Scheduler::TimerId m_reconnectTimer{Scheduler::kNoTimer};
    Scheduler::Clock::time_point m_lastActivityAt;
    std::optional<Scheduler::Clock::time_point> m_lastSubscriptionRequestedAt;
    std::optional<Scheduler::Clock::time_point> m_lastConnectionOpenedAt;

    std::optional<std::string> m_lastSubscribedSymbol;
    std::optional<std::string> m_lastSubscribedTimeframe;
    std::optional<std::string> m_lastRequestedSymbol;
    std::optional<std::string> m_lastRequestedTimeframe;
    std::vector<std::string>   m_lastSubscribedTopics;

    nlohmann::json             m_lastCapabilities;       // null when none cached
    std::optional<std::string> m_lastCapabilitiesSymbol; // upper-cased

    // Mismatch warnings already surfaced to the sink
    std::set<std::string> m_reportedMismatches;
};

} // namespace MarketStream
