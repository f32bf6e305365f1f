#include "MarketRealtimeClient.hpp"
#include "SubscriptionProtocol.hpp"
#include "../Log.hpp"
#include "../hub/HubProtocol.hpp"
#include "../normalize/JsonFields.hpp"
#include "../normalize/Normalizer.hpp"
#include "../normalize/Symbols.hpp"
#include <algorithm>
#include <cmath>

namespace MarketStream {

using nlohmann::json;
using std::chrono::milliseconds;

namespace {

constexpr std::string_view kMissingTokenError = "missing market data access token";
constexpr std::string_view kAuthenticationError = "market data authentication failed";

json orNull(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> nonEmpty(std::string value) {
    if (value.empty()) return std::nullopt;
    return value;
}

std::int64_t elapsedMs(Scheduler::Clock::time_point from, Scheduler::Clock::time_point to) {
    return std::chrono::duration_cast<milliseconds>(to - from).count();
}

double round4(double value) {
    return std::round(value * 1e4) / 1e4;
}

std::optional<double> firstFinite(std::initializer_list<std::optional<double>> values) {
    for (const auto& v : values) {
        if (v && std::isfinite(*v)) return v;
    }
    return std::nullopt;
}

// Same contract root, different spelling (ESM4 vs esm4, ESM4 vs ESU4)
bool relabelByRoot(std::string& symbol, const std::string& target) {
    if (target.empty() || symbol == target) return false;
    if (!Symbols::symbolsShareRoot(symbol, target)) return false;
    symbol = target;
    return true;
}

} // namespace

MarketRealtimeClient::MarketRealtimeClient(ConnectionHub& hub,
                                           Scheduler& scheduler,
                                           IMarketRealtimeSink& sink,
                                           MetricsBus& metrics,
                                           RealtimeOptions options,
                                           RealtimeConfig config)
    : m_hub(hub)
    , m_scheduler(scheduler)
    , m_sink(sink)
    , m_metrics(metrics)
    , m_options(std::move(options))
    , m_config(std::move(config))
    , m_lastActivityAt(scheduler.now())
{
    m_lastSubscribedTopics = defaultTopics(currentSymbol());
}

MarketRealtimeClient::~MarketRealtimeClient() {
    m_started = false;
    stopHeartbeat();
    clearReconnectTimer();
    disposeSocket();
}

// ============================================================================
// Public operations
// ============================================================================

void MarketRealtimeClient::connect(bool force) {
    if (m_started && !force) {
        LOG_D("realtime", "connect ignored, already started");
        return;
    }
    m_started = true;
    if (force) {
        stopHeartbeat();
        disposeSocket();
    }
    clearReconnectTimer();
    m_reconnectAttempt = 0;
    updateConnectionStatus(ConnectionStatus::Connecting);
    openSocket();
}

void MarketRealtimeClient::disconnect() {
    LOG_I("realtime", "disconnecting");
    m_started = false;
    stopHeartbeat();
    clearReconnectTimer();
    m_reconnectAttempt = 0;
    disposeSocket();

    resetSubscriptionState();
    m_lastSubscribedTopics = defaultTopics(currentSymbol());
    m_lastConnectionOpenedAt.reset();
    m_reportedMismatches.clear();

    emitMetric(TelemetryType::SocketClosed, {{"reason", "manual"}, {"code", nullptr}});
    m_sink.onSubscriptionReset();
}

void MarketRealtimeClient::refreshSubscription() {
    subscribeToTopics(false);
}

std::vector<std::string> MarketRealtimeClient::defaultTopics(std::string_view symbol) const {
    const std::string trimmed(JsonFields::trim(symbol));
    return SubscriptionProtocol::buildTopics(trimmed, shouldIncludeDomTopics(trimmed));
}

// ============================================================================
// Socket lifecycle
// ============================================================================

void MarketRealtimeClient::openSocket() {
    if (currentToken().empty()) {
        LOG_W("realtime", "no access token available, not connecting");
        m_sink.onSubscriptionReset();
        updateConnectionStatus(ConnectionStatus::Failed, std::string(kMissingTokenError));
        m_started = false;
        return;
    }

    const auto symbol = currentSymbol();
    const std::string name = symbol.empty() ? m_config.connectionName : symbol;

    disposeSocket();
    clearReconnectTimer();
    updateConnectionStatus(ConnectionStatus::Connecting);
    m_lastConnectionOpenedAt = m_scheduler.now();

    HubSubscriber subscriber;
    subscriber.onOpen = [this] { handleOpen(); };
    subscriber.onMessage = [this](const std::string& raw) { handleMessage(raw); };
    subscriber.onError = [this](const std::string& error) { handleError(error); };
    subscriber.onClose = [this](const CloseInfo& info) { handleClose(info); };
    subscriber.tokenProvider = [this] { return currentToken(); };

    LOG_D("realtime", "opening connection '{}' on {}", name, m_config.path);
    m_socket = m_hub.subscribe(name, std::move(subscriber), m_config.path);
}

void MarketRealtimeClient::disposeSocket() {
    // Reset first so re-entrant callbacks see no socket
    auto socket = std::move(m_socket);
    if (socket) socket->dispose();
}

void MarketRealtimeClient::handleOpen() {
    touchActivity();
    startHeartbeat();
    clearReconnectTimer();

    const int attempt = m_reconnectAttempt;
    json latency = nullptr;
    if (m_lastConnectionOpenedAt) latency = elapsedMs(*m_lastConnectionOpenedAt, m_scheduler.now());

    updateConnectionStatus(ConnectionStatus::Connected);
    emitMetric(TelemetryType::SocketOpened, {{"attempt", attempt}, {"latencyMs", latency}});
    m_reconnectAttempt = 0;
    LOG_I("realtime", "socket open after {} reconnect attempt(s)", attempt);

    subscribeToTopics(true);
}

void MarketRealtimeClient::handleError(const std::string& error) {
    LOG_W("realtime", "socket error: {}", error);
    stopHeartbeat();
    emitMetric(TelemetryType::SocketError, {{"reason", "socket-error"}});
    scheduleReconnect("socket-error");
}

void MarketRealtimeClient::handleClose(const CloseInfo& info) {
    stopHeartbeat();
    const bool authFailure = HubProtocol::isAuthenticationFailure(info);
    emitMetric(TelemetryType::SocketClosed,
               {{"reason", authFailure ? "authentication-failure" : "socket-close"}, {"code", info.code}});

    if (authFailure) {
        LOG_E("realtime", "market data authentication rejected (code={}), not reconnecting", info.code);
        m_started = false;
        clearReconnectTimer();
        disposeSocket();
        m_sink.onAuthenticationFailure();
        updateConnectionStatus(ConnectionStatus::Failed, std::string(kAuthenticationError));
        return;
    }
    LOG_I("realtime", "socket closed code={} reason='{}'", info.code, info.reason);
    scheduleReconnect("socket-close");
}

void MarketRealtimeClient::scheduleReconnect(std::string_view reason, bool immediate) {
    if (!m_started || m_reconnectTimer != Scheduler::kNoTimer) return;

    ++m_reconnectAttempt;
    milliseconds delay{0};
    if (!immediate) {
        delay = m_config.reconnectBaseDelay;
        for (int i = 1; i < m_reconnectAttempt && delay < m_config.reconnectMaxDelay; ++i) delay *= 2;
        delay = std::min(delay, m_config.reconnectMaxDelay);
    }

    LOG_I("realtime", "reconnect #{} in {} ms ({})", m_reconnectAttempt, delay.count(), reason);
    emitMetric(TelemetryType::ReconnectScheduled,
               {{"reason", std::string(reason)}, {"attempt", m_reconnectAttempt}, {"delayMs", delay.count()}});

    stopHeartbeat();
    disposeSocket();
    updateConnectionStatus(ConnectionStatus::Reconnecting);

    m_reconnectTimer = m_scheduler.schedule(delay, [this] {
        m_reconnectTimer = Scheduler::kNoTimer;
        if (m_started) openSocket();
    });
}

void MarketRealtimeClient::clearReconnectTimer() {
    if (m_reconnectTimer == Scheduler::kNoTimer) return;
    m_scheduler.cancel(m_reconnectTimer);
    m_reconnectTimer = Scheduler::kNoTimer;
}

// ============================================================================
// Heartbeat watchdog
// ============================================================================

void MarketRealtimeClient::startHeartbeat() {
    if (m_heartbeatTimer != Scheduler::kNoTimer) return;
    armHeartbeat();
}

void MarketRealtimeClient::armHeartbeat() {
    m_heartbeatTimer = m_scheduler.schedule(m_config.heartbeatCheckInterval, [this] {
        m_heartbeatTimer = Scheduler::kNoTimer;
        // Re-arm before checking: the check may stop the watchdog.
        armHeartbeat();
        checkHeartbeat();
    });
}

void MarketRealtimeClient::stopHeartbeat() {
    if (m_heartbeatTimer == Scheduler::kNoTimer) return;
    m_scheduler.cancel(m_heartbeatTimer);
    m_heartbeatTimer = Scheduler::kNoTimer;
}

void MarketRealtimeClient::touchActivity() {
    m_lastActivityAt = m_scheduler.now();
}

void MarketRealtimeClient::checkHeartbeat() {
    if (!m_started) return;
    const auto inactivity = elapsedMs(m_lastActivityAt, m_scheduler.now());
    if (inactivity < m_config.heartbeatTimeout.count()) return;

    const auto symbol = m_lastSubscribedSymbol ? *m_lastSubscribedSymbol : currentSymbol();
    if (symbol.empty()) {
        touchActivity();
        return;
    }
    const auto timeframe = m_lastSubscribedTimeframe ? m_lastSubscribedTimeframe : nonEmpty(currentTimeframe());
    const auto topics = m_lastSubscribedTopics.empty() ? defaultTopics(symbol) : m_lastSubscribedTopics;

    LOG_W("realtime", "no market data for {} ms on {}, reconnecting", inactivity, symbol);
    emitMetric(TelemetryType::HeartbeatTimeout,
               {{"inactivityMs", inactivity}, {"symbol", symbol}, {"timeframe", orNull(timeframe)}, {"topics", topics}});
    touchActivity();
    scheduleReconnect("heartbeat-timeout");
}

// ============================================================================
// Subscription protocol
// ============================================================================

void MarketRealtimeClient::subscribeToTopics(bool force) {
    if (!m_socket || !m_socket->isOpen()) {
        LOG_D("realtime", "subscribe deferred, socket not open");
        return;
    }
    const auto symbol = currentSymbol();
    if (symbol.empty()) {
        LOG_D("realtime", "subscribe skipped, no symbol selected");
        return;
    }
    const auto topics = defaultTopics(symbol);
    if (topics.empty()) return;
    const auto timeframe = nonEmpty(currentTimeframe());

    const bool shouldUnsubscribePrevious =
        m_lastSubscribedSymbol && (*m_lastSubscribedSymbol != symbol || m_lastSubscribedTimeframe != timeframe);

    if (!force && m_lastRequestedSymbol == symbol && m_lastRequestedTimeframe == timeframe) {
        LOG_D("realtime", "subscription for {} {} already requested", symbol, timeframe.value_or("-"));
        return;
    }

    if (shouldUnsubscribePrevious) unsubscribeFromTopics(m_lastSubscribedTopics);

    if (!m_socket->send(SubscriptionProtocol::buildSubscribeFrame(topics, symbol, timeframe))) {
        LOG_W("realtime", "failed to send subscribe for {}", symbol);
        return;
    }

    LOG_I("realtime", "subscribe requested for {} {} ({} topics)", symbol, timeframe.value_or("-"), topics.size());
    m_sink.onSubscriptionPending(SubscriptionPending{symbol, timeframe, topics});
    emitMetric(TelemetryType::SubscribeRequested,
               {{"symbol", symbol}, {"timeframe", orNull(timeframe)}, {"topics", topics}});

    m_lastRequestedSymbol = symbol;
    m_lastRequestedTimeframe = timeframe;
    m_lastSubscribedSymbol = symbol;
    m_lastSubscribedTimeframe = timeframe;
    m_lastSubscribedTopics = topics;
    m_lastSubscriptionRequestedAt = m_scheduler.now();
    m_reportedMismatches.clear();
}

void MarketRealtimeClient::unsubscribeFromTopics(const std::vector<std::string>& topics) {
    const auto normalized = SubscriptionProtocol::uniqueTopics(topics);
    if (normalized.empty() || !m_socket) return;
    if (!m_socket->send(SubscriptionProtocol::buildUnsubscribeFrame(normalized))) {
        LOG_W("realtime", "failed to send unsubscribe for {} topics", normalized.size());
        return;
    }
    LOG_D("realtime", "unsubscribe sent for {} topics", normalized.size());
}

void MarketRealtimeClient::handleMessage(const std::string& raw) {
    try {
        const auto message = json::parse(raw);
        touchActivity();
        if (!message.is_object()) {
            LOG_D("realtime", "ignoring non-object message");
            return;
        }
        const auto type = JsonFields::string(message, "type").value_or("");
        if (type == "event") {
            handleEvent(message);
        } else if (type == "ack") {
            handleAck(message);
        } else {
            LOG_T("realtime", "ignoring message type '{}'", type);
        }
    } catch (const json::parse_error& e) {
        LOG_W("realtime", "dropping malformed message: {}", e.what());
    } catch (const std::exception& e) {
        LOG_E("realtime", "error processing message: {}", e.what());
    }
}

void MarketRealtimeClient::handleAck(const json& ack) {
    const auto action = JsonFields::string(ack, "action");
    if (!action) return;

    if (*action == "subscribe") {
        handleSubscribeAck(ack);
    } else if (*action == "unsubscribe") {
        const auto topics = SubscriptionProtocol::normalizeTopics(JsonFields::find(ack, "topics"));
        if (SubscriptionProtocol::sameTopicSet(topics, m_lastSubscribedTopics)) {
            LOG_D("realtime", "subscription reset after unsubscribe ack");
            m_sink.onSubscriptionReset();
        } else {
            LOG_D("realtime", "ignoring unsubscribe ack for previous topics");
        }
    } else {
        LOG_D("realtime", "ignoring ack for action '{}'", *action);
    }
}

void MarketRealtimeClient::handleSubscribeAck(const json& ack) {
    const auto topics = SubscriptionProtocol::normalizeTopics(JsonFields::find(ack, "topics"));
    const auto symbol = JsonFields::string(ack, "symbol");
    const auto timeframe = JsonFields::string(ack, "timeframe");
    const auto subscriptionId = SubscriptionProtocol::extractSubscriptionId(ack);
    const auto capabilities = SubscriptionProtocol::extractCapabilities(ack);

    if (auto error = SubscriptionProtocol::extractAckError(ack)) {
        LOG_W("realtime", "subscription rejected: {}", *error);
        m_sink.onSubscriptionFailed(SubscriptionFailure{*error, symbol, timeframe});
        updateConnectionStatus(ConnectionStatus::Failed, *error);
        stopHeartbeat();
        clearReconnectTimer();
        disposeSocket();
        m_started = false;
        resetSubscriptionState();
        emitMetric(TelemetryType::SubscribeFailed,
                   {{"symbol", orNull(symbol)}, {"timeframe", orNull(timeframe)}, {"error", *error}});
        return;
    }

    const auto effectiveSymbol = symbol ? symbol : m_lastSubscribedSymbol;
    const auto effectiveTimeframe = timeframe ? timeframe : m_lastSubscribedTimeframe;
    if (symbol) m_lastSubscribedSymbol = symbol;
    if (timeframe) m_lastSubscribedTimeframe = timeframe;

    const auto resolvedTopics = SubscriptionProtocol::uniqueTopics(
        topics.empty() ? defaultTopics(effectiveSymbol.value_or(currentSymbol())) : topics);

    m_sink.onSubscriptionReady(
        SubscriptionReady{subscriptionId, effectiveSymbol, effectiveTimeframe, resolvedTopics, capabilities});

    json latency = nullptr;
    if (m_lastSubscriptionRequestedAt) latency = elapsedMs(*m_lastSubscriptionRequestedAt, m_scheduler.now());
    emitMetric(TelemetryType::SubscribeAck,
               {{"symbol", orNull(effectiveSymbol)},
                {"timeframe", orNull(effectiveTimeframe)},
                {"latencyMs", latency},
                {"capabilities", capabilities}});
    m_lastSubscriptionRequestedAt.reset();
    m_lastSubscribedTopics = resolvedTopics;
    LOG_I("realtime", "subscription ready id={} symbol={} timeframe={} ({} topics)",
          subscriptionId.value_or("-"), effectiveSymbol.value_or("-"), effectiveTimeframe.value_or("-"),
          resolvedTopics.size());

    if (capabilities.is_object()) {
        const auto owner = JsonFields::toUpper(JsonFields::trim(effectiveSymbol.value_or(currentSymbol())));
        m_lastCapabilities = capabilities;
        m_lastCapabilitiesSymbol = nonEmpty(owner);
    } else {
        m_lastCapabilities = nullptr;
        m_lastCapabilitiesSymbol.reset();
    }

    const auto result = ingestAckSnapshot(ack);

    if (!effectiveSymbol) return;
    if (SubscriptionProtocol::expectsDepthSnapshot(resolvedTopics, capabilities) && !result.depthApplied) {
        LOG_W("realtime", "subscribe ack for {} carried no depth snapshot, waiting for live updates", *effectiveSymbol);
    }
    if (SubscriptionProtocol::expectsBarSnapshot(resolvedTopics, capabilities) && !result.historyApplied &&
        !result.barApplied) {
        LOG_W("realtime", "subscribe ack for {} carried no bar snapshot, waiting for live updates", *effectiveSymbol);
    }
}

void MarketRealtimeClient::resetSubscriptionState() {
    m_lastSubscribedSymbol.reset();
    m_lastSubscribedTimeframe.reset();
    m_lastRequestedSymbol.reset();
    m_lastRequestedTimeframe.reset();
    m_lastSubscriptionRequestedAt.reset();
    m_lastCapabilities = nullptr;
    m_lastCapabilitiesSymbol.reset();
}

// ============================================================================
// ACK snapshots
// ============================================================================

MarketRealtimeClient::AckResult MarketRealtimeClient::ingestAckSnapshot(const json& ack) {
    AckResult result;
    const auto* snapshot = AckSnapshot::resolveAckSnapshot(ack);
    if (snapshot == nullptr) {
        LOG_D("realtime", "subscribe ack carried no snapshot");
        return result;
    }
    const auto context = buildHistoricalContext(snapshot);

    if (const auto* depth = AckSnapshot::pickSnapshotValue(
            *snapshot, {"market.dom", "market.depth", "depth", "dom", "depthSnapshot", "latest_dom", "latestDom"})) {
        handleDepthUpdate(*depth);
        result.depthApplied = true;
    }
    if (const auto* ticker = AckSnapshot::pickSnapshotValue(
            *snapshot, {"market.ticker", "ticker", "tickerSnapshot", "latest_ticker", "latestTicker"})) {
        handleTickerUpdate(*ticker);
        result.tickerApplied = true;
    }
    if (const auto* history = AckSnapshot::pickSnapshotValue(*snapshot, {"historical_bars", "historicalBars"})) {
        if (handleHistoricalBarsSnapshot(*history, context)) result.historyApplied = true;
    }
    if (const auto* bar = AckSnapshot::pickSnapshotValue(
            *snapshot, {"market.bar", "bar", "barSnapshot", "latestBar", "latest_bar"})) {
        // Seed the chart with the lone bar when no history came along
        if (!result.historyApplied && handleHistoricalBarsSnapshot(*bar, context)) result.historyApplied = true;
        handleBarUpdate(*bar);
        result.barApplied = true;
    }
    if (const auto* kline = AckSnapshot::pickSnapshotValue(*snapshot, {"kline", "klineSnapshot", "market.kline"})) {
        if (kline->is_null()) {
            m_sink.onKline(std::nullopt);
        } else if (handleHistoricalBarsSnapshot(*kline, context)) {
            result.historyApplied = true;
        } else {
            LOG_D("realtime", "kline snapshot ignored after normalization");
        }
    }
    if (const auto* availability = AckSnapshot::pickSnapshotValue(
            *snapshot, {"availability", "marketAvailability", "market.availability"})) {
        m_sink.onAvailability(*availability);
    }
    return result;
}

AckSnapshot::HistoricalContext MarketRealtimeClient::buildHistoricalContext(const json* snapshot) const {
    AckSnapshot::HistoricalContext context;
    if (snapshot != nullptr) {
        AckSnapshot::applyHistoricalContext(context, *snapshot);
        const auto* metadata = AckSnapshot::pickSnapshotValue(*snapshot, {"metadata", "context"});
        if (JsonFields::isRecord(metadata)) AckSnapshot::applyHistoricalContext(context, *metadata);
    }
    if (!context.symbol) context.symbol = nonEmpty(currentSymbol());
    if (!context.timeframe) context.timeframe = nonEmpty(currentTimeframe());

    const auto window = Symbols::resolveAggregationWindow(context.timeframe.value_or(""));
    if (!context.intervalSeconds || *context.intervalSeconds == 0) {
        context.intervalSeconds = static_cast<double>(window.intervalSeconds);
    }
    if (!context.durationSeconds || *context.durationSeconds == 0) {
        context.durationSeconds = static_cast<double>(requestedDuration().value_or(window.durationSeconds));
    }
    return context;
}

bool MarketRealtimeClient::handleHistoricalBarsSnapshot(const json& data, const AckSnapshot::HistoricalContext& base) {
    auto collected = AckSnapshot::collectHistoricalBars(data, base);
    if (!collected) {
        LOG_D("realtime", "historical bars payload empty or invalid");
        return false;
    }
    const auto& context = collected->context;

    KlineSnapshot kline;
    kline.timeframe = context.timeframe ? *context.timeframe : currentTimeframe();
    const auto window = Symbols::resolveAggregationWindow(kline.timeframe);
    kline.symbol = context.symbol ? *context.symbol : currentSymbol();
    relabelByRoot(kline.symbol, currentSymbol());
    kline.intervalSeconds = context.intervalSeconds ? std::llround(*context.intervalSeconds) : window.intervalSeconds;
    kline.durationSeconds = context.durationSeconds ? std::llround(*context.durationSeconds)
                                                    : requestedDuration().value_or(window.durationSeconds);
    kline.bars = std::move(collected->bars);
    kline.end = kline.bars.back().timestamp;

    LOG_D("realtime", "kline snapshot {} {} with {} bars", kline.symbol, kline.timeframe, kline.bars.size());
    m_sink.onKline(kline);
    return true;
}

// ============================================================================
// Events
// ============================================================================

void MarketRealtimeClient::handleEvent(const json& message) {
    const auto name = SubscriptionProtocol::resolveEventName(message);
    if (!name) {
        LOG_D("realtime", "event without a recognizable name");
        return;
    }
    static const json kNoPayload;
    const auto* found = SubscriptionProtocol::resolveEventPayload(message);
    const json& payload = found ? *found : kNoPayload;

    const auto descriptor = Symbols::parseTopicDescriptor(*name);
    const auto payloadSymbol = SubscriptionProtocol::extractPayloadSymbol(&payload);
    auto expected = currentSymbol();
    if (expected.empty() && m_lastSubscribedSymbol) expected = *m_lastSubscribedSymbol;

    if (auto warning = SubscriptionProtocol::detectSymbolMismatch(descriptor.topicSymbol, payloadSymbol, expected)) {
        LOG_W("realtime", "dropping {}: {}", *name, *warning);
        if (m_reportedMismatches.insert(*warning).second) m_sink.onSymbolMismatch(*warning);
        return;
    }

    const auto& base = descriptor.normalizedBaseTopic;
    if (base == "market.depth" || base == "market.dom" || base == "depth" || base == "dom") {
        handleDepthUpdate(payload);
    } else if (base == "market.ticker" || base == "ticker") {
        handleTickerUpdate(payload);
    } else if (base == "market.bar" || base == "market.kline" || base == "bar" || base == "bars" || base == "kline") {
        handleBarUpdate(payload);
    } else {
        LOG_EVERY_N(DEBUG, 100, "realtime", "ignoring event '{}'", *name);
    }
}

void MarketRealtimeClient::handleDepthUpdate(const json& data) {
    const auto target = currentSymbol();
    auto depth = Normalize::normalizeDepthPayload(data, target);
    if (!depth) {
        LOG_T("realtime", "depth payload ignored after normalization");
        return;
    }
    const auto targetRoot = Symbols::extractRootSymbol(target);
    const auto depthRoot = Symbols::extractRootSymbol(depth->symbol);
    if (!targetRoot.empty() && !depthRoot.empty() && targetRoot != depthRoot) {
        LOG_D("realtime", "depth for {} ignored, subscribed to {}", depth->symbol, target);
        return;
    }
    if (depth->symbol.empty()) depth->symbol = target;
    relabelByRoot(depth->symbol, target);

    m_sink.onDepth(*depth);

    const auto price = derivePriceFromDepth(*depth);
    const auto& pricingSymbol = depth->symbol.empty() ? target : depth->symbol;
    if (price && !pricingSymbol.empty()) m_sink.onPositionPrice(pricingSymbol, *price);
}

void MarketRealtimeClient::handleTickerUpdate(const json& data) {
    const auto target = currentSymbol();
    auto ticker = Normalize::normalizeTickerPayload(data, target);
    if (!ticker) {
        LOG_T("realtime", "ticker payload ignored after normalization");
        return;
    }
    const auto normalized = normalizeTickerPrices(std::move(*ticker), target);
    m_sink.onTicker(normalized);

    const auto price = derivePriceFromTicker(normalized);
    const auto& pricingSymbol = normalized.symbol.empty() ? target : normalized.symbol;
    if (price && !pricingSymbol.empty()) m_sink.onPositionPrice(pricingSymbol, *price);
}

void MarketRealtimeClient::handleBarUpdate(const json& data) {
    const auto symbol = currentSymbol();
    const auto timeframe = currentTimeframe();
    const auto window = Symbols::resolveAggregationWindow(timeframe);

    Normalize::BarContext context;
    context.symbol = nonEmpty(symbol);
    context.timeframe = nonEmpty(timeframe);
    context.intervalSeconds = window.intervalSeconds;
    context.durationSeconds = requestedDuration().value_or(window.durationSeconds);

    auto normalized = Normalize::normalizeBarEventPayload(data, context);
    if (!normalized) {
        LOG_T("realtime", "bar payload ignored after normalization");
        return;
    }
    const auto resolved = normalized->symbol.value_or(symbol);
    const auto targetRoot = Symbols::extractRootSymbol(symbol);
    const auto barRoot = Symbols::extractRootSymbol(resolved);
    if (!targetRoot.empty() && !barRoot.empty() && targetRoot != barRoot) {
        LOG_D("realtime", "bar for {} ignored, subscribed to {}", resolved, symbol);
        return;
    }
    if (normalized->snapshot) {
        relabelByRoot(normalized->snapshot->symbol, symbol);
        m_sink.onKline(normalized->snapshot);
    }
    if (normalized->bar) {
        BarUpdate update;
        update.bar = std::move(*normalized->bar);
        update.symbol = resolved;
        relabelByRoot(update.symbol, symbol);
        update.timeframe = normalized->timeframe.value_or(timeframe);
        update.intervalSeconds = normalized->intervalSeconds;
        update.durationSeconds = normalized->durationSeconds;
        m_sink.onBar(update);
    }
}

TickerSnapshot MarketRealtimeClient::normalizeTickerPrices(TickerSnapshot ticker, const std::string& targetSymbol) const {
    if (ticker.symbol.empty()) ticker.symbol = targetSymbol;
    relabelByRoot(ticker.symbol, targetSymbol);
    const auto& symbol = ticker.symbol;

    const auto last = normalizeRealtimePrice(symbol, ticker.last, ticker.close);
    const auto close = normalizeRealtimePrice(symbol, ticker.close, last ? last : ticker.last);
    const auto reference = last ? last : close;
    const auto bid = normalizeRealtimePrice(symbol, ticker.bid, reference);
    const auto ask = normalizeRealtimePrice(symbol, ticker.ask, reference);
    const auto mid = normalizeRealtimePrice(symbol, ticker.midPrice, reference);

    if (last) ticker.last = last;
    if (close) ticker.close = close;
    if (bid) ticker.bid = bid;
    if (ask) ticker.ask = ask;
    if (mid) ticker.midPrice = mid;

    if (ticker.bid && ticker.ask) {
        ticker.midPrice = JsonFields::round6((*ticker.bid + *ticker.ask) / 2);
        ticker.spread = JsonFields::round6(std::abs(*ticker.ask - *ticker.bid));
    }
    if (ticker.last && ticker.close) {
        const double change = *ticker.last - *ticker.close;
        ticker.change = JsonFields::round6(change);
        ticker.changePercent = std::abs(*ticker.close) > 1e-6
                                   ? std::optional<double>(JsonFields::round6(change / *ticker.close * 100))
                                   : std::nullopt;
    }
    return ticker;
}

std::optional<double> MarketRealtimeClient::derivePriceFromDepth(const DepthSnapshot& depth) const {
    const auto symbol = depth.symbol.empty() ? currentSymbol() : depth.symbol;
    const auto mid = depth.midPrice;
    if (mid) {
        if (auto normalized = normalizeRealtimePrice(symbol, mid, mid)) return normalized;
    }
    const std::optional<double> bestBid = depth.bids.empty() ? std::nullopt : std::optional<double>(depth.bids.front().price);
    const std::optional<double> bestAsk = depth.asks.empty() ? std::nullopt : std::optional<double>(depth.asks.front().price);

    std::optional<double> candidate;
    if (bestBid && bestAsk) {
        candidate = JsonFields::round6((*bestBid + *bestAsk) / 2);
    } else {
        candidate = bestBid ? bestBid : bestAsk;
    }
    if (!candidate) return std::nullopt;
    return normalizeRealtimePrice(symbol, candidate, mid ? mid : candidate);
}

std::optional<double> MarketRealtimeClient::derivePriceFromTicker(const TickerSnapshot& ticker) const {
    std::optional<double> bidAskMid;
    if (ticker.bid && ticker.ask) bidAskMid = round4((*ticker.bid + *ticker.ask) / 2);
    const auto candidate = firstFinite({ticker.last, ticker.midPrice, ticker.close, bidAskMid});
    if (!candidate) return std::nullopt;
    const auto reference = firstFinite({ticker.close, ticker.midPrice, candidate});
    const auto symbol = ticker.symbol.empty() ? currentSymbol() : ticker.symbol;
    return normalizeRealtimePrice(symbol, candidate, reference);
}

std::optional<double> MarketRealtimeClient::normalizeRealtimePrice(const std::string& symbol,
                                                                   std::optional<double> price,
                                                                   std::optional<double> reference) const {
    if (!price || !std::isfinite(*price)) return std::nullopt;
    Symbols::PriceNormalization opts;
    if (auto metadata = resolveSymbolMetadata(symbol)) opts.tickSize = metadata->tickSize;
    opts.reference = reference;
    if (auto normalized = Symbols::normalizePriceByTick(price, symbol, opts)) return normalized;
    return price;
}

// ============================================================================
// DOM preference
// ============================================================================

bool MarketRealtimeClient::shouldIncludeDomTopics(const std::string& symbol) const {
    if (!symbol.empty()) {
        if (auto metadata = resolveSymbolMetadata(symbol)) {
            if (auto preference = SubscriptionProtocol::domPreferenceFromMetadata(*metadata)) return *preference;
        }
        if (m_lastCapabilities.is_object() && m_lastCapabilitiesSymbol &&
            *m_lastCapabilitiesSymbol == JsonFields::toUpper(symbol)) {
            if (auto flag = SubscriptionProtocol::findDomCapability(m_lastCapabilities)) return *flag;
        }
    }
    return m_config.assumeDomWhenUnknown;
}

std::optional<SymbolInfo> MarketRealtimeClient::resolveSymbolMetadata(const std::string& symbol) const {
    if (!m_options.symbolMetadataProvider || symbol.empty()) return std::nullopt;
    try {
        return m_options.symbolMetadataProvider(symbol);
    } catch (const std::exception& e) {
        LOG_FIRST_N(WARN, 5, "realtime", "symbol metadata lookup for {} failed: {}", symbol, e.what());
        return std::nullopt;
    }
}

// ============================================================================
// Providers and reporting
// ============================================================================

std::string MarketRealtimeClient::currentToken() const {
    if (!m_options.tokenProvider) return {};
    try {
        return std::string(JsonFields::trim(m_options.tokenProvider()));
    } catch (const std::exception& e) {
        LOG_W("realtime", "token provider failed: {}", e.what());
        return {};
    }
}

std::string MarketRealtimeClient::currentSymbol() const {
    if (!m_options.symbolProvider) return {};
    try {
        return std::string(JsonFields::trim(m_options.symbolProvider()));
    } catch (const std::exception& e) {
        LOG_W("realtime", "symbol provider failed: {}", e.what());
        return {};
    }
}

std::string MarketRealtimeClient::currentTimeframe() const {
    if (!m_options.timeframeProvider) return {};
    try {
        return std::string(JsonFields::trim(m_options.timeframeProvider()));
    } catch (const std::exception& e) {
        LOG_W("realtime", "timeframe provider failed: {}", e.what());
        return {};
    }
}

std::optional<std::int64_t> MarketRealtimeClient::requestedDuration() const {
    if (!m_options.durationProvider) return std::nullopt;
    try {
        return m_options.durationProvider();
    } catch (const std::exception& e) {
        LOG_W("realtime", "duration provider failed: {}", e.what());
        return std::nullopt;
    }
}

void MarketRealtimeClient::updateConnectionStatus(ConnectionStatus status, std::optional<std::string> error) {
    LOG_D("realtime", "status -> {}{}", toString(status), error ? " (" + *error + ")" : std::string{});
    m_sink.onConnectionStatus(status, error);
    emitMetric(TelemetryType::ConnectionStatus, {{"status", std::string(toString(status))}, {"error", orNull(error)}});
}

void MarketRealtimeClient::emitMetric(TelemetryType type, json fields) {
    m_metrics.emit(TelemetryEvent{type, std::move(fields)});
}

} // namespace MarketStream
