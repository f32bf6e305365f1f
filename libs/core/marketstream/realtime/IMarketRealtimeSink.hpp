#pragma once
#include "RealtimeTypes.hpp"
#include "../normalize/MarketTypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace MarketStream {

// Consumer surface of MarketRealtimeClient. Every call happens on the io_context thread.
class IMarketRealtimeSink {
public:
    virtual ~IMarketRealtimeSink() = default;

    virtual void onConnectionStatus(ConnectionStatus status, const std::optional<std::string>& error) = 0;

    virtual void onSubscriptionPending(const SubscriptionPending& pending) = 0;
    virtual void onSubscriptionReady(const SubscriptionReady& ready) = 0;
    virtual void onSubscriptionFailed(const SubscriptionFailure& failure) = 0;
    virtual void onSubscriptionReset() = 0;

    virtual void onDepth(const DepthSnapshot& depth) = 0;
    virtual void onTicker(const TickerSnapshot& ticker) = 0;
    virtual void onBar(const BarUpdate& update) = 0;
    // nullopt clears the current kline
    virtual void onKline(const std::optional<KlineSnapshot>& kline) = 0;
    virtual void onAvailability(const nlohmann::json& availability) = 0;

    // Best current price estimate for position valuation
    virtual void onPositionPrice(const std::string& symbol, double price) = 0;

    virtual void onSymbolMismatch(const std::string& message) = 0;
    virtual void onAuthenticationFailure() = 0;
};

} // namespace MarketStream
