#pragma once
#include "../Log.hpp"
#include "../realtime/IMarketRealtimeSink.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <cstdint>

namespace MarketStream {

// Prints every normalized event through the logger under the "cli" category.
// Depth and price updates are throttled; lifecycle events always print.
class LoggingSinkAdapter : public IMarketRealtimeSink {
public:
    void onConnectionStatus(ConnectionStatus status, const std::optional<std::string>& error) override {
        if (error) {
            LOG_W("cli", "status {} ({})", toString(status), *error);
        } else {
            LOG_I("cli", "status {}", toString(status));
        }
    }

    void onSubscriptionPending(const SubscriptionPending& pending) override {
        LOG_I("cli", "subscribing {} {} -> [{}]", pending.symbol.value_or("-"), pending.timeframe.value_or("-"),
              fmt::join(pending.topics, ", "));
    }

    void onSubscriptionReady(const SubscriptionReady& ready) override {
        LOG_I("cli", "subscription {} ready for {} {} ({} topics)", ready.id.value_or("-"),
              ready.symbol.value_or("-"), ready.timeframe.value_or("-"), ready.topics.size());
    }

    void onSubscriptionFailed(const SubscriptionFailure& failure) override {
        LOG_E("cli", "subscription failed for {}: {}", failure.symbol.value_or("-"), failure.error);
    }

    void onSubscriptionReset() override { LOG_I("cli", "subscription reset"); }

    void onDepth(const DepthSnapshot& depth) override {
        ++m_depthCount;
        LOG_EVERY_N(INFO, 50, "cli", "depth {} bids={} asks={} mid={} (#{})", depth.symbol, depth.bids.size(),
                    depth.asks.size(), depth.midPrice.value_or(0.0), m_depthCount);
    }

    void onTicker(const TickerSnapshot& ticker) override {
        LOG_I("cli", "ticker {} last={} bid={} ask={} chg%={}", ticker.symbol, ticker.last.value_or(0.0),
              ticker.bid.value_or(0.0), ticker.ask.value_or(0.0), ticker.changePercent.value_or(0.0));
    }

    void onBar(const BarUpdate& update) override {
        LOG_I("cli", "bar {} {} {} o={} h={} l={} c={}", update.symbol, update.timeframe, update.bar.timestamp,
              update.bar.open, update.bar.high, update.bar.low, update.bar.close);
    }

    void onKline(const std::optional<KlineSnapshot>& kline) override {
        if (!kline) {
            LOG_I("cli", "kline cleared");
            return;
        }
        LOG_I("cli", "kline {} {} with {} bars ending {}", kline->symbol, kline->timeframe, kline->bars.size(),
              kline->end.value_or("-"));
    }

    void onAvailability(const nlohmann::json& availability) override {
        LOG_I("cli", "availability {}", availability.dump());
    }

    void onPositionPrice(const std::string& symbol, double price) override {
        LOG_EVERY_N(DEBUG, 50, "cli", "position price {} {}", symbol, price);
    }

    void onSymbolMismatch(const std::string& message) override { LOG_W("cli", "{}", message); }

    void onAuthenticationFailure() override {
        LOG_E("cli", "market data authentication failed; supply a fresh token");
    }

private:
    std::uint64_t m_depthCount{0};
};

} // namespace MarketStream
