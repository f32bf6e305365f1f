#pragma once
#include "marketstream/realtime/IMarketRealtimeSink.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fixtures {

/// Spy sink that records every callback for verification in tests
class SpySink : public MarketStream::IMarketRealtimeSink {
public:
    using StatusCall = std::pair<MarketStream::ConnectionStatus, std::optional<std::string>>;

    void onConnectionStatus(MarketStream::ConnectionStatus status, const std::optional<std::string>& error) override {
        statuses_.emplace_back(status, error);
    }
    void onSubscriptionPending(const MarketStream::SubscriptionPending& pending) override {
        pending_.push_back(pending);
    }
    void onSubscriptionReady(const MarketStream::SubscriptionReady& ready) override { ready_.push_back(ready); }
    void onSubscriptionFailed(const MarketStream::SubscriptionFailure& failure) override {
        failures_.push_back(failure);
    }
    void onSubscriptionReset() override { ++resets_; }

    void onDepth(const MarketStream::DepthSnapshot& depth) override { depths_.push_back(depth); }
    void onTicker(const MarketStream::TickerSnapshot& ticker) override { tickers_.push_back(ticker); }
    void onBar(const MarketStream::BarUpdate& update) override { bars_.push_back(update); }
    void onKline(const std::optional<MarketStream::KlineSnapshot>& kline) override { klines_.push_back(kline); }
    void onAvailability(const nlohmann::json& availability) override { availability_.push_back(availability); }
    void onPositionPrice(const std::string& symbol, double price) override { prices_.emplace_back(symbol, price); }
    void onSymbolMismatch(const std::string& message) override { mismatches_.push_back(message); }
    void onAuthenticationFailure() override { ++auth_failures_; }

    // Accessors for test verification
    const std::vector<StatusCall>& statuses() const { return statuses_; }
    const std::vector<MarketStream::SubscriptionPending>& pending() const { return pending_; }
    const std::vector<MarketStream::SubscriptionReady>& ready() const { return ready_; }
    const std::vector<MarketStream::SubscriptionFailure>& failures() const { return failures_; }
    int resets() const { return resets_; }
    const std::vector<MarketStream::DepthSnapshot>& depths() const { return depths_; }
    const std::vector<MarketStream::TickerSnapshot>& tickers() const { return tickers_; }
    const std::vector<MarketStream::BarUpdate>& bars() const { return bars_; }
    const std::vector<std::optional<MarketStream::KlineSnapshot>>& klines() const { return klines_; }
    const std::vector<nlohmann::json>& availability() const { return availability_; }
    const std::vector<std::pair<std::string, double>>& prices() const { return prices_; }
    const std::vector<std::string>& mismatches() const { return mismatches_; }
    int authFailures() const { return auth_failures_; }

    // Helper: most recent status transition
    const StatusCall& lastStatus() const {
        if (statuses_.empty()) {
            throw std::runtime_error("SpySink: no status recorded");
        }
        return statuses_.back();
    }

    void clear() {
        statuses_.clear();
        pending_.clear();
        ready_.clear();
        failures_.clear();
        resets_ = 0;
        depths_.clear();
        tickers_.clear();
        bars_.clear();
        klines_.clear();
        availability_.clear();
        prices_.clear();
        mismatches_.clear();
        auth_failures_ = 0;
    }

private:
    std::vector<StatusCall> statuses_;
    std::vector<MarketStream::SubscriptionPending> pending_;
    std::vector<MarketStream::SubscriptionReady> ready_;
    std::vector<MarketStream::SubscriptionFailure> failures_;
    int resets_{0};
    std::vector<MarketStream::DepthSnapshot> depths_;
    std::vector<MarketStream::TickerSnapshot> tickers_;
    std::vector<MarketStream::BarUpdate> bars_;
    std::vector<std::optional<MarketStream::KlineSnapshot>> klines_;
    std::vector<nlohmann::json> availability_;
    std::vector<std::pair<std::string, double>> prices_;
    std::vector<std::string> mismatches_;
    int auth_failures_{0};
};

} // namespace fixtures
