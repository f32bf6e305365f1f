#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace MarketStream {

// One price level of the order book
struct DepthLevel {
    double price{0.0};
    double size{0.0};
};

// Top-of-book view, at most 5 levels per side. bids are best-first as sent by
// the venue, asks likewise.
struct DepthSnapshot {
    std::vector<DepthLevel> bids;
    std::vector<DepthLevel> asks;
    std::optional<double> midPrice;
    std::optional<double> spread;
    std::optional<double> totalBidSize;
    std::optional<double> totalAskSize;
    std::string symbol;
    std::string updatedAt; // UTC ISO-8601, millisecond precision
};

struct TickerSnapshot {
    std::string symbol;
    std::optional<double> bid;
    std::optional<double> ask;
    std::optional<double> last;
    std::optional<double> lastSize;
    std::optional<double> close;
    std::optional<double> midPrice;
    std::optional<double> spread;
    std::optional<double> change;
    std::optional<double> changePercent;
    std::string updatedAt;
};

struct Bar {
    std::string timestamp; // UTC ISO-8601, also the dedupe key
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    std::optional<double> volume;
};

struct KlineSnapshot {
    std::string symbol;
    std::string timeframe;
    std::int64_t intervalSeconds{0};
    std::int64_t durationSeconds{0};
    std::vector<Bar> bars;             // deduped, ascending by timestamp
    std::optional<std::string> end;    // timestamp of the last bar
};

// Incremental bar with the window it belongs to
struct BarUpdate {
    Bar bar;
    std::string symbol;
    std::string timeframe;
    std::int64_t intervalSeconds{0};
    std::int64_t durationSeconds{0};
};

} // namespace MarketStream
