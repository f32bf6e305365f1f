#include "Normalizer.hpp"
#include "JsonFields.hpp"
#include "Symbols.hpp"
#include "Timestamps.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace MarketStream {
namespace Normalize {

using nlohmann::json;
namespace jf = JsonFields;

namespace {

// First member that is present and not null, mirroring a ?? chain
const json* firstPresent(const json& obj, std::initializer_list<std::string_view> keys) {
    for (auto key : keys) {
        const auto* v = jf::find(obj, key);
        if (v != nullptr && !v->is_null()) return v;
    }
    return nullptr;
}

std::optional<double> sanitizePrice(std::optional<double> value) {
    if (value && *value < 0) return std::nullopt;
    return value;
}

bool rootMismatch(std::string_view targetSymbol, std::string_view payloadSymbol) {
    const auto targetRoot = Symbols::extractRootSymbol(targetSymbol);
    const auto payloadRoot = Symbols::extractRootSymbol(payloadSymbol);
    return !targetRoot.empty() && !payloadRoot.empty() && targetRoot != payloadRoot;
}

std::vector<DepthLevel> toDepthLevels(const json* levels) {
    std::vector<DepthLevel> out;
    if (levels == nullptr || !levels->is_array()) return out;
    for (const auto& level : *levels) {
        if (!level.is_object()) continue;
        const auto price = jf::number(level, "price");
        const auto size = jf::number(level, "size");
        if (!price || !size) continue;
        out.push_back(DepthLevel{*price, *size});
    }
    return out;
}

std::optional<DepthLevel> buildBestLevel(const json* level, const json* fallbackPrice, const json* fallbackSize) {
    const json* price = fallbackPrice;
    const json* size = fallbackSize;
    if (jf::isRecord(level)) {
        if (const auto* p = firstPresent(*level, {"price"})) price = p;
        if (const auto* s = firstPresent(*level, {"size"})) size = s;
    }
    const auto p = jf::toNumber(price);
    const auto s = jf::toNumber(size);
    if (!p || !s) return std::nullopt;
    return DepthLevel{*p, *s};
}

void prependUnique(std::vector<DepthLevel>& levels, const std::optional<DepthLevel>& candidate) {
    if (!candidate) return;
    for (const auto& level : levels) {
        if (std::abs(level.price - candidate->price) < 1e-6) return;
    }
    levels.insert(levels.begin(), *candidate);
}

std::string timestampOrNow(const json& payload) {
    if (const auto* ts = jf::find(payload, "timestamp"); ts != nullptr && ts->is_string()) {
        if (auto normalized = Timestamps::normalizeToUtc(ts->get_ref<const std::string&>())) {
            return *normalized;
        }
    }
    return Timestamps::nowUtc();
}

std::int64_t toSeconds(double value) {
    return static_cast<std::int64_t>(std::llround(value));
}

} // namespace

std::optional<std::string> normalizeTimestampToUtc(std::string_view text) {
    return Timestamps::normalizeToUtc(text);
}

std::optional<DepthSnapshot> normalizeDepthPayload(const json& data, std::string_view targetSymbol) {
    if (!data.is_object()) return std::nullopt;

    const auto payloadSymbol = jf::string(data, "symbol");
    if (rootMismatch(targetSymbol, payloadSymbol.value_or(""))) return std::nullopt;

    auto bids = toDepthLevels(jf::find(data, "bids"));
    auto asks = toDepthLevels(jf::find(data, "asks"));

    const auto bestBid = buildBestLevel(firstPresent(data, {"best_bid", "bestBid"}),
                                        firstPresent(data, {"best_bid_price", "bestBidPrice"}),
                                        firstPresent(data, {"best_bid_size", "bestBidSize"}));
    const auto bestAsk = buildBestLevel(firstPresent(data, {"best_ask", "bestAsk"}),
                                        firstPresent(data, {"best_ask_price", "bestAskPrice"}),
                                        firstPresent(data, {"best_ask_size", "bestAskSize"}));

    prependUnique(bids, bestBid);
    prependUnique(asks, bestAsk);
    // Best price first on each side, so the cap keeps the top of book
    std::stable_sort(bids.begin(), bids.end(),
                     [](const DepthLevel& a, const DepthLevel& b) { return a.price > b.price; });
    std::stable_sort(asks.begin(), asks.end(),
                     [](const DepthLevel& a, const DepthLevel& b) { return a.price < b.price; });
    if (bids.size() > kMaxDepthLevels) bids.resize(kMaxDepthLevels);
    if (asks.size() > kMaxDepthLevels) asks.resize(kMaxDepthLevels);

    DepthSnapshot snap;
    snap.totalBidSize = jf::toNumber(firstPresent(data, {"total_bid_size", "totalBidSize"}));
    if (!snap.totalBidSize && bestBid) snap.totalBidSize = bestBid->size;
    snap.totalAskSize = jf::toNumber(firstPresent(data, {"total_ask_size", "totalAskSize"}));
    if (!snap.totalAskSize && bestAsk) snap.totalAskSize = bestAsk->size;

    if (bids.empty() && asks.empty() && !snap.totalBidSize && !snap.totalAskSize) return std::nullopt;

    snap.midPrice = jf::number(data, "mid_price");
    snap.spread = jf::number(data, "spread");
    const auto topBid = bestBid ? bestBid : (bids.empty() ? std::nullopt : std::optional<DepthLevel>(bids.front()));
    const auto topAsk = bestAsk ? bestAsk : (asks.empty() ? std::nullopt : std::optional<DepthLevel>(asks.front()));
    if (topBid && topAsk) {
        if (!snap.midPrice) snap.midPrice = jf::round6((topBid->price + topAsk->price) / 2);
        if (!snap.spread) snap.spread = jf::round6(std::abs(topAsk->price - topBid->price));
    }

    snap.bids = std::move(bids);
    snap.asks = std::move(asks);
    snap.symbol = payloadSymbol.value_or(std::string(targetSymbol));
    snap.updatedAt = timestampOrNow(data);
    return snap;
}

std::optional<TickerSnapshot> normalizeTickerPayload(const json& data, std::string_view targetSymbol) {
    if (!data.is_object()) return std::nullopt;

    const auto payloadSymbol = jf::string(data, "symbol");
    if (rootMismatch(targetSymbol, payloadSymbol.value_or(""))) return std::nullopt;

    TickerSnapshot t;
    t.symbol = payloadSymbol.value_or(std::string(targetSymbol));
    t.bid = sanitizePrice(jf::firstNumber(data, {"bid", "bid_price", "bidPrice"}));
    t.ask = sanitizePrice(jf::firstNumber(data, {"ask", "ask_price", "askPrice"}));
    t.last = sanitizePrice(jf::firstNumber(data, {"last", "last_price", "lastPrice", "trade_price", "price",
                                                   "mark", "mark_price", "markPrice"}));
    t.close = sanitizePrice(jf::firstNumber(data, {"close", "close_price", "closePrice"}));
    t.lastSize = jf::number(data, "last_size");

    if (t.last && t.close) {
        t.change = *t.last - *t.close;
        if (*t.close != 0.0) t.changePercent = *t.change / *t.close * 100.0;
    }

    auto mid = jf::firstNumber(data, {"mid_price", "midPrice", "mid"});
    if (!mid && t.bid && t.ask) mid = jf::round6((*t.bid + *t.ask) / 2);
    t.midPrice = sanitizePrice(mid);

    t.spread = jf::firstNumber(data, {"spread", "bid_ask_spread", "bidAskSpread"});
    if (!t.spread && t.bid && t.ask) t.spread = std::abs(*t.ask - *t.bid);

    t.updatedAt = timestampOrNow(data);
    return t;
}

std::optional<Bar> mapBarPayload(const json& value) {
    if (!value.is_object()) return std::nullopt;
    const auto* ts = jf::find(value, "timestamp");
    if (ts == nullptr || !ts->is_string()) return std::nullopt;
    auto timestamp = Timestamps::normalizeToUtc(ts->get_ref<const std::string&>());
    if (!timestamp) return std::nullopt;

    Bar bar;
    bar.timestamp = std::move(*timestamp);
    bar.open = jf::number(value, "open").value_or(0.0);
    bar.high = jf::number(value, "high").value_or(bar.open);
    bar.low = jf::number(value, "low").value_or(bar.open);
    bar.close = jf::number(value, "close").value_or(bar.open);
    bar.volume = jf::number(value, "volume");
    return bar;
}

std::vector<Bar> dedupeBars(std::vector<Bar> bars) {
    // Normalized timestamps share one fixed-width layout, so key order is time order.
    std::map<std::string, Bar> merged;
    for (auto& bar : bars) {
        auto key = Timestamps::normalizeToUtc(bar.timestamp).value_or(bar.timestamp);
        bar.timestamp = key;
        merged.insert_or_assign(std::move(key), std::move(bar));
    }
    std::vector<Bar> out;
    out.reserve(merged.size());
    for (auto& [_, bar] : merged) out.push_back(std::move(bar));
    return out;
}

std::optional<NormalizedBarEvent> normalizeBarEventPayload(const json& data, const BarContext& context) {
    if (!data.is_object()) return std::nullopt;
    const json* metadata = jf::findRecord(data, "metadata");

    NormalizedBarEvent result;
    result.symbol = jf::string(data, "symbol");
    if (!result.symbol) result.symbol = context.symbol;

    result.timeframe = jf::string(data, "timeframe");
    if (!result.timeframe && metadata) result.timeframe = jf::string(*metadata, "timeframe");
    if (!result.timeframe) result.timeframe = context.timeframe;

    auto interval = jf::firstNumber(data, {"interval_seconds", "intervalSeconds"});
    if (!interval && metadata) interval = jf::firstNumber(*metadata, {"interval_seconds", "intervalSeconds"});
    result.intervalSeconds = interval ? toSeconds(*interval) : context.intervalSeconds;

    auto duration = jf::firstNumber(data, {"duration_seconds", "durationSeconds", "duration"});
    if (!duration && metadata) duration = jf::firstNumber(*metadata, {"duration_seconds", "durationSeconds"});
    result.durationSeconds = duration ? toSeconds(*duration) : context.durationSeconds;

    if (const auto* barsValue = jf::find(data, "bars"); barsValue != nullptr && barsValue->is_array() && !barsValue->empty()) {
        std::vector<Bar> bars;
        bars.reserve(barsValue->size());
        for (const auto& item : *barsValue) {
            if (auto mapped = mapBarPayload(item)) bars.push_back(std::move(*mapped));
        }
        auto normalized = dedupeBars(std::move(bars));
        if (!normalized.empty()) {
            KlineSnapshot snap;
            snap.symbol = result.symbol.value_or("");
            snap.timeframe = result.timeframe.value_or("");
            snap.intervalSeconds = result.intervalSeconds;
            snap.durationSeconds = result.durationSeconds;
            snap.end = normalized.back().timestamp;
            snap.bars = std::move(normalized);
            result.snapshot = std::move(snap);
            return result;
        }
    }

    if (const auto* single = jf::find(data, "bar"); single != nullptr) {
        if (auto bar = mapBarPayload(*single)) {
            result.bar = std::move(bar);
            return result;
        }
    }

    if (auto bar = mapBarPayload(data)) {
        result.bar = std::move(bar);
        return result;
    }
    return std::nullopt;
}

} // namespace Normalize
} // namespace MarketStream
