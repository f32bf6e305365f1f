/*
MarketStream — Symbols
Role: Pure helpers for futures root symbols, topic names, tick tables and aggregation windows.
Inputs/Outputs: Symbol/topic strings and raw prices in; roots, descriptors and tick-corrected prices out.
Threading: Stateless; safe from any thread.
Performance: Small fixed lookup tables; no allocation beyond the returned strings.
Integration: Used by Normalize (root guards) and MarketRealtimeClient (topics, price correction).
Observability: None.
Related: Normalizer.hpp, MarketRealtimeClient.hpp.
Assumptions: Futures contracts follow <root><month code><year digits>, e.g. ESM4, M2KZ5.
*/
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace MarketStream {
namespace Symbols {

// ESM4 -> ES, M2KZ5 -> M2K, ES -> ES. Empty for blank input.
std::string extractRootSymbol(std::string_view symbol);

// Both roots non-empty and equal
bool symbolsShareRoot(std::string_view a, std::string_view b);

struct TopicDescriptor {
    std::string baseTopic;            // as written on the wire
    std::string normalizedBaseTopic;  // lower-cased
    std::optional<std::string> topicSymbol;
};

/**
 * Split an event/topic name into base and symbol.
 * Known bases (market.dom, market.ticker, bar, ...) match exactly or as "<base>-" prefix,
 * case-insensitively. Anything else splits on the first interior hyphen.
 */
TopicDescriptor parseTopicDescriptor(std::string_view topic);

// "<base>-<symbol>"
std::string formatTopic(std::string_view base, std::string_view symbol);

// Contract value per point for the root; 1 when unknown
double tickValueFor(std::string_view symbol);

// Default minimum price increment for the root
std::optional<double> defaultTickSize(std::string_view symbol);

struct PriceNormalization {
    std::optional<double> tickSize;   // overrides the table when > 0
    std::optional<double> tickValue;  // overrides the table when set
    std::optional<double> reference;  // price the result should land near
    bool allowDownscale{false};
};

/**
 * Repair a price quoted in the wrong unit and snap it to the tick grid.
 * With a non-zero reference, the candidates |v|, |v|*f (f in tick factor, tick value and
 * their product, each only when > 1) and, with allowDownscale, |v|/f, limited to
 * [|v|/200, |v|*200], compete. A candidate wins only when its distance to the reference
 * is below 0.4x the current best. The result is rounded to the tick and to 6 decimals.
 * @return nullopt for a non-finite value; the value unchanged when no tick size is known
 */
std::optional<double> normalizePriceByTick(std::optional<double> value,
                                           std::string_view symbol,
                                           const PriceNormalization& opts = {});

struct AggregationWindow {
    std::int64_t intervalSeconds{0};
    std::int64_t durationSeconds{0};
};

// 1m, 5m, 15m, 1h, 4h, 1d; anything else maps to the 5m window
AggregationWindow resolveAggregationWindow(std::string_view timeframe);

} // namespace Symbols
} // namespace MarketStream
