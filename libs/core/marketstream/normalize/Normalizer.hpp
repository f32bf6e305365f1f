/*
MarketStream — Normalizer
Role: Map heterogeneous wire payloads (depth, ticker, bar/kline events) onto canonical snapshots.
Inputs/Outputs: Parsed nlohmann::json payload + target symbol/context in; DepthSnapshot, TickerSnapshot, Bar/KlineSnapshot out.
Threading: Pure functions; no shared state.
Performance: Single pass over each payload; depth is capped at 5 levels per side before any copy leaves.
Integration: Called by MarketRealtimeClient for live events and ACK snapshots.
Observability: None; callers decide whether a nullopt is worth logging.
Related: JsonFields.hpp, Timestamps.hpp, Symbols.hpp, MarketTypes.hpp.
Assumptions: Numbers may arrive as JSON numbers or numeric strings; unknown fields are ignored.
*/
#pragma once
#include "MarketTypes.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MarketStream {
namespace Normalize {

inline constexpr std::size_t kMaxDepthLevels = 5;

/**
 * Canonical order book view.
 * @return nullopt for a non-object payload, a payload whose root symbol differs from the
 *         target's, or a payload carrying neither levels nor totals
 */
std::optional<DepthSnapshot> normalizeDepthPayload(const nlohmann::json& data, std::string_view targetSymbol);

/**
 * Canonical ticker. Negative prices are dropped to null; change and changePercent are
 * derived from last and close.
 * @return nullopt for a non-object payload or a root mismatch
 */
std::optional<TickerSnapshot> normalizeTickerPayload(const nlohmann::json& data, std::string_view targetSymbol);

// Defaults used when a bar event does not carry its own window
struct BarContext {
    std::optional<std::string> symbol;
    std::optional<std::string> timeframe;
    std::int64_t intervalSeconds{0};
    std::int64_t durationSeconds{0};
};

// Exactly one of snapshot / bar is set
struct NormalizedBarEvent {
    std::optional<KlineSnapshot> snapshot;
    std::optional<Bar> bar;
    std::optional<std::string> symbol;
    std::optional<std::string> timeframe;
    std::int64_t intervalSeconds{0};
    std::int64_t durationSeconds{0};
};

// A "bars" array becomes a snapshot; otherwise "bar" or the payload itself is one bar.
std::optional<NormalizedBarEvent> normalizeBarEventPayload(const nlohmann::json& data, const BarContext& context);

// Needs a parsable string timestamp. open defaults to 0, high/low/close to open.
std::optional<Bar> mapBarPayload(const nlohmann::json& value);

// Keyed by normalized timestamp, last occurrence wins, ascending.
std::vector<Bar> dedupeBars(std::vector<Bar> bars);

std::optional<std::string> normalizeTimestampToUtc(std::string_view text);

} // namespace Normalize
} // namespace MarketStream
