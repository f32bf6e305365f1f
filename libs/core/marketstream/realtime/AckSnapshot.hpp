/*
MarketStream — AckSnapshot
Role: Locate the snapshot embedded in a subscribe ACK and pull historical bars out of it.
Inputs/Outputs: Parsed ACK JSON in; snapshot pointer, keyed values and deduped bar lists out.
Threading: Stateless; safe from any thread.
Performance: Returned pointers alias the caller's JSON; nothing is copied until bars are mapped.
Integration: MarketRealtimeClient::ingestAckSnapshot drives these and forwards the results to the sink.
Observability: None.
Related: SubscriptionProtocol.hpp, Normalizer.hpp.
Assumptions: The gateway is free to nest snapshots under payload/data and to vary key spelling.
*/
#pragma once
#include "../normalize/MarketTypes.hpp"
#include <nlohmann/json.hpp>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MarketStream {
namespace AckSnapshot {

/**
 * snapshot, snapshots, then payload.snapshot(s), payload.data.snapshot(s), data.snapshot(s)
 * and the elements of a snapshots array. First object wins.
 * @return pointer into `ack`, or nullptr
 */
const nlohmann::json* resolveAckSnapshot(const nlohmann::json& ack);

/**
 * Value for the first key that matches. An exact key wins (even when its value is null);
 * otherwise a trimmed case-insensitive key equal to it, or starting with it followed by
 * '-', ':', '.' or '_'. Inexact matches scan keys in nlohmann's sorted order.
 * @return nullptr when no key matches
 */
const nlohmann::json* pickSnapshotValue(const nlohmann::json& snapshot, std::initializer_list<std::string_view> keys);

struct HistoricalContext {
    std::optional<std::string> symbol;
    std::optional<std::string> timeframe;
    std::optional<double> intervalSeconds;
    std::optional<double> durationSeconds;
};

// symbol/timeframe only fill gaps; interval/duration overwrite when present
void applyHistoricalContext(HistoricalContext& context, const nlohmann::json& record);

// Lenient OHLCV mapping; high/low widened to cover open and close
std::optional<Bar> mapHistoricalBar(const nlohmann::json& value);

struct CollectedBars {
    std::vector<Bar> bars; // deduped, ascending, never empty
    HistoricalContext context;
};

/**
 * Gather bars from an array or a record (historical_bars, bars, items, bar, latest_bar,
 * snapshot, metadata.bars, metadata.bar, or the record itself when it looks like a bar).
 * Context found along the way is merged into `base`.
 * @return nullopt when no bar survives mapping
 */
std::optional<CollectedBars> collectHistoricalBars(const nlohmann::json& data, HistoricalContext base);

} // namespace AckSnapshot
} // namespace MarketStream
