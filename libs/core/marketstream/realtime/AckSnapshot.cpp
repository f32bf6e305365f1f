#include "AckSnapshot.hpp"
#include "../normalize/JsonFields.hpp"
#include "../normalize/Normalizer.hpp"
#include <algorithm>
#include <array>

namespace MarketStream {
namespace AckSnapshot {

using nlohmann::json;

namespace {

bool looksLikeBar(const json& record) {
    const auto* ts = JsonFields::find(record, "timestamp");
    if (ts == nullptr || !ts->is_string()) return false;
    return record.contains("open") || record.contains("close") || record.contains("high") || record.contains("low");
}

void pushAll(const json& array, std::vector<const json*>& out) {
    for (const auto& item : array) out.push_back(&item);
}

void enqueueFromRecord(const json& record, HistoricalContext& context, std::vector<const json*>& candidates) {
    applyHistoricalContext(context, record);

    bool sawArray = false;
    for (auto key : {"historical_bars", "historicalBars", "bars", "items"}) {
        const auto* value = JsonFields::find(record, key);
        if (value && value->is_array()) {
            sawArray = true;
            pushAll(*value, candidates);
        }
    }
    bool sawSingle = false;
    for (auto key : {"bar", "latest_bar", "latestBar", "snapshot"}) {
        if (const auto* value = JsonFields::findRecord(record, key)) {
            sawSingle = true;
            candidates.push_back(value);
        }
    }
    if (!sawArray && !sawSingle && looksLikeBar(record)) {
        candidates.push_back(&record);
    }

    if (const auto* metadata = JsonFields::findRecord(record, "metadata")) {
        applyHistoricalContext(context, *metadata);
        const auto* bars = JsonFields::find(*metadata, "bars");
        if (bars && bars->is_array()) pushAll(*bars, candidates);
        if (const auto* bar = JsonFields::findRecord(*metadata, "bar")) candidates.push_back(bar);
    }
}

} // namespace

const json* resolveAckSnapshot(const json& ack) {
    if (const auto* snapshot = JsonFields::findRecord(ack, "snapshot")) return snapshot;
    if (const auto* snapshots = JsonFields::findRecord(ack, "snapshots")) return snapshots;

    std::vector<const json*> candidates;
    if (const auto* payload = JsonFields::findRecord(ack, "payload")) {
        candidates.push_back(JsonFields::find(*payload, "snapshot"));
        candidates.push_back(JsonFields::find(*payload, "snapshots"));
        if (const auto* data = JsonFields::findRecord(*payload, "data")) {
            candidates.push_back(JsonFields::find(*data, "snapshot"));
            candidates.push_back(JsonFields::find(*data, "snapshots"));
        }
    }
    if (const auto* data = JsonFields::findRecord(ack, "data")) {
        candidates.push_back(JsonFields::find(*data, "snapshot"));
        candidates.push_back(JsonFields::find(*data, "snapshots"));
    }
    if (const auto* snapshots = JsonFields::find(ack, "snapshots"); snapshots && snapshots->is_array()) {
        pushAll(*snapshots, candidates);
    }

    for (const auto* candidate : candidates) {
        if (JsonFields::isRecord(candidate)) return candidate;
    }
    return nullptr;
}

const json* pickSnapshotValue(const json& snapshot, std::initializer_list<std::string_view> keys) {
    if (!snapshot.is_object()) return nullptr;
    static constexpr std::array<char, 4> separators{'-', ':', '.', '_'};

    for (auto key : keys) {
        if (const auto* exact = JsonFields::find(snapshot, key)) return exact;

        const auto wanted = JsonFields::toLower(JsonFields::trim(key));
        if (wanted.empty()) continue;
        for (auto it = snapshot.begin(); it != snapshot.end(); ++it) {
            const auto candidate = JsonFields::toLower(JsonFields::trim(it.key()));
            if (candidate.empty()) continue;
            if (candidate == wanted) return &it.value();
            if (candidate.size() > wanted.size() && candidate.compare(0, wanted.size(), wanted) == 0 &&
                std::find(separators.begin(), separators.end(), candidate[wanted.size()]) != separators.end()) {
                return &it.value();
            }
        }
    }
    return nullptr;
}

void applyHistoricalContext(HistoricalContext& context, const json& record) {
    if (!context.symbol) {
        context.symbol = JsonFields::string(record, "symbol");
    }
    if (!context.timeframe) {
        context.timeframe = JsonFields::firstString(record, {"timeframe", "time_frame"});
    }
    if (auto interval = JsonFields::firstNumber(record, {"interval_seconds", "intervalSeconds"})) {
        context.intervalSeconds = interval;
    }
    if (auto duration = JsonFields::firstNumber(record, {"duration_seconds", "durationSeconds", "duration"})) {
        context.durationSeconds = duration;
    }
}

std::optional<Bar> mapHistoricalBar(const json& value) {
    if (!value.is_object()) return std::nullopt;
    const auto rawTimestamp = JsonFields::string(value, "timestamp");
    if (!rawTimestamp) return std::nullopt;
    auto timestamp = Normalize::normalizeTimestampToUtc(*rawTimestamp);
    if (!timestamp) return std::nullopt;

    Bar bar;
    bar.timestamp = std::move(*timestamp);
    bar.open = JsonFields::firstNumber(value, {"open", "close"}).value_or(0.0);
    const double high = JsonFields::number(value, "high").value_or(bar.open);
    const double low = JsonFields::number(value, "low").value_or(bar.open);
    bar.close = JsonFields::number(value, "close").value_or(bar.open);
    bar.high = std::max({high, bar.open, bar.close});
    bar.low = std::min({low, bar.open, bar.close});
    bar.volume = JsonFields::number(value, "volume");
    return bar;
}

std::optional<CollectedBars> collectHistoricalBars(const json& data, HistoricalContext base) {
    CollectedBars collected;
    collected.context = std::move(base);

    std::vector<const json*> candidates;
    if (data.is_array()) {
        pushAll(data, candidates);
    } else if (data.is_object()) {
        enqueueFromRecord(data, collected.context, candidates);
    } else {
        return std::nullopt;
    }

    std::vector<Bar> bars;
    bars.reserve(candidates.size());
    for (const auto* candidate : candidates) {
        if (auto bar = mapHistoricalBar(*candidate)) bars.push_back(std::move(*bar));
    }
    if (bars.empty()) return std::nullopt;

    collected.bars = Normalize::dedupeBars(std::move(bars));
    return collected;
}

} // namespace AckSnapshot
} // namespace MarketStream
