#include "Symbols.hpp"
#include "JsonFields.hpp"
#include <array>
#include <cctype>
#include <cmath>
#include <unordered_map>
#include <vector>

namespace MarketStream {
namespace Symbols {

namespace {

bool isAlnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool isMonthCode(char c) {
    constexpr std::string_view kMonthCodes = "FGHJKMNQUVXZ";
    return kMonthCodes.find(c) != std::string_view::npos;
}

const std::unordered_map<std::string, double>& tickValueTable() {
    static const std::unordered_map<std::string, double> table = {
        {"ES", 50}, {"MES", 5}, {"NQ", 20}, {"MNQ", 2}, {"YM", 5}, {"MYM", 0.5},
        {"RTY", 5}, {"M2K", 5}, {"NKD", 5}, {"NIY", 5},
        {"DAX", 25}, {"FDAX", 25}, {"FDXM", 5}, {"FESX", 10},
        {"IF", 300}, {"IH", 300}, {"IC", 200}, {"IM", 200},
        // crypto futures, contract unit per $1 move
        {"BTC", 5}, {"MBT", 0.1}, {"ETH", 50}, {"MET", 0.1},
    };
    return table;
}

const std::unordered_map<std::string, double>& tickSizeTable() {
    static const std::unordered_map<std::string, double> table = {
        {"ES", 0.25}, {"MES", 0.25}, {"NQ", 0.25}, {"MNQ", 0.25},
        {"YM", 1}, {"MYM", 1}, {"RTY", 0.1}, {"M2K", 0.1},
        {"NKD", 5}, {"NIY", 5},
        {"DAX", 0.5}, {"FDAX", 0.5}, {"FDXM", 0.5}, {"FESX", 0.5},
        {"IF", 0.2}, {"IH", 0.2}, {"IC", 0.2}, {"IM", 0.2},
        {"BTC", 5}, {"MBT", 5}, {"ETH", 0.5}, {"MET", 0.5},
    };
    return table;
}

constexpr std::array<std::string_view, 11> kKnownTopicBases = {
    "market.dom", "market.depth", "market.ticker", "market.bar", "market.kline",
    "dom", "depth", "ticker", "bar", "bars", "kline",
};

std::optional<double> magnitudeAboveOne(double factor) {
    if (!std::isfinite(factor)) return std::nullopt;
    const double m = std::abs(factor);
    if (m <= 1.0) return std::nullopt;
    return m;
}

} // namespace

std::string extractRootSymbol(std::string_view symbol) {
    const std::string upper = JsonFields::toUpper(JsonFields::trim(symbol));
    if (upper.empty()) return {};

    // Shortest alphanumeric root followed by a month code and a year digit.
    for (std::size_t i = 1; i + 1 < upper.size(); ++i) {
        if (!isAlnum(upper[i - 1])) break;
        if (isMonthCode(upper[i]) && std::isdigit(static_cast<unsigned char>(upper[i + 1]))) {
            return upper.substr(0, i);
        }
    }

    std::size_t n = 0;
    while (n < upper.size() && isAlnum(upper[n])) ++n;
    return upper.substr(0, n);
}

bool symbolsShareRoot(std::string_view a, std::string_view b) {
    const auto ra = extractRootSymbol(a);
    const auto rb = extractRootSymbol(b);
    return !ra.empty() && ra == rb;
}

TopicDescriptor parseTopicDescriptor(std::string_view topic) {
    TopicDescriptor out;
    const auto trimmed = JsonFields::trim(topic);
    if (trimmed.empty()) return out;
    const std::string lower = JsonFields::toLower(trimmed);

    for (auto base : kKnownTopicBases) {
        if (lower == base) {
            out.baseTopic = std::string(base);
            out.normalizedBaseTopic = std::string(base);
            return out;
        }
        if (lower.size() > base.size() && lower.compare(0, base.size(), base) == 0 && lower[base.size()] == '-') {
            out.baseTopic = std::string(base);
            out.normalizedBaseTopic = std::string(base);
            const auto suffix = JsonFields::trim(trimmed.substr(base.size() + 1));
            if (!suffix.empty()) out.topicSymbol = std::string(suffix);
            return out;
        }
    }

    const auto hyphen = trimmed.find('-');
    if (hyphen != std::string_view::npos && hyphen > 0 && hyphen < trimmed.size() - 1) {
        out.baseTopic = std::string(trimmed.substr(0, hyphen));
        out.normalizedBaseTopic = JsonFields::toLower(out.baseTopic);
        const auto suffix = JsonFields::trim(trimmed.substr(hyphen + 1));
        if (!suffix.empty()) out.topicSymbol = std::string(suffix);
        return out;
    }

    out.baseTopic = std::string(trimmed);
    out.normalizedBaseTopic = lower;
    return out;
}

std::string formatTopic(std::string_view base, std::string_view symbol) {
    std::string topic;
    topic.reserve(base.size() + symbol.size() + 1);
    topic.append(base);
    topic.push_back('-');
    topic.append(symbol);
    return topic;
}

double tickValueFor(std::string_view symbol) {
    const auto& table = tickValueTable();
    auto it = table.find(extractRootSymbol(symbol));
    return it == table.end() ? 1.0 : it->second;
}

std::optional<double> defaultTickSize(std::string_view symbol) {
    const auto& table = tickSizeTable();
    auto it = table.find(extractRootSymbol(symbol));
    if (it == table.end()) return std::nullopt;
    return it->second;
}

std::optional<double> normalizePriceByTick(std::optional<double> value,
                                           std::string_view symbol,
                                           const PriceNormalization& opts) {
    if (!value || !std::isfinite(*value)) return std::nullopt;

    std::optional<double> tickSize;
    if (opts.tickSize && *opts.tickSize > 0) tickSize = opts.tickSize;
    else tickSize = defaultTickSize(symbol);
    if (!tickSize || *tickSize <= 0) return value;

    const double tickValue = opts.tickValue ? *opts.tickValue : tickValueFor(symbol);
    const double reference = (opts.reference && std::isfinite(*opts.reference)) ? std::abs(*opts.reference) : 0.0;

    double normalized = *value;

    if (reference != 0.0) {
        const double absolute = std::abs(*value);
        const double sign = *value >= 0 ? 1.0 : -1.0;

        // Insertion-ordered and unique; the order decides ties under the 0.4 rule.
        std::vector<double> candidates{absolute};
        auto consider = [&](double candidate) {
            if (!std::isfinite(candidate)) return;
            const double c = std::abs(candidate);
            if (c == 0.0 || c > absolute * 200 || c < absolute / 200) return;
            for (double existing : candidates) {
                if (existing == c) return;
            }
            candidates.push_back(c);
        };
        auto registerFactor = [&](double factor) {
            auto magnitude = magnitudeAboveOne(factor);
            if (!magnitude) return magnitude;
            consider(absolute * *magnitude);
            if (opts.allowDownscale) consider(absolute / *magnitude);
            return magnitude;
        };

        const auto primary = registerFactor(*tickSize > 1 ? *tickSize : 1.0 / *tickSize);
        const auto secondary = registerFactor(tickValue);
        if (primary && secondary) {
            if (auto combined = magnitudeAboveOne(*primary * *secondary)) {
                consider(absolute * *combined);
                if (opts.allowDownscale) consider(absolute / *combined);
            }
        }

        double best = absolute;
        double bestError = std::abs(absolute - reference);
        for (double candidate : candidates) {
            const double error = std::abs(candidate - reference);
            if (error < bestError * 0.4) {
                best = candidate;
                bestError = error;
            }
        }
        normalized = sign * best;
    }

    const double snapped = std::floor(normalized / *tickSize + 0.5) * *tickSize;
    if (std::isfinite(snapped)) normalized = JsonFields::round6(snapped);
    return normalized;
}

AggregationWindow resolveAggregationWindow(std::string_view timeframe) {
    static const std::unordered_map<std::string, AggregationWindow> windows = {
        {"1m", {60, 3600}},
        {"5m", {300, 21600}},
        {"15m", {900, 86400}},
        {"1h", {3600, 604800}},
        {"4h", {14400, 2592000}},
        {"1d", {86400, 15552000}},
    };
    auto it = windows.find(std::string(timeframe));
    return it == windows.end() ? windows.at("5m") : it->second;
}

} // namespace Symbols
} // namespace MarketStream
