#include "SubscriptionProtocol.hpp"
#include "../normalize/JsonFields.hpp"
#include "../normalize/Symbols.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <cmath>
#include <set>
#include <unordered_set>

namespace MarketStream {
namespace SubscriptionProtocol {

using nlohmann::json;
using Keys = std::initializer_list<std::string_view>;

namespace {

constexpr std::array<std::string_view, 10> kDomCapabilityKeys{
    "market.dom", "market.depth", "dom", "depth",
    "enable_dom", "enable_depth", "has_dom", "has_depth", "supports_dom", "supports_depth"};

constexpr std::array<std::string_view, 9> kBarCapabilityKeys{
    "market.bar", "market.kline", "bar", "bars", "kline",
    "historical_bars", "enable_bars", "has_bars", "supports_bars"};

template <typename Range>
bool contains(const Range& keys, std::string_view value) {
    return std::find(keys.begin(), keys.end(), value) != keys.end();
}

std::string normalizedKey(std::string_view key) {
    return JsonFields::toLower(JsonFields::trim(key));
}

// Used only to decide whether a snapshot should have arrived, so it is stricter
// than parseCapabilityFlag: only explicit "yes" values count.
bool capabilityTruthy(const json& value, Keys arrayItems, Keys nestedKeys) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) {
        const double d = value.get<double>();
        return std::isfinite(d) && d > 0;
    }
    if (value.is_string()) {
        const auto s = normalizedKey(value.get_ref<const std::string&>());
        return s == "true" || s == "1" || s == "yes";
    }
    if (value.is_array()) {
        return std::any_of(value.begin(), value.end(), [&](const json& item) {
            return item.is_string() && contains(arrayItems, JsonFields::toLower(item.get_ref<const std::string&>()));
        });
    }
    if (value.is_object()) {
        for (auto key : nestedKeys) {
            const auto* nested = JsonFields::find(value, key);
            if (nested && capabilityTruthy(*nested, arrayItems, nestedKeys)) return true;
        }
    }
    return false;
}

bool anyTopicBase(const std::vector<std::string>& topics, Keys bases) {
    return std::any_of(topics.begin(), topics.end(), [&](const std::string& topic) {
        const auto base = Symbols::parseTopicDescriptor(topic).normalizedBaseTopic;
        return !base.empty() && contains(bases, base);
    });
}

template <typename Range>
bool capabilitiesExpect(const json& capabilities, const Range& keys, Keys arrayItems, Keys nestedKeys) {
    if (!capabilities.is_object()) return false;
    for (auto it = capabilities.begin(); it != capabilities.end(); ++it) {
        if (contains(keys, JsonFields::toLower(it.key())) && capabilityTruthy(it.value(), arrayItems, nestedKeys)) {
            return true;
        }
    }
    return false;
}

std::optional<bool> combineFlags(const json& container) {
    bool sawFalse = false;
    for (const auto& item : container) {
        const auto flag = parseCapabilityFlag(item);
        if (flag == true) return true;
        if (flag == false) sawFalse = true;
    }
    if (sawFalse) return false;
    return std::nullopt;
}

std::optional<bool> findFlag(const json& source) {
    bool sawFalse = false;
    auto note = [&](std::optional<bool> flag) {
        if (flag == false) sawFalse = true;
        return flag == true;
    };

    if (source.is_array()) {
        for (const auto& item : source) {
            if (note(findFlag(item))) return true;
        }
    } else if (source.is_object()) {
        for (auto it = source.begin(); it != source.end(); ++it) {
            if (contains(kDomCapabilityKeys, normalizedKey(it.key())) && note(parseCapabilityFlag(it.value()))) {
                return true;
            }
            if ((it->is_object() || it->is_array()) && note(findFlag(it.value()))) {
                return true;
            }
        }
    } else {
        return std::nullopt;
    }
    if (sawFalse) return false;
    return std::nullopt;
}

// Recursive message/error/detail lookup used for ACK errors
std::optional<std::string> errorText(const json* value) {
    if (value == nullptr) return std::nullopt;
    if (value->is_string()) return JsonFields::toString(value);
    if (value->is_object()) {
        for (auto key : {"message", "error", "detail"}) {
            if (auto nested = errorText(JsonFields::find(*value, key))) return nested;
        }
    }
    return std::nullopt;
}

bool isFalse(const json& obj, std::string_view key) {
    const auto* v = JsonFields::find(obj, key);
    return v && v->is_boolean() && !v->get<bool>();
}

// Candidate id keys at one level plus its "subscription" child
void collectIdCandidates(const json& record, std::vector<const json*>& out, bool includeId) {
    out.push_back(JsonFields::find(record, "subscriptionId"));
    out.push_back(JsonFields::find(record, "subscription_id"));
    if (includeId) out.push_back(JsonFields::find(record, "id"));
    if (const auto* nested = JsonFields::findRecord(record, "subscription")) {
        out.push_back(JsonFields::find(*nested, "id"));
        out.push_back(JsonFields::find(*nested, "subscriptionId"));
        out.push_back(JsonFields::find(*nested, "subscription_id"));
    }
}

} // namespace

bool isDomTopicBase(std::string_view base) {
    return base == "market.dom" || base == "market.depth";
}

std::vector<std::string> buildTopics(std::string_view symbol, bool includeDom) {
    const auto trimmed = JsonFields::trim(symbol);
    std::vector<std::string> topics;
    for (auto base : kDefaultTopicBases) {
        if (isDomTopicBase(base) && !includeDom) continue;
        topics.push_back(trimmed.empty() ? std::string(base) : Symbols::formatTopic(base, trimmed));
    }
    return topics;
}

json buildSubscribeFrame(const std::vector<std::string>& topics,
                         const std::string& symbol,
                         const std::optional<std::string>& timeframe) {
    json msg;
    msg["action"] = "subscribe";
    msg["topics"] = topics;
    msg["symbol"] = symbol;
    if (timeframe && !timeframe->empty()) msg["timeframe"] = *timeframe;
    return msg;
}

json buildUnsubscribeFrame(const std::vector<std::string>& topics) {
    json msg;
    msg["action"] = "unsubscribe";
    msg["topics"] = topics;
    return msg;
}

std::vector<std::string> normalizeTopics(const json* value) {
    std::vector<std::string> topics;
    if (value == nullptr || !value->is_array()) return topics;
    for (const auto& item : *value) {
        if (auto topic = JsonFields::toString(&item)) topics.push_back(std::move(*topic));
    }
    return topics;
}

std::vector<std::string> uniqueTopics(const std::vector<std::string>& topics) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& topic : topics) {
        std::string trimmed(JsonFields::trim(topic));
        if (trimmed.empty() || !seen.insert(trimmed).second) continue;
        out.push_back(std::move(trimmed));
    }
    return out;
}

bool sameTopicSet(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    return std::set<std::string>(a.begin(), a.end()) == std::set<std::string>(b.begin(), b.end());
}

std::optional<bool> domPreferenceFromMetadata(const SymbolInfo& info) {
    if (info.domCapable) return info.domCapable;

    if (info.secType) {
        const auto secType = JsonFields::toUpper(JsonFields::trim(*info.secType));
        if (secType == "STK" || secType == "ETF" || secType == "CFD") return false;
        if (secType == "FUT" || secType == "FOP" || secType == "FUTOPT" || secType == "FWD" || secType == "CMDTY") {
            return true;
        }
    }

    if (info.exchange) {
        static constexpr std::array<std::string_view, 10> futuresVenues{"CME", "CBOT", "NYMEX", "COMEX", "ICE", "ICEUS", "ICEEU", "EUREX", "SGX", "CFE"};
        static constexpr std::array<std::string_view, 6> equityVenues{"SMART", "NASDAQ", "NYSE", "ARCA", "BATS", "IEX"};
        const auto exchange = JsonFields::toUpper(JsonFields::trim(*info.exchange));
        if (contains(futuresVenues, exchange)) return true;
        if (contains(equityVenues, exchange)) return false;
    }
    return std::nullopt;
}

std::optional<bool> parseCapabilityFlag(const json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) {
        const double d = value.get<double>();
        if (!std::isfinite(d)) return std::nullopt;
        if (d == 0) return false;
        return d > 0;
    }
    if (value.is_string()) {
        static constexpr std::array<std::string_view, 6> yes{"true", "1", "yes", "y", "enabled", "on"};
        static constexpr std::array<std::string_view, 6> no{"false", "0", "no", "n", "disabled", "off"};
        const auto s = normalizedKey(value.get_ref<const std::string&>());
        if (s.empty()) return std::nullopt;
        if (contains(yes, s)) return true;
        if (contains(no, s)) return false;
        return std::nullopt;
    }
    if (value.is_array() || value.is_object()) return combineFlags(value);
    return std::nullopt;
}

std::optional<bool> findDomCapability(const json& capabilities) {
    return findFlag(capabilities);
}

std::optional<std::string> extractAckError(const json& ack) {
    if (auto direct = errorText(JsonFields::find(ack, "error"))) return direct;
    if (const auto* payload = JsonFields::findRecord(ack, "payload")) {
        if (auto nested = errorText(JsonFields::find(*payload, "error"))) return nested;
    }
    const auto status = JsonFields::find(ack, "status");
    const bool statusError = status && status->is_string() && status->get_ref<const std::string&>() == "error";
    if (statusError || isFalse(ack, "ok") || isFalse(ack, "success")) {
        if (auto message = JsonFields::string(ack, "message")) return message;
        return std::string(kDefaultAckError);
    }
    return std::nullopt;
}

std::optional<std::string> extractSubscriptionId(const json& ack) {
    std::vector<const json*> candidates{
        JsonFields::find(ack, "subscriptionId"),
        JsonFields::find(ack, "subscription_id"),
    };
    for (auto key : {"metadata", "snapshots"}) {
        if (const auto* record = JsonFields::findRecord(ack, key)) collectIdCandidates(*record, candidates, true);
    }
    if (const auto* payload = JsonFields::findRecord(ack, "payload")) {
        candidates.push_back(JsonFields::find(*payload, "subscriptionId"));
        candidates.push_back(JsonFields::find(*payload, "subscription_id"));
        candidates.push_back(JsonFields::find(*payload, "id"));
        if (const auto* snapshots = JsonFields::findRecord(*payload, "snapshots")) {
            collectIdCandidates(*snapshots, candidates, true);
        }
    }
    for (const auto* candidate : candidates) {
        if (auto id = JsonFields::toString(candidate)) return id;
    }
    return std::nullopt;
}

json extractCapabilities(const json& ack) {
    auto fromSnapshots = [](const json& snapshots) -> const json* {
        if (const auto* caps = JsonFields::findRecord(snapshots, "capabilities")) return caps;
        if (const auto* subscription = JsonFields::findRecord(snapshots, "subscription")) {
            return JsonFields::findRecord(*subscription, "capabilities");
        }
        return nullptr;
    };

    if (const auto* caps = JsonFields::findRecord(ack, "capabilities")) return *caps;
    if (const auto* metadata = JsonFields::findRecord(ack, "metadata")) {
        if (const auto* caps = JsonFields::findRecord(*metadata, "capabilities")) return *caps;
    }
    if (const auto* snapshots = JsonFields::findRecord(ack, "snapshots")) {
        if (const auto* caps = fromSnapshots(*snapshots)) return *caps;
    }
    if (const auto* payload = JsonFields::findRecord(ack, "payload")) {
        if (const auto* caps = JsonFields::findRecord(*payload, "capabilities")) return *caps;
        if (const auto* snapshots = JsonFields::findRecord(*payload, "snapshots")) {
            if (const auto* caps = fromSnapshots(*snapshots)) return *caps;
        }
    }
    return nullptr;
}

bool expectsDepthSnapshot(const std::vector<std::string>& topics, const json& capabilities) {
    if (anyTopicBase(topics, {"market.dom", "market.depth"})) return true;
    return capabilitiesExpect(capabilities, kDomCapabilityKeys,
                              {"market.dom", "market.depth"},
                              {"market.dom", "market.depth", "dom", "depth", "enable_dom", "enable_depth",
                               "has_dom", "has_depth", "supports_dom", "supports_depth", "topics"});
}

bool expectsBarSnapshot(const std::vector<std::string>& topics, const json& capabilities) {
    if (anyTopicBase(topics, {"market.bar", "market.kline", "bars", "kline"})) return true;
    return capabilitiesExpect(capabilities, kBarCapabilityKeys,
                              {"market.bar", "market.kline", "bars", "kline"},
                              {"market.bar", "market.kline", "bar", "bars", "kline", "historical_bars",
                               "historicalBars", "enable_bars", "enable_bar", "has_bars", "has_bar",
                               "supports_bars", "supports_bar", "topics"});
}

std::optional<std::string> resolveEventName(const json& message) {
    return JsonFields::firstString(message, {"event", "topic", "channel"});
}

const json* resolveEventPayload(const json& message) {
    if (const auto* payload = JsonFields::find(message, "payload")) return payload;
    return JsonFields::find(message, "data");
}

std::optional<std::string> extractPayloadSymbol(const json* payload) {
    if (!JsonFields::isRecord(payload)) return std::nullopt;
    if (auto direct = JsonFields::string(*payload, "symbol")) return direct;
    for (auto key : {"payload", "data"}) {
        if (const auto* nested = JsonFields::findRecord(*payload, key)) {
            if (auto symbol = JsonFields::string(*nested, "symbol")) return symbol;
        }
    }
    return std::nullopt;
}

std::optional<std::string> detectSymbolMismatch(const std::optional<std::string>& topicSymbol,
                                                const std::optional<std::string>& payloadSymbol,
                                                std::string_view expectedSymbol) {
    const auto expected = JsonFields::toLower(JsonFields::trim(expectedSymbol));
    const auto expectedRoot = JsonFields::toLower(Symbols::extractRootSymbol(expected));
    auto lowered = [](const std::optional<std::string>& s) {
        return s ? JsonFields::toLower(*s) : std::string{};
    };
    const auto topic = lowered(topicSymbol);
    const auto payload = lowered(payloadSymbol);
    const auto topicRoot = JsonFields::toLower(Symbols::extractRootSymbol(topic));
    const auto payloadRoot = JsonFields::toLower(Symbols::extractRootSymbol(payload));

    // Absent symbols carry no evidence either way
    auto matchesExpected = [&](const std::string& symbol, const std::string& root) {
        if (expected.empty() || symbol.empty()) return true;
        if (symbol == expected) return true;
        return !expectedRoot.empty() && !root.empty() && root == expectedRoot;
    };

    bool mismatch = false;
    if (!topic.empty() && !payload.empty() && topic != payload) {
        // Two contracts of one root are fine only if that root is the subscribed one
        const bool sameRoot = !topicRoot.empty() && topicRoot == payloadRoot;
        mismatch = !sameRoot || (!expectedRoot.empty() && topicRoot != expectedRoot);
    } else {
        mismatch = !matchesExpected(topic, topicRoot) || !matchesExpected(payload, payloadRoot);
    }
    if (!mismatch) return std::nullopt;

    std::vector<std::string> observed;
    for (const auto* symbol : {&topicSymbol, &payloadSymbol}) {
        if (*symbol && std::find(observed.begin(), observed.end(), **symbol) == observed.end()) {
            observed.push_back(**symbol);
        }
    }
    const auto trimmedExpected = JsonFields::trim(expectedSymbol);
    return fmt::format("received market data for {} which does not match the current subscription {}",
                       observed.empty() ? std::string("unknown symbol") : fmt::format("{}", fmt::join(observed, " / ")),
                       trimmedExpected.empty() ? std::string_view("(none)") : trimmedExpected);
}

} // namespace SubscriptionProtocol
} // namespace MarketStream
