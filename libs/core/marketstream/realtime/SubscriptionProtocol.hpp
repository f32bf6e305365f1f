/*
MarketStream — SubscriptionProtocol
Role: Frame builders and ACK/event field extraction for the topic subscription protocol.
Inputs/Outputs: Topics/symbols in, JSON frames out; parsed ACKs and events in, typed fields out.
Threading: Stateless; safe from any thread.
Performance: Only touches the handful of keys it is asked for.
Integration: MarketRealtimeClient builds every outgoing frame and reads every ACK through here.
Observability: None; the client logs decisions made from these results.
Related: MarketRealtimeClient.hpp, AckSnapshot.hpp, Symbols.hpp.
Assumptions: The gateway answers subscribe/unsubscribe with {"type":"ack","action":...}.
*/
#pragma once
#include "RealtimeTypes.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MarketStream {
namespace SubscriptionProtocol {

inline constexpr std::array<std::string_view, 4> kDefaultTopicBases{
    "market.dom", "market.depth", "market.ticker", "market.bar"};

inline constexpr std::string_view kDefaultAckError = "market data subscription failed";

[[nodiscard]] bool isDomTopicBase(std::string_view base);

// Default bases, DOM ones dropped unless includeDom, suffixed with "-<symbol>" when given
std::vector<std::string> buildTopics(std::string_view symbol, bool includeDom);

// {"action":"subscribe","topics":[...],"symbol":"...","timeframe":"..."}; timeframe omitted when empty
nlohmann::json buildSubscribeFrame(const std::vector<std::string>& topics,
                                   const std::string& symbol,
                                   const std::optional<std::string>& timeframe);

nlohmann::json buildUnsubscribeFrame(const std::vector<std::string>& topics);

// String items only, trimmed, empties dropped. Non-arrays give an empty list.
std::vector<std::string> normalizeTopics(const nlohmann::json* value);

// Trimmed, deduplicated, first occurrence order kept
std::vector<std::string> uniqueTopics(const std::vector<std::string>& topics);

// Same members regardless of order or duplicates
[[nodiscard]] bool sameTopicSet(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Metadata precedence: domCapable, then secType, then exchange. nullopt when undecided.
std::optional<bool> domPreferenceFromMetadata(const SymbolInfo& info);

/**
 * Lenient boolean reading of a capability value.
 * bool as is; numbers 0 -> false, > 0 -> true; true/1/yes/y/enabled/on and
 * false/0/no/n/disabled/off; arrays and objects: any true wins, then any false.
 */
std::optional<bool> parseCapabilityFlag(const nlohmann::json& value);

// Recursive search for DOM flags (market.dom, depth, has_dom, supports_depth, ...)
std::optional<bool> findDomCapability(const nlohmann::json& capabilities);

std::optional<std::string> extractAckError(const nlohmann::json& ack);
std::optional<std::string> extractSubscriptionId(const nlohmann::json& ack);

// First object among the known capability locations; null when none
nlohmann::json extractCapabilities(const nlohmann::json& ack);

[[nodiscard]] bool expectsDepthSnapshot(const std::vector<std::string>& topics, const nlohmann::json& capabilities);
[[nodiscard]] bool expectsBarSnapshot(const std::vector<std::string>& topics, const nlohmann::json& capabilities);

// First non-empty of event, topic, channel
std::optional<std::string> resolveEventName(const nlohmann::json& message);

// "payload" when present (even null), else "data"; nullptr when neither exists
const nlohmann::json* resolveEventPayload(const nlohmann::json& message);

// symbol, payload.symbol, data.symbol
std::optional<std::string> extractPayloadSymbol(const nlohmann::json* payload);

/**
 * Decide whether an event belongs to the current subscription.
 * Symbols are compared lower-cased; contracts of the same root are accepted.
 * @return the warning text when the event must be dropped
 */
std::optional<std::string> detectSymbolMismatch(const std::optional<std::string>& topicSymbol,
                                                const std::optional<std::string>& payloadSymbol,
                                                std::string_view expectedSymbol);

} // namespace SubscriptionProtocol
} // namespace MarketStream
