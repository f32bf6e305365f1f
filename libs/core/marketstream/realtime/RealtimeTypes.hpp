#pragma once
#include "../hub/HubTypes.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MarketStream {

enum class ConnectionStatus { Connecting, Connected, Reconnecting, Failed };

inline std::string_view toString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Reconnecting: return "reconnecting";
        case ConnectionStatus::Failed:       return "failed";
    }
    return "unknown";
}

// Instrument metadata used for DOM capability and tick size decisions
struct SymbolInfo {
    std::optional<bool> domCapable;
    std::optional<std::string> secType;   // STK, FUT, ...
    std::optional<std::string> exchange;  // CME, NASDAQ, ...
    std::optional<double> tickSize;
};

// Everything the client needs from its owner is pulled lazily through these.
// An empty string means "not available".
struct RealtimeOptions {
    std::function<std::string()> tokenProvider;
    std::function<std::string()> symbolProvider;
    std::function<std::string()> timeframeProvider;
    std::function<std::optional<std::int64_t>()> durationProvider;                          // optional
    std::function<std::optional<SymbolInfo>(const std::string&)> symbolMetadataProvider;    // optional
};

struct RealtimeConfig {
    std::string path{kDefaultEventsPath};
    // hub connection name used while no symbol is selected
    std::string connectionName{kDefaultConnectionName};
    std::chrono::milliseconds heartbeatCheckInterval{10000};
    // hub ping interval (30 s) plus a 10 s margin
    std::chrono::milliseconds heartbeatTimeout{40000};
    std::chrono::milliseconds reconnectBaseDelay{1000};
    std::chrono::milliseconds reconnectMaxDelay{30000};
    // DOM topics are requested when nothing says whether the instrument has a book
    bool assumeDomWhenUnknown{true};
};

struct SubscriptionPending {
    std::optional<std::string> symbol;
    std::optional<std::string> timeframe;
    std::vector<std::string> topics;
};

struct SubscriptionReady {
    std::optional<std::string> id;
    std::optional<std::string> symbol;
    std::optional<std::string> timeframe;
    std::vector<std::string> topics;
    nlohmann::json capabilities; // object or null
};

struct SubscriptionFailure {
    std::string error;
    std::optional<std::string> symbol;
    std::optional<std::string> timeframe;
};

} // namespace MarketStream
