/*
MarketStream — Config
Role: Stream settings with defaults, environment/argument overrides and validation.
Inputs/Outputs: MARKETSTREAM_* variables and --flags in; HubConfig and RealtimeConfig out.
Threading: Plain value type; built once at startup.
Performance: Not on any hot path.
Integration: The CLI builds it before anything connects; tests build it directly.
Observability: describe() renders a one-line summary for startup logging (never includes the token).
Related: HubTypes.hpp, RealtimeTypes.hpp, apps/stream_cli/stream_main.cpp.
Assumptions: The access token is not part of Config; it is supplied through a provider.
*/
#pragma once
#include "hub/HubTypes.hpp"
#include "realtime/RealtimeTypes.hpp"
#include <chrono>
#include <stdexcept>
#include <string>

namespace MarketStream {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    // Transport
    std::string host{"localhost"};
    std::string port{"443"};
    std::string path{kDefaultEventsPath};
    std::string connectionName{kDefaultConnectionName};

    // Subscription
    std::string symbol;
    std::string timeframe{"5m"};

    // Hub timing
    std::chrono::milliseconds hubReconnectBase{5000};
    std::chrono::milliseconds hubReconnectMax{60000};
    std::chrono::milliseconds failureCooldown{60000};
    int earlyFailureThreshold{3};
    std::chrono::milliseconds pingInterval{30000};

    // Client timing
    std::chrono::milliseconds heartbeatCheckInterval{10000};
    std::chrono::milliseconds heartbeatMargin{10000}; // added to pingInterval for the timeout
    std::chrono::milliseconds reconnectBase{1000};
    std::chrono::milliseconds reconnectMax{30000};

    bool assumeDomWhenUnknown{true};

    /**
     * Defaults overridden by MARKETSTREAM_WS_HOST, _WS_PORT, _WS_PATH, _SYMBOL, _TIMEFRAME,
     * _RECONNECT_BASE_MS and _ASSUME_DOM.
     * @throws ConfigError when a numeric or boolean variable cannot be parsed
     */
    static Config fromEnvironment();

    /**
     * fromEnvironment() followed by --host, --port, --path, --symbol, --timeframe and
     * --assume-dom (both "--key value" and "--key=value" forms).
     */
    static Config fromArgs(int argc, char** argv);

    // Value of "--key value" or "--key=value"; empty when absent
    static std::string argValue(int argc, char** argv, const std::string& key);

    // @throws ConfigError describing the first invalid field
    void validate() const;

    [[nodiscard]] HubConfig hubConfig() const;
    [[nodiscard]] RealtimeConfig realtimeConfig() const;
    [[nodiscard]] std::string describe() const;
};

} // namespace MarketStream
