#include "Config.hpp"
#include "normalize/JsonFields.hpp"
#include <fmt/format.h>
#include <cstdlib>
#include <limits>

namespace MarketStream {
namespace {

std::string envValue(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) return {};
    return std::string(JsonFields::trim(raw));
}

std::chrono::milliseconds parseDelayMs(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) throw std::invalid_argument("trailing characters");
        return std::chrono::milliseconds(parsed);
    } catch (const std::exception&) {
        throw ConfigError(fmt::format("invalid value for {}: '{}'", label, value));
    }
}

bool parseBool(const std::string& value, const std::string& label) {
    const auto normalized = JsonFields::toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") return true;
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") return false;
    throw ConfigError(fmt::format("invalid boolean for {}: '{}'", label, value));
}

bool isPortNumber(const std::string& value) {
    if (value.empty() || value.size() > 5) return false;
    for (char c : value) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

Config Config::fromEnvironment() {
    Config config;
    if (auto v = envValue("MARKETSTREAM_WS_HOST"); !v.empty()) config.host = v;
    if (auto v = envValue("MARKETSTREAM_WS_PORT"); !v.empty()) config.port = v;
    if (auto v = envValue("MARKETSTREAM_WS_PATH"); !v.empty()) config.path = v;
    if (auto v = envValue("MARKETSTREAM_SYMBOL"); !v.empty()) config.symbol = v;
    if (auto v = envValue("MARKETSTREAM_TIMEFRAME"); !v.empty()) config.timeframe = v;
    if (auto v = envValue("MARKETSTREAM_RECONNECT_BASE_MS"); !v.empty()) {
        config.reconnectBase = parseDelayMs(v, "MARKETSTREAM_RECONNECT_BASE_MS");
    }
    if (auto v = envValue("MARKETSTREAM_ASSUME_DOM"); !v.empty()) {
        config.assumeDomWhenUnknown = parseBool(v, "MARKETSTREAM_ASSUME_DOM");
    }
    return config;
}

Config Config::fromArgs(int argc, char** argv) {
    auto config = fromEnvironment();
    if (auto v = argValue(argc, argv, "--host"); !v.empty()) config.host = v;
    if (auto v = argValue(argc, argv, "--port"); !v.empty()) config.port = v;
    if (auto v = argValue(argc, argv, "--path"); !v.empty()) config.path = v;
    if (auto v = argValue(argc, argv, "--symbol"); !v.empty()) config.symbol = v;
    if (auto v = argValue(argc, argv, "--timeframe"); !v.empty()) config.timeframe = v;
    if (auto v = argValue(argc, argv, "--assume-dom"); !v.empty()) {
        config.assumeDomWhenUnknown = parseBool(v, "--assume-dom");
    }
    return config;
}

std::string Config::argValue(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        const std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) return std::string(JsonFields::trim(argv[i + 1]));
        if (arg.rfind(withEquals, 0) == 0) return std::string(JsonFields::trim(arg.substr(withEquals.size())));
    }
    return {};
}

void Config::validate() const {
    if (host.empty()) throw ConfigError("host must not be empty");
    if (!isPortNumber(port) || std::stoul(port) == 0 || std::stoul(port) > 65535) {
        throw ConfigError(fmt::format("port must be a number in 1..65535, got '{}'", port));
    }
    if (path.empty() || path.front() != '/') {
        throw ConfigError(fmt::format("path must start with '/', got '{}'", path));
    }

    auto positive = [](std::chrono::milliseconds value, const char* label) {
        if (value.count() <= 0) throw ConfigError(fmt::format("{} must be positive", label));
    };
    positive(hubReconnectBase, "hub reconnect base delay");
    positive(hubReconnectMax, "hub reconnect max delay");
    positive(failureCooldown, "failure cooldown");
    positive(pingInterval, "ping interval");
    positive(heartbeatCheckInterval, "heartbeat check interval");
    positive(heartbeatMargin, "heartbeat margin");
    positive(reconnectBase, "reconnect base delay");
    positive(reconnectMax, "reconnect max delay");
    if (earlyFailureThreshold <= 0) throw ConfigError("early failure threshold must be positive");

    if (hubReconnectBase > hubReconnectMax) {
        throw ConfigError("hub reconnect base delay exceeds its maximum");
    }
    if (reconnectBase > reconnectMax) {
        throw ConfigError("reconnect base delay exceeds its maximum");
    }
}

HubConfig Config::hubConfig() const {
    HubConfig hub;
    hub.host = host;
    hub.port = port;
    hub.defaultPath = path;
    hub.baseReconnectDelay = hubReconnectBase;
    hub.maxReconnectDelay = hubReconnectMax;
    hub.failureCooldown = failureCooldown;
    hub.earlyFailureThreshold = earlyFailureThreshold;
    hub.heartbeatInterval = pingInterval;
    return hub;
}

RealtimeConfig Config::realtimeConfig() const {
    RealtimeConfig realtime;
    realtime.path = path;
    realtime.connectionName = connectionName;
    realtime.heartbeatCheckInterval = heartbeatCheckInterval;
    realtime.heartbeatTimeout = pingInterval + heartbeatMargin;
    realtime.reconnectBaseDelay = reconnectBase;
    realtime.reconnectMaxDelay = reconnectMax;
    realtime.assumeDomWhenUnknown = assumeDomWhenUnknown;
    return realtime;
}

std::string Config::describe() const {
    return fmt::format("wss://{}:{}{} symbol={} timeframe={} reconnect={}..{}ms dom-default={}",
                       host, port, path, symbol.empty() ? "-" : symbol, timeframe,
                       reconnectBase.count(), reconnectMax.count(), assumeDomWhenUnknown);
}

} // namespace MarketStream
