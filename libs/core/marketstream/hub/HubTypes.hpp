#pragma once
#include "../ws/WsTransport.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace MarketStream {

inline constexpr const char* kDefaultConnectionName = "ws";
inline constexpr const char* kDefaultEventsPath = "/ws/events";

struct HubConfig {
    std::string host;
    std::string port{"443"};
    std::string defaultPath{kDefaultEventsPath};

    std::chrono::milliseconds baseReconnectDelay{5000};
    std::chrono::milliseconds maxReconnectDelay{60000};
    std::chrono::milliseconds failureCooldown{60000};
    int earlyFailureThreshold{3};
    std::chrono::milliseconds heartbeatInterval{30000};
};

// Callbacks of one logical consumer of a shared socket. Any of them may be empty
// except tokenProvider, which is asked on every connection attempt.
struct HubSubscriber {
    std::function<void()> onOpen;
    std::function<void(const std::string&)> onMessage;
    std::function<void(const std::string&)> onError;
    std::function<void(const CloseInfo&)> onClose;
    std::function<std::string()> tokenProvider;
};

// Point-in-time view of one managed connection
struct ConnectionSnapshot {
    std::string name;
    std::string path;
    bool open{false};
    bool connecting{false};
    std::size_t subscriberCount{0};
    int consecutiveFailures{0};
    std::chrono::milliseconds reconnectDelay{0};
    bool inFailureCooldown{false};
    bool shouldReconnect{true};
    bool reconnectPending{false};
};

} // namespace MarketStream
