/*
MarketStream — MetricsBus
Role: Fire-and-forget fan-out of realtime client metrics to registered listeners.
Inputs/Outputs: TelemetryEvent in; every listener called in registration order.
Threading: Owned and driven by the io_context thread; no locking.
Performance: No queueing or backpressure; a listener runs inline with emit().
Integration: MarketRealtimeClient emits; CLI and tests subscribe.
Observability: Listener failures are logged under the "telemetry" category and skipped.
Related: MetricsBus.cpp, MarketRealtimeClient.hpp.
Assumptions: Listeners are cheap; heavy consumers should copy the event and return.
*/
#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <string_view>

namespace MarketStream {

enum class TelemetryType {
    ConnectionStatus,
    SubscribeRequested,
    SubscribeAck,
    SubscribeFailed,
    ReconnectScheduled,
    HeartbeatTimeout,
    SocketOpened,
    SocketClosed,
    SocketError,
};

// "market.realtime.<name>"
std::string_view toString(TelemetryType type);

struct TelemetryEvent {
    TelemetryType type;
    nlohmann::json fields = nlohmann::json::object();

    [[nodiscard]] std::string_view name() const { return toString(type); }
};

class MetricsBus {
public:
    using Listener = std::function<void(const TelemetryEvent&)>;
    using ListenerId = std::uint64_t;

    ListenerId subscribe(Listener listener);
    void unsubscribe(ListenerId id);

    // A listener that throws is logged and skipped; the rest still run.
    void emit(const TelemetryEvent& event);

    [[nodiscard]] std::size_t listenerCount() const { return m_listeners.size(); }

private:
    std::map<ListenerId, Listener> m_listeners;
    ListenerId m_nextId{1};
};

} // namespace MarketStream
