#include "MetricsBus.hpp"
#include "../Log.hpp"
#include <exception>
#include <vector>

namespace MarketStream {

std::string_view toString(TelemetryType type) {
    switch (type) {
        case TelemetryType::ConnectionStatus:   return "market.realtime.connection_status";
        case TelemetryType::SubscribeRequested: return "market.realtime.subscribe.requested";
        case TelemetryType::SubscribeAck:       return "market.realtime.subscribe.ack";
        case TelemetryType::SubscribeFailed:    return "market.realtime.subscribe.failed";
        case TelemetryType::ReconnectScheduled: return "market.realtime.reconnect_scheduled";
        case TelemetryType::HeartbeatTimeout:   return "market.realtime.heartbeat_timeout";
        case TelemetryType::SocketOpened:       return "market.realtime.socket.opened";
        case TelemetryType::SocketClosed:       return "market.realtime.socket.closed";
        case TelemetryType::SocketError:        return "market.realtime.socket.error";
    }
    return "market.realtime.unknown";
}

MetricsBus::ListenerId MetricsBus::subscribe(Listener listener) {
    const auto id = m_nextId++;
    m_listeners.emplace(id, std::move(listener));
    return id;
}

void MetricsBus::unsubscribe(ListenerId id) {
    m_listeners.erase(id);
}

void MetricsBus::emit(const TelemetryEvent& event) {
    // Snapshot ids so a listener may unsubscribe itself (or others) mid-dispatch.
    std::vector<ListenerId> ids;
    ids.reserve(m_listeners.size());
    for (const auto& [id, _] : m_listeners) ids.push_back(id);

    for (auto id : ids) {
        auto it = m_listeners.find(id);
        if (it == m_listeners.end() || !it->second) continue;
        auto listener = it->second;
        try {
            listener(event);
        } catch (const std::exception& e) {
            LOG_W("telemetry", "listener {} failed on {}: {}", id, event.name(), e.what());
        }
    }
}

} // namespace MarketStream
