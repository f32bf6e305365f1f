/*
MarketStream — ConnectionHub
Role: Registry that maps a logical connection name to one shared ManagedConnection.
Inputs/Outputs: subscribe(name, handlers, path) in; a HubSubscription handle out.
Threading: io_context thread only; no locking.
Performance: One socket per name regardless of subscriber count.
Integration: Owned by the application (CLI, tests) and passed by reference to MarketRealtimeClient.
Observability: Connection state is visible through inspect(); lifecycle is logged under "hub".
Related: ManagedConnection.hpp, HubTypes.hpp, MarketRealtimeClient.hpp.
Assumptions: The hub outlives the clients that subscribe through it; the scheduler outlives the hub.
*/
#pragma once
#include "HubTypes.hpp"
#include "ManagedConnection.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace MarketStream {

// Caller-side handle of one subscriber. Disposes itself on destruction.
class HubSubscription {
public:
    HubSubscription(std::weak_ptr<ManagedConnection> connection, ManagedConnection::SubscriberId id)
        : m_connection(std::move(connection)), m_id(id) {}
    ~HubSubscription() { dispose(); }

    HubSubscription(const HubSubscription&) = delete;
    HubSubscription& operator=(const HubSubscription&) = delete;

    // False when the socket is not open or the handle was disposed
    bool send(std::string message);
    bool send(const nlohmann::json& message);
    bool send(const char* message) { return send(std::string(message)); }

    [[nodiscard]] bool isOpen() const;

    // Idempotent
    void dispose();

private:
    std::weak_ptr<ManagedConnection> m_connection;
    ManagedConnection::SubscriberId m_id;
    bool m_disposed{false};
};

class ConnectionHub {
public:
    ConnectionHub(Scheduler& scheduler, TransportFactory factory, HubConfig config = {});
    ~ConnectionHub();

    ConnectionHub(const ConnectionHub&) = delete;
    ConnectionHub& operator=(const ConnectionHub&) = delete;

    /**
     * Attach a subscriber to the connection called `name` ("ws" when empty), creating it
     * on first use. `path` defaults to the configured events path and only matters for
     * the subscriber that creates the connection.
     */
    std::unique_ptr<HubSubscription> subscribe(std::string name, HubSubscriber subscriber, std::string path = {});

    [[nodiscard]] std::optional<ConnectionSnapshot> inspect(const std::string& name) const;
    [[nodiscard]] std::size_t connectionCount() const { return m_connections.size(); }
    [[nodiscard]] const HubConfig& config() const { return m_config; }

    // Tears down every connection; outstanding handles become inert.
    void shutdown();

private:
    Scheduler& m_scheduler;
    TransportFactory m_factory;
    HubConfig m_config;
    std::unordered_map<std::string, std::shared_ptr<ManagedConnection>> m_connections;
};

} // namespace MarketStream
