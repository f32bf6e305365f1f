#include "ConnectionHub.hpp"
#include "../Log.hpp"

namespace MarketStream {

bool HubSubscription::send(std::string message) {
    if (m_disposed) return false;
    auto connection = m_connection.lock();
    return connection && connection->send(std::move(message));
}

bool HubSubscription::send(const nlohmann::json& message) {
    return send(message.dump());
}

bool HubSubscription::isOpen() const {
    if (m_disposed) return false;
    auto connection = m_connection.lock();
    return connection && connection->isOpen();
}

void HubSubscription::dispose() {
    if (m_disposed) return;
    m_disposed = true;
    if (auto connection = m_connection.lock()) {
        connection->removeSubscriber(m_id);
    }
    m_connection.reset();
}

ConnectionHub::ConnectionHub(Scheduler& scheduler, TransportFactory factory, HubConfig config)
    : m_scheduler(scheduler)
    , m_factory(std::move(factory))
    , m_config(std::move(config))
{
}

ConnectionHub::~ConnectionHub() {
    shutdown();
}

std::unique_ptr<HubSubscription> ConnectionHub::subscribe(std::string name, HubSubscriber subscriber, std::string path) {
    if (name.empty()) name = kDefaultConnectionName;
    if (path.empty()) path = m_config.defaultPath;

    auto it = m_connections.find(name);
    if (it == m_connections.end()) {
        LOG_D("hub", "creating connection '{}' with path {}", name, path);
        auto connection = std::make_shared<ManagedConnection>(name, path, m_scheduler, m_factory, m_config);
        std::weak_ptr<ManagedConnection> weak = connection;
        connection->setIdleCallback([this, name, weak] {
            auto found = m_connections.find(name);
            if (found != m_connections.end() && found->second == weak.lock()) {
                LOG_D("hub", "dropping idle connection '{}'", name);
                m_connections.erase(found);
            }
        });
        it = m_connections.emplace(name, std::move(connection)).first;
    }

    // Keep the connection alive even if the registration itself ends up idling it.
    auto connection = it->second;
    const auto id = connection->addSubscriber(std::move(subscriber));
    return std::make_unique<HubSubscription>(connection, id);
}

std::optional<ConnectionSnapshot> ConnectionHub::inspect(const std::string& name) const {
    auto it = m_connections.find(name.empty() ? std::string(kDefaultConnectionName) : name);
    if (it == m_connections.end()) return std::nullopt;
    return it->second->snapshot();
}

void ConnectionHub::shutdown() {
    auto connections = std::move(m_connections);
    m_connections.clear();
    for (auto& [name, connection] : connections) {
        LOG_D("hub", "shutting down connection '{}'", name);
        connection->setIdleCallback({});
        connection->teardown();
    }
}

} // namespace MarketStream
