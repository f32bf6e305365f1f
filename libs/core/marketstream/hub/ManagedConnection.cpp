#include "ManagedConnection.hpp"
#include "HubProtocol.hpp"
#include "../Log.hpp"
#include <algorithm>
#include <exception>
#include <vector>

namespace MarketStream {

ManagedConnection::ManagedConnection(std::string name,
                                     std::string path,
                                     Scheduler& scheduler,
                                     TransportFactory factory,
                                     HubConfig config)
    : m_name(std::move(name))
    , m_path(std::move(path))
    , m_scheduler(scheduler)
    , m_factory(std::move(factory))
    , m_config(std::move(config))
    , m_reconnectDelay(m_config.baseReconnectDelay)
{
    LOG_D("hub", "[{}] created for path {}", m_name, m_path);
}

ManagedConnection::~ManagedConnection() {
    m_scheduler.cancel(m_reconnectTimer);
    m_scheduler.cancel(m_cooldownTimer);
    m_scheduler.cancel(m_heartbeatTimer);
    detachSocket();
}

template <class Fn>
void ManagedConnection::forEachSubscriber(std::uint64_t generation, const char* what, Fn&& fn) {
    // Handlers may add or remove subscribers, or replace the socket, while we iterate.
    std::vector<SubscriberId> ids;
    ids.reserve(m_subscribers.size());
    for (const auto& [id, _] : m_subscribers) ids.push_back(id);

    for (auto id : ids) {
        if (m_generation != generation) return;
        auto it = m_subscribers.find(id);
        if (it == m_subscribers.end()) continue;
        auto subscriber = it->second;
        try {
            fn(*subscriber);
        } catch (const std::exception& e) {
            LOG_W("hub", "[{}] subscriber {} {} handler threw: {}", m_name, id, what, e.what());
        }
    }
}

ManagedConnection::SubscriberId ManagedConnection::addSubscriber(HubSubscriber subscriber) {
    const auto id = m_nextSubscriberId++;
    m_subscribers.emplace(id, std::make_shared<const HubSubscriber>(std::move(subscriber)));
    LOG_D("hub", "[{}] subscriber {} registered ({} total)", m_name, id, m_subscribers.size());

    ensureConnection();

    if (isOpen()) {
        const auto generation = m_generation;
        m_scheduler.post([weak = weak_from_this(), id, generation] {
            auto self = weak.lock();
            if (!self || self->m_generation != generation || !self->isOpen()) return;
            auto it = self->m_subscribers.find(id);
            if (it == self->m_subscribers.end() || !it->second->onOpen) return;
            auto subscriber = it->second;
            try {
                subscriber->onOpen();
            } catch (const std::exception& e) {
                LOG_W("hub", "[{}] subscriber {} open handler threw: {}", self->m_name, id, e.what());
            }
        });
    }
    return id;
}

void ManagedConnection::removeSubscriber(SubscriberId id) {
    auto self = shared_from_this();
    if (m_subscribers.erase(id) == 0) return;
    LOG_D("hub", "[{}] subscriber {} removed ({} left)", m_name, id, m_subscribers.size());
    if (m_subscribers.empty()) {
        teardown();
        notifyIdle();
    }
}

bool ManagedConnection::send(std::string message) {
    if (!isOpen()) {
        LOG_D("hub", "[{}] send attempted while socket not open", m_name);
        return false;
    }
    m_socket->send(std::move(message));
    return true;
}

void ManagedConnection::teardown() {
    LOG_D("hub", "[{}] teardown", m_name);
    stopHeartbeat();
    m_scheduler.cancel(m_reconnectTimer);
    m_reconnectTimer = Scheduler::kNoTimer;
    clearFailureCooldown();
    m_shouldReconnect = true;
    m_consecutiveFailures = 0;
    m_reconnectDelay = m_config.baseReconnectDelay;
    detachSocket();
}

ConnectionSnapshot ManagedConnection::snapshot() const {
    ConnectionSnapshot s;
    s.name = m_name;
    s.path = m_path;
    s.open = isOpen();
    s.connecting = isConnecting();
    s.subscriberCount = m_subscribers.size();
    s.consecutiveFailures = m_consecutiveFailures;
    s.reconnectDelay = m_reconnectDelay;
    s.inFailureCooldown = m_inFailureCooldown;
    s.shouldReconnect = m_shouldReconnect;
    s.reconnectPending = m_reconnectTimer != Scheduler::kNoTimer;
    return s;
}

void ManagedConnection::ensureConnection() {
    if (m_socket) {
        LOG_T("hub", "[{}] socket already open or connecting", m_name);
        return;
    }
    open();
}

std::string ManagedConnection::resolveToken() {
    for (const auto& [id, subscriber] : m_subscribers) {
        if (!subscriber->tokenProvider) continue;
        try {
            auto token = subscriber->tokenProvider();
            if (!token.empty()) return token;
        } catch (const std::exception& e) {
            LOG_W("hub", "[{}] token provider of subscriber {} threw: {}", m_name, id, e.what());
        }
    }
    return {};
}

void ManagedConnection::open() {
    if (m_socket) return;

    const auto token = resolveToken();
    if (token.empty()) {
        LOG_D("hub", "[{}] no token available, retrying later", m_name);
        scheduleReconnect();
        return;
    }

    if (token != m_lastResolvedToken) {
        resetFailureState();
        m_lastResolvedToken = token;
    }

    if (!m_shouldReconnect || m_inFailureCooldown) {
        LOG_D("hub", "[{}] open deferred (shouldReconnect={}, cooldown={})",
              m_name, m_shouldReconnect, m_inFailureCooldown);
        scheduleReconnect();
        return;
    }

    const auto target = HubProtocol::buildTarget(m_path, token);
    LOG_I("hub", "[{}] connecting to wss://{}:{}{}", m_name, m_config.host, m_config.port,
          HubProtocol::redactToken(target));

    std::shared_ptr<WsTransport> socket;
    try {
        if (m_factory) socket = m_factory();
    } catch (const std::exception& e) {
        LOG_W("hub", "[{}] transport creation failed: {}", m_name, e.what());
    }
    if (!socket) {
        handleEarlyFailure();
        scheduleReconnect();
        return;
    }

    // Callbacks stay bound to this generation; they go inert once it moves on.
    const auto generation = ++m_generation;
    std::weak_ptr<ManagedConnection> weak = weak_from_this();
    socket->onOpen([weak, generation] {
        if (auto self = weak.lock()) self->handleOpen(generation);
    });
    socket->onMessage([weak, generation](std::string data) {
        if (auto self = weak.lock()) self->handleMessage(generation, data);
    });
    socket->onError([weak, generation](std::string error) {
        if (auto self = weak.lock()) self->handleError(generation, error);
    });
    socket->onClose([weak, generation](CloseInfo info) {
        if (auto self = weak.lock()) self->handleClose(generation, info);
    });

    m_socket = socket;
    m_open = false;
    m_hadSuccessfulOpen = false;
    socket->connect(m_config.host, m_config.port, target);
}

void ManagedConnection::handleOpen(std::uint64_t generation) {
    if (generation != m_generation || !m_socket) return;
    auto self = shared_from_this();

    m_open = true;
    m_hadSuccessfulOpen = true;
    m_consecutiveFailures = 0;
    m_reconnectDelay = m_config.baseReconnectDelay;
    clearFailureCooldown();
    LOG_I("hub", "[{}] connected ({} subscribers)", m_name, m_subscribers.size());

    forEachSubscriber(generation, "open", [](const HubSubscriber& s) {
        if (s.onOpen) s.onOpen();
    });
    if (generation == m_generation) startHeartbeat();
}

void ManagedConnection::handleMessage(std::uint64_t generation, const std::string& data) {
    if (generation != m_generation || !m_socket) return;
    auto self = shared_from_this();
    forEachSubscriber(generation, "message", [&data](const HubSubscriber& s) {
        if (s.onMessage) s.onMessage(data);
    });
}

void ManagedConnection::handleError(std::uint64_t generation, const std::string& error) {
    if (generation != m_generation || !m_socket) return;
    auto self = shared_from_this();
    LOG_W("hub", "[{}] socket error: {}", m_name, error);
    forEachSubscriber(generation, "error", [&error](const HubSubscriber& s) {
        if (s.onError) s.onError(error);
    });
}

void ManagedConnection::handleClose(std::uint64_t generation, const CloseInfo& info) {
    if (generation != m_generation || !m_socket) return;
    auto self = shared_from_this();

    m_socket.reset();
    m_open = false;
    const auto closedGeneration = ++m_generation;
    stopHeartbeat();

    const bool fatal = HubProtocol::isAuthenticationFailure(info);
    const bool closedBeforeOpen = !m_hadSuccessfulOpen;
    m_hadSuccessfulOpen = false;
    LOG_I("hub", "[{}] closed code={} reason='{}'{}", m_name, info.code, info.reason,
          closedBeforeOpen ? " before open" : "");

    if (fatal) {
        LOG_W("hub", "[{}] authentication rejected, not reconnecting", m_name);
        m_shouldReconnect = false;
        m_scheduler.cancel(m_reconnectTimer);
        m_reconnectTimer = Scheduler::kNoTimer;
        clearFailureCooldown();
        m_consecutiveFailures = 0;
        m_reconnectDelay = m_config.baseReconnectDelay;
    }

    forEachSubscriber(closedGeneration, "close", [&info](const HubSubscriber& s) {
        if (s.onClose) s.onClose(info);
    });

    if (!m_subscribers.empty() && !fatal && closedGeneration == m_generation) {
        if (closedBeforeOpen) {
            handleEarlyFailure();
        } else {
            m_consecutiveFailures = 0;
            m_reconnectDelay = m_config.baseReconnectDelay;
        }
        scheduleReconnect();
    }
    if (m_subscribers.empty()) notifyIdle();
}

void ManagedConnection::scheduleReconnect() {
    if (!m_shouldReconnect || m_inFailureCooldown) {
        LOG_D("hub", "[{}] reconnect suppressed (shouldReconnect={}, cooldown={})",
              m_name, m_shouldReconnect, m_inFailureCooldown);
        return;
    }
    if (m_reconnectTimer != Scheduler::kNoTimer) return;

    const auto delay = m_reconnectDelay;
    LOG_I("hub", "[{}] reconnecting in {} ms", m_name, delay.count());
    m_reconnectTimer = m_scheduler.schedule(delay, [weak = weak_from_this()] {
        auto self = weak.lock();
        if (!self) return;
        self->m_reconnectTimer = Scheduler::kNoTimer;
        if (self->hasSubscribers() && !self->m_socket) self->open();
    });
}

void ManagedConnection::handleEarlyFailure() {
    ++m_consecutiveFailures;
    m_reconnectDelay = std::min(m_reconnectDelay * 2, m_config.maxReconnectDelay);
    LOG_W("hub", "[{}] connection failed before open ({} in a row, next delay {} ms)",
          m_name, m_consecutiveFailures, m_reconnectDelay.count());
    if (m_consecutiveFailures >= m_config.earlyFailureThreshold) beginFailureCooldown();
}

void ManagedConnection::beginFailureCooldown() {
    if (m_inFailureCooldown) return;
    m_inFailureCooldown = true;
    m_shouldReconnect = false;
    LOG_W("hub", "[{}] failed to connect {} times, pausing reconnects for {} ms",
          m_name, m_consecutiveFailures, m_config.failureCooldown.count());

    m_cooldownTimer = m_scheduler.schedule(m_config.failureCooldown, [weak = weak_from_this()] {
        auto self = weak.lock();
        if (!self) return;
        self->m_cooldownTimer = Scheduler::kNoTimer;
        self->m_inFailureCooldown = false;
        self->m_shouldReconnect = true;
        self->m_consecutiveFailures = 0;
        self->m_reconnectDelay = self->m_config.baseReconnectDelay;
        LOG_I("hub", "[{}] cooldown over", self->m_name);
        if (self->hasSubscribers() && !self->m_socket) self->ensureConnection();
    });
}

void ManagedConnection::clearFailureCooldown() {
    m_scheduler.cancel(m_cooldownTimer);
    m_cooldownTimer = Scheduler::kNoTimer;
    m_inFailureCooldown = false;
}

void ManagedConnection::resetFailureState() {
    clearFailureCooldown();
    m_consecutiveFailures = 0;
    m_reconnectDelay = m_config.baseReconnectDelay;
    m_hadSuccessfulOpen = false;
    m_shouldReconnect = true;
}

void ManagedConnection::startHeartbeat() {
    stopHeartbeat();
    sendPing();
}

void ManagedConnection::sendPing() {
    if (!isOpen()) {
        LOG_T("hub", "[{}] ping skipped, socket not open", m_name);
        return;
    }
    m_socket->send(std::string(HubProtocol::kPingFrame));
    m_heartbeatTimer = m_scheduler.schedule(m_config.heartbeatInterval, [weak = weak_from_this()] {
        auto self = weak.lock();
        if (!self) return;
        self->m_heartbeatTimer = Scheduler::kNoTimer;
        self->sendPing();
    });
}

void ManagedConnection::stopHeartbeat() {
    m_scheduler.cancel(m_heartbeatTimer);
    m_heartbeatTimer = Scheduler::kNoTimer;
}

void ManagedConnection::detachSocket() {
    m_open = false;
    if (!m_socket) return;
    auto socket = std::move(m_socket);
    m_socket.reset();
    ++m_generation;
    socket->close();
}

void ManagedConnection::notifyIdle() {
    if (!m_onIdle) return;
    auto cb = m_onIdle;
    cb();
}

} // namespace MarketStream
