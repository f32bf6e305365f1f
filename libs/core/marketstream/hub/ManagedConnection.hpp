/*
MarketStream — ManagedConnection
Role: One physical WebSocket shared by N subscribers, kept alive across failures.
Inputs/Outputs: Subscriber callbacks + token providers in; fan-out of open/message/error/close out.
Threading: io_context thread only. Transport callbacks are bound to a connection generation so
           callbacks from a replaced or torn-down socket are dropped.
Performance: Subscriber handlers are shared_ptr so fan-out copies pointers, not std::functions.
Integration: Created and owned by ConnectionHub; reached by callers only through HubSubscription.
Observability: Logs lifecycle under the "hub" category; URLs are redacted before logging.
Related: ConnectionHub.hpp, HubProtocol.hpp, Scheduler.hpp, WsTransport.hpp.
Assumptions: Scheduler outlives every connection; the transport factory may throw or return null.
*/
#pragma once
#include "HubTypes.hpp"
#include "../ws/Scheduler.hpp"
#include "../ws/WsTransport.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace MarketStream {

class ManagedConnection : public std::enable_shared_from_this<ManagedConnection> {
public:
    using SubscriberId = std::uint64_t;
    using IdleCallback = std::function<void()>;

    ManagedConnection(std::string name,
                      std::string path,
                      Scheduler& scheduler,
                      TransportFactory factory,
                      HubConfig config);
    ~ManagedConnection();

    ManagedConnection(const ManagedConnection&) = delete;
    ManagedConnection& operator=(const ManagedConnection&) = delete;

    /**
     * Register a subscriber and make sure a connection is open or on its way.
     * When the socket is already open, the subscriber's onOpen is posted, never
     * called from inside this function.
     */
    SubscriberId addSubscriber(HubSubscriber subscriber);

    // Idempotent. The last removal tears the socket down and reports idle.
    void removeSubscriber(SubscriberId id);

    // False when the socket is not open
    bool send(std::string message);

    // Clears every timer, detaches transport callbacks and closes the socket.
    void teardown();

    // Called once the connection has no subscribers left
    void setIdleCallback(IdleCallback cb) { m_onIdle = std::move(cb); }

    [[nodiscard]] bool isOpen() const { return m_socket != nullptr && m_open; }
    [[nodiscard]] bool isConnecting() const { return m_socket != nullptr && !m_open; }
    [[nodiscard]] bool hasSubscribers() const { return !m_subscribers.empty(); }
    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConnectionSnapshot snapshot() const;

private:
    void ensureConnection();
    void open();
    std::string resolveToken();

    void handleOpen(std::uint64_t generation);
    void handleMessage(std::uint64_t generation, const std::string& data);
    void handleError(std::uint64_t generation, const std::string& error);
    void handleClose(std::uint64_t generation, const CloseInfo& info);

    void scheduleReconnect();
    void handleEarlyFailure();
    void beginFailureCooldown();
    void clearFailureCooldown();
    void resetFailureState();

    void startHeartbeat();
    void sendPing();
    void stopHeartbeat();

    void detachSocket();
    void notifyIdle();

    template <class Fn>
    void forEachSubscriber(std::uint64_t generation, const char* what, Fn&& fn);

    const std::string m_name;
    const std::string m_path;
    Scheduler& m_scheduler;
    TransportFactory m_factory;
    const HubConfig m_config;

    std::map<SubscriberId, std::shared_ptr<const HubSubscriber>> m_subscribers;
    SubscriberId m_nextSubscriberId{1};

    std::shared_ptr<WsTransport> m_socket;
    std::uint64_t m_generation{0};
    bool m_open{false};
    bool m_hadSuccessfulOpen{false};

    Scheduler::TimerId m_reconnectTimer{Scheduler::kNoTimer};
    Scheduler::TimerId m_cooldownTimer{Scheduler::kNoTimer};
    Scheduler::TimerId m_heartbeatTimer{Scheduler::kNoTimer};

    std::chrono::milliseconds m_reconnectDelay;
    int m_consecutiveFailures{0};
    bool m_inFailureCooldown{false};
    bool m_shouldReconnect{true};
    std::string m_lastResolvedToken;

    IdleCallback m_onIdle;
};

} // namespace MarketStream
