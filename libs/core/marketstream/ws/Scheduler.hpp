/*
MarketStream — Scheduler
Role: Single-threaded timer and deferred-call abstraction for the hub and the realtime client.
Inputs/Outputs: Tasks and delays in; tasks run later on the owning io_context thread.
Threading: Every task runs on the io_context thread; no locking is needed by callers.
Performance: One steady_timer per pending timer; cancelled timers are released immediately.
Integration: AsioScheduler is used in production, tests substitute a manual clock.
Observability: None; callers log their own timer decisions.
Related: AsioScheduler.cpp, ManagedConnection.hpp, MarketRealtimeClient.hpp.
Assumptions: The io_context outlives the scheduler and is run by exactly one thread.
*/
#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

namespace MarketStream {

class Scheduler {
public:
    using Clock   = std::chrono::steady_clock;
    using Task    = std::function<void()>;
    using TimerId = std::uint64_t;

    static constexpr TimerId kNoTimer = 0;

    virtual ~Scheduler() = default;

    virtual Clock::time_point now() const = 0;

    // Runs the task on the next turn of the loop, never inside the caller's stack.
    virtual void post(Task task) = 0;

    // One-shot timer. Returns an id usable with cancel(); never returns kNoTimer.
    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;

    // Unknown or already-fired ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

class AsioScheduler : public Scheduler {
public:
    explicit AsioScheduler(boost::asio::io_context& ioc) : m_ioc(ioc) {}
    ~AsioScheduler() override;

    AsioScheduler(const AsioScheduler&) = delete;
    AsioScheduler& operator=(const AsioScheduler&) = delete;

    Clock::time_point now() const override { return Clock::now(); }
    void post(Task task) override;
    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;

    [[nodiscard]] std::size_t pendingTimers() const { return m_timers.size(); }

private:
    boost::asio::io_context& m_ioc;
    std::unordered_map<TimerId, std::shared_ptr<boost::asio::steady_timer>> m_timers;
    TimerId m_nextId{1};
};

} // namespace MarketStream
