#include "Scheduler.hpp"
#include <boost/asio/post.hpp>

namespace net = boost::asio;

namespace MarketStream {

AsioScheduler::~AsioScheduler() {
    for (auto& [id, timer] : m_timers) {
        timer->cancel();
    }
    m_timers.clear();
}

void AsioScheduler::post(Task task) {
    net::post(m_ioc, std::move(task));
}

Scheduler::TimerId AsioScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    const TimerId id = m_nextId++;
    auto timer = std::make_shared<net::steady_timer>(m_ioc);
    timer->expires_after(delay);
    m_timers.emplace(id, timer);

    // The timer is captured so it survives until its handler runs, even after cancel().
    timer->async_wait([this, id, timer, task = std::move(task)](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) return;
        auto it = m_timers.find(id);
        if (it == m_timers.end()) return;
        m_timers.erase(it);
        task();
    });
    return id;
}

void AsioScheduler::cancel(TimerId id) {
    if (id == kNoTimer) return;
    auto it = m_timers.find(id);
    if (it == m_timers.end()) return;
    it->second->cancel();
    m_timers.erase(it);
}

} // namespace MarketStream
