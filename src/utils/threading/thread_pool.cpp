#include "plexwatch/utils/threading.hpp"
#include "plexwatch/utils/logger.hpp"

#include <algorithm>

namespace plexwatch {
namespace utils {

ThreadPool::ThreadPool(size_t workers, std::string name)
    : m_name(std::move(name)) {
    const auto count = std::max<size_t>(workers, 1);
    m_workers.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        m_workers.emplace_back([this](std::stop_token stop) { run(stop); });
    }
    PLEXWATCH_LOG_DEBUG("ThreadPool", m_name + ": " + std::to_string(count) + " workers");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    std::deque<std::function<void()>> discarded;
    {
        std::lock_guard lock(m_mutex);
        if (m_closed && m_workers.empty()) {
            return;
        }
        m_closed = true;
        discarded.swap(m_queue);
    }

    for (auto& worker : m_workers) {
        worker.request_stop();
    }
    m_wakeup.notify_all();
    m_workers.clear();

    if (!discarded.empty()) {
        PLEXWATCH_LOG_DEBUG("ThreadPool", m_name + ": discarded " + std::to_string(discarded.size()) + " queued tasks");
    }
}

size_t ThreadPool::pending() const {
    std::lock_guard lock(m_mutex);
    return m_queue.size();
}

void ThreadPool::run(std::stop_token stop) {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(m_mutex);
            if (!m_wakeup.wait(lock, stop, [this] { return !m_queue.empty() || m_closed; })) {
                return;
            }
            if (m_closed) {
                return;
            }
            task = std::move(m_queue.front());
            m_queue.pop_front();
        }
        // exceptions land in the task's future
        task();
    }
}

} // namespace utils
} // namespace plexwatch
