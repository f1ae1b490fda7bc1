#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace plexwatch {
namespace utils {

enum class ThreadPoolError {
    Shutdown
};

// Workers for source fetches. A fetch that overruns its tick keeps its worker
// until it returns; shutdown discards whatever is still queued, and the
// futures of discarded tasks report broken_promise.
class ThreadPool {
public:
    explicit ThreadPool(size_t workers, std::string name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
        requires std::is_invocable_v<F>
    auto try_submit(F&& task) -> std::expected<std::future<std::invoke_result_t<F>>, ThreadPoolError>;

    void shutdown();

    [[nodiscard]] size_t pending() const;

private:
    void run(std::stop_token stop);

    std::string m_name;
    mutable std::mutex m_mutex;
    std::condition_variable_any m_wakeup;
    std::deque<std::function<void()>> m_queue;
    bool m_closed = false;
    std::vector<std::jthread> m_workers;
};

template<typename F>
    requires std::is_invocable_v<F>
auto ThreadPool::try_submit(F&& task) -> std::expected<std::future<std::invoke_result_t<F>>, ThreadPoolError> {
    using R = std::invoke_result_t<F>;

    // std::function needs a copyable target, so the packaged_task is shared
    auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
    auto future = packaged->get_future();

    {
        std::lock_guard lock(m_mutex);
        if (m_closed) {
            return std::unexpected(ThreadPoolError::Shutdown);
        }
        m_queue.emplace_back([packaged] { (*packaged)(); });
    }
    m_wakeup.notify_one();
    return future;
}

} // namespace utils
} // namespace plexwatch
