#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>

namespace plexwatch::services {

/**
 * @brief Limits for presence updates
 *
 * Discord drops activity updates sent more often than about five per
 * twenty seconds. The defaults stay well below that.
 */
struct DiscordRateLimitConfig {
    // Sliding window limit
    int max_operations_per_window = 5;
    std::chrono::seconds window_duration{60};

    // Minimum spacing between two operations
    std::chrono::seconds minimum_interval{15};

    bool is_valid() const {
        return max_operations_per_window > 0 &&
               window_duration > std::chrono::seconds{0} &&
               minimum_interval >= std::chrono::seconds{0};
    }
};

/**
 * @brief Sliding window rate limiter for Discord operations
 *
 * can_proceed() only checks; callers record_operation() once they actually
 * send. Thread-safe.
 */
class DiscordRateLimiter {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using ClockFn = std::function<TimePoint()>;

    explicit DiscordRateLimiter(DiscordRateLimitConfig config = {}, ClockFn clock = {});

    bool can_proceed();
    void record_operation();
    std::chrono::milliseconds time_until_next_allowed();

    size_t operations_in_window();

private:
    mutable std::mutex m_mutex;
    DiscordRateLimitConfig m_config;
    ClockFn m_clock;

    std::deque<TimePoint> m_operation_times;
    TimePoint m_last_operation{};
    bool m_has_operation = false;

    void cleanup_expired_operations(TimePoint now);
    bool check_minimum_interval(TimePoint now) const;
    bool check_window() const;
    std::chrono::milliseconds calculate_wait_time(TimePoint now) const;
};

} // namespace plexwatch::services
