#include "plexwatch/services/discord/rate_limiter.hpp"
#include "plexwatch/utils/logger.hpp"
#include <algorithm>

namespace plexwatch::services {

DiscordRateLimiter::DiscordRateLimiter(DiscordRateLimitConfig config, ClockFn clock)
    : m_config(std::move(config))
    , m_clock(std::move(clock)) {

    if (!m_config.is_valid()) {
        PLEXWATCH_LOG_WARNING("RateLimiter", "Invalid rate limit configuration, using defaults");
        m_config = DiscordRateLimitConfig{};
    }
    if (!m_clock) {
        m_clock = [] { return std::chrono::steady_clock::now(); };
    }

    PLEXWATCH_LOG_DEBUG("RateLimiter",
        "Initialized with " + std::to_string(m_config.max_operations_per_window) +
        " ops/" + std::to_string(m_config.window_duration.count()) + "s, minimum interval " +
        std::to_string(m_config.minimum_interval.count()) + "s");
}

bool DiscordRateLimiter::can_proceed() {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_clock();

    cleanup_expired_operations(now);

    if (!check_minimum_interval(now)) {
        PLEXWATCH_LOG_DEBUG("RateLimiter", "Blocked by minimum interval");
        return false;
    }

    if (!check_window()) {
        PLEXWATCH_LOG_DEBUG("RateLimiter", "Blocked by window limit");
        return false;
    }

    return true;
}

void DiscordRateLimiter::record_operation() {
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto now = m_clock();
    m_operation_times.push_back(now);
    m_last_operation = now;
    m_has_operation = true;

    PLEXWATCH_LOG_DEBUG("RateLimiter",
        "Operation recorded. Current window: " + std::to_string(m_operation_times.size()) +
        "/" + std::to_string(m_config.max_operations_per_window));
}

std::chrono::milliseconds DiscordRateLimiter::time_until_next_allowed() {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_clock();

    cleanup_expired_operations(now);
    return calculate_wait_time(now);
}

size_t DiscordRateLimiter::operations_in_window() {
    std::lock_guard<std::mutex> lock(m_mutex);

    cleanup_expired_operations(m_clock());
    return m_operation_times.size();
}

void DiscordRateLimiter::cleanup_expired_operations(TimePoint now) {
    const auto cutoff = now - m_config.window_duration;
    while (!m_operation_times.empty() && m_operation_times.front() <= cutoff) {
        m_operation_times.pop_front();
    }
}

bool DiscordRateLimiter::check_minimum_interval(TimePoint now) const {
    if (!m_has_operation) {
        return true;
    }
    return now - m_last_operation >= m_config.minimum_interval;
}

bool DiscordRateLimiter::check_window() const {
    return static_cast<int>(m_operation_times.size()) < m_config.max_operations_per_window;
}

std::chrono::milliseconds DiscordRateLimiter::calculate_wait_time(TimePoint now) const {
    std::chrono::milliseconds max_wait{0};

    if (m_has_operation) {
        const auto elapsed = now - m_last_operation;
        if (elapsed < m_config.minimum_interval) {
            max_wait = std::max(max_wait, std::chrono::duration_cast<std::chrono::milliseconds>(
                m_config.minimum_interval - elapsed));
        }
    }

    if (!check_window() && !m_operation_times.empty()) {
        const auto window_expires = m_operation_times.front() + m_config.window_duration;
        if (window_expires > now) {
            max_wait = std::max(max_wait, std::chrono::duration_cast<std::chrono::milliseconds>(
                window_expires - now));
        }
    }

    return max_wait;
}

} // namespace plexwatch::services
