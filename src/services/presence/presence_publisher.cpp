#include "plexwatch/services/presence/presence_publisher.hpp"
#include "plexwatch/utils/format_utils.hpp"
#include "plexwatch/utils/logger.hpp"

namespace plexwatch {
namespace services {

namespace {

DiscordRateLimitConfig limiter_config(const core::PresenceConfig& config) {
    DiscordRateLimitConfig limits;
    limits.max_operations_per_window = config.max_per_window;
    limits.window_duration = config.window;
    limits.minimum_interval = config.min_interval;
    return limits;
}

std::string stream_text(const std::string& pattern, std::size_t count) {
    std::string text = utils::replace_all(pattern, "{count}", std::to_string(count));
    return utils::replace_all(std::move(text), "{s}", count == 1 ? "" : "s");
}

} // namespace

PresencePublisher::PresencePublisher(std::shared_ptr<PresenceSink> sink,
                                     core::PresenceConfig config,
                                     DiscordRateLimiter::ClockFn clock)
    : m_sink(std::move(sink))
    , m_config(std::move(config))
    , m_limiter(limiter_config(m_config), std::move(clock)) {
}

std::string PresencePublisher::derive(const core::ViewModel& view, const core::PresenceConfig& config) {
    if (view.primary_down()) {
        return config.offline_text;
    }

    if (view.total_streams > 0) {
        return stream_text(config.stream_text, view.total_streams);
    }

    std::string summary;
    for (const auto& row : view.library) {
        if (!row.include_in_presence) {
            continue;
        }
        if (!summary.empty()) {
            summary += " | ";
        }
        summary += utils::format_count(row.item_count) + " " + row.display_name + " " + row.emoji;
    }
    if (!summary.empty()) {
        return summary;
    }

    return stream_text(config.stream_text, 0);
}

PresenceOutcome PresencePublisher::publish(const core::ViewModel& view) {
    if (!m_sink) {
        return PresenceOutcome::Skipped;
    }

    const auto text = derive(view, m_config);
    if (m_last_text && *m_last_text == text) {
        return PresenceOutcome::Skipped;
    }

    if (!m_limiter.can_proceed()) {
        PLEXWATCH_LOG_DEBUG("PresencePublisher", "Presence update deferred for " +
                            std::to_string(m_limiter.time_until_next_allowed().count()) + "ms, " +
                            std::to_string(m_limiter.operations_in_window()) + " updates in window");
        return PresenceOutcome::RateLimited;
    }

    m_limiter.record_operation();
    auto result = m_sink->set_presence(text);
    if (!result) {
        PLEXWATCH_LOG_WARNING("PresencePublisher", "Failed to update presence: " + to_string(result.error()));
        return PresenceOutcome::Failed;
    }

    m_last_text = text;
    PLEXWATCH_LOG_INFO("PresencePublisher", "Status updated: " + text);
    return PresenceOutcome::Sent;
}

std::string to_string(PresenceOutcome outcome) {
    switch (outcome) {
        case PresenceOutcome::Sent: return "sent";
        case PresenceOutcome::Skipped: return "skipped";
        case PresenceOutcome::RateLimited: return "rate limited";
        case PresenceOutcome::Failed: return "failed";
    }
    return "unknown";
}

} // namespace services
} // namespace plexwatch
