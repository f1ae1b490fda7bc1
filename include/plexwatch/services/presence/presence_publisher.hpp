#pragma once

#include "plexwatch/core/models.hpp"
#include "plexwatch/services/discord/rate_limiter.hpp"
#include "plexwatch/services/presence/presence_sink.hpp"
#include <memory>
#include <optional>
#include <string>

namespace plexwatch {
namespace services {

enum class PresenceOutcome {
    Sent,
    Skipped,
    RateLimited,
    Failed
};

/**
 * @brief Derives the one-line status from a ViewModel and pushes it
 *
 * Unchanged text is never re-sent. Pushes are rate limited independently of
 * the dashboard, and a failed push is only logged; the next tick tries
 * again with whatever text it derives then.
 */
class PresencePublisher {
public:
    PresencePublisher(std::shared_ptr<PresenceSink> sink,
                      core::PresenceConfig config,
                      DiscordRateLimiter::ClockFn clock = {});

    static std::string derive(const core::ViewModel& view, const core::PresenceConfig& config);

    PresenceOutcome publish(const core::ViewModel& view);

    const std::optional<std::string>& last_text() const { return m_last_text; }

private:
    std::shared_ptr<PresenceSink> m_sink;
    core::PresenceConfig m_config;
    DiscordRateLimiter m_limiter;
    std::optional<std::string> m_last_text;
};

std::string to_string(PresenceOutcome outcome);

} // namespace services
} // namespace plexwatch
