#include "plexwatch/utils/config_validator.hpp"
#include "plexwatch/utils/url_utils.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace plexwatch::utils {

ValidationResult ConfigValidator::validate_discord_config(const core::DiscordConfig& config) {
    ValidationResult result;

    if (config.bot_token.empty()) {
        result.add_error(ValidationError::MissingRequiredField, "Discord bot token cannot be empty");
    }

    if (config.channel_id.empty()) {
        result.add_error(ValidationError::MissingRequiredField, "Discord channel ID cannot be empty");
    } else if (!is_valid_snowflake(config.channel_id)) {
        result.add_error(ValidationError::MissingRequiredField,
            "Discord channel ID must be numeric: " + config.channel_id);
    }

    if (!config.client_id.empty() && !is_valid_snowflake(config.client_id)) {
        result.add_warning("Discord client ID does not look like an application ID, presence may fail");
    }

    return result;
}

ValidationResult ConfigValidator::validate_scheduler_config(const core::SchedulerConfig& config) {
    ValidationResult result;

    if (config.tick_interval <= std::chrono::milliseconds{0}) {
        result.add_error(ValidationError::InvalidInterval, "Tick interval must be positive");
    } else if (config.tick_interval < std::chrono::seconds{15}) {
        result.add_warning("Tick interval under 15 seconds may hit Discord rate limits");
    }

    if (config.source_timeout <= std::chrono::milliseconds{0}) {
        result.add_error(ValidationError::InvalidInterval, "Source timeout must be positive");
    } else if (config.tick_interval > std::chrono::milliseconds{0} &&
               config.source_timeout >= config.tick_interval) {
        result.add_warning("Source timeout is not shorter than the tick interval, ticks will run late");
    }

    if (config.offline_threshold < 0) {
        result.add_error(ValidationError::InvalidInterval, "Offline threshold cannot be negative");
    }

    if (config.worker_threads == 0) {
        result.add_error(ValidationError::InvalidInterval, "Worker thread count must be positive");
    }

    return result;
}

ValidationResult ConfigValidator::validate_library_config(const core::LibraryConfig& config) {
    ValidationResult result;

    if (config.update_interval <= std::chrono::seconds{0}) {
        result.add_error(ValidationError::InvalidInterval, "Library update interval must be positive");
    }

    std::set<std::string> seen;
    for (const auto& section : config.sections) {
        if (section.title.empty()) {
            result.add_error(ValidationError::InvalidSection, "Library section with an empty title");
            continue;
        }
        if (section.display_name.empty()) {
            result.add_error(ValidationError::InvalidSection,
                "Library section '" + section.title + "' needs a display_name");
        }
        if (!seen.insert(section.title).second) {
            result.add_error(ValidationError::InvalidSection,
                "Library section '" + section.title + "' is listed twice");
        }
    }

    return result;
}

ValidationResult ConfigValidator::validate_title_config(const core::TitleConfig& config) {
    ValidationResult result;

    for (const auto& keyword : config.keywords) {
        const bool blank = std::all_of(keyword.begin(), keyword.end(),
            [](unsigned char c) { return std::isspace(c) != 0; });
        if (blank) {
            result.add_error(ValidationError::InvalidKeyword, "Title keywords cannot be empty");
            break;
        }
    }

    if (config.max_length < 1) {
        result.add_error(ValidationError::InvalidLength, "Title max_length must be at least 1");
    }

    return result;
}

ValidationResult ConfigValidator::validate_presence_config(const core::PresenceConfig& config) {
    ValidationResult result;

    if (config.min_interval <= std::chrono::seconds{0}) {
        result.add_error(ValidationError::InvalidInterval, "Presence min_interval must be positive");
    }
    if (config.window <= std::chrono::seconds{0}) {
        result.add_error(ValidationError::InvalidInterval, "Presence window must be positive");
    }
    if (config.max_per_window <= 0) {
        result.add_error(ValidationError::InvalidRateLimit, "Presence max_per_window must be positive");
    } else if (config.max_per_window > 5) {
        result.add_warning("More than 5 presence updates per window exceeds the Discord activity limit");
    }

    return result;
}

ValidationResult ConfigValidator::validate_source_urls(const core::ApplicationConfig& config) {
    ValidationResult result;

    auto check = [&result](const std::string& name, const std::string& url) {
        if (!url.empty() && !url::is_http(url)) {
            result.add_error(ValidationError::InvalidServerUrl, "Invalid " + name + " URL: " + url);
        }
    };

    check("Plex", config.plex.url);
    check("Jellyfin", config.jellyfin.url);
    check("SABnzbd", config.sabnzbd.url);

    if (!config.plex.enabled && !config.jellyfin.enabled) {
        result.add_warning("Neither Plex nor Jellyfin is configured, the dashboard will show no streams");
    }

    return result;
}

ValidationResult ConfigValidator::validate_application_config(const core::ApplicationConfig& config) {
    ValidationResult result;

    result.merge(validate_discord_config(config.discord));
    result.merge(validate_scheduler_config(config.scheduler));
    result.merge(validate_library_config(config.library));
    result.merge(validate_title_config(config.titles));
    result.merge(validate_presence_config(config.presence));
    result.merge(validate_source_urls(config));

    if (config.dashboard.max_streams == 0) {
        result.add_error(ValidationError::InvalidLength, "Dashboard max_streams must be at least 1");
    }

    return result;
}

bool ConfigValidator::is_valid_snowflake(const std::string& id) {
    if (id.empty() || id.length() > 20) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace plexwatch::utils
