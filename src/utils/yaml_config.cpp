#include "plexwatch/utils/yaml_config.hpp"
#include "plexwatch/utils/logger.hpp"
#include "plexwatch/utils/url_utils.hpp"
#include <fstream>
#include <cstdlib>

namespace plexwatch {
namespace utils {

namespace {
    std::chrono::seconds read_seconds(const YAML::Node& node, std::chrono::seconds fallback) {
        if (!node) {
            return fallback;
        }
        return std::chrono::seconds{node.as<long long>()};
    }

    std::string read_string(const YAML::Node& node, const std::string& fallback = {}) {
        if (!node || node.IsNull()) {
            return fallback;
        }
        return node.as<std::string>();
    }
}

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        PLEXWATCH_LOG_WARNING("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const std::exception& e) {
        PLEXWATCH_LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<void, core::ConfigError>
YamlConfigHelper::save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path) {
    try {
        auto dir = path.parent_path();
        if (!dir.empty() && !std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }

        YAML::Node node = to_yaml(config);
        std::ofstream file(path);
        if (!file) {
            PLEXWATCH_LOG_ERROR("YamlConfig", "Cannot open file for writing: " + path.string());
            return std::unexpected(core::ConfigError::PermissionDenied);
        }

        file << node << "\n";
        return {};
    } catch (const std::exception& e) {
        PLEXWATCH_LOG_ERROR("YamlConfig", "Save error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

core::ApplicationConfig YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::ApplicationConfig config;

    if (node["log_level"]) {
        const auto name = node["log_level"].as<std::string>();
        if (auto level = log_level_from_string(name)) {
            config.log_level = *level;
        } else {
            PLEXWATCH_LOG_WARNING("YamlConfig", "Unknown log_level '" + name + "', keeping info");
        }
    }

    if (node["scheduler"]) {
        config.scheduler = parse_scheduler_config(node["scheduler"]);
    }
    if (node["dashboard"]) {
        config.dashboard = parse_dashboard_config(node["dashboard"]);
    }
    config.library = parse_library_config(node["plex_sections"], node["cache"]);
    if (node["presence"]) {
        config.presence = parse_presence_config(node["presence"]);
    }
    if (node["titles"]) {
        config.titles = parse_title_config(node["titles"]);
    }

    if (const auto plex = node["plex"]) {
        config.plex.url = read_string(plex["url"]);
        config.plex.token = read_string(plex["token"]);
    }
    if (const auto jellyfin = node["jellyfin"]) {
        config.jellyfin.url = read_string(jellyfin["url"]);
        config.jellyfin.api_key = read_string(jellyfin["api_key"]);
    }
    if (const auto sabnzbd = node["sabnzbd"]) {
        config.sabnzbd.url = read_string(sabnzbd["url"]);
        config.sabnzbd.api_key = read_string(sabnzbd["api_key"]);
    }
    if (const auto uptime = node["uptime"]) {
        config.uptime.api_key = read_string(uptime["api_key"]);
        config.uptime.monitor_id = read_string(uptime["monitor_id"]);
        config.uptime.endpoint = read_string(uptime["endpoint"], config.uptime.endpoint);
    }
    if (const auto discord = node["discord"]) {
        config.discord.bot_token = read_string(discord["bot_token"]);
        config.discord.channel_id = read_string(discord["channel_id"]);
        config.discord.client_id = read_string(discord["client_id"]);
        config.discord.api_base = read_string(discord["api_base"], config.discord.api_base);
    }

    if (const auto paths = node["paths"]) {
        config.paths.user_mapping = read_string(paths["user_mapping"]);
        config.paths.state_file = read_string(paths["state_file"]);
    }

    return config;
}

YAML::Node YamlConfigHelper::to_yaml(const core::ApplicationConfig& config) {
    YAML::Node node;

    node["log_level"] = to_string(config.log_level);

    node["scheduler"]["tick_interval"] =
        std::chrono::duration_cast<std::chrono::seconds>(config.scheduler.tick_interval).count();
    node["scheduler"]["source_timeout"] =
        std::chrono::duration_cast<std::chrono::seconds>(config.scheduler.source_timeout).count();
    node["scheduler"]["offline_threshold"] = config.scheduler.offline_threshold;
    node["scheduler"]["worker_threads"] = config.scheduler.worker_threads;

    node["dashboard"]["name"] = config.dashboard.name;
    node["dashboard"]["icon_url"] = config.dashboard.icon_url;
    node["dashboard"]["footer_icon_url"] = config.dashboard.footer_icon_url;
    node["dashboard"]["max_streams"] = config.dashboard.max_streams;
    node["dashboard"]["max_downloads"] = config.dashboard.max_downloads;

    node["plex_sections"]["show_all"] = config.library.show_all;
    YAML::Node sections(YAML::NodeType::Map);
    for (const auto& section : config.library.sections) {
        YAML::Node entry;
        entry["display_name"] = section.display_name;
        entry["emoji"] = section.emoji;
        entry["show_episodes"] = section.show_episodes;
        entry["include_in_presence"] = section.include_in_presence;
        sections[section.title] = entry;
    }
    node["plex_sections"]["sections"] = sections;

    node["presence"]["offline_text"] = config.presence.offline_text;
    node["presence"]["stream_text"] = config.presence.stream_text;
    node["presence"]["min_interval"] = config.presence.min_interval.count();
    node["presence"]["max_per_window"] = config.presence.max_per_window;
    node["presence"]["window"] = config.presence.window.count();

    node["cache"]["library_update_interval"] = config.library.update_interval.count();

    YAML::Node keywords(YAML::NodeType::Sequence);
    for (const auto& keyword : config.titles.keywords) {
        keywords.push_back(keyword);
    }
    node["titles"]["keywords"] = keywords;
    node["titles"]["max_length"] = config.titles.max_length;

    node["plex"]["url"] = config.plex.url;
    node["plex"]["token"] = config.plex.token;
    node["jellyfin"]["url"] = config.jellyfin.url;
    node["jellyfin"]["api_key"] = config.jellyfin.api_key;
    node["sabnzbd"]["url"] = config.sabnzbd.url;
    node["sabnzbd"]["api_key"] = config.sabnzbd.api_key;
    node["uptime"]["api_key"] = config.uptime.api_key;
    node["uptime"]["monitor_id"] = config.uptime.monitor_id;
    node["discord"]["bot_token"] = config.discord.bot_token;
    node["discord"]["channel_id"] = config.discord.channel_id;
    node["discord"]["client_id"] = config.discord.client_id;

    node["paths"]["user_mapping"] = config.paths.user_mapping.string();
    node["paths"]["state_file"] = config.paths.state_file.string();

    return node;
}

void YamlConfigHelper::apply_env_overrides(core::ApplicationConfig& config, const EnvLookup& lookup) {
    EnvLookup get = lookup;
    if (!get) {
        get = [](const char* name) -> std::optional<std::string> {
            const char* value = std::getenv(name);
            if (!value || *value == '\0') {
                return std::nullopt;
            }
            return std::string(value);
        };
    }

    auto apply = [&get](const char* name, std::string& target) {
        if (auto value = get(name); value && !value->empty()) {
            PLEXWATCH_LOG_DEBUG("YamlConfig", std::string("Using ") + name + " from environment");
            target = *value;
        }
    };

    apply("PLEX_URL", config.plex.url);
    apply("PLEX_TOKEN", config.plex.token);
    apply("JELLYFIN_URL", config.jellyfin.url);
    apply("JELLYFIN_API_KEY", config.jellyfin.api_key);
    apply("SABNZBD_URL", config.sabnzbd.url);
    apply("SABNZBD_API_KEY", config.sabnzbd.api_key);
    apply("UPTIMEROBOT_API_KEY", config.uptime.api_key);
    apply("UPTIMEROBOT_MONITOR_ID", config.uptime.monitor_id);
    apply("DISCORD_BOT_TOKEN", config.discord.bot_token);
    apply("CHANNEL_ID", config.discord.channel_id);
    apply("DISCORD_CLIENT_ID", config.discord.client_id);

    config.plex.url = url::trim_trailing_slashes(config.plex.url);
    config.jellyfin.url = url::trim_trailing_slashes(config.jellyfin.url);
    config.sabnzbd.url = url::trim_trailing_slashes(config.sabnzbd.url);
}

core::SchedulerConfig YamlConfigHelper::parse_scheduler_config(const YAML::Node& node) {
    core::SchedulerConfig config;

    config.tick_interval = read_seconds(node["tick_interval"],
        std::chrono::duration_cast<std::chrono::seconds>(config.tick_interval));
    config.source_timeout = read_seconds(node["source_timeout"],
        std::chrono::duration_cast<std::chrono::seconds>(config.source_timeout));
    if (node["offline_threshold"]) {
        config.offline_threshold = node["offline_threshold"].as<int>();
    }
    if (node["worker_threads"]) {
        config.worker_threads = node["worker_threads"].as<std::size_t>();
    }

    return config;
}

core::DashboardConfig YamlConfigHelper::parse_dashboard_config(const YAML::Node& node) {
    core::DashboardConfig config;

    config.name = read_string(node["name"], config.name);
    config.icon_url = read_string(node["icon_url"]);
    config.footer_icon_url = read_string(node["footer_icon_url"]);
    if (node["max_streams"]) {
        config.max_streams = node["max_streams"].as<std::size_t>();
    }
    if (node["max_downloads"]) {
        config.max_downloads = node["max_downloads"].as<std::size_t>();
    }

    return config;
}

core::LibraryConfig YamlConfigHelper::parse_library_config(const YAML::Node& sections, const YAML::Node& cache) {
    core::LibraryConfig config;

    if (sections) {
        if (sections["show_all"]) {
            config.show_all = sections["show_all"].as<bool>();
        }

        // Map iteration keeps document order, which is the display order
        if (const auto entries = sections["sections"]; entries && entries.IsMap()) {
            for (const auto& entry : entries) {
                core::LibrarySectionConfig section;
                section.title = entry.first.as<std::string>();

                const YAML::Node& value = entry.second;
                if (!value.IsMap()) {
                    // Left without a display name so validation reports it
                    PLEXWATCH_LOG_WARNING("YamlConfig", "Section entry is not a mapping: " + section.title);
                    config.sections.push_back(std::move(section));
                    continue;
                }

                section.display_name = read_string(value["display_name"], section.title);
                section.emoji = read_string(value["emoji"]);
                if (value["show_episodes"]) {
                    section.show_episodes = value["show_episodes"].as<bool>();
                }
                if (value["include_in_presence"]) {
                    section.include_in_presence = value["include_in_presence"].as<bool>();
                }
                config.sections.push_back(std::move(section));
            }
        }
    }

    if (cache) {
        config.update_interval = read_seconds(cache["library_update_interval"], config.update_interval);
    }

    return config;
}

core::PresenceConfig YamlConfigHelper::parse_presence_config(const YAML::Node& node) {
    core::PresenceConfig config;

    config.offline_text = read_string(node["offline_text"], config.offline_text);
    config.stream_text = read_string(node["stream_text"], config.stream_text);
    config.min_interval = read_seconds(node["min_interval"], config.min_interval);
    if (node["max_per_window"]) {
        config.max_per_window = node["max_per_window"].as<int>();
    }
    config.window = read_seconds(node["window"], config.window);

    return config;
}

core::TitleConfig YamlConfigHelper::parse_title_config(const YAML::Node& node) {
    core::TitleConfig config;

    if (node["keywords"] && node["keywords"].IsSequence()) {
        for (const auto& keyword : node["keywords"]) {
            config.keywords.push_back(keyword.as<std::string>());
        }
    }
    if (node["max_length"]) {
        // Negative lengths clamp to 0
        const auto max_length = node["max_length"].as<long long>();
        config.max_length = max_length < 0 ? 0 : static_cast<std::size_t>(max_length);
    }

    return config;
}

} // namespace utils
} // namespace plexwatch
