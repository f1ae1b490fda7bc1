#include "plexwatch/core/application.hpp"
#include "plexwatch/utils/config_validator.hpp"
#include "plexwatch/utils/yaml_config.hpp"
#include "plexwatch/utils/logger.hpp"
#include <shared_mutex>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace plexwatch {
namespace core {

class ConfigManager::Impl {
public:
    explicit Impl(const std::filesystem::path& config_path)
        : m_config_path(config_path.empty() ? get_default_config_path() : config_path) {
        PLEXWATCH_LOG_DEBUG("ConfigManager", "Initializing with path: " + m_config_path.string());
        m_config_exists = std::filesystem::exists(m_config_path);
    }

    std::expected<void, ConfigError> load() {
        PLEXWATCH_LOG_DEBUG("ConfigManager", "Loading configuration");

        ApplicationConfig loaded;
        if (!std::filesystem::exists(m_config_path)) {
            PLEXWATCH_LOG_INFO("ConfigManager", "No configuration file, writing defaults to " + m_config_path.string());
            {
                std::unique_lock lock(m_mutex);
                m_config = ApplicationConfig{};
            }
            if (auto saved = save(); !saved) {
                return saved;
            }
        } else {
            auto result = utils::YamlConfigHelper::load_from_file(m_config_path);
            if (!result) {
                return std::unexpected(result.error());
            }
            loaded = std::move(*result);
        }

        utils::YamlConfigHelper::apply_env_overrides(loaded);
        loaded.derive_enabled_flags();

        if (auto valid = validate(loaded); !valid) {
            return valid;
        }

        std::unique_lock lock(m_mutex);
        m_config = std::move(loaded);
        PLEXWATCH_LOG_DEBUG("ConfigManager", "Configuration loaded");
        return {};
    }

    std::expected<void, ConfigError> save() {
        ApplicationConfig config_copy;
        {
            std::shared_lock lock(m_mutex);
            config_copy = m_config;
        }

        PLEXWATCH_LOG_DEBUG("ConfigManager", "Saving configuration");

        auto result = utils::YamlConfigHelper::save_to_file(config_copy, m_config_path);

        if (result && !m_config_exists) {
            m_config_exists = true;
            if (auto documented = add_documentation_comments(); !documented) {
                PLEXWATCH_LOG_WARNING("ConfigManager", "Could not add documentation to configuration file");
            }
        }

        return result;
    }

    const ApplicationConfig& get() const {
        std::shared_lock lock(m_mutex);
        return m_config;
    }

    std::expected<void, ConfigError> update(const ApplicationConfig& config) {
        PLEXWATCH_LOG_INFO("ConfigManager", "Updating configuration");

        if (auto valid = validate(config); !valid) {
            return valid;
        }

        {
            std::unique_lock lock(m_mutex);
            m_config = config;
        }
        return save();
    }

    const std::filesystem::path& path() const {
        return m_config_path;
    }

private:
    static std::expected<void, ConfigError> validate(const ApplicationConfig& config) {
        auto validation = utils::ConfigValidator::validate_application_config(config);
        for (const auto& warning : validation.warnings) {
            PLEXWATCH_LOG_WARNING("ConfigManager", warning);
        }
        if (!validation.is_valid) {
            PLEXWATCH_LOG_ERROR("ConfigManager", "Invalid configuration: " + validation.get_error_summary());
            return std::unexpected(ConfigError::ValidationError);
        }
        return {};
    }

    std::expected<void, ConfigError> add_documentation_comments() const {
        try {
            std::ifstream in_file(m_config_path);
            if (!in_file) {
                return std::unexpected(ConfigError::FileNotFound);
            }

            std::stringstream content;
            content << "# plexwatch configuration\n";
            content << "# This file was automatically generated on first run\n";
            content << "# Credentials may also come from the environment (PLEX_URL, PLEX_TOKEN,\n";
            content << "# JELLYFIN_URL, JELLYFIN_API_KEY, SABNZBD_URL, SABNZBD_API_KEY,\n";
            content << "# UPTIMEROBOT_API_KEY, UPTIMEROBOT_MONITOR_ID, DISCORD_BOT_TOKEN,\n";
            content << "# CHANNEL_ID, DISCORD_CLIENT_ID); the environment wins.\n\n";
            content << "# log_level: debug, info, warning, error, none\n";
            content << "# scheduler.tick_interval / source_timeout: seconds\n";
            content << "# scheduler.offline_threshold: consecutive failures tolerated before a source is down\n";
            content << "# plex_sections.sections: ordered map of library title to\n";
            content << "#   {display_name, emoji, show_episodes, include_in_presence}\n";
            content << "# plex_sections.show_all: also list sections not named above\n";
            content << "# presence.stream_text: {count} and {s} are replaced\n";
            content << "# cache.library_update_interval: seconds between library count refreshes\n";
            content << "# titles.keywords: titles are cut before the first keyword found\n";
            content << "# discord.client_id: application id for the status line; empty disables it\n";
            content << "# paths.user_mapping: JSON object mapping account names to display names\n\n";

            content << in_file.rdbuf();
            in_file.close();

            std::ofstream out_file(m_config_path);
            if (!out_file) {
                return std::unexpected(ConfigError::PermissionDenied);
            }

            out_file << content.str();
            PLEXWATCH_LOG_INFO("ConfigManager", "Added documentation to configuration file");
            return {};
        } catch (const std::exception& e) {
            PLEXWATCH_LOG_WARNING("ConfigManager", "Could not add documentation: " + std::string(e.what()));
            return std::unexpected(ConfigError::PermissionDenied);
        }
    }

    mutable std::shared_mutex m_mutex;
    std::filesystem::path m_config_path;
    ApplicationConfig m_config;
    bool m_config_exists = false;
};

ConfigManager::ConfigManager(const std::filesystem::path& config_path)
    : m_impl(std::make_unique<Impl>(config_path)) {}

ConfigManager::~ConfigManager() = default;

std::expected<void, ConfigError> ConfigManager::load() {
    return m_impl->load();
}

const ApplicationConfig& ConfigManager::get() const {
    return m_impl->get();
}

std::expected<void, ConfigError> ConfigManager::update(const ApplicationConfig& config) {
    return m_impl->update(config);
}

const std::filesystem::path& ConfigManager::path() const {
    return m_impl->path();
}

std::filesystem::path ConfigManager::get_default_config_path() {
    std::filesystem::path config_dir;

    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME")) {
        config_dir = std::filesystem::path(xdg_config) / "plexwatch";
    } else if (const char* home = std::getenv("HOME")) {
        config_dir = std::filesystem::path(home) / ".config" / "plexwatch";
    } else {
        config_dir = std::filesystem::current_path();
    }

    return config_dir / "config.yaml";
}

} // namespace core
} // namespace plexwatch
