#pragma once

#include "plexwatch/core/models.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <expected>
#include <functional>
#include <optional>

namespace plexwatch {
namespace utils {

// Mapping between config.yaml and ApplicationConfig
class YamlConfigHelper {
public:
    // FileNotFound, or InvalidFormat for unparsable YAML
    static std::expected<core::ApplicationConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    static std::expected<void, core::ConfigError>
    save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path);

    // Unknown keys are ignored; missing keys keep their defaults
    static core::ApplicationConfig from_yaml(const YAML::Node& node);
    static YAML::Node to_yaml(const core::ApplicationConfig& config);

    using EnvLookup = std::function<std::optional<std::string>(const char*)>;

    // Credentials from the environment win over the file
    static void apply_env_overrides(core::ApplicationConfig& config, const EnvLookup& lookup = {});

private:
    static core::SchedulerConfig parse_scheduler_config(const YAML::Node& node);
    static core::DashboardConfig parse_dashboard_config(const YAML::Node& node);
    static core::LibraryConfig parse_library_config(const YAML::Node& sections, const YAML::Node& cache);
    static core::PresenceConfig parse_presence_config(const YAML::Node& node);
    static core::TitleConfig parse_title_config(const YAML::Node& node);
};

} // namespace utils
} // namespace plexwatch
