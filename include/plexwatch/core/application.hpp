#pragma once

#include "plexwatch/core/models.hpp"
#include <memory>
#include <expected>
#include <filesystem>
#include <string>

namespace plexwatch {
namespace core {

// Owns the YAML file and the validated configuration read from it
class ConfigManager {
public:
    explicit ConfigManager(const std::filesystem::path& config_path = {});
    ~ConfigManager();

    // Reads the file (writing a documented default when it is missing),
    // applies environment overrides, derives enabled flags and validates
    std::expected<void, ConfigError> load();

    const ApplicationConfig& get() const;
    // Validates, then persists; a rejected config leaves the current one in place
    std::expected<void, ConfigError> update(const ApplicationConfig& config);

    const std::filesystem::path& path() const;

    static std::filesystem::path get_default_config_path();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// Wires sources, publishers and the scheduler from a loaded configuration.
// initialize() builds everything; start() launches the tick loop.
class Application {
public:
    virtual ~Application() = default;

    virtual std::expected<void, ApplicationError> initialize() = 0;
    virtual std::expected<void, ApplicationError> start() = 0;
    virtual void stop() = 0;
    virtual void shutdown() = 0;

    virtual bool is_running() const = 0;

    // One synchronous tick, for --once
    virtual std::expected<void, ApplicationError> run_single_tick() = 0;
};

std::expected<std::unique_ptr<Application>, ApplicationError>
create_application(std::shared_ptr<ConfigManager> config_manager);

} // namespace core
} // namespace plexwatch
