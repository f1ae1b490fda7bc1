#include "plexwatch/core/application.hpp"
#include "plexwatch/utils/logger.hpp"
#include "version.h"

#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <cstdlib>
#include <string_view>

namespace {
    std::atomic<bool> g_shutdown_requested{false};

    void handle_shutdown_signal(int) {
        g_shutdown_requested = true;
    }

    void register_signal_handlers() {
        std::signal(SIGINT, handle_shutdown_signal);
        std::signal(SIGTERM, handle_shutdown_signal);
    }

    struct CommandLine {
        std::filesystem::path config_path;
        bool verbose = false;
        bool once = false;
        bool help = false;
    };

    CommandLine parse_command_line(int argc, char* argv[]) {
        CommandLine cli;
        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];
            if (arg == "--verbose" || arg == "-v") {
                cli.verbose = true;
            } else if (arg == "--once") {
                cli.once = true;
            } else if (arg == "--help" || arg == "-h") {
                cli.help = true;
            } else if (cli.config_path.empty()) {
                cli.config_path = std::filesystem::path(arg);
            }
        }
        return cli;
    }

    std::unique_ptr<plexwatch::utils::Logger> setup_logging(plexwatch::utils::LogLevel log_level) {
        using namespace plexwatch::utils;

        auto logger = std::make_unique<Logger>(log_level);
        logger->add_sink(std::make_unique<ConsoleSink>(true));

        std::filesystem::path log_path;
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
            log_path = std::filesystem::path(xdg) / "plexwatch" / "plexwatch.log";
        } else if (const char* home = std::getenv("HOME")) {
            log_path = std::filesystem::path(home) / ".config" / "plexwatch" / "plexwatch.log";
        }

        if (!log_path.empty()) {
            auto file_sink = std::make_unique<FileSink>(log_path);
            if (file_sink->is_open()) {
                logger->add_sink(std::move(file_sink));
                std::cerr << "Logging to: " << log_path << std::endl;
            }
        }

        return logger;
    }
} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto cli = parse_command_line(argc, argv);
    if (cli.help) {
        std::cout << "Usage: plexwatch [--verbose] [--once] [config.yaml]\n";
        return 0;
    }

    if (cli.verbose) {
        plexwatch::utils::LoggerManager::get_instance().set_level(plexwatch::utils::LogLevel::Debug);
    }

    try {
        auto config_manager = std::make_shared<plexwatch::core::ConfigManager>(cli.config_path);
        if (auto loaded = config_manager->load(); !loaded) {
            std::cerr << "Configuration error in " << config_manager->path()
                      << ", see the log above" << std::endl;
            return 1;
        }

        const auto& config = config_manager->get();
        const auto level = cli.verbose ? plexwatch::utils::LogLevel::Debug : config.log_level;
        plexwatch::utils::LoggerManager::set_instance(setup_logging(level));

        PLEXWATCH_LOG_INFO("Main", "plexwatch v" + std::string(PLEXWATCH_VERSION_STRING) + " starting...");
        PLEXWATCH_LOG_DEBUG("Main", "Log level: " + plexwatch::utils::to_string(level));

        register_signal_handlers();

        auto app_result = plexwatch::core::create_application(config_manager);
        if (!app_result) {
            PLEXWATCH_LOG_ERROR("Main", "Application creation failed");
            return 1;
        }

        auto app = std::move(*app_result);

        if (!app->initialize()) {
            PLEXWATCH_LOG_ERROR("Main", "Application initialization failed");
            return 1;
        }

        if (cli.once) {
            auto ticked = app->run_single_tick();
            app->shutdown();
            return ticked ? 0 : 1;
        }

        if (!app->start()) {
            PLEXWATCH_LOG_ERROR("Main", "Application start failed");
            return 1;
        }

        std::cout << "\nplexwatch v" << PLEXWATCH_VERSION_STRING << " running\n"
                  << "Press Ctrl+C to exit\n" << std::endl;

        while (!g_shutdown_requested && app->is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        PLEXWATCH_LOG_INFO("Main", "Shutting down...");
        app->stop();
        app->shutdown();

        PLEXWATCH_LOG_INFO("Main", "Shutdown complete");
        plexwatch::utils::LoggerManager::get_instance().flush();
        return 0;

    } catch (const std::exception& e) {
        PLEXWATCH_LOG_ERROR("Main", "Fatal: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
