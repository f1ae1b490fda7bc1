#include "plexwatch/core/application.hpp"
#include "plexwatch/core/scheduler.hpp"
#include "plexwatch/core/view_aggregator.hpp"
#include "plexwatch/services/dashboard/artifact_publisher.hpp"
#include "plexwatch/services/dashboard/artifact_state_store.hpp"
#include "plexwatch/services/dashboard/dashboard_renderer.hpp"
#include "plexwatch/services/discord/discord_message_sink.hpp"
#include "plexwatch/services/discord/discord_presence_sink.hpp"
#include "plexwatch/services/library/library_cache.hpp"
#include "plexwatch/services/library/library_metadata_source.hpp"
#include "plexwatch/services/network/http_client.hpp"
#include "plexwatch/services/presence/presence_publisher.hpp"
#include "plexwatch/services/sources/jellyfin_stream_source.hpp"
#include "plexwatch/services/sources/plex_stream_source.hpp"
#include "plexwatch/services/sources/sabnzbd_queue_source.hpp"
#include "plexwatch/services/sources/uptime_robot_source.hpp"
#include "plexwatch/utils/logger.hpp"
#include "plexwatch/utils/name_resolver.hpp"
#include "plexwatch/utils/threading.hpp"
#include "plexwatch/utils/title_normalizer.hpp"
#include "version.h"

#include <atomic>

namespace plexwatch {
namespace core {

class ApplicationImpl : public Application {
public:
    explicit ApplicationImpl(std::shared_ptr<ConfigManager> config_manager)
        : m_state(ApplicationState::NotInitialized),
          m_running(false),
          m_config_manager(std::move(config_manager)) {
        PLEXWATCH_LOG_DEBUG("Application", "Application created");
    }

    ~ApplicationImpl() override {
        if (m_running) {
            stop();
        }
        if (m_state != ApplicationState::Stopped && m_state != ApplicationState::NotInitialized) {
            shutdown();
        }
        PLEXWATCH_LOG_DEBUG("Application", "Application destroyed");
    }

    std::expected<void, ApplicationError> initialize() override {
        PLEXWATCH_LOG_INFO("Application", "Initializing...");

        if (m_state != ApplicationState::NotInitialized) {
            PLEXWATCH_LOG_WARNING("Application", "Already initialized");
            return std::unexpected(ApplicationError::AlreadyRunning);
        }

        m_state = ApplicationState::Initializing;

        try {
            if (!m_config_manager) {
                PLEXWATCH_LOG_ERROR("Application", "No configuration available");
                m_state = ApplicationState::Error;
                return std::unexpected(ApplicationError::ConfigurationError);
            }
            const auto& config = m_config_manager->get();

            initialize_thread_pool(config);
            initialize_http_client();
            initialize_sources(config);
            initialize_library_cache(config);

            auto aggregator = initialize_aggregator(config);
            if (!aggregator) {
                m_state = ApplicationState::Error;
                return std::unexpected(aggregator.error());
            }

            initialize_dashboard(config);
            initialize_presence(config);

            SchedulerComponents components;
            components.sources = m_sources;
            components.library_cache = m_library_cache;
            components.aggregator = std::move(*aggregator);
            components.renderer = m_renderer;
            components.publisher = m_publisher;
            components.state_store = m_state_store;
            components.presence = m_presence;
            components.pool = m_thread_pool;

            m_scheduler = std::make_unique<Scheduler>(std::move(components), config.scheduler);

            m_state = ApplicationState::Running;
            PLEXWATCH_LOG_INFO("Application", "Initialization complete");
            return {};

        } catch (const std::exception& e) {
            PLEXWATCH_LOG_ERROR("Application", "Initialization failed: " + std::string(e.what()));
            m_state = ApplicationState::Error;
            return std::unexpected(ApplicationError::InitializationFailed);
        }
    }

    std::expected<void, ApplicationError> start() override {
        PLEXWATCH_LOG_INFO("Application", "Starting scheduler...");

        if (m_state != ApplicationState::Running || !m_scheduler) {
            PLEXWATCH_LOG_ERROR("Application", "Not initialized");
            return std::unexpected(ApplicationError::NotInitialized);
        }
        if (m_running) {
            return std::unexpected(ApplicationError::AlreadyRunning);
        }

        m_scheduler->start();
        m_running = true;
        PLEXWATCH_LOG_INFO("Application", "plexwatch " + std::string(PLEXWATCH_VERSION_STRING) + " running");
        return {};
    }

    void stop() override {
        PLEXWATCH_LOG_INFO("Application", "Stopping...");
        if (m_state == ApplicationState::Running) {
            m_state = ApplicationState::Stopping;
        }
        m_running = false;
        if (m_scheduler) {
            m_scheduler->stop();
        }
    }

    void shutdown() override {
        PLEXWATCH_LOG_INFO("Application", "Shutting down...");

        if (m_scheduler) {
            m_scheduler->stop();
            m_scheduler.reset();
        }

        if (m_thread_pool) {
            m_thread_pool->shutdown();
        }

        // Clears the status line and closes the IPC socket
        m_presence.reset();
        m_presence_sink.reset();

        m_state = ApplicationState::Stopped;
        PLEXWATCH_LOG_INFO("Application", "Shutdown complete");
    }

    bool is_running() const override {
        return m_running && m_scheduler && m_scheduler->is_running();
    }

    std::expected<void, ApplicationError> run_single_tick() override {
        if (m_state != ApplicationState::Running || !m_scheduler) {
            return std::unexpected(ApplicationError::NotInitialized);
        }

        auto report = m_scheduler->run_tick();
        if (!report.view) {
            PLEXWATCH_LOG_ERROR("Application", "Tick did not produce a view");
            return std::unexpected(ApplicationError::InitializationFailed);
        }
        PLEXWATCH_LOG_INFO("Application", "Single tick finished in " +
                           std::to_string(report.duration.count()) + "ms");
        return {};
    }

private:
    void initialize_thread_pool(const ApplicationConfig& config) {
        m_thread_pool = std::make_shared<utils::ThreadPool>(config.scheduler.worker_threads, "sources");
    }

    void initialize_http_client() {
        services::HttpClientConfig http_config;
        http_config.user_agent = "plexwatch/" + std::string(PLEXWATCH_VERSION_STRING);
        m_http_client = services::create_http_client(http_config);
    }

    void initialize_sources(const ApplicationConfig& config) {
        m_sources.push_back(std::make_shared<services::PlexStreamSource>(m_http_client, config.plex));
        m_sources.push_back(std::make_shared<services::JellyfinStreamSource>(m_http_client, config.jellyfin));
        m_sources.push_back(std::make_shared<services::SabnzbdQueueSource>(m_http_client, config.sabnzbd));
        m_sources.push_back(std::make_shared<services::UptimeRobotSource>(m_http_client, config.uptime));

        for (const auto& source : m_sources) {
            PLEXWATCH_LOG_INFO("Application", to_string(source->kind()) +
                               (source->enabled() ? " enabled" : " disabled"));
        }
    }

    void initialize_library_cache(const ApplicationConfig& config) {
        if (!config.plex.enabled) {
            return;
        }
        auto metadata = std::make_shared<services::PlexLibraryMetadataSource>(
            m_http_client, config.plex, config.library);
        m_library_cache = std::make_shared<services::LibraryCache>(
            std::move(metadata), config.library.update_interval, config.scheduler.source_timeout);
    }

    std::expected<std::shared_ptr<ViewAggregator>, ApplicationError>
    initialize_aggregator(const ApplicationConfig& config) {
        auto resolver = std::make_shared<utils::NameResolver>();
        if (!config.paths.user_mapping.empty()) {
            auto loaded = utils::NameResolver::load_from_file(config.paths.user_mapping);
            if (!loaded) {
                PLEXWATCH_LOG_ERROR("Application", "Cannot load user mapping: " + config.paths.user_mapping.string());
                return std::unexpected(ApplicationError::ConfigurationError);
            }
            resolver = std::make_shared<utils::NameResolver>(std::move(*loaded));
            PLEXWATCH_LOG_INFO("Application", "Loaded " + std::to_string(resolver->size()) + " user mappings");
        }

        AggregatorConfig aggregator_config;
        aggregator_config.max_streams = config.dashboard.max_streams;
        aggregator_config.offline_threshold = config.scheduler.offline_threshold;
        aggregator_config.library = config.library;

        return std::make_shared<ViewAggregator>(
            std::move(resolver),
            utils::TitleNormalizer(config.titles.keywords, config.titles.max_length),
            std::move(aggregator_config));
    }

    void initialize_dashboard(const ApplicationConfig& config) {
        m_renderer = std::make_shared<services::DashboardRenderer>(config.dashboard, config.library);
        auto sink = std::make_shared<services::DiscordMessageSink>(m_http_client, config.discord);
        m_publisher = std::make_shared<services::ArtifactPublisher>(std::move(sink));
        m_state_store = std::make_shared<services::ArtifactStateStore>(config.paths.state_file);
        PLEXWATCH_LOG_DEBUG("Application", "Dashboard state file: " + m_state_store->path().string());
    }

    void initialize_presence(const ApplicationConfig& config) {
        if (!config.discord.presence_enabled()) {
            PLEXWATCH_LOG_INFO("Application", "No Discord client id, status line disabled");
            return;
        }
        m_presence_sink = std::make_shared<services::DiscordPresenceSink>(config.discord.client_id);
        m_presence = std::make_shared<services::PresencePublisher>(m_presence_sink, config.presence);
    }

    ApplicationState m_state;
    std::atomic<bool> m_running;

    std::shared_ptr<ConfigManager> m_config_manager;
    std::shared_ptr<utils::ThreadPool> m_thread_pool;
    std::shared_ptr<services::HttpClient> m_http_client;

    std::vector<std::shared_ptr<services::SourceAdapter>> m_sources;
    std::shared_ptr<services::LibraryCache> m_library_cache;
    std::shared_ptr<services::DashboardRenderer> m_renderer;
    std::shared_ptr<services::ArtifactPublisher> m_publisher;
    std::shared_ptr<services::ArtifactStateStore> m_state_store;
    std::shared_ptr<services::PresenceSink> m_presence_sink;
    std::shared_ptr<services::PresencePublisher> m_presence;

    std::unique_ptr<Scheduler> m_scheduler;
};

std::expected<std::unique_ptr<Application>, ApplicationError>
create_application(std::shared_ptr<ConfigManager> config_manager) {
    try {
        return std::make_unique<ApplicationImpl>(std::move(config_manager));
    } catch (const std::exception& e) {
        PLEXWATCH_LOG_ERROR("Application", "Failed to create application: " + std::string(e.what()));
        return std::unexpected(ApplicationError::InitializationFailed);
    }
}

} // namespace core
} // namespace plexwatch
