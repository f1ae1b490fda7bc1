#pragma once

#include "plexwatch/core/models.hpp"
#include "plexwatch/core/view_aggregator.hpp"
#include "plexwatch/services/dashboard/artifact_publisher.hpp"
#include "plexwatch/services/dashboard/artifact_state_store.hpp"
#include "plexwatch/services/dashboard/dashboard_renderer.hpp"
#include "plexwatch/services/library/library_cache.hpp"
#include "plexwatch/services/presence/presence_publisher.hpp"
#include "plexwatch/services/sources/source_adapter.hpp"
#include "plexwatch/utils/threading.hpp"

#include <atomic>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace plexwatch {
namespace core {

struct SchedulerComponents {
    std::vector<std::shared_ptr<services::SourceAdapter>> sources;
    std::shared_ptr<services::LibraryCache> library_cache;        // optional
    std::shared_ptr<ViewAggregator> aggregator;
    std::shared_ptr<services::DashboardRenderer> renderer;
    std::shared_ptr<services::ArtifactPublisher> publisher;
    std::shared_ptr<services::ArtifactStateStore> state_store;    // optional
    std::shared_ptr<services::PresencePublisher> presence;        // optional
    std::shared_ptr<utils::ThreadPool> pool;
};

struct TickReport {
    std::vector<SourceSnapshot> snapshots;
    std::optional<ViewModel> view;
    std::optional<services::PublishAction> publish_action;
    std::optional<services::PresenceOutcome> presence_outcome;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief The single control loop
 *
 * Each tick fans the fetches out to the worker pool, waits for all of them
 * up to one shared deadline, then aggregates, renders, publishes and
 * pushes presence on the calling thread. A source whose previous fetch is
 * still running counts as failed for the tick and is not dispatched again.
 * Ticks never overlap; an overrunning tick delays the next one.
 */
class Scheduler {
public:
    Scheduler(SchedulerComponents components, SchedulerConfig config);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Runs one full tick on the calling thread
    TickReport run_tick();

    void start();
    void stop();
    [[nodiscard]] bool is_running() const { return m_running.load(); }

    HealthMap health() const;
    PublishedArtifactState artifact_state() const;
    [[nodiscard]] std::size_t tick_count() const { return m_tick_count.load(); }

private:
    SchedulerComponents m_components;
    SchedulerConfig m_config;

    std::map<SourceKind, std::shared_ptr<std::atomic<bool>>> m_in_flight;
    std::shared_ptr<std::atomic<bool>> m_library_in_flight;

    HealthMap m_health;
    PublishedArtifactState m_state;
    mutable std::mutex m_tick_mutex;

    std::jthread m_thread;
    std::mutex m_wait_mutex;
    std::condition_variable_any m_wake;
    std::atomic<bool> m_running{false};
    std::atomic<std::size_t> m_tick_count{0};

    void run_loop(std::stop_token stop_token);

    std::vector<SourceSnapshot> collect_snapshots(std::chrono::steady_clock::time_point deadline, TimePoint now);
    std::optional<std::future<LibraryCounts>> dispatch_library(TimePoint now);
    LibraryCounts await_library(std::optional<std::future<LibraryCounts>> task,
                                std::chrono::steady_clock::time_point deadline);
    std::shared_ptr<std::atomic<bool>> in_flight_flag(SourceKind kind);
};

} // namespace core
} // namespace plexwatch
