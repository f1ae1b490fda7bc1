#include "plexwatch/core/scheduler.hpp"
#include "plexwatch/utils/logger.hpp"
#include <stdexcept>

namespace plexwatch {
namespace core {

namespace {

// Clears an in-flight flag when the fetch task ends, however it ends
struct InFlightGuard {
    std::shared_ptr<std::atomic<bool>> flag;
    ~InFlightGuard() { flag->store(false); }
};

} // namespace

Scheduler::Scheduler(SchedulerComponents components, SchedulerConfig config)
    : m_components(std::move(components))
    , m_config(config)
    , m_library_in_flight(std::make_shared<std::atomic<bool>>(false)) {

    if (!m_components.aggregator || !m_components.renderer || !m_components.publisher || !m_components.pool) {
        throw std::invalid_argument("Scheduler requires an aggregator, renderer, publisher and worker pool");
    }

    for (const auto& source : m_components.sources) {
        m_in_flight.emplace(source->kind(), std::make_shared<std::atomic<bool>>(false));
    }

    if (m_components.state_store) {
        m_state = m_components.state_store->load();
        if (m_state.artifact_id) {
            PLEXWATCH_LOG_INFO("Scheduler", "Resuming dashboard message " + *m_state.artifact_id);
        }
    }
}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    if (m_running.exchange(true)) {
        PLEXWATCH_LOG_WARNING("Scheduler", "Scheduler already running");
        return;
    }

    PLEXWATCH_LOG_INFO("Scheduler", "Starting scheduler, tick interval " +
                       std::to_string(m_config.tick_interval.count()) + "ms");
    m_thread = std::jthread([this](std::stop_token stop_token) {
        run_loop(stop_token);
    });
}

void Scheduler::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    PLEXWATCH_LOG_INFO("Scheduler", "Stopping scheduler");
    m_thread.request_stop();
    m_wake.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void Scheduler::run_loop(std::stop_token stop_token) {
    auto next_tick = std::chrono::steady_clock::now();

    while (!stop_token.stop_requested()) {
        run_tick();

        next_tick += m_config.tick_interval;
        const auto now = std::chrono::steady_clock::now();
        if (next_tick < now) {
            PLEXWATCH_LOG_DEBUG("Scheduler", "Tick overran its interval, starting the next one now");
            next_tick = now;
        }

        std::unique_lock lock(m_wait_mutex);
        m_wake.wait_until(lock, stop_token, next_tick, [] { return false; });
    }

    PLEXWATCH_LOG_DEBUG("Scheduler", "Scheduler loop exited");
}

TickReport Scheduler::run_tick() {
    std::lock_guard<std::mutex> tick_lock(m_tick_mutex);

    const auto started = std::chrono::steady_clock::now();
    const auto now = Clock::now();
    const auto deadline = started + m_config.source_timeout;
    const auto tick = ++m_tick_count;

    PLEXWATCH_LOG_DEBUG("Scheduler", "Tick " + std::to_string(tick) + " started");

    TickReport report;
    try {
        // The library refresh shares the source deadline and runs alongside the fetches
        auto library_task = dispatch_library(now);
        report.snapshots = collect_snapshots(deadline, now);
        const auto library = await_library(std::move(library_task), deadline);

        auto view = m_components.aggregator->aggregate(report.snapshots, library, m_health, now);
        m_health = view.source_health;

        const auto rendered = m_components.renderer->render(view);
        auto result = m_components.publisher->publish(rendered, m_state);
        report.publish_action = result.action;

        if (result.state != m_state) {
            m_state = result.state;
            if (m_components.state_store) {
                auto saved = m_components.state_store->save(m_state);
                if (!saved) {
                    PLEXWATCH_LOG_ERROR("Scheduler", "Failed to persist dashboard state");
                }
            }
        }

        if (m_components.presence) {
            report.presence_outcome = m_components.presence->publish(view);
        }

        report.view = std::move(view);
    } catch (const std::exception& e) {
        PLEXWATCH_LOG_ERROR("Scheduler", "Tick " + std::to_string(tick) + " failed: " + std::string(e.what()));
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    PLEXWATCH_LOG_DEBUG("Scheduler", "Tick " + std::to_string(tick) + " finished in " +
                        std::to_string(report.duration.count()) + "ms");
    return report;
}

std::vector<SourceSnapshot> Scheduler::collect_snapshots(std::chrono::steady_clock::time_point deadline,
                                                         TimePoint now) {
    struct Pending {
        SourceKind kind;
        std::future<SourceSnapshot> future;
    };

    std::vector<SourceSnapshot> snapshots;
    std::vector<Pending> pending;

    for (const auto& source : m_components.sources) {
        const auto kind = source->kind();
        if (!source->enabled()) {
            snapshots.push_back(SourceSnapshot::failure(kind, now, SourceError::Disabled));
            continue;
        }

        auto flag = in_flight_flag(kind);
        if (flag->exchange(true)) {
            PLEXWATCH_LOG_WARNING("Scheduler", to_string(kind) + " fetch from an earlier tick is still running");
            snapshots.push_back(SourceSnapshot::failure(kind, now, SourceError::StillInFlight));
            continue;
        }

        const auto timeout = m_config.source_timeout;
        auto submitted = m_components.pool->try_submit([source, flag, timeout]() {
            InFlightGuard guard{flag};
            return source->fetch(timeout);
        });

        if (!submitted) {
            flag->store(false);
            PLEXWATCH_LOG_ERROR("Scheduler", "Could not dispatch " + to_string(kind) + " fetch");
            snapshots.push_back(SourceSnapshot::failure(kind, now, SourceError::Unavailable));
            continue;
        }
        pending.push_back(Pending{kind, std::move(*submitted)});
    }

    for (auto& entry : pending) {
        if (entry.future.wait_until(deadline) != std::future_status::ready) {
            PLEXWATCH_LOG_WARNING("Scheduler", to_string(entry.kind) + " fetch timed out (" +
                                  std::to_string(m_components.pool->pending()) + " queued)");
            snapshots.push_back(SourceSnapshot::failure(entry.kind, now, SourceError::Timeout));
            continue;
        }

        try {
            snapshots.push_back(entry.future.get());
        } catch (const std::exception& e) {
            PLEXWATCH_LOG_ERROR("Scheduler", to_string(entry.kind) + " fetch failed: " + std::string(e.what()));
            snapshots.push_back(SourceSnapshot::failure(entry.kind, now, SourceError::Unavailable));
        }
    }

    return snapshots;
}

std::optional<std::future<LibraryCounts>> Scheduler::dispatch_library(TimePoint now) {
    auto cache = m_components.library_cache;
    if (!cache || m_library_in_flight->exchange(true)) {
        return std::nullopt;
    }

    auto flag = m_library_in_flight;
    auto submitted = m_components.pool->try_submit([cache, flag, now]() {
        InFlightGuard guard{flag};
        return cache->get_section_counts(now);
    });
    if (!submitted) {
        flag->store(false);
        return std::nullopt;
    }
    return std::move(*submitted);
}

LibraryCounts Scheduler::await_library(std::optional<std::future<LibraryCounts>> task,
                                       std::chrono::steady_clock::time_point deadline) {
    auto cache = m_components.library_cache;
    if (!cache) {
        return {};
    }
    if (!task) {
        return cache->peek();
    }

    if (task->wait_until(deadline) != std::future_status::ready) {
        PLEXWATCH_LOG_WARNING("Scheduler", "Library refresh still running, using cached counts");
        return cache->peek();
    }

    try {
        return task->get();
    } catch (const std::exception& e) {
        PLEXWATCH_LOG_ERROR("Scheduler", "Library refresh failed: " + std::string(e.what()));
        return cache->peek();
    }
}

std::shared_ptr<std::atomic<bool>> Scheduler::in_flight_flag(SourceKind kind) {
    auto it = m_in_flight.find(kind);
    if (it == m_in_flight.end()) {
        it = m_in_flight.emplace(kind, std::make_shared<std::atomic<bool>>(false)).first;
    }
    return it->second;
}

HealthMap Scheduler::health() const {
    std::lock_guard<std::mutex> lock(m_tick_mutex);
    return m_health;
}

PublishedArtifactState Scheduler::artifact_state() const {
    std::lock_guard<std::mutex> lock(m_tick_mutex);
    return m_state;
}

} // namespace core
} // namespace plexwatch
