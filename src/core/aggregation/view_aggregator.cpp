#include "plexwatch/core/view_aggregator.hpp"
#include "plexwatch/utils/logger.hpp"
#include <algorithm>
#include <type_traits>

namespace plexwatch {
namespace core {

namespace {
    const std::string DEFAULT_SECTION_EMOJI = "🎬";
}

ViewAggregator::ViewAggregator(std::shared_ptr<const utils::NameResolver> resolver,
                               utils::TitleNormalizer normalizer,
                               AggregatorConfig config)
    : m_resolver(std::move(resolver))
    , m_normalizer(std::move(normalizer))
    , m_config(std::move(config)) {
}

ViewModel ViewAggregator::aggregate(const std::vector<SourceSnapshot>& snapshots,
                                    const LibraryCounts& library,
                                    const HealthMap& previous_health,
                                    TimePoint now) const {
    ViewModel view;
    view.generated_at = now;
    view.source_health = previous_health;

    std::vector<const SourceSnapshot*> ordered;
    ordered.reserve(snapshots.size());
    for (const auto& snapshot : snapshots) {
        ordered.push_back(&snapshot);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const SourceSnapshot* a, const SourceSnapshot* b) { return a->kind < b->kind; });

    std::vector<StreamSession> merged;

    for (const auto* snapshot : ordered) {
        std::optional<SourceHealth> previous;
        if (auto it = previous_health.find(snapshot->kind); it != previous_health.end()) {
            previous = it->second;
        }
        view.source_health[snapshot->kind] = next_health(*snapshot, previous, now);

        if (!snapshot->ok() || !snapshot->payload) {
            continue;
        }

        std::visit([&](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, StreamList>) {
                for (const auto& session : payload.sessions) {
                    StreamSession entry = session;
                    entry.raw_user = m_resolver ? m_resolver->resolve(session.raw_user) : session.raw_user;
                    entry.title = m_normalizer.normalize(session.title);
                    merged.push_back(std::move(entry));
                }
            } else if constexpr (std::is_same_v<T, QueueList>) {
                QueueList queue = payload;
                for (auto& item : queue.items) {
                    item.raw_title = m_normalizer.normalize(item.raw_title);
                }
                view.queue = std::move(queue);
            } else if constexpr (std::is_same_v<T, UptimeStats>) {
                view.uptime = payload;
            }
        }, *snapshot->payload);
    }

    view.total_streams = merged.size();
    if (merged.size() > m_config.max_streams) {
        PLEXWATCH_LOG_DEBUG("ViewAggregator", "Dropping " + std::to_string(merged.size() - m_config.max_streams) +
                            " streams over the display limit");
        merged.resize(m_config.max_streams);
    }
    view.streams = std::move(merged);
    view.library = build_library_rows(library);

    return view;
}

SourceHealth ViewAggregator::next_health(const SourceSnapshot& snapshot,
                                         const std::optional<SourceHealth>& previous,
                                         TimePoint now) const {
    SourceHealth health;
    if (snapshot.is_disabled()) {
        health.status = SourceStatus::Disabled;
        return health;
    }

    if (snapshot.ok()) {
        health.consecutive_failures = 0;
        health.last_ok_at = now;
        const bool was_ok = previous && previous->status == SourceStatus::Ok && previous->up_since;
        health.up_since = was_ok ? previous->up_since : std::optional<TimePoint>(now);
        health.status = SourceStatus::Ok;
        return health;
    }

    if (previous) {
        health.last_ok_at = previous->last_ok_at;
        health.up_since = previous->up_since;
        health.consecutive_failures = previous->consecutive_failures;
    }
    health.consecutive_failures += 1;
    health.last_error = snapshot.error;
    health.status = health.consecutive_failures > m_config.offline_threshold
        ? SourceStatus::Down
        : SourceStatus::Degraded;

    if (!previous || previous->status != health.status) {
        PLEXWATCH_LOG_WARNING("ViewAggregator", to_string(snapshot.kind) + " is now " + to_string(health.status) +
                              " (" + to_string(*snapshot.error) + ")");
    }
    return health;
}

std::vector<LibraryRow> ViewAggregator::build_library_rows(const LibraryCounts& library) const {
    std::vector<LibraryRow> rows;

    auto find_counts = [&library](const std::string& title) -> const LibrarySectionCounts* {
        auto it = std::find_if(library.begin(), library.end(),
            [&title](const LibrarySectionCounts& counts) { return counts.title == title; });
        return it == library.end() ? nullptr : &*it;
    };

    for (const auto& section : m_config.library.sections) {
        const auto* counts = find_counts(section.title);
        if (!counts) {
            continue;
        }
        LibraryRow row;
        row.display_name = section.display_name.empty() ? section.title : section.display_name;
        row.emoji = section.emoji;
        row.item_count = counts->item_count;
        if (section.show_episodes) {
            row.episode_count = counts->episode_count;
        }
        row.include_in_presence = section.include_in_presence;
        rows.push_back(std::move(row));
    }

    if (m_config.library.show_all) {
        for (const auto& counts : library) {
            const bool configured = std::any_of(m_config.library.sections.begin(), m_config.library.sections.end(),
                [&counts](const LibrarySectionConfig& cfg) { return cfg.title == counts.title; });
            if (configured) {
                continue;
            }
            LibraryRow row;
            row.display_name = counts.title;
            row.emoji = DEFAULT_SECTION_EMOJI;
            row.item_count = counts.item_count;
            rows.push_back(std::move(row));
        }
    }

    return rows;
}

} // namespace core
} // namespace plexwatch
