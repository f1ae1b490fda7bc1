#pragma once

#include "plexwatch/core/models.hpp"
#include "plexwatch/utils/name_resolver.hpp"
#include "plexwatch/utils/title_normalizer.hpp"
#include <memory>
#include <vector>

namespace plexwatch {
namespace core {

struct AggregatorConfig {
    std::size_t max_streams = 8;
    int offline_threshold = 0;
    LibraryConfig library;
};

/**
 * @brief Folds one tick of snapshots into an immutable ViewModel
 *
 * Streams are merged in SourceKind declaration order, then arrival order,
 * and capped at @c max_streams. Health carries over from the previous tick:
 * a source with more than @c offline_threshold consecutive failures is Down,
 * a failing source at or below it is Degraded. Disabled sources never count
 * as failures.
 */
class ViewAggregator {
public:
    ViewAggregator(std::shared_ptr<const utils::NameResolver> resolver,
                   utils::TitleNormalizer normalizer,
                   AggregatorConfig config);

    ViewModel aggregate(const std::vector<SourceSnapshot>& snapshots,
                        const LibraryCounts& library,
                        const HealthMap& previous_health,
                        TimePoint now) const;

    SourceHealth next_health(const SourceSnapshot& snapshot,
                             const std::optional<SourceHealth>& previous,
                             TimePoint now) const;

    std::vector<LibraryRow> build_library_rows(const LibraryCounts& library) const;

private:
    std::shared_ptr<const utils::NameResolver> m_resolver;
    utils::TitleNormalizer m_normalizer;
    AggregatorConfig m_config;
};

} // namespace core
} // namespace plexwatch
