#pragma once

#include "plexwatch/services/library/library_metadata_source.hpp"
#include <mutex>
#include <optional>

namespace plexwatch {
namespace services {

/**
 * @brief Read-through cache in front of a LibraryMetadataSource
 *
 * A refresh is attempted on a miss, or once the entry is at least
 * @c update_interval old. A failed refresh serves the last known counts
 * (possibly empty) and never reports the error upward. Safe to call from
 * several threads; refreshes are serialized, and peek() never waits for a
 * refresh in progress.
 */
class LibraryCache {
public:
    LibraryCache(std::shared_ptr<LibraryMetadataSource> source,
                 std::chrono::seconds update_interval,
                 std::chrono::milliseconds fetch_timeout = std::chrono::milliseconds(10000));

    core::LibraryCounts get_section_counts(core::TimePoint now);

    // Cached counts without any refresh attempt
    core::LibraryCounts peek() const;

private:
    struct CacheEntry {
        core::LibraryCounts data;
        core::TimePoint refreshed_at;
    };

    std::shared_ptr<LibraryMetadataSource> m_source;
    std::chrono::seconds m_update_interval;
    const std::chrono::milliseconds m_fetch_timeout;
    std::optional<CacheEntry> m_entry;
    mutable std::mutex m_mutex;
    std::mutex m_refresh_mutex;

    std::optional<core::LibraryCounts> fresh_entry(core::TimePoint now) const;
};

} // namespace services
} // namespace plexwatch
