#include "plexwatch/services/library/library_cache.hpp"
#include "plexwatch/utils/logger.hpp"

namespace plexwatch {
namespace services {

LibraryCache::LibraryCache(std::shared_ptr<LibraryMetadataSource> source,
                           std::chrono::seconds update_interval,
                           std::chrono::milliseconds fetch_timeout)
    : m_source(std::move(source))
    , m_update_interval(update_interval)
    , m_fetch_timeout(fetch_timeout) {
    PLEXWATCH_LOG_DEBUG("LibraryCache", "Update interval " + std::to_string(m_update_interval.count()) + "s");
}

core::LibraryCounts LibraryCache::get_section_counts(core::TimePoint now) {
    if (auto cached = fresh_entry(now)) {
        return std::move(*cached);
    }

    std::lock_guard<std::mutex> refresh_lock(m_refresh_mutex);

    // Another caller may have refreshed while we waited
    if (auto cached = fresh_entry(now)) {
        return std::move(*cached);
    }

    if (!m_source) {
        return peek();
    }

    auto result = m_source->fetch_counts(m_fetch_timeout);
    if (!result) {
        if (result.error() != core::SourceError::Disabled) {
            PLEXWATCH_LOG_WARNING("LibraryCache", "Library refresh failed (" + core::to_string(result.error()) +
                                  "), serving last known counts");
        }
        return peek();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entry = CacheEntry{std::move(*result), now};
    return m_entry->data;
}

core::LibraryCounts LibraryCache::peek() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entry ? m_entry->data : core::LibraryCounts{};
}

std::optional<core::LibraryCounts> LibraryCache::fresh_entry(core::TimePoint now) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entry && now - m_entry->refreshed_at < m_update_interval) {
        return m_entry->data;
    }
    return std::nullopt;
}

} // namespace services
} // namespace plexwatch
