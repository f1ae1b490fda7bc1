#pragma once

#include "plexwatch/core/models.hpp"
#include "plexwatch/services/network/http_client.hpp"
#include <chrono>
#include <expected>
#include <memory>

namespace plexwatch {
namespace services {

// Section names and item counts, which change far slower than sessions
class LibraryMetadataSource {
public:
    virtual ~LibraryMetadataSource() = default;
    virtual std::expected<core::LibraryCounts, core::SourceError>
    fetch_counts(std::chrono::milliseconds timeout) = 0;
};

class PlexLibraryMetadataSource : public LibraryMetadataSource {
public:
    PlexLibraryMetadataSource(std::shared_ptr<HttpClient> http_client,
                              core::PlexConfig plex,
                              core::LibraryConfig library);

    std::expected<core::LibraryCounts, core::SourceError>
    fetch_counts(std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<HttpClient> m_http_client;
    core::PlexConfig m_plex;
    core::LibraryConfig m_library;

    std::expected<std::uint64_t, core::SourceError>
    fetch_total_size(const std::string& section_key, const std::string& extra_query,
                     std::chrono::milliseconds timeout);
    bool wants_episodes(const std::string& title) const;
};

} // namespace services
} // namespace plexwatch
