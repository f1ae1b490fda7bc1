#include "plexwatch/services/library/library_metadata_source.hpp"
#include "plexwatch/services/sources/source_adapter.hpp"
#include "plexwatch/utils/json_helper.hpp"
#include "plexwatch/utils/logger.hpp"
#include "plexwatch/utils/plex_headers_builder.hpp"
#include "plexwatch/utils/url_utils.hpp"
#include <algorithm>

namespace plexwatch {
namespace services {

using json = nlohmann::json;
using utils::JsonHelper;

namespace {
    // Plex metadata type for episodes
    constexpr const char* EPISODE_TYPE = "4";
}

PlexLibraryMetadataSource::PlexLibraryMetadataSource(std::shared_ptr<HttpClient> http_client,
                                                     core::PlexConfig plex,
                                                     core::LibraryConfig library)
    : m_http_client(std::move(http_client))
    , m_plex(std::move(plex))
    , m_library(std::move(library)) {
}

std::expected<core::LibraryCounts, core::SourceError>
PlexLibraryMetadataSource::fetch_counts(std::chrono::milliseconds timeout) {
    if (!m_plex.enabled) {
        return std::unexpected(core::SourceError::Disabled);
    }

    PLEXWATCH_LOG_DEBUG("PlexLibrary", "Refreshing library section counts");

    HttpRequest request;
    request.url = utils::url::join(m_plex.url, "/library/sections");
    request.headers = utils::PlexHeadersBuilder::create_plex_headers(m_plex.token);
    request.timeout = timeout;

    auto response = m_http_client->execute(request);
    if (!response) {
        PLEXWATCH_LOG_WARNING("PlexLibrary", "Failed to list library sections: " + to_string(response.error()));
        return std::unexpected(source_error_from_network(response.error()));
    }
    if (!response->is_success()) {
        PLEXWATCH_LOG_WARNING("PlexLibrary", "Library sections returned HTTP " + std::to_string(response->status()));
        return std::unexpected(source_error_from_status(response->status()));
    }

    auto body = JsonHelper::safe_parse(response->body);
    if (!body || !JsonHelper::has_field(*body, "MediaContainer")) {
        PLEXWATCH_LOG_WARNING("PlexLibrary", "Unexpected library sections response");
        return std::unexpected(core::SourceError::MalformedResponse);
    }

    struct SectionRef {
        std::string key;
        std::string title;
        std::string type;
    };
    std::vector<SectionRef> sections;
    JsonHelper::for_each_in_array((*body)["MediaContainer"], "Directory", [&](const json& directory) {
        SectionRef ref;
        ref.key = JsonHelper::get_optional<std::string>(directory, "key", "");
        ref.title = JsonHelper::get_optional<std::string>(directory, "title", "");
        ref.type = JsonHelper::get_optional<std::string>(directory, "type", "");
        if (!ref.key.empty()) {
            sections.push_back(std::move(ref));
        }
    });

    const auto now = core::Clock::now();
    core::LibraryCounts counts;
    for (const auto& section : sections) {
        const bool configured = std::any_of(m_library.sections.begin(), m_library.sections.end(),
            [&](const core::LibrarySectionConfig& cfg) { return cfg.title == section.title; });
        if (!configured && !m_library.show_all) {
            continue;
        }

        auto total = fetch_total_size(section.key, "", timeout);
        if (!total) {
            return std::unexpected(total.error());
        }

        core::LibrarySectionCounts entry;
        entry.section_key = section.key;
        entry.title = section.title;
        entry.type = section.type;
        entry.item_count = *total;
        entry.last_refreshed_at = now;

        if (section.type == "show" && wants_episodes(section.title)) {
            auto episodes = fetch_total_size(section.key, EPISODE_TYPE, timeout);
            if (!episodes) {
                return std::unexpected(episodes.error());
            }
            entry.episode_count = *episodes;
        }

        counts.push_back(std::move(entry));
    }

    PLEXWATCH_LOG_INFO("PlexLibrary", "Library counts refreshed for " + std::to_string(counts.size()) + " sections");
    return counts;
}

std::expected<std::uint64_t, core::SourceError>
PlexLibraryMetadataSource::fetch_total_size(const std::string& section_key, const std::string& extra_query,
                                            std::chrono::milliseconds timeout) {
    utils::url::QueryParams params = {
        {"X-Plex-Container-Start", "0"},
        {"X-Plex-Container-Size", "0"}
    };
    if (!extra_query.empty()) {
        params.emplace_back("type", extra_query);
    }

    HttpRequest request;
    request.url = utils::url::with_query(m_plex.url, "/library/sections/" + section_key + "/all", params);
    request.headers = utils::PlexHeadersBuilder::create_plex_headers(m_plex.token);
    request.timeout = timeout;

    auto response = m_http_client->execute(request);
    if (!response) {
        return std::unexpected(source_error_from_network(response.error()));
    }
    if (!response->is_success()) {
        return std::unexpected(source_error_from_status(response->status()));
    }

    auto body = JsonHelper::safe_parse(response->body);
    if (!body || !JsonHelper::has_field(*body, "MediaContainer")) {
        return std::unexpected(core::SourceError::MalformedResponse);
    }

    const auto& container = (*body)["MediaContainer"];
    auto total = JsonHelper::get_number(container, "totalSize");
    if (!total) {
        total = JsonHelper::get_number(container, "size");
    }
    if (!total || *total < 0) {
        return std::unexpected(core::SourceError::MalformedResponse);
    }
    return static_cast<std::uint64_t>(*total);
}

bool PlexLibraryMetadataSource::wants_episodes(const std::string& title) const {
    return std::any_of(m_library.sections.begin(), m_library.sections.end(),
        [&](const core::LibrarySectionConfig& cfg) { return cfg.title == title && cfg.show_episodes; });
}

} // namespace services
} // namespace plexwatch
