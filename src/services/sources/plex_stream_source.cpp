#include "plexwatch/services/sources/plex_stream_source.hpp"
#include "plexwatch/utils/json_helper.hpp"
#include "plexwatch/utils/logger.hpp"
#include "plexwatch/utils/plex_headers_builder.hpp"
#include "plexwatch/utils/url_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace plexwatch {
namespace services {

using json = nlohmann::json;
using utils::JsonHelper;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

// "Show: The Subtitle - Part" -> "Show"
std::string series_name(const std::string& grandparent_title) {
    std::string name = grandparent_title.substr(0, grandparent_title.find(':'));
    name = name.substr(0, name.find('-'));
    return trim(name);
}

std::string episode_code(int season, int episode) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "S%02dE%02d", season, episode);
    return buffer;
}

std::string format_title(const json& metadata, core::MediaKind kind) {
    const auto title = JsonHelper::get_optional<std::string>(metadata, "title", "");

    switch (kind) {
        case core::MediaKind::Track: {
            const auto artist = JsonHelper::get_optional<std::string>(metadata, "grandparentTitle", "Unknown Artist");
            return artist + " - " + title;
        }
        case core::MediaKind::Episode: {
            const auto show = series_name(JsonHelper::get_optional<std::string>(metadata, "grandparentTitle", ""));
            auto season = JsonHelper::get_maybe<int>(metadata, "parentIndex");
            auto episode = JsonHelper::get_maybe<int>(metadata, "index");
            if (season && episode) {
                return show + " - " + episode_code(*season, *episode);
            }
            return show.empty() ? title : show;
        }
        default: {
            auto year = JsonHelper::get_maybe<int>(metadata, "year");
            return year && *year > 0 ? title + " (" + std::to_string(*year) + ")" : title;
        }
    }
}

std::string format_mbps(double kbps) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f Mbps", kbps / 1000.0);
    return buffer;
}

std::optional<std::string> video_quality(const json& media) {
    auto resolution = JsonHelper::get_maybe<std::string>(media, "videoResolution");
    if (!resolution || resolution->empty()) {
        return std::nullopt;
    }
    std::string lower = *resolution;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "4k") {
        return "4K";
    }
    if (lower == "sd") {
        return "SD";
    }
    if (lower.back() == 'p') {
        return lower;
    }
    return lower + "p";
}

std::string audio_quality(const json& media) {
    if (!JsonHelper::has_array(media, "Part") || media["Part"].empty()) {
        return "Audio";
    }

    std::string quality;
    JsonHelper::for_each_in_array(media["Part"][0], "Stream", [&](const json& stream) {
        if (!quality.empty() || JsonHelper::get_optional<int>(stream, "streamType", 0) != 2) {
            return;
        }
        if (auto depth = JsonHelper::get_maybe<int>(stream, "bitDepth")) {
            quality = std::to_string(*depth) + "bit";
        }
        if (auto rate = JsonHelper::get_maybe<int>(stream, "samplingRate")) {
            if (!quality.empty()) {
                quality += " ";
            }
            quality += std::to_string(*rate / 1000) + "kHz";
        }
    });
    return quality.empty() ? "Audio" : quality;
}

std::string player_name(std::string product) {
    const std::string prefix = "Plex for ";
    if (product.starts_with(prefix)) {
        product.erase(0, prefix.size());
    }
    if (product == "Infuse-Library") {
        product = "Infuse";
    }
    return product;
}

} // namespace

PlexStreamSource::PlexStreamSource(std::shared_ptr<HttpClient> http_client, core::PlexConfig config)
    : m_http_client(std::move(http_client))
    , m_config(std::move(config)) {
}

bool PlexStreamSource::enabled() const {
    return m_config.enabled && !m_config.url.empty() && !m_config.token.empty();
}

core::SourceSnapshot PlexStreamSource::fetch(std::chrono::milliseconds timeout) {
    const auto now = core::Clock::now();
    if (!enabled()) {
        return core::SourceSnapshot::failure(kind(), now, core::SourceError::Disabled);
    }

    HttpRequest request;
    request.url = utils::url::join(m_config.url, "/status/sessions");
    request.headers = utils::PlexHeadersBuilder::create_plex_headers(m_config.token);
    request.timeout = timeout;

    auto response = m_http_client->execute(request);
    if (!response) {
        PLEXWATCH_LOG_WARNING("PlexStreamSource", "Session request failed: " + to_string(response.error()));
        return core::SourceSnapshot::failure(kind(), now, source_error_from_network(response.error()));
    }
    if (!response->is_success()) {
        PLEXWATCH_LOG_WARNING("PlexStreamSource", "Session request returned HTTP " + std::to_string(response->status()));
        return core::SourceSnapshot::failure(kind(), now, source_error_from_status(response->status()));
    }

    auto body = JsonHelper::safe_parse(response->body);
    if (!body || !body->contains("MediaContainer") || !(*body)["MediaContainer"].is_object()) {
        PLEXWATCH_LOG_WARNING("PlexStreamSource", "Unexpected session response");
        return core::SourceSnapshot::failure(kind(), now, core::SourceError::MalformedResponse);
    }

    core::StreamList streams;
    try {
        JsonHelper::for_each_in_array((*body)["MediaContainer"], "Metadata", [&](const json& metadata) {
            streams.sessions.push_back(parse_session(metadata));
        });
    } catch (const json::exception& e) {
        PLEXWATCH_LOG_WARNING("PlexStreamSource", "Failed to parse sessions: " + std::string(e.what()));
        return core::SourceSnapshot::failure(kind(), now, core::SourceError::MalformedResponse);
    }

    PLEXWATCH_LOG_DEBUG("PlexStreamSource", "Found " + std::to_string(streams.sessions.size()) + " active sessions");
    return core::SourceSnapshot::success(kind(), now, std::move(streams));
}

core::StreamSession PlexStreamSource::parse_session(const json& metadata) {
    core::StreamSession session;
    session.system = core::StreamSystem::Plex;

    const auto type = JsonHelper::get_optional<std::string>(metadata, "type", "");
    if (type == "movie") {
        session.media_kind = core::MediaKind::Movie;
    } else if (type == "episode") {
        session.media_kind = core::MediaKind::Episode;
    } else if (type == "track") {
        session.media_kind = core::MediaKind::Track;
    }

    if (metadata.contains("User")) {
        session.raw_user = JsonHelper::get_optional<std::string>(metadata["User"], "title", "");
    }
    session.title = format_title(metadata, session.media_kind);
    session.section_or_media_type = JsonHelper::get_optional<std::string>(metadata, "librarySectionTitle", type);

    const auto offset_ms = JsonHelper::get_optional<std::int64_t>(metadata, "viewOffset", 0);
    const auto duration_ms = JsonHelper::get_optional<std::int64_t>(metadata, "duration", 0);
    session.elapsed = std::chrono::seconds(offset_ms / 1000);
    session.duration = std::chrono::seconds(duration_ms / 1000);
    if (duration_ms > 0) {
        session.progress_fraction = std::clamp(static_cast<double>(offset_ms) / static_cast<double>(duration_ms), 0.0, 1.0);
    }

    if (metadata.contains("Player") && metadata["Player"].is_object()) {
        const auto& player = metadata["Player"];
        auto product = JsonHelper::get_maybe<std::string>(player, "product");
        if (product && !product->empty()) {
            session.player_label = player_name(*product);
        }
        session.paused = JsonHelper::get_optional<std::string>(player, "state", "") == "paused";
    }

    std::optional<double> bitrate_kbps;
    if (metadata.contains("TranscodeSession") && metadata["TranscodeSession"].is_object()) {
        session.transcoding = true;
        bitrate_kbps = JsonHelper::get_number(metadata["TranscodeSession"], "bitrate");
    }

    if (JsonHelper::has_array(metadata, "Media") && !metadata["Media"].empty()) {
        const auto& media = metadata["Media"][0];
        if (session.media_kind == core::MediaKind::Track) {
            session.quality_label = audio_quality(media);
        } else {
            session.quality_label = video_quality(media);
        }
        if (!bitrate_kbps) {
            bitrate_kbps = JsonHelper::get_number(media, "bitrate");
        }
    }

    if (bitrate_kbps && *bitrate_kbps > 0) {
        session.bitrate_label = format_mbps(*bitrate_kbps);
    }

    return session;
}

} // namespace services
} // namespace plexwatch
