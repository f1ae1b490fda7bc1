#include "plexwatch/services/sources/jellyfin_stream_source.hpp"
#include "plexwatch/utils/json_helper.hpp"
#include "plexwatch/utils/logger.hpp"
#include "plexwatch/utils/plex_headers_builder.hpp"
#include "plexwatch/utils/url_utils.hpp"
#include <algorithm>
#include <cstdio>

namespace plexwatch {
namespace services {

using json = nlohmann::json;
using utils::JsonHelper;

namespace {

// Jellyfin positions are in 100 ns ticks
constexpr std::int64_t TICKS_PER_SECOND = 10'000'000;

std::string series_name(const std::string& series) {
    std::string name = series.substr(0, series.find(':'));
    name = name.substr(0, name.find('-'));
    const auto first = name.find_first_not_of(' ');
    if (first == std::string::npos) {
        return "";
    }
    return name.substr(first, name.find_last_not_of(' ') - first + 1);
}

std::string format_title(const json& item) {
    if (JsonHelper::get_optional<std::string>(item, "Type", "") == "Episode") {
        const auto show = series_name(JsonHelper::get_optional<std::string>(item, "SeriesName", "Unknown Show"));
        char code[32];
        std::snprintf(code, sizeof(code), "S%02dE%02d",
                      JsonHelper::get_optional<int>(item, "ParentIndexNumber", 0),
                      JsonHelper::get_optional<int>(item, "IndexNumber", 0));
        return show + " - " + code;
    }

    const auto name = JsonHelper::get_optional<std::string>(item, "Name", "Unknown");
    auto year = JsonHelper::get_maybe<int>(item, "ProductionYear");
    return year ? name + " (" + std::to_string(*year) + ")" : name;
}

std::optional<std::string> video_quality(const json& item) {
    std::optional<std::string> quality;
    JsonHelper::for_each_in_array(item, "MediaStreams", [&](const json& stream) {
        if (quality || JsonHelper::get_optional<std::string>(stream, "Type", "") != "Video") {
            return;
        }
        auto height = JsonHelper::get_maybe<int>(stream, "Height");
        if (height && *height >= 2160) {
            quality = "4K";
        } else if (height && *height > 0) {
            quality = std::to_string(*height) + "p";
        }
    });
    return quality;
}

std::string format_mbps(double bits_per_second) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f Mbps", bits_per_second / 1'000'000.0);
    return buffer;
}

} // namespace

JellyfinStreamSource::JellyfinStreamSource(std::shared_ptr<HttpClient> http_client, core::JellyfinConfig config)
    : m_http_client(std::move(http_client))
    , m_config(std::move(config)) {
}

bool JellyfinStreamSource::enabled() const {
    return m_config.enabled && !m_config.url.empty() && !m_config.api_key.empty();
}

core::SourceSnapshot JellyfinStreamSource::fetch(std::chrono::milliseconds timeout) {
    const auto now = core::Clock::now();
    if (!enabled()) {
        return core::SourceSnapshot::failure(kind(), now, core::SourceError::Disabled);
    }

    HttpRequest request;
    request.url = utils::url::join(m_config.url, "/Sessions");
    request.headers = utils::PlexHeadersBuilder::create_jellyfin_headers(m_config.api_key);
    request.timeout = timeout;

    auto response = m_http_client->execute(request);
    if (!response) {
        PLEXWATCH_LOG_WARNING("JellyfinStreamSource", "Session request failed: " + to_string(response.error()));
        return core::SourceSnapshot::failure(kind(), now, source_error_from_network(response.error()));
    }
    if (!response->is_success()) {
        PLEXWATCH_LOG_WARNING("JellyfinStreamSource", "Jellyfin API returned status " + std::to_string(response->status()));
        return core::SourceSnapshot::failure(kind(), now, source_error_from_status(response->status()));
    }

    auto body = JsonHelper::safe_parse(response->body);
    if (!body || !body->is_array()) {
        PLEXWATCH_LOG_WARNING("JellyfinStreamSource", "Unexpected session response");
        return core::SourceSnapshot::failure(kind(), now, core::SourceError::MalformedResponse);
    }

    core::StreamList streams;
    try {
        for (const auto& entry : *body) {
            if (auto session = parse_session(entry)) {
                streams.sessions.push_back(std::move(*session));
            }
        }
    } catch (const json::exception& e) {
        PLEXWATCH_LOG_WARNING("JellyfinStreamSource", "Failed to parse sessions: " + std::string(e.what()));
        return core::SourceSnapshot::failure(kind(), now, core::SourceError::MalformedResponse);
    }

    PLEXWATCH_LOG_DEBUG("JellyfinStreamSource", "Found " + std::to_string(streams.sessions.size()) + " active Jellyfin sessions");
    return core::SourceSnapshot::success(kind(), now, std::move(streams));
}

std::optional<core::StreamSession> JellyfinStreamSource::parse_session(const json& session) {
    if (!JsonHelper::has_field(session, "NowPlayingItem") || !session["NowPlayingItem"].is_object()) {
        return std::nullopt;
    }
    const auto& item = session["NowPlayingItem"];
    const json play_state = JsonHelper::get_optional<json>(session, "PlayState", json::object());

    core::StreamSession result;
    result.system = core::StreamSystem::Jellyfin;
    result.raw_user = JsonHelper::get_optional<std::string>(session, "UserName", "Unknown");

    const auto type = JsonHelper::get_optional<std::string>(item, "Type", "Video");
    if (type == "Episode") {
        result.media_kind = core::MediaKind::Episode;
    } else if (type == "Movie") {
        result.media_kind = core::MediaKind::Movie;
    } else if (type == "Audio") {
        result.media_kind = core::MediaKind::Track;
    }
    result.title = format_title(item);
    result.section_or_media_type = type;

    const auto position = JsonHelper::get_optional<std::int64_t>(play_state, "PositionTicks", 0);
    const auto runtime = JsonHelper::get_optional<std::int64_t>(item, "RunTimeTicks", 0);
    result.elapsed = std::chrono::seconds(position / TICKS_PER_SECOND);
    result.duration = std::chrono::seconds(runtime / TICKS_PER_SECOND);
    if (runtime > 0) {
        result.progress_fraction = std::clamp(static_cast<double>(position) / static_cast<double>(runtime), 0.0, 1.0);
    }
    result.paused = JsonHelper::get_optional<bool>(play_state, "IsPaused", false);

    result.quality_label = video_quality(item).value_or("Video");

    const bool transcoding = JsonHelper::has_field(session, "TranscodingInfo") && session["TranscodingInfo"].is_object();
    result.transcoding = transcoding;

    double bitrate = 0.0;
    if (transcoding) {
        bitrate = JsonHelper::get_number(session["TranscodingInfo"], "Bitrate").value_or(0.0);
    }
    if (bitrate <= 0.0) {
        bitrate = JsonHelper::get_number(item, "Bitrate").value_or(0.0);
    }
    if (bitrate > 0.0) {
        result.bitrate_label = format_mbps(bitrate);
    }

    auto client = JsonHelper::get_optional<std::string>(session, "Client", "");
    if (client.empty()) {
        client = JsonHelper::get_optional<std::string>(session, "DeviceName", "");
    }
    if (!client.empty()) {
        result.player_label = client + " (JF)";
    } else {
        result.player_label = "(JF)";
    }

    return result;
}

} // namespace services
} // namespace plexwatch
