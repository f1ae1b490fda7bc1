#pragma once

#include "plexwatch/utils/logger.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace plexwatch {
namespace core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ============================================================================
// Application-wide types
// ============================================================================

enum class ApplicationState {
    NotInitialized,
    Initializing,
    Running,
    Stopping,
    Stopped,
    Error
};

enum class ApplicationError {
    InitializationFailed,
    ConfigurationError,
    AlreadyRunning,
    NotInitialized
};

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    PermissionDenied
};

enum class StorageError {
    IoError,
    InvalidFormat,
    PermissionDenied
};

// ============================================================================
// Sources and snapshots
// ============================================================================

// Declaration order is the display priority of stream sources
enum class SourceKind {
    PlexStreams,
    JellyfinStreams,
    Queue,
    Uptime
};

enum class SourceError {
    Disabled,
    Unavailable,
    Unauthorized,
    MalformedResponse,
    Timeout,
    StillInFlight
};

enum class StreamSystem {
    Plex,
    Jellyfin
};

enum class MediaKind {
    Movie,
    Episode,
    Track,
    Other
};

struct StreamSession {
    StreamSystem system = StreamSystem::Plex;
    std::string raw_user;
    std::string title;
    std::string section_or_media_type;
    MediaKind media_kind = MediaKind::Other;
    double progress_fraction = 0.0;   // [0, 1]
    std::optional<std::string> quality_label;
    std::optional<std::string> player_label;
    std::optional<std::string> bitrate_label;
    bool paused = false;
    bool transcoding = false;
    std::chrono::seconds elapsed{0};
    std::chrono::seconds duration{0};

    [[nodiscard]] bool is_episode() const { return media_kind == MediaKind::Episode; }
};

struct StreamList {
    std::vector<StreamSession> sessions;
};

struct QueueItem {
    std::string raw_title;
    std::uint64_t size_bytes = 0;
    double progress_fraction = 0.0;
    double speed_bytes_per_sec = 0.0;
};

struct QueueList {
    std::vector<QueueItem> items;
    std::optional<std::uint64_t> disk_free_bytes;
    std::optional<std::uint64_t> disk_total_bytes;
    bool paused = false;
};

struct UptimeWindow {
    double percentage = 0.0;          // [0, 100]
    std::chrono::seconds duration_up{0};
};

struct UptimeStats {
    UptimeWindow last_24h;
    UptimeWindow last_7d;
    UptimeWindow last_30d;
    std::optional<TimePoint> last_down_at;
};

using SourcePayload = std::variant<StreamList, QueueList, UptimeStats>;

// One source's result for one tick. Immutable once produced.
struct SourceSnapshot {
    SourceKind kind = SourceKind::PlexStreams;
    TimePoint captured_at;
    std::optional<SourcePayload> payload;
    std::optional<SourceError> error;

    [[nodiscard]] bool ok() const { return !error.has_value(); }
    [[nodiscard]] bool is_disabled() const { return error == SourceError::Disabled; }

    static SourceSnapshot success(SourceKind kind, TimePoint at, SourcePayload data) {
        return SourceSnapshot{kind, at, std::move(data), std::nullopt};
    }

    static SourceSnapshot failure(SourceKind kind, TimePoint at, SourceError err) {
        return SourceSnapshot{kind, at, std::nullopt, err};
    }
};

// ============================================================================
// Health
// ============================================================================

enum class SourceStatus {
    Disabled,
    Ok,
    Degraded,
    Down
};

struct SourceHealth {
    int consecutive_failures = 0;
    std::optional<TimePoint> last_ok_at;
    std::optional<TimePoint> up_since;
    std::optional<SourceError> last_error;
    SourceStatus status = SourceStatus::Disabled;
};

using HealthMap = std::map<SourceKind, SourceHealth>;

// ============================================================================
// Library metadata
// ============================================================================

struct LibrarySectionConfig {
    std::string title;                 // canonical section title on the server
    std::string display_name;
    std::string emoji;
    bool show_episodes = false;
    bool include_in_presence = false;
};

struct LibrarySectionCounts {
    std::string section_key;
    std::string title;
    std::string type;                  // "movie", "show", "artist", ...
    std::uint64_t item_count = 0;
    std::optional<std::uint64_t> episode_count;
    TimePoint last_refreshed_at;
};

// Server order
using LibraryCounts = std::vector<LibrarySectionCounts>;

struct LibraryRow {
    std::string display_name;
    std::string emoji;
    std::uint64_t item_count = 0;
    std::optional<std::uint64_t> episode_count;
    bool include_in_presence = false;
};

// ============================================================================
// View model
// ============================================================================

struct ViewModel {
    std::vector<StreamSession> streams;       // display order, capped
    std::size_t total_streams = 0;            // before the cap
    std::optional<QueueList> queue;           // present iff the queue source is enabled and ok
    std::optional<UptimeStats> uptime;        // present iff the uptime source is enabled and ok
    std::vector<LibraryRow> library;
    HealthMap source_health;
    TimePoint generated_at;

    [[nodiscard]] SourceStatus status_of(SourceKind kind) const {
        auto it = source_health.find(kind);
        return it == source_health.end() ? SourceStatus::Disabled : it->second.status;
    }

    // Plex, unless Plex is disabled and Jellyfin is not
    [[nodiscard]] SourceKind primary_stream_source() const {
        if (status_of(SourceKind::PlexStreams) == SourceStatus::Disabled &&
            status_of(SourceKind::JellyfinStreams) != SourceStatus::Disabled) {
            return SourceKind::JellyfinStreams;
        }
        return SourceKind::PlexStreams;
    }

    [[nodiscard]] bool primary_down() const {
        return status_of(primary_stream_source()) == SourceStatus::Down;
    }
};

struct PublishedArtifactState {
    std::optional<std::string> artifact_id;
    std::string last_content_hash;

    bool operator==(const PublishedArtifactState&) const = default;
};

// ============================================================================
// Configuration
// ============================================================================

struct SchedulerConfig {
    std::chrono::milliseconds tick_interval{60000};
    std::chrono::milliseconds source_timeout{10000};
    int offline_threshold = 0;
    std::size_t worker_threads = 6;
};

struct DashboardConfig {
    std::string name = "Plex Dashboard";
    std::string icon_url;
    std::string footer_icon_url;
    std::size_t max_streams = 8;
    std::size_t max_downloads = 4;
};

struct LibraryConfig {
    bool show_all = true;
    std::vector<LibrarySectionConfig> sections;
    std::chrono::seconds update_interval{900};
};

struct PresenceConfig {
    std::string offline_text = "🔴 Server Offline!";
    std::string stream_text = "{count} active Stream{s} 🟢";
    std::chrono::seconds min_interval{15};
    int max_per_window = 5;
    std::chrono::seconds window{60};
};

struct TitleConfig {
    std::vector<std::string> keywords;
    std::size_t max_length = 40;
};

struct PlexConfig {
    bool enabled = false;
    std::string url;
    std::string token;
};

struct JellyfinConfig {
    bool enabled = false;
    std::string url;
    std::string api_key;
};

struct SabnzbdConfig {
    bool enabled = false;
    std::string url;
    std::string api_key;
};

struct UptimeConfig {
    bool enabled = false;
    std::string api_key;
    std::string monitor_id;
    std::string endpoint = "https://api.uptimerobot.com/v2/getMonitors";
};

struct DiscordConfig {
    std::string bot_token;
    std::string channel_id;
    std::string client_id;            // RPC application id; empty disables presence
    std::string api_base = "https://discord.com/api/v10";

    [[nodiscard]] bool presence_enabled() const { return !client_id.empty(); }
};

struct PathsConfig {
    std::filesystem::path user_mapping;
    std::filesystem::path state_file;
};

struct ApplicationConfig {
    plexwatch::utils::LogLevel log_level = plexwatch::utils::LogLevel::Info;

    SchedulerConfig scheduler;
    DashboardConfig dashboard;
    LibraryConfig library;
    PresenceConfig presence;
    TitleConfig titles;

    PlexConfig plex;
    JellyfinConfig jellyfin;
    SabnzbdConfig sabnzbd;
    UptimeConfig uptime;
    DiscordConfig discord;

    PathsConfig paths;

    // Sets each integration's enabled flag from the presence of its credentials
    void derive_enabled_flags();
};

inline std::string to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::PlexStreams: return "Plex";
        case SourceKind::JellyfinStreams: return "Jellyfin";
        case SourceKind::Queue: return "SABnzbd";
        case SourceKind::Uptime: return "UptimeRobot";
    }
    return "Unknown";
}

inline std::string to_string(SourceError error) {
    switch (error) {
        case SourceError::Disabled: return "disabled";
        case SourceError::Unavailable: return "unavailable";
        case SourceError::Unauthorized: return "unauthorized";
        case SourceError::MalformedResponse: return "malformed response";
        case SourceError::Timeout: return "timeout";
        case SourceError::StillInFlight: return "previous fetch still running";
    }
    return "unknown";
}

inline std::string to_string(SourceStatus status) {
    switch (status) {
        case SourceStatus::Disabled: return "disabled";
        case SourceStatus::Ok: return "ok";
        case SourceStatus::Degraded: return "degraded";
        case SourceStatus::Down: return "down";
    }
    return "unknown";
}

} // namespace core
} // namespace plexwatch
