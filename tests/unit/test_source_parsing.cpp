#include <gtest/gtest.h>
#include "plexwatch/services/discord/discord_message_sink.hpp"
#include "plexwatch/services/sources/jellyfin_stream_source.hpp"
#include "plexwatch/services/sources/plex_stream_source.hpp"
#include "plexwatch/services/sources/sabnzbd_queue_source.hpp"
#include "plexwatch/services/sources/uptime_robot_source.hpp"
#include "mocks/mock_http_client.hpp"

using namespace plexwatch::core;
using namespace plexwatch::services;
using plexwatch::testing::MockHttpClient;
using nlohmann::json;
using namespace std::chrono_literals;

namespace {

constexpr std::uint64_t MiB = 1024ULL * 1024ULL;

const StreamList& streams_of(const SourceSnapshot& snapshot) {
    return std::get<StreamList>(*snapshot.payload);
}

} // namespace

// ----------------------------------------------------------------------------
// Plex
// ----------------------------------------------------------------------------

TEST(PlexStreamSourceTest, ParsesTranscodedEpisode) {
    auto metadata = json::parse(R"({
        "type": "episode",
        "title": "The Pilot",
        "grandparentTitle": "Some Show: Reloaded",
        "parentIndex": 1,
        "index": 2,
        "librarySectionTitle": "TV Shows",
        "viewOffset": 600000,
        "duration": 1200000,
        "User": {"title": "alice"},
        "Player": {"product": "Plex for Android", "state": "paused"},
        "TranscodeSession": {"bitrate": 8000},
        "Media": [{"videoResolution": "1080", "bitrate": 20000}]
    })");

    auto session = PlexStreamSource::parse_session(metadata);
    EXPECT_EQ(session.system, StreamSystem::Plex);
    EXPECT_EQ(session.media_kind, MediaKind::Episode);
    EXPECT_EQ(session.raw_user, "alice");
    EXPECT_EQ(session.title, "Some Show - S01E02");
    EXPECT_EQ(session.section_or_media_type, "TV Shows");
    EXPECT_DOUBLE_EQ(session.progress_fraction, 0.5);
    EXPECT_EQ(session.elapsed, 600s);
    EXPECT_EQ(session.duration, 1200s);
    EXPECT_TRUE(session.paused);
    EXPECT_TRUE(session.transcoding);
    EXPECT_EQ(session.quality_label, std::optional<std::string>("1080p"));
    EXPECT_EQ(session.bitrate_label, std::optional<std::string>("8.0 Mbps"));
    EXPECT_EQ(session.player_label, std::optional<std::string>("Android"));
}

TEST(PlexStreamSourceTest, ParsesDirectPlayTrack) {
    auto metadata = json::parse(R"({
        "type": "track",
        "title": "Song",
        "grandparentTitle": "Band",
        "librarySectionTitle": "Music",
        "Player": {"product": "Plexamp", "state": "playing"},
        "Media": [{"Part": [{"Stream": [
            {"streamType": 2, "bitDepth": 24, "samplingRate": 96000}
        ]}]}]
    })");

    auto session = PlexStreamSource::parse_session(metadata);
    EXPECT_EQ(session.media_kind, MediaKind::Track);
    EXPECT_EQ(session.title, "Band - Song");
    EXPECT_EQ(session.quality_label, std::optional<std::string>("24bit 96kHz"));
    EXPECT_FALSE(session.transcoding);
    EXPECT_FALSE(session.paused);
    EXPECT_FALSE(session.bitrate_label.has_value());
    EXPECT_DOUBLE_EQ(session.progress_fraction, 0.0);
}

TEST(PlexStreamSourceTest, MovieTitleCarriesYear) {
    auto session = PlexStreamSource::parse_session(json::parse(
        R"({"type": "movie", "title": "Film", "year": 1999, "Media": [{"videoResolution": "4k"}]})"));
    EXPECT_EQ(session.title, "Film (1999)");
    EXPECT_EQ(session.quality_label, std::optional<std::string>("4K"));
    EXPECT_EQ(session.section_or_media_type, "movie");
}

TEST(PlexStreamSourceTest, FetchSendsTokenAndParsesContainer) {
    auto http = std::make_shared<MockHttpClient>();
    http->respond("http://plex:32400/status/sessions", 200,
                  R"({"MediaContainer": {"size": 1, "Metadata": [{"type": "movie", "title": "Film"}]}})");

    PlexStreamSource source(http, PlexConfig{true, "http://plex:32400", "secret"});
    auto snapshot = source.fetch(5s);

    ASSERT_TRUE(snapshot.ok());
    ASSERT_EQ(streams_of(snapshot).sessions.size(), 1u);
    EXPECT_EQ(streams_of(snapshot).sessions[0].title, "Film");

    auto requests = http->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].headers.at("X-Plex-Token"), "secret");
    EXPECT_EQ(requests[0].timeout, 5000ms);
}

TEST(PlexStreamSourceTest, EmptyContainerMeansNoStreams) {
    auto http = std::make_shared<MockHttpClient>();
    http->respond("http://plex", 200, R"({"MediaContainer": {"size": 0}})");

    PlexStreamSource source(http, PlexConfig{true, "http://plex", "secret"});
    auto snapshot = source.fetch(5s);
    ASSERT_TRUE(snapshot.ok());
    EXPECT_TRUE(streams_of(snapshot).sessions.empty());
}

TEST(PlexStreamSourceTest, ErrorsMapToSourceErrors) {
    auto http = std::make_shared<MockHttpClient>();
    http->respond("http://unauthorized", 401, "");
    http->respond("http://broken", 200, "<html>");
    http->fail("http://slow", NetworkError::Timeout);

    EXPECT_EQ(PlexStreamSource(http, PlexConfig{true, "http://unauthorized", "t"}).fetch(1s).error,
              std::optional<SourceError>(SourceError::Unauthorized));
    EXPECT_EQ(PlexStreamSource(http, PlexConfig{true, "http://broken", "t"}).fetch(1s).error,
              std::optional<SourceError>(SourceError::MalformedResponse));
    EXPECT_EQ(PlexStreamSource(http, PlexConfig{true, "http://slow", "t"}).fetch(1s).error,
              std::optional<SourceError>(SourceError::Timeout));
    EXPECT_EQ(PlexStreamSource(http, PlexConfig{true, "http://nowhere", "t"}).fetch(1s).error,
              std::optional<SourceError>(SourceError::Unavailable));
}

TEST(PlexStreamSourceTest, DisabledSourceMakesNoRequest) {
    auto http = std::make_shared<MockHttpClient>();
    PlexStreamSource source(http, PlexConfig{false, "http://plex", ""});

    EXPECT_FALSE(source.enabled());
    EXPECT_EQ(source.fetch(1s).error, std::optional<SourceError>(SourceError::Disabled));
    EXPECT_TRUE(http->requests().empty());
}

// ----------------------------------------------------------------------------
// Jellyfin
// ----------------------------------------------------------------------------

TEST(JellyfinStreamSourceTest, ParsesPlayingEpisode) {
    auto entry = json::parse(R"({
        "UserName": "bob",
        "Client": "Jellyfin Web",
        "NowPlayingItem": {
            "Type": "Episode",
            "SeriesName": "Other Show",
            "ParentIndexNumber": 3,
            "IndexNumber": 10,
            "RunTimeTicks": 24000000000,
            "MediaStreams": [{"Type": "Audio"}, {"Type": "Video", "Height": 720}]
        },
        "PlayState": {"PositionTicks": 6000000000, "IsPaused": false},
        "TranscodingInfo": {"Bitrate": 4500000}
    })");

    auto session = JellyfinStreamSource::parse_session(entry);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->system, StreamSystem::Jellyfin);
    EXPECT_EQ(session->media_kind, MediaKind::Episode);
    EXPECT_EQ(session->raw_user, "bob");
    EXPECT_EQ(session->title, "Other Show - S03E10");
    EXPECT_EQ(session->section_or_media_type, "Episode");
    EXPECT_EQ(session->elapsed, 600s);
    EXPECT_EQ(session->duration, 2400s);
    EXPECT_DOUBLE_EQ(session->progress_fraction, 0.25);
    EXPECT_TRUE(session->transcoding);
    EXPECT_EQ(session->quality_label, std::optional<std::string>("720p"));
    EXPECT_EQ(session->bitrate_label, std::optional<std::string>("4.5 Mbps"));
    EXPECT_EQ(session->player_label, std::optional<std::string>("Jellyfin Web (JF)"));
}

TEST(JellyfinStreamSourceTest, IdleSessionIsSkipped) {
    EXPECT_FALSE(JellyfinStreamSource::parse_session(json::parse(R"({"UserName": "idle"})")).has_value());
}

TEST(JellyfinStreamSourceTest, FetchKeepsOnlyPlayingSessions) {
    auto http = std::make_shared<MockHttpClient>();
    http->respond("http://jf:8096/Sessions", 200, R"([
        {"UserName": "idle"},
        {"UserName": "carol", "NowPlayingItem": {"Type": "Movie", "Name": "Film", "ProductionYear": 2001}}
    ])");

    JellyfinStreamSource source(http, JellyfinConfig{true, "http://jf:8096", "key"});
    auto snapshot = source.fetch(5s);

    ASSERT_TRUE(snapshot.ok());
    ASSERT_EQ(streams_of(snapshot).sessions.size(), 1u);
    EXPECT_EQ(streams_of(snapshot).sessions[0].title, "Film (2001)");
    EXPECT_EQ(streams_of(snapshot).sessions[0].quality_label, std::optional<std::string>("Video"));
    EXPECT_EQ(http->requests()[0].headers.at("X-Emby-Token"), "key");
}

TEST(JellyfinStreamSourceTest, ObjectBodyIsMalformed) {
    auto http = std::make_shared<MockHttpClient>();
    http->respond("http://jf", 200, R"({"Items": []})");

    JellyfinStreamSource source(http, JellyfinConfig{true, "http://jf", "key"});
    EXPECT_EQ(source.fetch(1s).error, std::optional<SourceError>(SourceError::MalformedResponse));
}

// ----------------------------------------------------------------------------
// SABnzbd
// ----------------------------------------------------------------------------

TEST(SabnzbdQueueSourceTest, ParsesQueue) {
    auto body = json::parse(R"({"queue": {
        "paused": false,
        "kbpersec": "2048.00",
        "diskspace1": "100.00",
        "diskspacetotal1": "500.00",
        "slots": [
            {"filename": "Release.One", "mb": "2048", "mbleft": "1536"},
            {"filename": "Release.Two", "mb": "512", "mbleft": "512"}
        ]
    }})");

    auto queue = SabnzbdQueueSource::parse_queue(body);
    ASSERT_TRUE(queue.has_value());
    ASSERT_EQ(queue->items.size(), 2u);
    EXPECT_EQ(queue->items[0].raw_title, "Release.One");
    EXPECT_EQ(queue->items[0].size_bytes, 2048 * MiB);
    EXPECT_DOUBLE_EQ(queue->items[0].progress_fraction, 0.25);
    EXPECT_DOUBLE_EQ(queue->items[0].speed_bytes_per_sec, 2.0 * MiB);
    EXPECT_DOUBLE_EQ(queue->items[1].speed_bytes_per_sec, 0.0);
    EXPECT_DOUBLE_EQ(queue->items[1].progress_fraction, 0.0);
    EXPECT_EQ(queue->disk_free_bytes, std::optional<std::uint64_t>(100 * 1024 * MiB));
    EXPECT_EQ(queue->disk_total_bytes, std::optional<std::uint64_t>(500 * 1024 * MiB));
}

TEST(SabnzbdQueueSourceTest, PausedQueueHasNoSpeed) {
    auto queue = SabnzbdQueueSource::parse_queue(json::parse(
        R"({"queue": {"paused": true, "kbpersec": "100", "slots": [{"filename": "A", "mb": "10", "mbleft": "5"}]}})"));
    ASSERT_TRUE(queue.has_value());
    EXPECT_TRUE(queue->paused);
    EXPECT_DOUBLE_EQ(queue->items[0].speed_bytes_per_sec, 0.0);
}

TEST(SabnzbdQueueSourceTest, ApiKeyErrorIsUnauthorized) {
    auto result = SabnzbdQueueSource::parse_queue(json::parse(R"({"status": false, "error": "API Key Incorrect"})"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SourceError::Unauthorized);
}

TEST(SabnzbdQueueSourceTest, MissingQueueIsMalformed) {
    auto result = SabnzbdQueueSource::parse_queue(json::parse(R"({"version": "4.0"})"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SourceError::MalformedResponse);
}

TEST(SabnzbdQueueSourceTest, FetchPassesApiKeyInQuery) {
    auto http = std::make_shared<MockHttpClient>();
    http->respond("http://sab:8080/api?", 200, R"({"queue": {"slots": []}})");

    SabnzbdQueueSource source(http, SabnzbdConfig{true, "http://sab:8080", "abc"});
    auto snapshot = source.fetch(5s);

    ASSERT_TRUE(snapshot.ok());
    EXPECT_TRUE(std::get<QueueList>(*snapshot.payload).items.empty());
    const auto url = http->requests()[0].url;
    EXPECT_NE(url.find("mode=queue"), std::string::npos);
    EXPECT_NE(url.find("apikey=abc"), std::string::npos);
}

// ----------------------------------------------------------------------------
// UptimeRobot
// ----------------------------------------------------------------------------

TEST(UptimeRobotSourceTest, ParsesRatiosAndLastDowntime) {
    auto body = json::parse(R"({
        "stat": "ok",
        "monitors": [{
            "custom_uptime_ratio": "99.900-99.500-98.000",
            "logs": [
                {"type": 2, "datetime": 1700001000},
                {"type": 1, "datetime": 1699990000},
                {"type": 1, "datetime": 1699000000}
            ]
        }]
    })");

    auto stats = UptimeRobotSource::parse_monitor(body);
    ASSERT_TRUE(stats.has_value());
    EXPECT_DOUBLE_EQ(stats->last_24h.percentage, 99.9);
    EXPECT_EQ(stats->last_24h.duration_up, 86313s);
    EXPECT_DOUBLE_EQ(stats->last_30d.percentage, 98.0);
    EXPECT_EQ(stats->last_30d.duration_up, 2540160s);
    ASSERT_TRUE(stats->last_down_at.has_value());
    EXPECT_EQ(*stats->last_down_at, TimePoint{std::chrono::seconds{1699990000}});
}

TEST(UptimeRobotSourceTest, FailStatIsUnauthorized) {
    auto result = UptimeRobotSource::parse_monitor(
        json::parse(R"({"stat": "fail", "error": {"message": "api_key not found."}})"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SourceError::Unauthorized);
}

TEST(UptimeRobotSourceTest, MalformedRatios) {
    auto result = UptimeRobotSource::parse_monitor(
        json::parse(R"({"stat": "ok", "monitors": [{"custom_uptime_ratio": "99.9"}]})"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SourceError::MalformedResponse);

    auto empty = UptimeRobotSource::parse_monitor(json::parse(R"({"stat": "ok", "monitors": []})"));
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), SourceError::MalformedResponse);
}

TEST(UptimeRobotSourceTest, DisabledWithoutMonitorId) {
    auto http = std::make_shared<MockHttpClient>();
    UptimeConfig config;
    config.enabled = true;
    config.api_key = "key";

    UptimeRobotSource source(http, config);
    EXPECT_EQ(source.fetch(1s).error, std::optional<SourceError>(SourceError::Disabled));
    EXPECT_TRUE(http->requests().empty());
}

// ----------------------------------------------------------------------------
// Discord message sink
// ----------------------------------------------------------------------------

TEST(DiscordMessageSinkTest, StatusMapping) {
    EXPECT_EQ(DiscordMessageSink::error_from_status(404), SinkError::NotFound);
    EXPECT_EQ(DiscordMessageSink::error_from_status(401), SinkError::Unauthorized);
    EXPECT_EQ(DiscordMessageSink::error_from_status(403), SinkError::Unauthorized);
    EXPECT_EQ(DiscordMessageSink::error_from_status(429), SinkError::RateLimited);
    EXPECT_EQ(DiscordMessageSink::error_from_status(500), SinkError::BadResponse);
}

TEST(DiscordMessageSinkTest, CreatePostsToChannelAndReturnsId) {
    auto http = std::make_shared<MockHttpClient>();
    http->respond("https://discord.test/api/channels/123/messages", 200, R"({"id": "987"})");

    DiscordConfig config;
    config.bot_token = "tok";
    config.channel_id = "123";
    config.api_base = "https://discord.test/api";
    DiscordMessageSink sink(http, config);

    auto id = sink.create(R"({"embeds": []})");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "987");

    auto requests = http->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, HttpMethod::POST);
    EXPECT_EQ(requests[0].headers.at("Authorization"), "Bot tok");
}

TEST(DiscordMessageSinkTest, UpdateOfDeletedMessageIsNotFound) {
    auto http = std::make_shared<MockHttpClient>();
    http->respond("https://discord.test/api/channels/123/messages/555", 404, R"({"message": "Unknown Message"})");

    DiscordConfig config;
    config.bot_token = "tok";
    config.channel_id = "123";
    config.api_base = "https://discord.test/api";
    DiscordMessageSink sink(http, config);

    auto result = sink.update("555", "{}");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SinkError::NotFound);
    EXPECT_EQ(http->requests()[0].method, HttpMethod::PATCH);
}
