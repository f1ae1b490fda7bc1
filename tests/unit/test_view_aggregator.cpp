#include <gtest/gtest.h>
#include "plexwatch/core/view_aggregator.hpp"

using namespace plexwatch::core;
using plexwatch::utils::NameResolver;
using plexwatch::utils::TitleNormalizer;
using namespace std::chrono_literals;

namespace {

StreamSession make_session(StreamSystem system, const std::string& user, const std::string& title) {
    StreamSession session;
    session.system = system;
    session.raw_user = user;
    session.title = title;
    session.media_kind = MediaKind::Movie;
    return session;
}

StreamList make_streams(StreamSystem system, int count, const std::string& prefix) {
    StreamList list;
    for (int i = 0; i < count; ++i) {
        list.sessions.push_back(make_session(system, "user" + std::to_string(i), prefix + std::to_string(i)));
    }
    return list;
}

UptimeStats make_uptime() {
    UptimeStats stats;
    stats.last_24h = {99.9, 86313s};
    stats.last_7d = {99.5, 601920s};
    stats.last_30d = {98.0, 2540160s};
    return stats;
}

} // namespace

class ViewAggregatorTest : public ::testing::Test {
protected:
    ViewAggregator make(AggregatorConfig config = {}) {
        auto resolver = std::make_shared<NameResolver>(
            std::unordered_map<std::string, std::string>{{"user0", "Alice"}});
        return ViewAggregator(resolver, TitleNormalizer({"1080p"}, 40), std::move(config));
    }

    TimePoint now = TimePoint{std::chrono::seconds{1700000000}};
};

TEST_F(ViewAggregatorTest, CapsStreamsAndKeepsSourcePriority) {
    auto aggregator = make();

    std::vector<SourceSnapshot> snapshots = {
        SourceSnapshot::success(SourceKind::JellyfinStreams, now, make_streams(StreamSystem::Jellyfin, 5, "jf")),
        SourceSnapshot::success(SourceKind::PlexStreams, now, make_streams(StreamSystem::Plex, 5, "plex")),
    };

    auto view = aggregator.aggregate(snapshots, {}, {}, now);

    EXPECT_EQ(view.total_streams, 10u);
    ASSERT_EQ(view.streams.size(), 8u);
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(view.streams[i].system, StreamSystem::Plex) << i;
    }
    EXPECT_EQ(view.streams[0].title, "plex0");
    EXPECT_EQ(view.streams[5].title, "jf0");
    EXPECT_EQ(view.streams[7].title, "jf2");
}

TEST_F(ViewAggregatorTest, ResolvesUsersAndNormalizesTitles) {
    auto aggregator = make();

    StreamList list;
    list.sessions.push_back(make_session(StreamSystem::Plex, "user0", "Some.Movie.1080p.WEB"));
    list.sessions.push_back(make_session(StreamSystem::Plex, "stranger", "Other"));

    auto view = aggregator.aggregate({SourceSnapshot::success(SourceKind::PlexStreams, now, list)}, {}, {}, now);

    ASSERT_EQ(view.streams.size(), 2u);
    EXPECT_EQ(view.streams[0].raw_user, "Alice");
    EXPECT_EQ(view.streams[0].title, "Some Movie");
    EXPECT_EQ(view.streams[1].raw_user, "stranger");
}

TEST_F(ViewAggregatorTest, TimedOutPrimaryWithQueueAndUptime) {
    auto aggregator = make();

    QueueList queue;
    queue.items.push_back({"Release.One.1080p", 1000, 0.5, 100.0});
    queue.items.push_back({"Release.Two", 2000, 0.1, 0.0});

    std::vector<SourceSnapshot> snapshots = {
        SourceSnapshot::failure(SourceKind::PlexStreams, now, SourceError::Timeout),
        SourceSnapshot::failure(SourceKind::JellyfinStreams, now, SourceError::Disabled),
        SourceSnapshot::success(SourceKind::Queue, now, queue),
        SourceSnapshot::success(SourceKind::Uptime, now, make_uptime()),
    };

    auto view = aggregator.aggregate(snapshots, {}, {}, now);

    EXPECT_TRUE(view.streams.empty());
    EXPECT_EQ(view.total_streams, 0u);
    EXPECT_EQ(view.status_of(SourceKind::PlexStreams), SourceStatus::Down);
    EXPECT_EQ(view.status_of(SourceKind::JellyfinStreams), SourceStatus::Disabled);
    EXPECT_EQ(view.status_of(SourceKind::Queue), SourceStatus::Ok);
    EXPECT_EQ(view.status_of(SourceKind::Uptime), SourceStatus::Ok);

    ASSERT_TRUE(view.queue.has_value());
    ASSERT_EQ(view.queue->items.size(), 2u);
    EXPECT_EQ(view.queue->items[0].raw_title, "Release One");
    ASSERT_TRUE(view.uptime.has_value());
    EXPECT_DOUBLE_EQ(view.uptime->last_24h.percentage, 99.9);

    const auto& plex = view.source_health.at(SourceKind::PlexStreams);
    EXPECT_EQ(plex.consecutive_failures, 1);
    EXPECT_EQ(plex.last_error, SourceError::Timeout);
}

TEST_F(ViewAggregatorTest, FailedQueueIsAbsentFromView) {
    auto aggregator = make();
    auto view = aggregator.aggregate(
        {SourceSnapshot::failure(SourceKind::Queue, now, SourceError::Unauthorized)}, {}, {}, now);
    EXPECT_FALSE(view.queue.has_value());
    EXPECT_EQ(view.status_of(SourceKind::Queue), SourceStatus::Down);
}

TEST_F(ViewAggregatorTest, ThresholdDegradesBeforeDown) {
    AggregatorConfig config;
    config.offline_threshold = 2;
    auto aggregator = make(config);

    auto failing = SourceSnapshot::failure(SourceKind::PlexStreams, now, SourceError::Unavailable);

    auto first = aggregator.next_health(failing, std::nullopt, now);
    EXPECT_EQ(first.status, SourceStatus::Degraded);
    auto second = aggregator.next_health(failing, first, now);
    EXPECT_EQ(second.status, SourceStatus::Degraded);
    auto third = aggregator.next_health(failing, second, now);
    EXPECT_EQ(third.status, SourceStatus::Down);
    EXPECT_EQ(third.consecutive_failures, 3);
}

TEST_F(ViewAggregatorTest, RecoveryResetsFailures) {
    auto aggregator = make();

    auto down = aggregator.next_health(
        SourceSnapshot::failure(SourceKind::PlexStreams, now, SourceError::Unavailable), std::nullopt, now);
    ASSERT_EQ(down.status, SourceStatus::Down);

    const auto later = now + 60s;
    auto up = aggregator.next_health(
        SourceSnapshot::success(SourceKind::PlexStreams, later, StreamList{}), down, later);
    EXPECT_EQ(up.status, SourceStatus::Ok);
    EXPECT_EQ(up.consecutive_failures, 0);
    EXPECT_EQ(up.up_since, later);
    EXPECT_EQ(up.last_ok_at, later);
}

TEST_F(ViewAggregatorTest, UpSinceSurvivesConsecutiveSuccesses) {
    auto aggregator = make();
    auto snapshot = SourceSnapshot::success(SourceKind::PlexStreams, now, StreamList{});

    auto first = aggregator.next_health(snapshot, std::nullopt, now);
    auto second = aggregator.next_health(snapshot, first, now + 60s);

    EXPECT_EQ(second.up_since, now);
    EXPECT_EQ(second.last_ok_at, now + 60s);
}

TEST_F(ViewAggregatorTest, FailureKeepsLastOk) {
    auto aggregator = make();
    auto ok = aggregator.next_health(SourceSnapshot::success(SourceKind::PlexStreams, now, StreamList{}),
                                     std::nullopt, now);
    auto failed = aggregator.next_health(
        SourceSnapshot::failure(SourceKind::PlexStreams, now + 60s, SourceError::Timeout), ok, now + 60s);
    EXPECT_EQ(failed.last_ok_at, now);
}

TEST_F(ViewAggregatorTest, DisabledNeverCountsAsFailure) {
    auto aggregator = make();
    auto health = aggregator.next_health(
        SourceSnapshot::failure(SourceKind::Uptime, now, SourceError::Disabled), std::nullopt, now);
    EXPECT_EQ(health.status, SourceStatus::Disabled);
    EXPECT_EQ(health.consecutive_failures, 0);
}

TEST_F(ViewAggregatorTest, HealthOfSourcesWithoutSnapshotCarriesOver) {
    auto aggregator = make();
    HealthMap previous;
    SourceHealth uptime;
    uptime.status = SourceStatus::Ok;
    uptime.up_since = now - 3600s;
    previous[SourceKind::Uptime] = uptime;

    auto view = aggregator.aggregate({}, {}, previous, now);
    EXPECT_EQ(view.status_of(SourceKind::Uptime), SourceStatus::Ok);
    EXPECT_EQ(view.source_health.at(SourceKind::Uptime).up_since, now - 3600s);
}

TEST_F(ViewAggregatorTest, LibraryRowsFollowConfigOrderThenServerOrder) {
    AggregatorConfig config;
    config.library.show_all = true;
    config.library.sections = {
        {"TV Shows", "Series", "📺", true, true},
        {"Movies", "Films", "🎥", false, true},
        {"Missing", "Gone", "❓", false, false},
    };
    auto aggregator = make(config);

    LibraryCounts counts = {
        {"1", "Movies", "movie", 1234, std::nullopt, now},
        {"2", "Music", "artist", 50, std::nullopt, now},
        {"3", "TV Shows", "show", 80, 4321, now},
    };

    auto rows = aggregator.build_library_rows(counts);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].display_name, "Series");
    EXPECT_EQ(rows[0].episode_count, std::optional<std::uint64_t>(4321));
    EXPECT_EQ(rows[1].display_name, "Films");
    EXPECT_FALSE(rows[1].episode_count.has_value());
    EXPECT_EQ(rows[2].display_name, "Music");
    EXPECT_EQ(rows[2].emoji, "🎬");
    EXPECT_FALSE(rows[2].include_in_presence);
}

TEST_F(ViewAggregatorTest, LibraryRowsWithoutShowAll) {
    AggregatorConfig config;
    config.library.show_all = false;
    config.library.sections = {{"Movies", "Films", "🎥", false, false}};
    auto aggregator = make(config);

    LibraryCounts counts = {
        {"1", "Movies", "movie", 10, std::nullopt, now},
        {"2", "Music", "artist", 50, std::nullopt, now},
    };
    auto rows = aggregator.build_library_rows(counts);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].display_name, "Films");
}
