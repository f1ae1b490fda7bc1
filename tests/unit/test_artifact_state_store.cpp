#include <gtest/gtest.h>
#include "plexwatch/services/dashboard/artifact_state_store.hpp"

#include <filesystem>
#include <fstream>

using plexwatch::services::ArtifactStateStore;
using plexwatch::core::PublishedArtifactState;

class ArtifactStateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("plexwatch_state_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path dir;
};

TEST_F(ArtifactStateStoreTest, MissingFileLoadsEmptyState) {
    ArtifactStateStore store(dir / "state.yaml");
    auto state = store.load();
    EXPECT_FALSE(state.artifact_id.has_value());
    EXPECT_TRUE(state.last_content_hash.empty());
}

TEST_F(ArtifactStateStoreTest, SaveThenLoadRestoresState) {
    ArtifactStateStore store(dir / "nested" / "state.yaml");
    PublishedArtifactState state{"1234567890123456789", "abcdef"};

    ASSERT_TRUE(store.save(state).has_value());
    EXPECT_FALSE(std::filesystem::exists(dir / "nested" / "state.yaml.tmp"));

    ArtifactStateStore reopened(dir / "nested" / "state.yaml");
    EXPECT_EQ(reopened.load(), state);
}

TEST_F(ArtifactStateStoreTest, ClearedIdIsPersisted) {
    ArtifactStateStore store(dir / "state.yaml");
    ASSERT_TRUE(store.save(PublishedArtifactState{"42", "h"}).has_value());
    ASSERT_TRUE(store.save(PublishedArtifactState{}).has_value());

    auto state = store.load();
    EXPECT_FALSE(state.artifact_id.has_value());
    EXPECT_TRUE(state.last_content_hash.empty());
}

TEST_F(ArtifactStateStoreTest, CorruptFileLoadsEmptyState) {
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "state.yaml") << "artifact_id: [unclosed\n";

    ArtifactStateStore store(dir / "state.yaml");
    auto state = store.load();
    EXPECT_FALSE(state.artifact_id.has_value());
}

TEST_F(ArtifactStateStoreTest, EmptyPathUsesDefault) {
    ArtifactStateStore store{std::filesystem::path{}};
    EXPECT_EQ(store.path(), ArtifactStateStore::get_default_path());
    EXPECT_EQ(store.path().filename(), "state.yaml");
}
