#include "upsync/sync/checkpoint.hpp"

#include "../support/fixtures.hpp"

#include <gtest/gtest.h>

using upsync::ErrorKind;
using upsync::sync::CheckpointStore;
using upsync::sync::EntityType;
using upsync::test_support::create_temp_dir;
namespace fs = std::filesystem;

namespace {

class CheckpointTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = create_temp_dir("upsync_checkpoint"); }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

} // namespace

TEST_F(CheckpointTest, LoadWithoutFileIsEmpty) {
    CheckpointStore store(dir_);
    auto loaded = store.load("snapshot.db");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_TRUE(loaded.value().empty());
    EXPECT_FALSE(store.exists("snapshot.db"));
}

TEST_F(CheckpointTest, MarkConfirmedIsIdempotent) {
    CheckpointStore store(dir_);
    ASSERT_TRUE(store.load("snapshot.db").is_ok());

    auto first = store.mark_confirmed(EntityType::Content, {"a", "b", "c"});
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value(), 3u);

    auto again = store.mark_confirmed(EntityType::Content, {"b", "c", "d"});
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value(), 1u);
    EXPECT_EQ(store.confirmed().size(EntityType::Content), 4u);
    EXPECT_EQ(store.confirmed().size(EntityType::Creator), 0u);
}

TEST_F(CheckpointTest, EntityTypesAreSeparate) {
    CheckpointStore store(dir_);
    ASSERT_TRUE(store.load("snapshot.db").is_ok());
    ASSERT_TRUE(store.mark_confirmed(EntityType::Content, {"42"}).is_ok());

    EXPECT_TRUE(store.is_confirmed(EntityType::Content, "42"));
    EXPECT_FALSE(store.is_confirmed(EntityType::Creator, "42"));
}

TEST_F(CheckpointTest, PersistedIdsSurviveReload) {
    {
        CheckpointStore store(dir_);
        ASSERT_TRUE(store.load("snapshot.db").is_ok());
        ASSERT_TRUE(store.mark_confirmed(EntityType::Content, {"c0", "c1"}).is_ok());
        ASSERT_TRUE(store.mark_confirmed(EntityType::Creator, {"u0"}).is_ok());
        ASSERT_TRUE(store.persist().is_ok());
    }

    CheckpointStore reopened(dir_);
    auto loaded = reopened.load("snapshot.db");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().ids(EntityType::Content), (std::vector<std::string>{"c0", "c1"}));
    EXPECT_EQ(loaded.value().ids(EntityType::Creator), (std::vector<std::string>{"u0"}));
}

TEST_F(CheckpointTest, UnpersistedIdsAreLost) {
    {
        CheckpointStore store(dir_);
        ASSERT_TRUE(store.load("snapshot.db").is_ok());
        ASSERT_TRUE(store.mark_confirmed(EntityType::Content, {"c0"}).is_ok());
        ASSERT_TRUE(store.persist().is_ok());
        ASSERT_TRUE(store.mark_confirmed(EntityType::Content, {"c1"}).is_ok());
    }

    CheckpointStore reopened(dir_);
    auto loaded = reopened.load("snapshot.db");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().size(EntityType::Content), 1u);
}

TEST_F(CheckpointTest, FingerprintsAreIsolated) {
    CheckpointStore store(dir_);
    ASSERT_TRUE(store.load("monday.db").is_ok());
    ASSERT_TRUE(store.mark_confirmed(EntityType::Content, {"c0"}).is_ok());
    ASSERT_TRUE(store.persist().is_ok());

    auto other = store.load("tuesday.db");
    ASSERT_TRUE(other.is_ok());
    EXPECT_TRUE(other.value().empty());
    EXPECT_NE(store.path_for("monday.db"), store.path_for("tuesday.db"));
}

TEST_F(CheckpointTest, ClearRemovesFileAndMemory) {
    CheckpointStore store(dir_);
    ASSERT_TRUE(store.load("snapshot.db").is_ok());
    ASSERT_TRUE(store.mark_confirmed(EntityType::Content, {"c0"}).is_ok());
    ASSERT_TRUE(store.persist().is_ok());
    ASSERT_TRUE(store.exists("snapshot.db"));

    ASSERT_TRUE(store.clear("snapshot.db").is_ok());
    EXPECT_FALSE(store.exists("snapshot.db"));
    EXPECT_TRUE(store.confirmed().empty());

    // Clearing twice is harmless
    EXPECT_TRUE(store.clear("snapshot.db").is_ok());
}

TEST_F(CheckpointTest, CorruptFileIsIoError) {
    CheckpointStore store(dir_);
    upsync::test_support::write_text(store.path_for("snapshot.db"), "{ not json");

    auto loaded = store.load("snapshot.db");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().kind, ErrorKind::Io);
    EXPECT_TRUE(store.confirmed().empty());
}

TEST_F(CheckpointTest, MarkWithoutLoadIsStateError) {
    CheckpointStore store(dir_);
    auto marked = store.mark_confirmed(EntityType::Content, {"c0"});
    ASSERT_TRUE(marked.is_error());
    EXPECT_EQ(marked.error().kind, ErrorKind::State);
}
