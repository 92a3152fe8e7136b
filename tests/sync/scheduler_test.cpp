#include "upsync/sync/scheduler.hpp"

#include "../support/fixtures.hpp"

#include <gtest/gtest.h>

using upsync::ErrorKind;
using upsync::sync::BatchScheduler;
using upsync::sync::EntityType;
using upsync::sync::PendingCounts;
using upsync::test_support::make_content_list;
using upsync::test_support::make_creator;

TEST(BatchSchedulerTest, SplitsIntoFullBatchesAndRemainder) {
    auto batches = BatchScheduler::schedule(make_content_list(120), 50);
    ASSERT_TRUE(batches.is_ok());
    ASSERT_EQ(batches.value().size(), 3u);
    EXPECT_EQ(batches.value()[0].size(), 50u);
    EXPECT_EQ(batches.value()[1].size(), 50u);
    EXPECT_EQ(batches.value()[2].size(), 20u);
}

TEST(BatchSchedulerTest, PreservesOrder) {
    const auto pending = make_content_list(7);
    auto batches = BatchScheduler::schedule(pending, 3);
    ASSERT_TRUE(batches.is_ok());

    for (std::size_t i = 0; i < pending.size(); ++i) {
        const auto& batch = batches.value()[i / 3];
        EXPECT_EQ(batch.content[i % 3].content_id, pending[i].content_id);
    }
}

TEST(BatchSchedulerTest, SequencesAndIds) {
    auto batches = BatchScheduler::schedule(make_content_list(5), 2, 4);
    ASSERT_TRUE(batches.is_ok());
    ASSERT_EQ(batches.value().size(), 3u);
    EXPECT_EQ(batches.value()[0].sequence, 4u);
    EXPECT_EQ(batches.value()[2].sequence, 6u);
    EXPECT_EQ(batches.value()[0].batch_id(), "articles-4");
    EXPECT_EQ(batches.value()[1].ids(), (std::vector<std::string>{"c2", "c3"}));
    EXPECT_EQ(batches.value()[0].entity_type, EntityType::Content);
    EXPECT_TRUE(batches.value()[0].creators.empty());
}

TEST(BatchSchedulerTest, CreatorBatches) {
    std::vector<upsync::source::CreatorRecord> creators{make_creator(0), make_creator(1), make_creator(2)};
    auto batches = BatchScheduler::schedule(creators, 2);
    ASSERT_TRUE(batches.is_ok());
    ASSERT_EQ(batches.value().size(), 2u);
    EXPECT_EQ(batches.value()[0].entity_type, EntityType::Creator);
    EXPECT_EQ(batches.value()[1].batch_id(), "creators-2");
    EXPECT_EQ(batches.value()[1].ids(), (std::vector<std::string>{"u2"}));
}

TEST(BatchSchedulerTest, EmptyInputHasNoBatches) {
    auto batches = BatchScheduler::schedule(std::vector<upsync::source::ContentRecord>{}, 50);
    ASSERT_TRUE(batches.is_ok());
    EXPECT_TRUE(batches.value().empty());
}

TEST(BatchSchedulerTest, ZeroBatchSizeIsConfigError) {
    auto batches = BatchScheduler::schedule(make_content_list(3), 0);
    ASSERT_TRUE(batches.is_error());
    EXPECT_EQ(batches.error().kind, ErrorKind::Config);
}

TEST(BatchSchedulerTest, TotalBatchesSumsBothTypes) {
    EXPECT_EQ(BatchScheduler::total_batches(PendingCounts{120, 0}, 50), 3u);
    EXPECT_EQ(BatchScheduler::total_batches(PendingCounts{100, 1}, 50), 3u);
    EXPECT_EQ(BatchScheduler::total_batches(PendingCounts{0, 0}, 50), 0u);
    EXPECT_EQ(BatchScheduler::total_batches(PendingCounts{10, 10}, 0), 0u);
}
