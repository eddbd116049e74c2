#include <gtest/gtest.h>
#include "objfs/stream_state.hpp"

using namespace objfs;

class StreamStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_.chunk_size = 1024;
        cfg_.sequential_threshold = 2;
        cfg_.prefetch_window_min = 1;
        cfg_.prefetch_window_step = 1;
        cfg_.prefetch_window_max = 4;
        object_ = ObjectId{"obj", 100 * 1024, "\"v1\""};
    }

    Config cfg_;
    ObjectId object_;
};

TEST_F(StreamStateTest, FirstReadDoesNotPrefetch) {
    StreamState s(object_, cfg_);
    PrefetchPlan plan = s.OnRead(0, 1024);
    EXPECT_TRUE(plan.empty());
    EXPECT_EQ(s.pattern(), AccessPattern::Initial);
    EXPECT_EQ(s.chunk_count(), 100u);
}

TEST_F(StreamStateTest, ContiguousReadsBecomeSequential) {
    StreamState s(object_, cfg_);
    s.OnRead(0, 1024);
    PrefetchPlan plan = s.OnRead(1024, 1024);

    EXPECT_EQ(s.pattern(), AccessPattern::Sequential);
    EXPECT_EQ(s.window(), 1u);
    EXPECT_EQ(plan.first, 2u);
    EXPECT_EQ(plan.last, 3u);
}

TEST_F(StreamStateTest, WindowGrowsAdditivelyUpToMax) {
    StreamState s(object_, cfg_);
    std::uint64_t offset = 0;
    for (int i = 0; i < 10; ++i) {
        s.OnRead(offset, 1024);
        offset += 1024;
    }
    EXPECT_EQ(s.window(), 4u);

    // Windows grow 1, 2, 3, 4 after the stream turns sequential
    StreamState t(object_, cfg_);
    t.OnRead(0, 1024);
    t.OnRead(1024, 1024);
    EXPECT_EQ(t.window(), 1u);
    t.OnRead(2048, 1024);
    EXPECT_EQ(t.window(), 2u);
    t.OnRead(3072, 1024);
    EXPECT_EQ(t.window(), 3u);
}

TEST_F(StreamStateTest, IssuedPrefetchesAreNotPlannedTwice) {
    StreamState s(object_, cfg_);
    s.OnRead(0, 1024);
    PrefetchPlan plan = s.OnRead(1024, 1024);
    s.OnPrefetchIssued(plan.last);

    plan = s.OnRead(2048, 1024);
    // window 2 ahead of chunk 2 is [3, 5); chunk 3 was not yet covered
    EXPECT_EQ(plan.first, 3u);
    EXPECT_EQ(plan.last, 5u);
    s.OnPrefetchIssued(5);

    plan = s.OnRead(3072, 1024);
    EXPECT_EQ(plan.first, 5u);
    EXPECT_EQ(plan.last, 7u);
}

TEST_F(StreamStateTest, JumpResetsToRandomWithMinimalWindow) {
    StreamState s(object_, cfg_);
    for (std::uint64_t i = 0; i < 5; ++i) {
        s.OnRead(i * 1024, 1024);
    }
    ASSERT_EQ(s.pattern(), AccessPattern::Sequential);
    ASSERT_GT(s.window(), 1u);

    PrefetchPlan plan = s.OnRead(50 * 1024, 1024);
    EXPECT_EQ(s.pattern(), AccessPattern::Random);
    EXPECT_EQ(s.window(), cfg_.prefetch_window_min);
    EXPECT_EQ(s.sequential_count(), 1u);
    EXPECT_EQ(s.prefetched_until(), 0u);
    EXPECT_TRUE(plan.empty());
}

TEST_F(StreamStateTest, RandomReadsNeverPrefetch) {
    StreamState s(object_, cfg_);
    const std::uint64_t offsets[] = {7, 3, 91, 40, 12, 66, 2, 58};
    for (std::uint64_t chunk : offsets) {
        PrefetchPlan plan = s.OnRead(chunk * 1024 + 100, 200);
        EXPECT_TRUE(plan.empty());
        EXPECT_LE(s.window(), cfg_.prefetch_window_min);
    }
    EXPECT_EQ(s.pattern(), AccessPattern::Random);
}

TEST_F(StreamStateTest, RandomStreamCanBecomeSequentialAgain) {
    StreamState s(object_, cfg_);
    s.OnRead(10 * 1024, 1024);
    s.OnRead(30 * 1024, 1024);
    ASSERT_EQ(s.pattern(), AccessPattern::Random);

    PrefetchPlan plan = s.OnRead(31 * 1024, 1024);
    EXPECT_EQ(s.pattern(), AccessPattern::Sequential);
    EXPECT_EQ(plan.first, 32u);
}

TEST_F(StreamStateTest, PlanIsClampedToObjectEnd) {
    StreamState s(object_, cfg_);
    s.OnRead(97 * 1024, 1024);
    s.OnRead(98 * 1024, 1024);
    PrefetchPlan plan = s.OnRead(99 * 1024, 1024);
    EXPECT_TRUE(plan.empty());
}

TEST_F(StreamStateTest, SmallContiguousReadsWithinOneChunk) {
    StreamState s(object_, cfg_);
    s.OnRead(0, 100);
    PrefetchPlan plan = s.OnRead(100, 100);
    EXPECT_EQ(s.pattern(), AccessPattern::Sequential);
    EXPECT_EQ(plan.first, 1u);
    EXPECT_EQ(plan.last, 2u);
}

TEST_F(StreamStateTest, ForwardGapsInsideAChunkAreSequential) {
    cfg_.chunk_size = 64 * 1024;
    object_.size = 64 * cfg_.chunk_size;
    StreamState s(object_, cfg_);

    // 4 KiB reads every 8 KiB
    s.OnRead(0, 4096);
    PrefetchPlan plan = s.OnRead(8192, 4096);
    EXPECT_EQ(s.pattern(), AccessPattern::Sequential);
    EXPECT_EQ(plan.first, 1u);
    EXPECT_EQ(plan.last, 2u);

    for (std::uint64_t offset = 16384; offset < 3 * cfg_.chunk_size; offset += 8192) {
        s.OnRead(offset, 4096);
    }
    EXPECT_EQ(s.pattern(), AccessPattern::Sequential);
    EXPECT_EQ(s.window(), cfg_.prefetch_window_max);
}

TEST_F(StreamStateTest, OutOfOrderArrivalKeepsWindow) {
    StreamState s(object_, cfg_);
    // Two-chunk reads numbered 0..7, with 4 and 5 swapped
    for (std::uint64_t n : {0, 1, 2, 3}) {
        s.OnRead(n * 2048, 2048);
    }
    ASSERT_EQ(s.window(), 3u);

    s.OnRead(5 * 2048, 2048);
    EXPECT_EQ(s.pattern(), AccessPattern::Sequential);
    EXPECT_EQ(s.window(), 3u);
    s.OnRead(4 * 2048, 2048);
    EXPECT_EQ(s.pattern(), AccessPattern::Sequential);
    EXPECT_EQ(s.window(), 3u);

    s.OnRead(6 * 2048, 2048);
    s.OnRead(7 * 2048, 2048);
    EXPECT_EQ(s.pattern(), AccessPattern::Sequential);
    EXPECT_EQ(s.window(), 4u);
    EXPECT_EQ(s.sequential_count(), 6u);
}

TEST_F(StreamStateTest, RepeatedReadDoesNotAdvance) {
    StreamState s(object_, cfg_);
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(s.OnRead(100, 200).empty());
    }
    EXPECT_EQ(s.pattern(), AccessPattern::Initial);
    EXPECT_EQ(s.sequential_count(), 1u);
}

TEST_F(StreamStateTest, ReadsBeyondReorderToleranceReset) {
    StreamState ahead(object_, cfg_);
    for (std::uint64_t i = 0; i < 4; ++i) {
        ahead.OnRead(i * 1024, 1024);
    }
    ASSERT_EQ(ahead.pattern(), AccessPattern::Sequential);
    // Chunk 6 is two chunks past the next one: tolerated
    ahead.OnRead(6 * 1024, 1024);
    EXPECT_EQ(ahead.pattern(), AccessPattern::Sequential);
    // Chunk 10 is not
    ahead.OnRead(10 * 1024, 1024);
    EXPECT_EQ(ahead.pattern(), AccessPattern::Random);

    StreamState behind(object_, cfg_);
    for (std::uint64_t i = 0; i < 6; ++i) {
        behind.OnRead(i * 1024, 1024);
    }
    behind.OnRead(3 * 1024, 1024);
    EXPECT_EQ(behind.pattern(), AccessPattern::Sequential);
    behind.OnRead(2 * 1024, 1024);
    EXPECT_EQ(behind.pattern(), AccessPattern::Random);
    EXPECT_EQ(behind.window(), cfg_.prefetch_window_min);
}
