#include <gtest/gtest.h>
#include "objfs/api.hpp"
#include "objfs/mock_client.hpp"
#include <algorithm>
#include <atomic>
#include <map>
#include <random>
#include <stdexcept>
#include <thread>

using namespace objfs;

class DispatcherTest : public ::testing::Test {
protected:
    static constexpr std::uint64_t kChunk = 1024;

    void SetUp() override {
        cfg_.chunk_size = kChunk;
        cfg_.cache_capacity_bytes = 256 * kChunk;
        cfg_.max_concurrent_fetches = 4;
        cfg_.max_prefetch_per_stream = 4;
        cfg_.max_coalesced_chunks = 4;
        cfg_.sequential_threshold = 2;
        cfg_.prefetch_window_min = 1;
        cfg_.prefetch_window_step = 1;
        cfg_.prefetch_window_max = 4;
        cfg_.retry_base_delay_ms = 1;
        cfg_.retry_max_delay_ms = 2;
        mock_ = std::make_shared<MockClient>();
    }

    void TearDown() override {
        mock_->Resume();
        dispatcher_.reset();
    }

    void Start() {
        dispatcher_ = std::make_unique<ReadDispatcher>(cfg_, mock_);
    }

    ObjectId AddObject(const std::string& key, std::uint64_t size, std::uint32_t seed = 1) {
        std::vector<std::uint8_t> contents(size);
        std::mt19937 rng(seed);
        for (auto& b : contents) {
            b = static_cast<std::uint8_t>(rng());
        }
        contents_[key] = contents;
        return mock_->AddObject(key, std::move(contents));
    }

    std::vector<std::uint8_t> Expected(const std::string& key, std::uint64_t offset, std::uint64_t length) {
        const auto& all = contents_[key];
        std::uint64_t begin = std::min<std::uint64_t>(offset, all.size());
        std::uint64_t end = std::min<std::uint64_t>(offset + length, all.size());
        return std::vector<std::uint8_t>(all.begin() + begin, all.begin() + end);
    }

    StreamHandle OpenKey(const std::string& key) {
        StreamHandle h = 0;
        Status st = dispatcher_->Open(key, &h);
        EXPECT_TRUE(st.ok()) << st.ToString();
        return h;
    }

    Config cfg_;
    std::shared_ptr<MockClient> mock_;
    std::unique_ptr<ReadDispatcher> dispatcher_;
    std::map<std::string, std::vector<std::uint8_t>> contents_;
};

TEST_F(DispatcherTest, ReadsReturnObjectBytes) {
    AddObject("a", 10 * kChunk + 17);
    Start();
    StreamHandle h = OpenKey("a");

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(dispatcher_->Read(h, 500, 3000, &out).ok());
    EXPECT_EQ(out, Expected("a", 500, 3000));

    // Same range again: identical bytes, served from cache
    std::vector<std::uint8_t> again;
    ASSERT_TRUE(dispatcher_->Read(h, 500, 3000, &again).ok());
    EXPECT_EQ(again, out);
    MetricsSnapshot stats = dispatcher_->Stats();
    EXPECT_EQ(stats.cache_misses, 4u);
    EXPECT_EQ(stats.cache_hits, 4u);
}

TEST_F(DispatcherTest, ShortReadAtEndOfObject) {
    AddObject("a", 2500);
    Start();
    StreamHandle h = OpenKey("a");

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(dispatcher_->Read(h, 2000, 1000, &out).ok());
    EXPECT_EQ(out.size(), 500u);
    EXPECT_EQ(out, Expected("a", 2000, 500));

    ASSERT_TRUE(dispatcher_->Read(h, 2500, 10, &out).ok());
    EXPECT_TRUE(out.empty());
    ASSERT_TRUE(dispatcher_->Read(h, 9000, 10, &out).ok());
    EXPECT_TRUE(out.empty());
    ASSERT_TRUE(dispatcher_->Read(h, 0, 0, &out).ok());
    EXPECT_TRUE(out.empty());
}

TEST_F(DispatcherTest, ConcurrentReadersShareOneFetch) {
    AddObject("a", 4 * kChunk);
    Start();
    StreamHandle h = OpenKey("a");
    mock_->Pause();

    constexpr int kReaders = 50;
    std::vector<std::thread> readers;
    std::vector<std::vector<std::uint8_t>> results(kReaders);
    std::atomic<int> failures{0};
    for (int i = 0; i < kReaders; ++i) {
        readers.emplace_back([&, i] {
            if (!dispatcher_->Read(h, 100, 200, &results[i]).ok()) {
                failures++;
            }
        });
    }

    // Every reader has looked the chunk up before the single fetch is let through
    while (dispatcher_->Stats().cache_misses < kReaders) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    mock_->Resume();
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(mock_->TotalRequests(), 1u);
    EXPECT_EQ(dispatcher_->Stats().joined_fetches, static_cast<std::uint64_t>(kReaders - 1));
    for (const auto& r : results) {
        EXPECT_EQ(r, Expected("a", 100, 200));
    }
}

TEST_F(DispatcherTest, SequentialScanIsServedByPrefetch) {
    AddObject("a", 100 * kChunk);
    Start();
    StreamHandle h = OpenKey("a");

    std::vector<std::uint8_t> out;
    for (std::uint64_t i = 0; i < 10; ++i) {
        ASSERT_TRUE(dispatcher_->Read(h, i * kChunk, kChunk, &out).ok());
        EXPECT_EQ(out, Expected("a", i * kChunk, kChunk));
        dispatcher_->WaitForIdle();
    }

    // Only the first two reads, before the stream was known to be sequential, miss
    MetricsSnapshot stats = dispatcher_->Stats();
    EXPECT_EQ(stats.cache_misses, 2u);
    EXPECT_EQ(stats.cache_hits, 8u);
    EXPECT_GT(stats.prefetches_issued, 0u);
    EXPECT_EQ(stats.prefetches_wasted, 0u);
}

TEST_F(DispatcherTest, RandomReadsDoNotPrefetch) {
    AddObject("a", 100 * kChunk);
    Start();
    StreamHandle h = OpenKey("a");

    const std::uint64_t chunks[] = {7, 3, 91, 40, 12, 66, 2, 58, 21, 80};
    std::vector<std::uint8_t> out;
    for (std::uint64_t c : chunks) {
        ASSERT_TRUE(dispatcher_->Read(h, c * kChunk + 100, 200, &out).ok());
        EXPECT_EQ(out, Expected("a", c * kChunk + 100, 200));
    }
    dispatcher_->WaitForIdle();

    MetricsSnapshot stats = dispatcher_->Stats();
    EXPECT_EQ(stats.prefetches_issued, 0u);
    EXPECT_EQ(mock_->TotalRequests(), 10u);
}

TEST_F(DispatcherTest, SpanningReadFetchesOnlyMissingChunk) {
    // Two advancing reads would otherwise start a prefetch of chunk 4
    cfg_.sequential_threshold = 3;
    AddObject("a", 8 * kChunk);
    Start();
    StreamHandle h = OpenKey("a");

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(dispatcher_->Read(h, 2 * kChunk, kChunk, &out).ok());
    ASSERT_TRUE(dispatcher_->Read(h, 2 * kChunk + 512, kChunk, &out).ok());
    EXPECT_EQ(out, Expected("a", 2 * kChunk + 512, kChunk));

    auto ranges = mock_->RequestedRanges("a");
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].first, 2 * kChunk);
    EXPECT_EQ(ranges[1].first, 3 * kChunk);
    EXPECT_EQ(dispatcher_->Stats().cache_hits, 1u);
}

TEST_F(DispatcherTest, TransientFailuresAreRetried) {
    AddObject("a", 4 * kChunk);
    cfg_.max_attempts = 3;
    Start();
    StreamHandle h = OpenKey("a");
    mock_->InjectFailures("a", {ErrorKind::Transient, ErrorKind::Transient});

    std::vector<std::uint8_t> out;
    Status st = dispatcher_->Read(h, 0, 100, &out);
    ASSERT_TRUE(st.ok()) << st.ToString();
    EXPECT_EQ(out, Expected("a", 0, 100));
    EXPECT_EQ(dispatcher_->Stats().retries, 2u);
}

TEST_F(DispatcherTest, PersistentFailureIsUnavailableAndNotCached) {
    AddObject("a", 4 * kChunk);
    cfg_.max_attempts = 2;
    Start();
    StreamHandle h = OpenKey("a");
    mock_->InjectFailures("a", {ErrorKind::Transient, ErrorKind::Transient});

    std::vector<std::uint8_t> out;
    EXPECT_EQ(dispatcher_->Read(h, 0, 100, &out).kind(), ErrorKind::Unavailable);
    EXPECT_TRUE(out.empty());

    // The failed chunk is absent again; the next read fetches it anew
    ASSERT_TRUE(dispatcher_->Read(h, 0, 100, &out).ok());
    EXPECT_EQ(out, Expected("a", 0, 100));
    EXPECT_EQ(mock_->TotalRequests(), 3u);
}

TEST_F(DispatcherTest, ChangedObjectFailsUntilReopened) {
    AddObject("a", 4 * kChunk, 1);
    Start();
    StreamHandle h = OpenKey("a");

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(dispatcher_->Read(h, 0, 100, &out).ok());

    AddObject("a", 4 * kChunk, 2);
    EXPECT_EQ(dispatcher_->Read(h, 3 * kChunk, 100, &out).kind(), ErrorKind::ObjectChanged);
    // Even chunks cached before the change are refused on this handle
    EXPECT_EQ(dispatcher_->Read(h, 0, 100, &out).kind(), ErrorKind::ObjectChanged);

    StreamHandle fresh = OpenKey("a");
    ASSERT_TRUE(dispatcher_->Read(fresh, 0, 100, &out).ok());
    EXPECT_EQ(out, Expected("a", 0, 100));
}

TEST_F(DispatcherTest, CacheStaysWithinBudget) {
    cfg_.cache_capacity_bytes = 6 * kChunk;
    AddObject("a", 40 * kChunk);
    Start();
    StreamHandle h = OpenKey("a");

    std::vector<std::uint8_t> out;
    for (std::uint64_t i = 0; i < 40; ++i) {
        ASSERT_TRUE(dispatcher_->Read(h, i * kChunk, kChunk, &out).ok());
        EXPECT_EQ(out, Expected("a", i * kChunk, kChunk));
        dispatcher_->WaitForIdle();
        EXPECT_LE(dispatcher_->ResidentBytes(), dispatcher_->CapacityBytes());
    }
    EXPECT_GT(dispatcher_->Stats().evictions, 0u);
}

TEST_F(DispatcherTest, CloseReleasesWaitingReader) {
    AddObject("a", 4 * kChunk);
    Start();
    StreamHandle h = OpenKey("a");
    mock_->Pause();

    Status result;
    std::thread reader([&] {
        std::vector<std::uint8_t> out;
        result = dispatcher_->Read(h, 0, 100, &out);
    });
    ASSERT_TRUE(mock_->WaitForPending(1, std::chrono::seconds(5)));
    while (dispatcher_->Stats().cache_misses < 1) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    dispatcher_->Close(h);
    reader.join();
    EXPECT_EQ(result.kind(), ErrorKind::Cancelled);
    EXPECT_EQ(dispatcher_->OpenStreams(), 0u);

    // The fetch still completes and stays cached for other handles
    mock_->Resume();
    dispatcher_->WaitForIdle();
    EXPECT_EQ(dispatcher_->ResidentBytes(), kChunk);

    StreamHandle other = OpenKey("a");
    std::vector<std::uint8_t> out;
    ASSERT_TRUE(dispatcher_->Read(other, 0, 100, &out).ok());
    EXPECT_EQ(mock_->TotalRequests(), 1u);
}

TEST_F(DispatcherTest, UnknownHandleIsRejected) {
    AddObject("a", kChunk);
    Start();
    StreamHandle h = OpenKey("a");
    dispatcher_->Close(h);

    std::vector<std::uint8_t> out;
    EXPECT_EQ(dispatcher_->Read(h, 0, 10, &out).kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(dispatcher_->Read(12345, 0, 10, &out).kind(), ErrorKind::InvalidArgument);
}

TEST_F(DispatcherTest, OpenMissingKey) {
    Start();
    StreamHandle h = 0;
    EXPECT_EQ(dispatcher_->Open("missing", &h).kind(), ErrorKind::NotFound);
    EXPECT_EQ(dispatcher_->OpenStreams(), 0u);
}

TEST_F(DispatcherTest, InvalidConfigThrows) {
    cfg_.prefetch_window_min = 8;
    cfg_.prefetch_window_max = 2;
    EXPECT_THROW({ ReadDispatcher d(cfg_, mock_); }, std::invalid_argument);

    Config zero_fetches = cfg_;
    zero_fetches.prefetch_window_min = 1;
    zero_fetches.max_concurrent_fetches = 0;
    EXPECT_THROW({ ReadDispatcher d(zero_fetches, mock_); }, std::invalid_argument);
}
