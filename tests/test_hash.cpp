#include <gtest/gtest.h>
#include "objfs/hash.hpp"
#include <unordered_set>

using namespace objfs;

TEST(HashTest, ChunkIdHashIsDeterministic) {
    ChunkId a{"data/file.bin", "\"abc\"", 42};
    ChunkId b{"data/file.bin", "\"abc\"", 42};
    EXPECT_EQ(HashChunkId(a), HashChunkId(b));
}

TEST(HashTest, FieldBoundariesMatter) {
    // Same concatenated bytes, different split between key and etag
    ChunkId a{"ab", "c", 0};
    ChunkId b{"a", "bc", 0};
    EXPECT_NE(HashChunkId(a), HashChunkId(b));
}

TEST(HashTest, IndexChangesHash) {
    std::unordered_set<std::uint64_t> seen;
    for (std::uint64_t i = 0; i < 1000; ++i) {
        seen.insert(HashChunkId(ChunkId{"k", "e", i}));
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(HashTest, ContentDigestHex) {
    std::vector<std::uint8_t> one = {1, 2, 3};
    std::vector<std::uint8_t> two = {1, 2, 4};

    std::string hex = ToHex(MakeContentDigest(one));
    EXPECT_EQ(hex.size(), 32u);
    EXPECT_EQ(hex, ToHex(MakeContentDigest(one)));
    EXPECT_NE(hex, ToHex(MakeContentDigest(two)));
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(HashTest, LongKeysDifferingInLastByte) {
    // Longer than one internal block of the streaming hash
    std::string key(1000, 'k');
    std::string other = key;
    other.back() = 'j';
    EXPECT_NE(HashChunkId(ChunkId{key, "\"v1\"", 7}), HashChunkId(ChunkId{other, "\"v1\"", 7}));
    EXPECT_EQ(HashChunkId(ChunkId{key, "\"v1\"", 7}), HashChunkId(ChunkId{key, "\"v1\"", 7}));

    std::string etag(600, 'e');
    EXPECT_NE(HashChunkId(ChunkId{"k", etag, 0}), HashChunkId(ChunkId{"k", etag + "x", 0}));
}

TEST(HashTest, EmptyFieldsHash) {
    ChunkId empty{"", "", 0};
    EXPECT_EQ(HashChunkId(empty), HashChunkId(ChunkId{"", "", 0}));
    EXPECT_NE(HashChunkId(empty), HashChunkId(ChunkId{"", "", 1}));
    EXPECT_NE(HashChunkId(empty), HashChunkId(ChunkId{"a", "", 0}));
}
