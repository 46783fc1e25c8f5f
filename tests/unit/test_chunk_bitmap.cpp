#include <gtest/gtest.h>
#include "chunkswarm/core/chunk_bitmap.hpp"

using chunkswarm::core::ChunkBitmap;

TEST(ChunkBitmapTest, StartsEmpty) {
    ChunkBitmap bitmap(10);
    EXPECT_EQ(bitmap.size(), 10u);
    EXPECT_TRUE(bitmap.none());
    EXPECT_FALSE(bitmap.complete());
    EXPECT_EQ(bitmap.bytes().size(), 2u);
}

TEST(ChunkBitmapTest, SetReportsNewBitsOnly) {
    ChunkBitmap bitmap(10);
    EXPECT_TRUE(bitmap.set(3));
    EXPECT_FALSE(bitmap.set(3));
    EXPECT_FALSE(bitmap.set(10));
    EXPECT_EQ(bitmap.count(), 1u);
    EXPECT_TRUE(bitmap.test(3));
    EXPECT_FALSE(bitmap.test(42));
}

TEST(ChunkBitmapTest, IndexZeroIsHighBit) {
    auto bitmap = ChunkBitmap::from_indices(9, {0, 8});
    ASSERT_EQ(bitmap.bytes().size(), 2u);
    EXPECT_EQ(bitmap.bytes()[0], 0x80);
    EXPECT_EQ(bitmap.bytes()[1], 0x80);
    EXPECT_EQ(bitmap.to_string(), "100000001");
}

TEST(ChunkBitmapTest, FullIsComplete) {
    auto bitmap = ChunkBitmap::full(13);
    EXPECT_TRUE(bitmap.complete());
    EXPECT_TRUE(bitmap.missing_indices().empty());
    EXPECT_EQ(bitmap.bytes()[1], 0xF8);
}

TEST(ChunkBitmapTest, EmptyBitmapIsNeverComplete) {
    ChunkBitmap bitmap(0);
    EXPECT_FALSE(bitmap.complete());
    EXPECT_TRUE(bitmap.bytes().empty());
}

TEST(ChunkBitmapTest, ResetAndMissing) {
    auto bitmap = ChunkBitmap::full(5);
    bitmap.reset(1);
    bitmap.reset(1);
    bitmap.reset(4);
    EXPECT_EQ(bitmap.count(), 3u);
    EXPECT_EQ(bitmap.missing_indices(), (std::vector<std::uint32_t>{1, 4}));
    EXPECT_EQ(bitmap.set_indices(), (std::vector<std::uint32_t>{0, 2, 3}));

    bitmap.clear();
    EXPECT_TRUE(bitmap.none());
}

TEST(ChunkBitmapTest, FromBytesChecksLengthAndPadding) {
    std::vector<std::uint8_t> bytes = {0xA0, 0x80};
    auto parsed = ChunkBitmap::from_bytes(9, bytes);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->set_indices(), (std::vector<std::uint32_t>{0, 2, 8}));

    EXPECT_FALSE(ChunkBitmap::from_bytes(17, bytes).has_value());

    std::vector<std::uint8_t> dirty_padding = {0x00, 0x40};
    EXPECT_FALSE(ChunkBitmap::from_bytes(9, dirty_padding).has_value());
}

TEST(ChunkBitmapTest, MergeUnionsMatchingSizes) {
    auto left = ChunkBitmap::from_indices(12, {0, 5});
    auto right = ChunkBitmap::from_indices(12, {5, 11});
    left.merge(right);
    EXPECT_EQ(left.set_indices(), (std::vector<std::uint32_t>{0, 5, 11}));
    EXPECT_EQ(left.count(), 3u);

    auto other_size = ChunkBitmap::full(4);
    left.merge(other_size);
    EXPECT_EQ(left.count(), 3u);
}
