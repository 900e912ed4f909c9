#include <gtest/gtest.h>
#include "transmit/burst_chunker.hpp"
#include "test_support.hpp"

#include <vector>

using namespace marquise;
using namespace marquise::test;

namespace {

// Drain a chunker; returns the final status (END or FORMAT_ERROR)
ReadStatus collect(BurstChunker& chunker, std::vector<std::vector<uint8_t>>& bursts) {
    std::vector<uint8_t> burst;
    for (;;) {
        ReadStatus st = chunker.next(burst);
        if (st != ReadStatus::OK) return st;
        bursts.push_back(burst);
    }
}

} // namespace

TEST(BurstChunkerTest, SmallPointsFormOneBurst) {
    std::vector<uint8_t> buf;
    append_point(buf, 0x10, 1, 100);
    append_point(buf, 0x20, 2, 200);
    append_point(buf, 0x30, 3, 300);

    PointReader reader(buf.data(), buf.size());
    BurstChunker chunker(reader);
    EXPECT_EQ(chunker.target_size(), IDEAL_BURST_SIZE);
    std::vector<std::vector<uint8_t>> bursts;

    EXPECT_EQ(collect(chunker, bursts), ReadStatus::END);
    ASSERT_EQ(bursts.size(), 1u);
    EXPECT_EQ(bursts[0].size(), 72u);
    EXPECT_EQ(bursts[0], buf);
}

TEST(BurstChunkerTest, OversizedExtendedPointGoesAlone) {
    const size_t payload = 20 * 1048576;
    std::vector<uint8_t> buf;
    append_extended_point(buf, 0x41, 1, payload);

    PointReader reader(buf.data(), buf.size());
    BurstChunker chunker(reader, IDEAL_BURST_SIZE);
    std::vector<std::vector<uint8_t>> bursts;

    EXPECT_EQ(collect(chunker, bursts), ReadStatus::END);
    ASSERT_EQ(bursts.size(), 1u);
    EXPECT_EQ(bursts[0].size(), payload + 24);
}

TEST(BurstChunkerTest, OversizedPointIsNotMergedWithNeighbours) {
    std::vector<uint8_t> buf;
    append_point(buf, 0x10, 1, 1);
    append_extended_point(buf, 0x21, 2, 200);
    append_point(buf, 0x30, 3, 3);

    PointReader reader(buf.data(), buf.size());
    BurstChunker chunker(reader, 100);
    std::vector<std::vector<uint8_t>> bursts;

    EXPECT_EQ(collect(chunker, bursts), ReadStatus::END);
    ASSERT_EQ(bursts.size(), 3u);
    EXPECT_EQ(bursts[0].size(), 24u);
    EXPECT_EQ(bursts[1].size(), 224u);
    EXPECT_EQ(bursts[2].size(), 24u);
}

TEST(BurstChunkerTest, BoundariesAndSizeBoundHold) {
    std::vector<uint8_t> buf;
    std::vector<size_t> point_sizes;
    for (int i = 0; i < 40; ++i) {
        if (i % 3 == 0) {
            size_t payload = static_cast<size_t>(i * 7 % 90);
            append_extended_point(buf, 0x101 + i * 2, i, payload, static_cast<uint8_t>(i));
            point_sizes.push_back(24 + payload);
        } else {
            append_point(buf, 0x100 + i * 2, i, i);
            point_sizes.push_back(24);
        }
    }

    const size_t target = 100;
    PointReader reader(buf.data(), buf.size());
    BurstChunker chunker(reader, target);
    std::vector<std::vector<uint8_t>> bursts;
    ASSERT_EQ(collect(chunker, bursts), ReadStatus::END);

    // Concatenation reproduces the input
    std::vector<uint8_t> joined;
    for (const auto& b : bursts) {
        joined.insert(joined.end(), b.begin(), b.end());
    }
    EXPECT_EQ(joined, buf);

    // Every burst boundary is a point boundary, and only single-point
    // bursts exceed the target
    size_t pi = 0;
    for (const auto& b : bursts) {
        size_t consumed = 0;
        size_t points = 0;
        while (consumed < b.size()) {
            ASSERT_LT(pi, point_sizes.size());
            consumed += point_sizes[pi++];
            points++;
        }
        EXPECT_EQ(consumed, b.size());
        if (b.size() > target) {
            EXPECT_EQ(points, 1u);
        }
    }
    EXPECT_EQ(pi, point_sizes.size());
}

TEST(BurstChunkerTest, ExactTargetFlushes) {
    std::vector<uint8_t> buf;
    for (int i = 0; i < 4; ++i) {
        append_point(buf, 0x10 + i * 2, i, i);
    }

    PointReader reader(buf.data(), buf.size());
    BurstChunker chunker(reader, 48);
    std::vector<std::vector<uint8_t>> bursts;

    EXPECT_EQ(collect(chunker, bursts), ReadStatus::END);
    ASSERT_EQ(bursts.size(), 2u);
    EXPECT_EQ(bursts[0].size(), 48u);
    EXPECT_EQ(bursts[1].size(), 48u);
}

TEST(BurstChunkerTest, EmptyInputYieldsNoBursts) {
    PointReader reader(nullptr, 0);
    BurstChunker chunker(reader);
    std::vector<uint8_t> burst;
    EXPECT_EQ(chunker.next(burst), ReadStatus::END);
    EXPECT_TRUE(burst.empty());
}

TEST(BurstChunkerTest, FormatErrorEmitsNothing) {
    std::vector<uint8_t> buf;
    append_point(buf, 0x10, 1, 1);
    size_t off = buf.size();
    append_extended_point(buf, 0x21, 2, 50);
    store_u64_le(buf.data() + off + 16, 100);

    PointReader reader(buf.data(), buf.size());
    BurstChunker chunker(reader);
    std::vector<uint8_t> burst;

    EXPECT_EQ(chunker.next(burst), ReadStatus::FORMAT_ERROR);
    EXPECT_TRUE(burst.empty());
    EXPECT_STREQ(chunker.error(), "not enough bytes in alleged extended burst");
    EXPECT_EQ(chunker.next(burst), ReadStatus::FORMAT_ERROR);
}
