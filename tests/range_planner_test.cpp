#include <gtest/gtest.h>

#include <ffdl/range_planner.hpp>

using ffdl::ByteRange;
using ffdl::kMiB;
using ffdl::plan_ranges;

TEST(RangePlanner, EmptyInputs) {
	EXPECT_TRUE(plan_ranges(0, 4 * kMiB).empty());
	EXPECT_TRUE(plan_ranges(100, 0).empty());
}

TEST(RangePlanner, ExactMultiple) {
	auto ranges = plan_ranges(12 * kMiB, 4 * kMiB);
	ASSERT_EQ(ranges.size(), 3u);
	EXPECT_EQ(ranges[0], (ByteRange{0, 4 * kMiB - 1}));
	EXPECT_EQ(ranges[2], (ByteRange{8 * kMiB, 12 * kMiB - 1}));
}

TEST(RangePlanner, LastRangeTruncated) {
	auto ranges = plan_ranges(10, 4);
	ASSERT_EQ(ranges.size(), 3u);
	EXPECT_EQ(ranges[2], (ByteRange{8, 9}));
	EXPECT_EQ(ranges[2].length(), 2u);
}

TEST(RangePlanner, SingleByte) {
	auto ranges = plan_ranges(1, ffdl::kDefaultChunkSize);
	ASSERT_EQ(ranges.size(), 1u);
	EXPECT_EQ(ranges[0], (ByteRange{0, 0}));
}

TEST(RangePlanner, CoversWholeFileWithoutGaps) {
	const std::uint64_t sizes[] = {1,	 2,	   3,		 7,		   1023,
								   1024, 4095, 4096, 4097, 5 * kMiB + 3,
								   kMiB, 9999999};
	const std::uint64_t chunks[] = {1, 3, 512, 4096, kMiB, 4 * kMiB};

	for (auto total : sizes) {
		for (auto chunk : chunks) {
			if (total / chunk > 100000) continue;
			SCOPED_TRACE(::testing::Message() << total << "/" << chunk);
			auto ranges = plan_ranges(total, chunk);

			ASSERT_FALSE(ranges.empty());
			EXPECT_EQ(ranges.front().start, 0u);
			EXPECT_EQ(ranges.back().end, total - 1);
			for (std::size_t i = 0; i < ranges.size(); ++i) {
				EXPECT_LE(ranges[i].start, ranges[i].end);
				EXPECT_LE(ranges[i].length(), chunk);
				if (i > 0) EXPECT_EQ(ranges[i].start, ranges[i - 1].end + 1);
			}
		}
	}
}
