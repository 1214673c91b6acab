#include <gtest/gtest.h>

#include "tabstream/core/errors.hpp"
#include "tabstream/core/slice.hpp"

namespace tabstream {
namespace {

////////////////////////////////////////////////////////////////////////////////

TEST(TSliceTest, FiveRowsByTwo)
{
    auto ranges = slice_ranges(5, 2);
    ASSERT_EQ(3u, ranges.size());
    EXPECT_EQ((RowRange{0, 2}), ranges[0]);
    EXPECT_EQ((RowRange{2, 4}), ranges[1]);
    EXPECT_EQ((RowRange{4, 5}), ranges[2]);
}

TEST(TSliceTest, CoversWithoutGaps)
{
    for (size_t length = 0; length <= 30; ++length) {
        for (size_t n = 1; n <= 12; ++n) {
            auto ranges = slice_ranges(length, n);
            ASSERT_EQ((length + n - 1) / n, ranges.size()) << length << "/" << n;

            size_t expected_begin = 0;
            for (size_t i = 0; i < ranges.size(); ++i) {
                EXPECT_EQ(expected_begin, ranges[i].begin);
                EXPECT_GT(ranges[i].size(), 0u);
                if (i + 1 < ranges.size()) {
                    EXPECT_EQ(n, ranges[i].size());
                } else {
                    EXPECT_LE(ranges[i].size(), n);
                }
                expected_begin = ranges[i].end;
            }
            EXPECT_EQ(length, expected_begin);
        }
    }
}

TEST(TSliceTest, LargeSliceYieldsSingleRange)
{
    auto ranges = slice_ranges(7, 100);
    ASSERT_EQ(1u, ranges.size());
    EXPECT_EQ((RowRange{0, 7}), ranges[0]);
}

TEST(TSliceTest, EmptyLength)
{
    EXPECT_TRUE(slice_ranges(0, 3).empty());
}

TEST(TSliceTest, ZeroSizeRejected)
{
    EXPECT_THROW(SliceGenerator(10, 0), ConfigurationError);
    EXPECT_THROW(slice_ranges(10, 0), ConfigurationError);
}

TEST(TSliceTest, GeneratorReset)
{
    SliceGenerator slices(3, 2);
    RowRange range;
    ASSERT_TRUE(slices.next(range));
    ASSERT_TRUE(slices.next(range));
    EXPECT_FALSE(slices.next(range));
    EXPECT_FALSE(slices.next(range));

    slices.reset();
    ASSERT_TRUE(slices.next(range));
    EXPECT_EQ((RowRange{0, 2}), range);
}

////////////////////////////////////////////////////////////////////////////////

} // namespace
} // namespace tabstream
