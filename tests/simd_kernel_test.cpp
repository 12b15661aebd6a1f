#include "simd_kernel.h"
#include "escape_time.h"
#include "errors.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

TEST(SimdKernelTest, EveryLaneMatchesTheScalarKernel)
{
    // Mix of points escaping at once, late and never
    const std::vector<double> re = {3.0, 0.0, -2.0, 1.0, -0.75, 0.25, -1.0, 0.3,
                                    -0.1, 0.4, 2.0, -1.75, 0.28, -0.5, 0.0, 0.37};
    const std::vector<double> im = {3.0, 0.0, 0.0, 0.0, 0.1, 0.0, 0.0, 0.5,
                                    0.65, 0.6, 2.0, 0.02, 0.008, 0.5, 1.0, -0.1};
    const int budget = 500;

    for (int lanes : SUPPORTED_LANE_WIDTHS)
    {
        for (int offset = 0; offset + lanes <= static_cast<int>(re.size()); offset += lanes)
        {
            std::vector<int> counts(lanes, -1);
            iterateLanes(re.data() + offset, im.data() + offset, lanes, budget, counts.data());

            for (int i = 0; i < lanes; ++i)
            {
                EXPECT_EQ(counts[i], iterate(re[offset + i], im[offset + i], budget))
                    << "lanes " << lanes << " point " << offset + i;
            }
        }
    }
}

TEST(SimdKernelTest, EscapedLanesStopCounting)
{
    const double re[4] = {3.0, 0.0, 3.0, 0.0};
    const double im[4] = {3.0, 0.0, 3.0, 0.0};
    int counts[4] = {};

    iterateLanes(re, im, 4, 77, counts);

    EXPECT_EQ(counts[0], 1);
    EXPECT_EQ(counts[1], 77);
    EXPECT_EQ(counts[2], 1);
    EXPECT_EQ(counts[3], 77);
}

TEST(SimdKernelTest, AllLanesEscapedEndsEarlyWithCorrectCounts)
{
    const double re[8] = {3.0, 2.5, -3.0, 1.0, 2.0, -2.5, 0.0, 10.0};
    const double im[8] = {3.0, 0.0, 1.0, 1.0, 2.0, 0.0, 3.0, 10.0};
    int counts[8] = {};

    iterateLanes(re, im, 8, 1000000, counts);

    for (int i = 0; i < 8; ++i)
    {
        EXPECT_EQ(counts[i], iterate(re[i], im[i], 1000000));
        EXPECT_LT(counts[i], 10);
    }
}

TEST(SimdKernelTest, RejectsUnsupportedLaneWidths)
{
    EXPECT_FALSE(isSupportedLaneWidth(0));
    EXPECT_FALSE(isSupportedLaneWidth(3));
    EXPECT_FALSE(isSupportedLaneWidth(32));
    EXPECT_TRUE(isSupportedLaneWidth(8));

    double re[3] = {}, im[3] = {};
    int counts[3] = {};
    EXPECT_THROW(iterateLanes(re, im, 3, 10, counts), ConfigurationError);
    EXPECT_THROW(validateLaneWidth(-4, 64), ConfigurationError);
}

TEST(SimdKernelTest, WidthMustBeAMultipleOfTheLaneWidth)
{
    EXPECT_NO_THROW(validateLaneWidth(8, 800));
    EXPECT_NO_THROW(validateLaneWidth(1, 801));

    try
    {
        validateLaneWidth(8, 801);
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError &e)
    {
        EXPECT_NE(std::string(e.what()).find("not divisible"), std::string::npos);
    }
}

TEST(SimdKernelTest, NativeLaneWidthIsSupported)
{
    EXPECT_TRUE(isSupportedLaneWidth(nativeLaneWidth()));
}
