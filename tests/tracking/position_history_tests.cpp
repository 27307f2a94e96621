/**
 * @file position_history_tests.cpp
 * @brief Bounded FIFO behaviour and exact averaging of PositionHistory.
 */

#include "../common/math_expect.hpp"

#include <arfocus/tracking/position_history.hpp>
#include <algorithm>
#include <gtest/gtest.h>
#include <random>
#include <stdexcept>
#include <vector>

using namespace arfocus::tracking;
using test_helpers::expectVecNear;

TEST (PositionHistoryTests, RejectsZeroCapacity) { EXPECT_THROW (PositionHistory (0), std::invalid_argument); }

TEST (PositionHistoryTests, EvictsOldestBeyondCapacity)
{
    PositionHistory h (3);
    h.push (Vec3 (1.0, 0.0, 0.0));
    h.push (Vec3 (2.0, 0.0, 0.0));
    h.push (Vec3 (3.0, 0.0, 0.0));
    const Vec3 m = h.push (Vec3 (4.0, 0.0, 0.0));

    ASSERT_EQ (h.size (), 3u);
    EXPECT_EQ (h.samples ().front ().x (), 2.0);
    EXPECT_EQ (h.samples ().back ().x (), 4.0);
    EXPECT_DOUBLE_EQ (m.x (), 3.0);
}

/// @brief Never more than capacity samples; mean is always the mean of what is held.
TEST (PositionHistoryTests, MeanOfRetainedSamplesForRandomSequences)
{
    std::mt19937 rng (42);
    std::uniform_real_distribution<double> coord (-5.0, 5.0);

    PositionHistory h;
    std::vector<Vec3> all;
    for (int i = 0; i < 250; ++i)
    {
        const Vec3 p (coord (rng), coord (rng), coord (rng));
        all.push_back (p);
        const Vec3 m = h.push (p);

        ASSERT_LE (h.size (), 10u);
        const std::size_t n = std::min<std::size_t> (all.size (), 10);
        Vec3 expected = Vec3::Zero ();
        for (std::size_t k = all.size () - n; k < all.size (); ++k)
            expected += all[k];
        expected = expected / static_cast<double> (n);

        expectVecNear (m, expected, 1e-12);
    }
}

TEST (PositionHistoryTests, ClearForgetsEverything)
{
    PositionHistory h;
    h.push (Vec3::Constant (5.0));
    h.clear ();
    EXPECT_TRUE (h.empty ());
    EXPECT_EQ (h.capacity (), 10u);

    const Vec3 m = h.push (Vec3 (1.0, 2.0, 3.0));
    expectVecNear (m, Vec3 (1.0, 2.0, 3.0), 0.0);
}
