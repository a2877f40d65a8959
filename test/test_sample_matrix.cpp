// Sample matrix helpers: baseline, variance statistics, row layout.

#include "math/sample_matrix.h"

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

using oc::SampleMatrix;
using oc::Signal;

// ============================================================================
// Baseline and Variance
// ============================================================================

TEST(SampleMatrix, BaselineSubtractsFirstSample) {
    SampleMatrix m(2, 3);
    m << 5.0, 6.0, 8.0,
         -1.0, -1.0, 2.0;
    oc::baseline_correct(m);
    EXPECT_DOUBLE_EQ(m(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(m(0, 2), 3.0);
    EXPECT_DOUBLE_EQ(m(1, 1), 0.0);
    EXPECT_DOUBLE_EQ(m(1, 2), 3.0);
}

TEST(SampleMatrix, ChannelVarianceIsUnbiased) {
    Signal x(4);
    x << 1.0, 2.0, 3.0, 4.0;
    EXPECT_NEAR(oc::channel_variance(x), 5.0 / 3.0, 1e-15);

    Signal one(1);
    one << 7.0;
    EXPECT_DOUBLE_EQ(oc::channel_variance(one), 0.0);
}

TEST(SampleMatrix, NoiseReductionPercent) {
    SampleMatrix before(2, 4);
    before << 1.0, -1.0, 1.0, -1.0,
              2.0, -2.0, 2.0, -2.0;
    const SampleMatrix after = before * 0.5;
    // Variance scales by 0.25
    EXPECT_NEAR(oc::noise_reduction_pct(before, after), 75.0, 1e-12);
}

TEST(SampleMatrix, NoiseReductionZeroWhenInputFlat) {
    const SampleMatrix flat = SampleMatrix::Constant(3, 10, 4.0);
    const SampleMatrix other = SampleMatrix::Random(3, 10);
    EXPECT_DOUBLE_EQ(oc::noise_reduction_pct(flat, other), 0.0);
}

TEST(SampleMatrix, ChannelPowerReduction) {
    SampleMatrix before(2, 2);
    before << 2.0, 2.0,
              0.0, 0.0;
    SampleMatrix after(2, 2);
    after << 1.0, 1.0,
             5.0, 5.0;
    const std::vector<double> pct = oc::channel_power_reduction_pct(before, after);
    ASSERT_EQ(pct.size(), 2u);
    EXPECT_NEAR(pct[0], 75.0, 1e-12);
    EXPECT_DOUBLE_EQ(pct[1], 0.0);  // No power before: undefined, reported as 0
}

// ============================================================================
// Row Layout
// ============================================================================

TEST(SampleMatrix, InterleaveThenStrideRecoversAxes) {
    const SampleMatrix z = SampleMatrix::Random(3, 5);
    const SampleMatrix y = SampleMatrix::Random(3, 5);
    const SampleMatrix both = oc::interleave_rows(z, y, 3);
    ASSERT_EQ(both.rows(), 6);
    EXPECT_TRUE(both.row(2) == z.row(1));
    EXPECT_TRUE(both.row(3) == y.row(1));
    EXPECT_TRUE(oc::strided_rows(both, 0, 2, 3) == z);
    EXPECT_TRUE(oc::strided_rows(both, 1, 2, 3) == y);
}

TEST(SampleMatrix, InterleaveUsesLeadingRowsOnly) {
    const SampleMatrix z = SampleMatrix::Random(4, 2);
    const SampleMatrix y = SampleMatrix::Random(4, 2);
    const SampleMatrix both = oc::interleave_rows(z, y, 2);
    EXPECT_EQ(both.rows(), 4);
    EXPECT_TRUE(both.row(3) == y.row(1));
}

TEST(SampleMatrix, SelectRowsKeepsRequestedOrder) {
    SampleMatrix m(4, 1);
    m << 10.0, 11.0, 12.0, 13.0;
    const SampleMatrix s = oc::select_rows(m, {3, 0, 2});
    ASSERT_EQ(s.rows(), 3);
    EXPECT_DOUBLE_EQ(s(0, 0), 13.0);
    EXPECT_DOUBLE_EQ(s(1, 0), 10.0);
    EXPECT_DOUBLE_EQ(s(2, 0), 12.0);
}
