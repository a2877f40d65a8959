#include <gtest/gtest.h>
#include "math/vec3.h"

#include <limits>
#include <vector>

using oc::Vec3;

// ============================================================================
// Orientation Vector
// ============================================================================

TEST(Vec3Test, DefaultConstructsToZero) {
    Vec3 v;
    EXPECT_DOUBLE_EQ(v.x, 0.0);
    EXPECT_DOUBLE_EQ(v.y, 0.0);
    EXPECT_DOUBLE_EQ(v.z, 0.0);
}

TEST(Vec3Test, ConstexprSensingAxes) {
    constexpr Vec3 kZ(0.0, 0.0, 1.0);
    static_assert(kZ.z == 1.0, "constexpr construction");
    const std::vector<Vec3> rows(4, kZ);
    EXPECT_DOUBLE_EQ(rows[3].z, 1.0);
    EXPECT_DOUBLE_EQ(rows[3].x, 0.0);
}

TEST(Vec3Test, FiniteCheck) {
    EXPECT_TRUE(Vec3(1.0, -2.0, 0.0).is_finite());
    EXPECT_TRUE(Vec3().is_finite());
    EXPECT_FALSE(Vec3(std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0).is_finite());
    EXPECT_FALSE(Vec3(0.0, std::numeric_limits<double>::infinity(), 0.0).is_finite());
    EXPECT_FALSE(Vec3(0.0, 0.0, -std::numeric_limits<double>::infinity()).is_finite());
}
