#include <gtest/gtest.h>
#include "../nav_geometry/geo_distance.h"
#include "../common/nav_constants.h"

using tripnav::Coordinate;
using tripnav::nav_geometry::distanceMeters;
using tripnav::nav_geometry::midpoint;

constexpr double TOL = 1e-6;

// ============================================================================
// Test Suite: GeoDistance
// ============================================================================

TEST(GeoDistance, SamePointIsZero) {
    Coordinate p{48.8566, 2.3522};
    EXPECT_DOUBLE_EQ(distanceMeters(p, p), 0.0);
}

TEST(GeoDistance, OneThousandthOfADegreeIs111Meters) {
    EXPECT_NEAR(distanceMeters(Coordinate{0.0, 0.0}, Coordinate{0.0, 0.001}), 111.0, TOL);
    EXPECT_NEAR(distanceMeters(Coordinate{0.0, 0.0}, Coordinate{0.001, 0.0}), 111.0, TOL);
}

TEST(GeoDistance, BothAxesUseTheSameScale) {
    // 3-4-5 triangle in ten-thousandths of a degree.
    double d = distanceMeters(Coordinate{0.0, 0.0}, Coordinate{0.0003, 0.0004});
    EXPECT_NEAR(d, 0.0005 * tripnav::constants::kMetersPerDegree, TOL);
}

TEST(GeoDistance, IsSymmetric) {
    Coordinate a{10.0, 10.0};
    Coordinate b{10.0007, 9.9991};
    EXPECT_DOUBLE_EQ(distanceMeters(a, b), distanceMeters(b, a));
}

TEST(GeoDistance, NoLatitudeCorrectionAwayFromEquator) {
    // The planar approximation ignores cos(latitude) on purpose.
    EXPECT_NEAR(distanceMeters(Coordinate{60.0, 0.0}, Coordinate{60.0, 0.001}), 111.0, TOL);
}

TEST(GeoDistance, ArrivalScenarioDistances) {
    Coordinate destination{0.0, 0.001};
    EXPECT_NEAR(distanceMeters(Coordinate{0.0, 0.00099}, destination), 1.11, TOL);
    EXPECT_NEAR(distanceMeters(Coordinate{0.0, 0.0008}, destination), 22.2, TOL);
}

TEST(GeoDistance, OffRouteScenarioDistance) {
    EXPECT_NEAR(distanceMeters(Coordinate{10.0, 10.0}, Coordinate{10.0, 10.0012}), 133.2, TOL);
}

// ============================================================================
// Test Suite: GeoMidpoint
// ============================================================================

TEST(GeoMidpoint, AveragesBothComponents) {
    Coordinate m = midpoint(Coordinate{10.0, 20.0}, Coordinate{12.0, 24.0});
    EXPECT_DOUBLE_EQ(m.latitude, 11.0);
    EXPECT_DOUBLE_EQ(m.longitude, 22.0);
}
