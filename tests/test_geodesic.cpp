/**
 * @file test_geodesic.cpp
 * @brief Vincenty direct projection on WGS84
 */

#include <gtest/gtest.h>

#include <geo_estimator/errors.hpp>
#include <geo_estimator/geodesic.hpp>
#include <geo_estimator/geometry.hpp>

#include <limits>

using namespace geo_estimator;

TEST(ProjectGeodesic, ZeroDistanceReturnsOriginExactly) {
    GeoPoint origin{52.520008, 13.404954};
    GeoPoint out = projectGeodesic(origin, 123.4, 0.0);
    EXPECT_EQ(out.lat, origin.lat);
    EXPECT_EQ(out.lon, origin.lon);
}

TEST(ProjectGeodesic, EastAlongEquator) {
    GeoPoint out = projectGeodesic({0.0, 0.0}, 90.0, 1000.0);
    EXPECT_LT(std::abs(out.lat), 1e-6);
    EXPECT_GT(out.lon, 0.0080);
    EXPECT_LT(out.lon, 0.0095);
    // 1 km / (a * pi / 180)
    EXPECT_NEAR(out.lon, 0.008983152841, 1e-9);
}

TEST(ProjectGeodesic, NorthAlongMeridian) {
    GeoPoint out = projectGeodesic({0.0, 0.0}, 0.0, 110574.0);
    EXPECT_NEAR(out.lat, 1.0, 1e-4);
    EXPECT_NEAR(out.lon, 0.0, 1e-12);
}

TEST(ProjectGeodesic, ShortHopAgreesWithHaversine) {
    GeoPoint origin{47.3769, 8.5417};
    GeoPoint out = projectGeodesic(origin, 37.0, 20.0);
    // Sphere vs ellipsoid differ by well under a percent at 20 m
    EXPECT_NEAR(haversineDistance(origin, out), 20.0, 0.2);
}

TEST(ProjectGeodesic, LongitudeWrapsAcrossAntimeridian) {
    GeoPoint out = projectGeodesic({0.0, 179.9999}, 90.0, 1000.0);
    EXPECT_GE(out.lon, -180.0);
    EXPECT_LT(out.lon, 180.0);
    EXPECT_LT(out.lon, -179.99);
}

TEST(ProjectGeodesic, NegativeOrNonFiniteDistanceRejected) {
    EXPECT_THROW(projectGeodesic({0.0, 0.0}, 0.0, -1.0), InvalidGeometryInput);
    EXPECT_THROW(projectGeodesic({0.0, 0.0}, 0.0, std::numeric_limits<double>::infinity()),
                 InvalidGeometryInput);
}

TEST(ProjectGeodesic, IterationCapExhaustedThrows) {
    // One iteration cannot settle sigma for an intercontinental distance
    try {
        projectGeodesic({10.0, 20.0}, 45.0, 5.0e6, 1);
        FAIL() << "expected GeodesicNonConvergence";
    } catch (const GeodesicNonConvergence& e) {
        EXPECT_EQ(e.iterations(), 1);
    }
}
