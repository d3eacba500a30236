/**
 * @file geodesic.hpp
 * @brief WGS84 direct geodesic projection (Vincenty)
 */

#pragma once

#include "data_types.hpp"

namespace geo_estimator {

/**
 * @brief WGS84 ellipsoid constants
 */
struct Wgs84 {
    static constexpr double a = 6378137.0;                 ///< Semi-major axis (m)
    static constexpr double f = 1.0 / 298.257223563;       ///< Flattening
    static constexpr double b = a * (1.0 - f);             ///< Semi-minor axis (m)
};

constexpr int DEFAULT_GEODESIC_MAX_ITERATIONS = 200;
constexpr double GEODESIC_SIGMA_TOLERANCE = 1e-12;

/**
 * @brief Destination point from origin, initial bearing and distance
 *
 * A zero distance returns the origin unchanged without iterating.
 * Longitude is normalized to [-180, 180).
 *
 * @param origin Start point (degrees)
 * @param bearing_deg Initial bearing (degrees clockwise from north)
 * @param distance_m Distance along the geodesic (meters, >= 0)
 * @param max_iterations Cap on sigma iterations
 * @throws InvalidGeometryInput for negative or non-finite distance
 * @throws GeodesicNonConvergence if sigma does not settle within the cap
 */
GeoPoint projectGeodesic(
    const GeoPoint& origin,
    double bearing_deg,
    double distance_m,
    int max_iterations = DEFAULT_GEODESIC_MAX_ITERATIONS
);

} // namespace geo_estimator
