/**
 * @file geometry.hpp
 * @brief Bearing and angle utilities
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <cmath>
#include <optional>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace geo_estimator {

/**
 * @brief Normalize an angle to [0, 360)
 */
double normalizeAngle(double deg);

/**
 * @brief Wrap an angle difference to (-180, 180]
 *
 * An exact -180 result is reported as +180.
 */
double wrapDelta(double deg);

/**
 * @brief Absolute heading mismatch in [0, 180]
 */
double angularDifference(double a_deg, double b_deg);

/**
 * @brief Absolute bearing of a pixel column
 *
 * Uses the pinhole model when fx and cx are both given, else the linear
 * HFOV heuristic.
 *
 * @param u Horizontal pixel coordinate of the target
 * @param image_width Image width (pixels)
 * @param hfov_deg Horizontal field of view (degrees)
 * @param heading_deg Camera compass heading (degrees)
 * @param cx Principal point x (pixels)
 * @param fx Focal length x (pixels)
 * @return Bearing in [0, 360)
 * @throws InvalidGeometryInput if neither model is usable
 */
double bearingFromBBox(
    double u,
    int image_width,
    std::optional<double> hfov_deg,
    double heading_deg,
    std::optional<double> cx = std::nullopt,
    std::optional<double> fx = std::nullopt
);

/**
 * @brief Bearing of the bbox center for a validated request
 */
double bearingForRequest(const EstimationRequest& request);

/**
 * @brief Great-circle distance on a 6371 km sphere (meters)
 */
double haversineDistance(const GeoPoint& a, const GeoPoint& b);

inline double deg2rad(double deg) { return deg * M_PI / 180.0; }
inline double rad2deg(double rad) { return rad * 180.0 / M_PI; }

} // namespace geo_estimator
