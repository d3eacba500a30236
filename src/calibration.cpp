/**
 * @file calibration.cpp
 * @brief Pinhole back-projection
 */

#include "geo_estimator/calibration.hpp"
#include "geo_estimator/geometry.hpp"
#include <cmath>

namespace geo_estimator {

Eigen::Vector3d PinholeIntrinsics::pixelRay(double u, double v) const {
    // K^-1 [u v 1]^T; no undistortion applied
    return K().inverse() * Eigen::Vector3d(u, v, 1.0);
}

double PinholeIntrinsics::yawOffsetDeg(double u) const {
    Eigen::Vector3d ray = pixelRay(u, cyOrDefault());
    return rad2deg(std::atan2(ray.x(), ray.z()));
}

} // namespace geo_estimator
