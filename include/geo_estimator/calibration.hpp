/**
 * @file calibration.hpp
 * @brief Camera models used to turn a pixel column into a yaw offset
 */

#pragma once

#include "common.hpp"
#include <Eigen/Dense>
#include <optional>

namespace geo_estimator {

/**
 * @brief Pinhole camera intrinsic parameters
 *
 * Only fx and cx are required for a horizontal angle. fy/cy default to
 * fx and the image center so the full camera matrix is always defined.
 */
struct PinholeIntrinsics {
    double fx;  ///< Focal length x (pixels)
    double cx;  ///< Principal point x (pixels)

    std::optional<double> fy;  ///< Focal length y (pixels)
    std::optional<double> cy;  ///< Principal point y (pixels)

    int width = 0;   ///< Image width
    int height = 0;  ///< Image height

    double fyOrDefault() const { return fy.value_or(fx); }
    double cyOrDefault() const { return cy.value_or(height / 2.0); }

    /**
     * @brief Get camera matrix K
     */
    Eigen::Matrix3d K() const {
        Eigen::Matrix3d mat;
        mat << fx, 0, cx,
               0, fyOrDefault(), cyOrDefault(),
               0, 0, 1;
        return mat;
    }

    /**
     * @brief Back-project a pixel to a camera-frame ray (z forward, x right, y down)
     */
    Eigen::Vector3d pixelRay(double u, double v) const;

    /**
     * @brief Horizontal angle of a pixel column off the optical axis (degrees, + right)
     */
    double yawOffsetDeg(double u) const;
};

/**
 * @brief Linear horizontal-FOV camera approximation
 */
struct HfovCamera {
    double hfov_deg;  ///< Horizontal field of view (degrees)
    int width;        ///< Image width (pixels)

    double degreesPerPixel() const { return hfov_deg / width; }

    /**
     * @brief Yaw offset of a pixel column from the image center (degrees, + right)
     */
    double yawOffsetDeg(double u) const {
        return (u - width / 2.0) * degreesPerPixel();
    }
};

} // namespace geo_estimator
