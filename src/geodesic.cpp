/**
 * @file geodesic.cpp
 * @brief Vincenty direct solution on the WGS84 ellipsoid
 */

#include "geo_estimator/geodesic.hpp"
#include "geo_estimator/errors.hpp"
#include "geo_estimator/geometry.hpp"
#include <cmath>
#include <limits>

namespace geo_estimator {

GeoPoint projectGeodesic(
    const GeoPoint& origin,
    double bearing_deg,
    double distance_m,
    int max_iterations
) {
    if (!std::isfinite(distance_m) || distance_m < 0.0) {
        throw InvalidGeometryInput("distance_m must be a finite value >= 0");
    }
    if (distance_m == 0.0) {
        return origin;
    }

    const double a = Wgs84::a;
    const double b = Wgs84::b;
    const double f = Wgs84::f;

    double alpha1 = deg2rad(bearing_deg);
    double sin_alpha1 = std::sin(alpha1);
    double cos_alpha1 = std::cos(alpha1);

    // Reduced latitude
    double tan_u1 = (1.0 - f) * std::tan(deg2rad(origin.lat));
    double cos_u1 = 1.0 / std::sqrt(1.0 + tan_u1 * tan_u1);
    double sin_u1 = tan_u1 * cos_u1;

    double sigma1 = std::atan2(tan_u1, cos_alpha1);
    double sin_alpha = cos_u1 * sin_alpha1;
    double cos_sq_alpha = 1.0 - sin_alpha * sin_alpha;
    double u_sq = cos_sq_alpha * (a * a - b * b) / (b * b);

    double A = 1.0 + u_sq / 16384.0 * (4096.0 + u_sq * (-768.0 + u_sq * (320.0 - 175.0 * u_sq)));
    double B = u_sq / 1024.0 * (256.0 + u_sq * (-128.0 + u_sq * (74.0 - 47.0 * u_sq)));

    double sigma = distance_m / (b * A);
    double sigma_prev = std::numeric_limits<double>::infinity();
    double cos2_sigma_m = 0.0;
    double sin_sigma = 0.0;
    double cos_sigma = 0.0;

    int iterations = 0;
    while (std::abs(sigma - sigma_prev) > GEODESIC_SIGMA_TOLERANCE) {
        if (iterations >= max_iterations) {
            throw GeodesicNonConvergence(iterations, std::abs(sigma - sigma_prev));
        }
        cos2_sigma_m = std::cos(2.0 * sigma1 + sigma);
        sin_sigma = std::sin(sigma);
        cos_sigma = std::cos(sigma);
        double delta_sigma = B * sin_sigma * (
            cos2_sigma_m + B / 4.0 * (
                cos_sigma * (-1.0 + 2.0 * cos2_sigma_m * cos2_sigma_m) -
                B / 6.0 * cos2_sigma_m *
                    (-3.0 + 4.0 * sin_sigma * sin_sigma) *
                    (-3.0 + 4.0 * cos2_sigma_m * cos2_sigma_m)
            )
        );
        sigma_prev = sigma;
        sigma = distance_m / (b * A) + delta_sigma;
        ++iterations;
    }

    double tmp = sin_u1 * sin_sigma - cos_u1 * cos_sigma * cos_alpha1;
    double phi2 = std::atan2(
        sin_u1 * cos_sigma + cos_u1 * sin_sigma * cos_alpha1,
        (1.0 - f) * std::sqrt(sin_alpha * sin_alpha + tmp * tmp)
    );
    double lambda = std::atan2(
        sin_sigma * sin_alpha1,
        cos_u1 * cos_sigma - sin_u1 * sin_sigma * cos_alpha1
    );
    double C = f / 16.0 * cos_sq_alpha * (4.0 + f * (4.0 - 3.0 * cos_sq_alpha));
    double L = lambda - (1.0 - C) * f * sin_alpha * (
        sigma + C * sin_sigma * (
            cos2_sigma_m + C * cos_sigma * (-1.0 + 2.0 * cos2_sigma_m * cos2_sigma_m)
        )
    );

    GeoPoint result;
    result.lat = rad2deg(phi2);
    result.lon = normalizeAngle(origin.lon + rad2deg(L) + 180.0) - 180.0;
    return result;
}

} // namespace geo_estimator
