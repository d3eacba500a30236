/**
 * @file geometry.cpp
 * @brief Implementation of bearing and angle utilities
 */

#include "geo_estimator/geometry.hpp"
#include "geo_estimator/errors.hpp"
#include <algorithm>
#include <cmath>

namespace geo_estimator {

namespace {
constexpr double EARTH_MEAN_RADIUS_M = 6371000.0;
}

double normalizeAngle(double deg) {
    double r = std::fmod(deg, 360.0);
    if (r < 0.0) {
        r += 360.0;
    }
    // -1e-15 + 360 rounds to 360
    if (r >= 360.0) {
        r = 0.0;
    }
    return r;
}

double wrapDelta(double deg) {
    double wrapped = normalizeAngle(deg + 180.0) - 180.0;
    if (wrapped == -180.0) {
        return 180.0;
    }
    return wrapped;
}

double angularDifference(double a_deg, double b_deg) {
    return std::abs(wrapDelta(a_deg - b_deg));
}

double bearingFromBBox(
    double u,
    int image_width,
    std::optional<double> hfov_deg,
    double heading_deg,
    std::optional<double> cx,
    std::optional<double> fx
) {
    double delta_yaw_deg;
    if (fx && cx) {
        PinholeIntrinsics k;
        k.fx = *fx;
        k.cx = *cx;
        k.width = image_width;
        delta_yaw_deg = k.yawOffsetDeg(u);
    } else if (hfov_deg) {
        if (image_width <= 0) {
            throw InvalidGeometryInput("image_width must be positive");
        }
        delta_yaw_deg = HfovCamera{*hfov_deg, image_width}.yawOffsetDeg(u);
    } else {
        throw InvalidGeometryInput("Either fx/cx or hfov_deg must be provided");
    }

    return normalizeAngle(heading_deg + delta_yaw_deg);
}

double bearingForRequest(const EstimationRequest& request) {
    cv::Point2d center = request.bbox.center();
    return bearingFromBBox(
        center.x,
        request.image_width,
        request.hfov_deg,
        request.camera_heading_deg,
        request.cx,
        request.fx
    );
}

double haversineDistance(const GeoPoint& a, const GeoPoint& b) {
    double phi1 = deg2rad(a.lat);
    double phi2 = deg2rad(b.lat);
    double dphi = deg2rad(b.lat - a.lat);
    double dlambda = deg2rad(b.lon - a.lon);

    double s = std::sin(dphi / 2.0) * std::sin(dphi / 2.0) +
               std::cos(phi1) * std::cos(phi2) * std::sin(dlambda / 2.0) * std::sin(dlambda / 2.0);
    s = std::clamp(s, 0.0, 1.0);
    double c = 2.0 * std::atan2(std::sqrt(s), std::sqrt(1.0 - s));
    return EARTH_MEAN_RADIUS_M * c;
}

} // namespace geo_estimator
