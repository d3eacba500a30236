/**
 * @file data_types.cpp
 * @brief Request validation
 */

#include "geo_estimator/data_types.hpp"
#include "geo_estimator/errors.hpp"
#include <cmath>

namespace geo_estimator {

namespace {

void requireFinite(double value, const char* field) {
    if (!std::isfinite(value)) {
        throw ValidationError(std::string(field) + " must be a finite number");
    }
}

void requirePositive(const std::optional<double>& value, const char* field) {
    if (value) {
        requireFinite(*value, field);
        if (*value <= 0.0) {
            throw ValidationError(std::string(field) + " must be > 0");
        }
    }
}

} // namespace

void EstimationRequest::validate() {
    if (image_width <= 0 || image_height <= 0) {
        throw ValidationError("image_width and image_height must be positive");
    }
    if (hfov_deg) {
        requireFinite(*hfov_deg, "hfov_deg");
        if (*hfov_deg <= 0.0 || *hfov_deg >= 360.0) {
            throw ValidationError("hfov_deg must be in (0, 360)");
        }
    }
    requirePositive(fx, "fx");
    requirePositive(fy, "fy");
    if (cx) requireFinite(*cx, "cx");
    if (cy) requireFinite(*cy, "cy");

    requireFinite(camera_lat, "camera_lat");
    requireFinite(camera_lon, "camera_lon");
    requireFinite(camera_heading_deg, "camera_heading_deg");

    requireFinite(bbox.x, "bbox.x");
    requireFinite(bbox.y, "bbox.y");
    requireFinite(bbox.w, "bbox.w");
    requireFinite(bbox.h, "bbox.h");
    if (bbox.rect().empty()) {
        throw ValidationError("bbox.w and bbox.h must be > 0");
    }

    requirePositive(assumed_distance_m, "assumed_distance_m");
    requirePositive(radius_m, "radius_m");

    // Throws InvalidGeometryInput when no source is usable
    bearingMethod();

    provider_priority = normalizeProviderPriority(provider_priority);
}

BearingMethod EstimationRequest::bearingMethod() const {
    if (fx && cx) {
        return BearingMethod::INTRINSICS;
    }
    if (hfov_deg) {
        return BearingMethod::HFOV;
    }
    throw InvalidGeometryInput("Either hfov_deg or both fx and cx must be provided");
}

std::optional<PinholeIntrinsics> EstimationRequest::intrinsics() const {
    if (!fx || !cx) {
        return std::nullopt;
    }
    PinholeIntrinsics k;
    k.fx = *fx;
    k.cx = *cx;
    k.fy = fy;
    k.cy = cy;
    k.width = image_width;
    k.height = image_height;
    return k;
}

} // namespace geo_estimator
