/**
 * @file data_types.hpp
 * @brief Request, response and intermediate data structures
 */

#pragma once

#include "common.hpp"
#include "calibration.hpp"
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace geo_estimator {

/**
 * @brief Geographic coordinate (WGS84 degrees)
 */
struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;

    bool operator==(const GeoPoint& other) const {
        return lat == other.lat && lon == other.lon;
    }
    bool operator!=(const GeoPoint& other) const { return !(*this == other); }
};

/**
 * @brief Detection box in image pixels
 */
struct BoundingBox {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;

    cv::Rect2d rect() const { return cv::Rect2d(x, y, w, h); }

    /**
     * @brief (u, v) center of the box
     *
     * v is carried for future pitch estimation and not consumed yet.
     */
    cv::Point2d center() const {
        return cv::Point2d(x + w / 2.0, y + h / 2.0);
    }
};

/**
 * @brief Inbound estimation request
 *
 * Either hfov_deg or the pair (fx, cx) must be present; when both are,
 * the pinhole model wins. validate() enforces this and the numeric ranges,
 * and normalizes provider_priority in place.
 */
struct EstimationRequest {
    int image_width = 0;
    int image_height = 0;

    std::optional<double> hfov_deg;  ///< (0, 360)

    std::optional<double> fx;
    std::optional<double> fy;
    std::optional<double> cx;
    std::optional<double> cy;

    double camera_lat = 0.0;
    double camera_lon = 0.0;
    double camera_heading_deg = 0.0;

    BoundingBox bbox;

    std::optional<double> assumed_distance_m;
    std::vector<std::string> provider_priority = {"google", "mapillary"};
    std::optional<double> radius_m = DEFAULT_SEARCH_RADIUS_M;

    /**
     * @brief Check ranges and geometry source, normalize provider list
     *
     * @throws ValidationError / InvalidGeometryInput
     */
    void validate();

    /**
     * @brief Which bearing model this request resolves to
     *
     * @throws InvalidGeometryInput if neither source is usable
     */
    BearingMethod bearingMethod() const;

    /**
     * @brief Pinhole model if fx and cx are both present
     */
    std::optional<PinholeIntrinsics> intrinsics() const;
};

/**
 * @brief Estimated target position
 */
struct EstimatedPoint {
    double lat = 0.0;
    double lon = 0.0;
    double bearing_deg = 0.0;  ///< [0, 360)
};

/**
 * @brief Reverse-geocoding result
 *
 * Always present in a response; an absent display_name with an "error"
 * component signals degraded enrichment.
 */
struct AddressInfo {
    std::optional<std::string> display_name;
    nlohmann::json components = nlohmann::json::object();

    bool isDegraded() const { return !display_name && components.contains("error"); }
};

/**
 * @brief Selected street-level imagery
 */
struct PanoramaInfo {
    std::optional<std::string> provider;
    nlohmann::json meta = nlohmann::json::object();
    std::optional<std::string> thumbnail_url;

    bool empty() const { return !provider.has_value(); }
};

/**
 * @brief Diagnostics attached to every estimate
 */
struct DebugInfo {
    std::string method;          ///< "intrinsics" or "hfov"
    double delta_yaw_deg = 0.0;  ///< (-180, 180]
    double assumed_distance_m = DEFAULT_ASSUMED_DISTANCE_M;
    std::vector<std::string> notes;
};

struct EstimateResponse {
    EstimatedPoint estimated_point;
    AddressInfo address;
    PanoramaInfo panorama;
    DebugInfo debug;
};

struct BearingResponse {
    double bearing_deg = 0.0;
};

/**
 * @brief One imagery record returned by a panorama provider
 */
struct ProviderCandidate {
    PanoramaProviderKind provider;
    GeoPoint location;
    std::optional<double> compass_angle_deg;  ///< Unknown for metadata-only lookups
    std::optional<std::string> thumbnail_url;
    nlohmann::json meta = nlohmann::json::object();
};

} // namespace geo_estimator
