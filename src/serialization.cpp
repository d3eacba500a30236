/**
 * @file serialization.cpp
 * @brief nlohmann::json conversions for wire types
 */

#include "geo_estimator/serialization.hpp"
#include "geo_estimator/errors.hpp"

using json = nlohmann::json;

namespace geo_estimator {

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
void readOptional(const json& j, const char* key, std::optional<T>& field) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        field.reset();
    } else {
        field = it->get<T>();
    }
}

} // namespace

// ============================================================================
// Inbound
// ============================================================================

void to_json(json& j, const BoundingBox& bbox) {
    j = json{{"x", bbox.x}, {"y", bbox.y}, {"w", bbox.w}, {"h", bbox.h}};
}

void from_json(const json& j, BoundingBox& bbox) {
    j.at("x").get_to(bbox.x);
    j.at("y").get_to(bbox.y);
    j.at("w").get_to(bbox.w);
    j.at("h").get_to(bbox.h);
}

void to_json(json& j, const EstimationRequest& request) {
    j = json{
        {"image_width", request.image_width},
        {"image_height", request.image_height},
        {"hfov_deg", optionalToJson(request.hfov_deg)},
        {"fx", optionalToJson(request.fx)},
        {"fy", optionalToJson(request.fy)},
        {"cx", optionalToJson(request.cx)},
        {"cy", optionalToJson(request.cy)},
        {"camera_lat", request.camera_lat},
        {"camera_lon", request.camera_lon},
        {"camera_heading_deg", request.camera_heading_deg},
        {"bbox", request.bbox},
        {"assumed_distance_m", optionalToJson(request.assumed_distance_m)},
        {"provider_priority", request.provider_priority},
        {"radius_m", optionalToJson(request.radius_m)},
    };
}

void from_json(const json& j, EstimationRequest& request) {
    j.at("image_width").get_to(request.image_width);
    j.at("image_height").get_to(request.image_height);
    readOptional(j, "hfov_deg", request.hfov_deg);
    readOptional(j, "fx", request.fx);
    readOptional(j, "fy", request.fy);
    readOptional(j, "cx", request.cx);
    readOptional(j, "cy", request.cy);
    j.at("camera_lat").get_to(request.camera_lat);
    j.at("camera_lon").get_to(request.camera_lon);
    j.at("camera_heading_deg").get_to(request.camera_heading_deg);
    j.at("bbox").get_to(request.bbox);
    readOptional(j, "assumed_distance_m", request.assumed_distance_m);

    // Absent keys keep the struct defaults
    if (j.contains("provider_priority") && !j.at("provider_priority").is_null()) {
        j.at("provider_priority").get_to(request.provider_priority);
    }
    if (j.contains("radius_m")) {
        readOptional(j, "radius_m", request.radius_m);
    }
}

EstimationRequest parseEstimationRequest(const std::string& body) {
    EstimationRequest request;
    try {
        json j = json::parse(body);
        if (!j.is_object()) {
            throw ValidationError("request body must be a JSON object");
        }
        request = j.get<EstimationRequest>();
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("malformed JSON: ") + e.what());
    } catch (const json::exception& e) {
        throw ValidationError(std::string("invalid request: ") + e.what());
    }
    request.validate();
    return request;
}

std::string toValidUtf8(const std::string& text) {
    std::string dumped = json(text).dump(-1, ' ', false, json::error_handler_t::replace);
    return json::parse(dumped).get<std::string>();
}

// ============================================================================
// Outbound
// ============================================================================

void to_json(json& j, const GeoPoint& point) {
    j = json{{"lat", point.lat}, {"lon", point.lon}};
}

void to_json(json& j, const EstimatedPoint& point) {
    j = json{{"lat", point.lat}, {"lon", point.lon}, {"bearing_deg", point.bearing_deg}};
}

void to_json(json& j, const AddressInfo& address) {
    j = json{
        {"display_name", optionalToJson(address.display_name)},
        {"components", address.components},
    };
}

void to_json(json& j, const PanoramaInfo& panorama) {
    j = json{
        {"provider", optionalToJson(panorama.provider)},
        {"meta", panorama.meta},
        {"thumbnail_url", optionalToJson(panorama.thumbnail_url)},
    };
}

void to_json(json& j, const DebugInfo& debug) {
    j = json{
        {"method", debug.method},
        {"delta_yaw_deg", debug.delta_yaw_deg},
        {"assumed_distance_m", debug.assumed_distance_m},
        {"notes", debug.notes},
    };
}

void to_json(json& j, const EstimateResponse& response) {
    j = json{
        {"estimated_point", response.estimated_point},
        {"address", response.address},
        {"panorama", response.panorama},
        {"debug", response.debug},
    };
}

void to_json(json& j, const BearingResponse& response) {
    j = json{{"bearing_deg", response.bearing_deg}};
}

} // namespace geo_estimator
