/**
 * @file street_view_provider.cpp
 * @brief Implementation of StreetViewProvider
 */

#include "geo_estimator/street_view_provider.hpp"
#include "geo_estimator/geometry.hpp"

using json = nlohmann::json;

namespace geo_estimator {

StreetViewProvider::StreetViewProvider(HttpGateway& gateway, const Config& config)
    : gateway_(gateway),
      api_key_(config.google_maps_api_key),
      metadata_url_(config.street_view_metadata_url),
      image_url_(config.street_view_image_url) {
    thumbnail_.size = config.thumbnail_size;
    thumbnail_.fov_deg = config.thumbnail_fov_deg;
    thumbnail_.pitch_deg = config.thumbnail_pitch_deg;
}

HttpRequest StreetViewProvider::buildMetadataRequest(const GeoPoint& point, double radius_m) const {
    HttpRequest request;
    request.url = metadata_url_;
    request.params = {
        {"location", formatNumber(point.lat) + "," + formatNumber(point.lon)},
        {"radius", formatNumber(radius_m)},
        {"key", api_key_.value_or("")},
    };
    return request;
}

std::string StreetViewProvider::buildThumbnailUrl(
    const std::optional<std::string>& pano_id,
    const GeoPoint& location,
    double heading_deg
) const {
    QueryParams params = {
        {"size", thumbnail_.size},
        {"fov", formatNumber(thumbnail_.fov_deg)},
        {"heading", formatNumber(normalizeAngle(heading_deg))},
        {"pitch", formatNumber(thumbnail_.pitch_deg)},
        {"key", api_key_.value_or("")},
    };
    if (pano_id && !pano_id->empty()) {
        params.emplace_back("pano", *pano_id);
    } else {
        params.emplace_back("location", formatNumber(location.lat) + "," + formatNumber(location.lon));
    }
    return image_url_ + "?" + encodeQuery(params);
}

std::vector<ProviderCandidate> StreetViewProvider::findNearby(
    const GeoPoint& point,
    double heading_deg,
    double radius_m,
    const CancellationToken* cancel
) {
    if (!isConfigured()) {
        return {};
    }

    HttpResponse response = gateway_.get(buildMetadataRequest(point, radius_m), RATE_KEY_GOOGLE, cancel);
    json data = json::parse(response.body);
    if (!data.is_object() || data.value("status", "") != "OK") {
        return {};
    }

    ProviderCandidate candidate;
    candidate.provider = PanoramaProviderKind::GOOGLE;
    candidate.location = point;
    if (data.contains("location") && data["location"].is_object()) {
        const json& loc = data["location"];
        candidate.location.lat = loc.value("lat", point.lat);
        candidate.location.lon = loc.value("lng", point.lon);
    }

    std::optional<std::string> pano_id;
    if (data.contains("pano_id") && data["pano_id"].is_string()) {
        pano_id = data["pano_id"].get<std::string>();
    }
    candidate.thumbnail_url = buildThumbnailUrl(pano_id, candidate.location, heading_deg);
    candidate.meta = data;
    return {candidate};
}

} // namespace geo_estimator
