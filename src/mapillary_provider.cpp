/**
 * @file mapillary_provider.cpp
 * @brief Implementation of MapillaryProvider
 */

#include "geo_estimator/mapillary_provider.hpp"

using json = nlohmann::json;

namespace geo_estimator {

MapillaryProvider::MapillaryProvider(HttpGateway& gateway, const Config& config)
    : gateway_(gateway),
      token_(config.mapillary_token),
      url_(config.mapillary_url),
      limit_(config.mapillary_limit) {
}

HttpRequest MapillaryProvider::buildSearchRequest(const GeoPoint& point, double radius_m) const {
    HttpRequest request;
    request.url = url_;
    request.params = {
        {"access_token", token_.value_or("")},
        {"fields", FIELDS},
        {"limit", std::to_string(limit_)},
        {"radius", formatNumber(radius_m)},
        // Mapillary expects lon,lat
        {"closeto", formatNumber(point.lon) + "," + formatNumber(point.lat)},
    };
    return request;
}

std::vector<ProviderCandidate> MapillaryProvider::parseResponse(const std::string& body,
                                                                const GeoPoint& fallback) {
    json payload = json::parse(body);

    std::vector<ProviderCandidate> candidates;
    if (!payload.is_object() || !payload.contains("data") || !payload["data"].is_array()) {
        return candidates;
    }

    for (const json& item : payload["data"]) {
        if (!item.is_object()) {
            continue;
        }
        ProviderCandidate candidate;
        candidate.provider = PanoramaProviderKind::MAPILLARY;
        candidate.location = fallback;

        if (item.contains("geometry") && item["geometry"].is_object()) {
            const json& coords = item["geometry"].value("coordinates", json::array());
            if (coords.is_array() && coords.size() >= 2 &&
                coords[0].is_number() && coords[1].is_number()) {
                candidate.location.lon = coords[0].get<double>();
                candidate.location.lat = coords[1].get<double>();
            }
        }
        if (item.contains("compass_angle") && item["compass_angle"].is_number()) {
            candidate.compass_angle_deg = item["compass_angle"].get<double>();
        }
        for (const char* key : {"thumb_1024_url", "thumb_256_url"}) {
            if (item.contains(key) && item[key].is_string()) {
                candidate.thumbnail_url = item[key].get<std::string>();
                break;
            }
        }
        candidate.meta = item;
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

std::vector<ProviderCandidate> MapillaryProvider::findNearby(
    const GeoPoint& point,
    double /*heading_deg*/,
    double radius_m,
    const CancellationToken* cancel
) {
    if (!isConfigured()) {
        return {};
    }
    HttpResponse response = gateway_.get(buildSearchRequest(point, radius_m), RATE_KEY_MAPILLARY, cancel);
    return parseResponse(response.body, point);
}

} // namespace geo_estimator
