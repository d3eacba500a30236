/**
 * @file street_view_provider.hpp
 * @brief Google Street View metadata lookup and thumbnail URLs
 */

#pragma once

#include "config.hpp"
#include "http_gateway.hpp"
#include "panorama_provider.hpp"
#include <optional>
#include <string>

namespace geo_estimator {

/**
 * @brief Static thumbnail parameters
 */
struct ThumbnailSpec {
    std::string size = "640x400";
    double fov_deg = 80.0;
    double pitch_deg = 0.0;
};

/**
 * @brief Google Street View provider
 *
 * One metadata lookup per request; a panorama with status "OK" yields a
 * single candidate whose thumbnail points along the target bearing.
 */
class StreetViewProvider : public PanoramaProvider {
public:
    StreetViewProvider(HttpGateway& gateway, const Config& config);

    PanoramaProviderKind kind() const override { return PanoramaProviderKind::GOOGLE; }
    bool isConfigured() const override { return api_key_.has_value(); }

    std::vector<ProviderCandidate> findNearby(
        const GeoPoint& point,
        double heading_deg,
        double radius_m,
        const CancellationToken* cancel
    ) override;

    HttpRequest buildMetadataRequest(const GeoPoint& point, double radius_m) const;

    /**
     * @brief Unsigned Street View Static API URL
     *
     * Uses the panorama id when known, else the raw location.
     */
    std::string buildThumbnailUrl(
        const std::optional<std::string>& pano_id,
        const GeoPoint& location,
        double heading_deg
    ) const;

private:
    HttpGateway& gateway_;
    std::optional<std::string> api_key_;
    std::string metadata_url_;
    std::string image_url_;
    ThumbnailSpec thumbnail_;
};

} // namespace geo_estimator
