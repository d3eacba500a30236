/**
 * @file mapillary_provider.hpp
 * @brief Mapillary API v4 nearby image search
 */

#pragma once

#include "config.hpp"
#include "http_gateway.hpp"
#include "panorama_provider.hpp"
#include <optional>
#include <string>

namespace geo_estimator {

class MapillaryProvider : public PanoramaProvider {
public:
    static constexpr const char* FIELDS = "id,compass_angle,captured_at,geometry,thumb_1024_url";

    MapillaryProvider(HttpGateway& gateway, const Config& config);

    PanoramaProviderKind kind() const override { return PanoramaProviderKind::MAPILLARY; }
    bool isConfigured() const override { return token_.has_value(); }

    std::vector<ProviderCandidate> findNearby(
        const GeoPoint& point,
        double heading_deg,
        double radius_m,
        const CancellationToken* cancel
    ) override;

    HttpRequest buildSearchRequest(const GeoPoint& point, double radius_m) const;

    /**
     * @brief Convert an image search payload into candidates
     *
     * Images without geometry are placed at @p fallback.
     */
    static std::vector<ProviderCandidate> parseResponse(const std::string& body,
                                                        const GeoPoint& fallback);

private:
    HttpGateway& gateway_;
    std::optional<std::string> token_;
    std::string url_;
    int limit_;
};

} // namespace geo_estimator
