/**
 * @file panorama_provider.hpp
 * @brief Interface for street-level imagery providers
 */

#pragma once

#include "cancellation.hpp"
#include "common.hpp"
#include "data_types.hpp"
#include <vector>

namespace geo_estimator {

/**
 * @brief A source of panoramic or street-level images near a point
 *
 * Implementations may throw UpstreamUnavailable or nlohmann::json errors;
 * the selector treats either as "nothing from this provider".
 */
class PanoramaProvider {
public:
    virtual ~PanoramaProvider() = default;

    virtual PanoramaProviderKind kind() const = 0;

    /**
     * @brief False when credentials are missing (provider is skipped silently)
     */
    virtual bool isConfigured() const = 0;

    /**
     * @brief Imagery near @p point
     *
     * @param point Target location
     * @param heading_deg Bearing from camera to target; used for thumbnails
     * @param radius_m Search radius
     * @param cancel Optional cancellation scope
     */
    virtual std::vector<ProviderCandidate> findNearby(
        const GeoPoint& point,
        double heading_deg,
        double radius_m,
        const CancellationToken* cancel
    ) = 0;
};

} // namespace geo_estimator
