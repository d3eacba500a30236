/**
 * @file estimation_pipeline.hpp
 * @brief Main estimation pipeline (integrates all components)
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "panorama_selector.hpp"
#include "reverse_geocoder.hpp"
#include <chrono>

namespace geo_estimator {

/// Always present in DebugInfo::notes
constexpr const char* NOTE_NEAREST_FEATURE = "Nominatim returns nearest suitable feature to the coordinate.";
/// Added when no provider produced imagery
constexpr const char* NOTE_NO_PANORAMA = "No panorama available from configured providers.";

/**
 * @brief Geometry result computed before enrichment
 */
struct ProjectionResult {
    double u = 0.0;               ///< bbox center column
    double v = 0.0;               ///< bbox center row (not consumed)
    double bearing_deg = 0.0;     ///< [0, 360)
    BearingMethod method = BearingMethod::HFOV;
    double delta_yaw_deg = 0.0;   ///< (-180, 180]
    double assumed_distance_m = DEFAULT_ASSUMED_DISTANCE_M;
    GeoPoint target;
};

/**
 * @brief Main estimation pipeline
 *
 * GEOMETRY: bbox center -> bearing -> geodesic projection (synchronous)
 * ENRICHMENT: reverse geocoding and panorama selection, run concurrently
 * under one deadline and one cancellation scope
 */
class EstimationPipeline {
public:
    EstimationPipeline(ReverseGeocoder& geocoder, PanoramaSelector& selector, const Config& config);

    /**
     * @brief Full estimate for a request
     *
     * @param request Inbound request (validated and normalized in place)
     * @return Point, address, panorama and diagnostics
     * @throws ValidationError / InvalidGeometryInput on bad input
     * @throws GeodesicNonConvergence if the projection does not settle
     * @throws PipelineTimeout if enrichment misses the deadline
     */
    EstimateResponse run(EstimationRequest request);

    /**
     * @brief Bearing only (no projection, no enrichment)
     *
     * @throws ValidationError / InvalidGeometryInput on bad input
     */
    BearingResponse bearing(EstimationRequest request) const;

    /**
     * @brief Geometry steps of run() for a validated request
     */
    ProjectionResult project(const EstimationRequest& request) const;

    const Config& config() const { return cfg_; }

private:
    ReverseGeocoder& geocoder_;
    PanoramaSelector& selector_;
    Config cfg_;
    std::chrono::steady_clock::duration timeout_;
};

} // namespace geo_estimator
