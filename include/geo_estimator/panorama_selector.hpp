/**
 * @file panorama_selector.hpp
 * @brief Provider-ordered search for the imagery best aligned with a bearing
 */

#pragma once

#include "cancellation.hpp"
#include "common.hpp"
#include "data_types.hpp"
#include "panorama_provider.hpp"
#include <memory>
#include <string>
#include <vector>

namespace geo_estimator {

/**
 * @brief Distance weight in the candidate score (meters per degree)
 */
constexpr double SCORE_METERS_PER_DEGREE = 5.0;

/**
 * @brief Alignment score of a candidate (lower is better)
 *
 * score = |wrapDelta(bearing - compass)| + distance_m / 5.
 * Candidates without a compass angle score +infinity.
 */
double scoreCandidate(const ProviderCandidate& candidate, const GeoPoint& target, double bearing_deg);

/**
 * @brief Lowest-score candidate, first one on ties
 *
 * @return Index into @p candidates, or -1 if empty
 */
int pickBestCandidate(const std::vector<ProviderCandidate>& candidates,
                      const GeoPoint& target, double bearing_deg);

/**
 * @brief Walks providers in priority order and keeps the first hit
 *
 * Unconfigured providers are skipped silently. Upstream failures and
 * malformed payloads count as "nothing found" and the next provider is
 * tried. Cancellation propagates as OperationCancelled.
 */
class PanoramaSelector {
public:
    explicit PanoramaSelector(bool verbose = false);

    /**
     * @brief Register a provider; a later registration of the same kind replaces it
     */
    void addProvider(std::unique_ptr<PanoramaProvider> provider);

    /**
     * @brief Provider registered for @p kind, or nullptr
     */
    PanoramaProvider* provider(PanoramaProviderKind kind) const;

    /**
     * @brief Select imagery for the target
     *
     * @param target Estimated target position
     * @param bearing_deg Camera-to-target bearing
     * @param priority Normalized provider tags in search order
     * @param radius_m Search radius
     * @param cancel Optional cancellation scope
     * @return Selected panorama, or an empty PanoramaInfo
     */
    PanoramaInfo select(
        const GeoPoint& target,
        double bearing_deg,
        const std::vector<std::string>& priority,
        double radius_m,
        const CancellationToken* cancel = nullptr
    );

private:
    std::vector<std::unique_ptr<PanoramaProvider>> providers_;
    bool verbose_;
};

} // namespace geo_estimator
