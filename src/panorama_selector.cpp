/**
 * @file panorama_selector.cpp
 * @brief Implementation of PanoramaSelector
 */

#include "geo_estimator/panorama_selector.hpp"
#include "geo_estimator/errors.hpp"
#include "geo_estimator/geometry.hpp"
#include <iostream>
#include <limits>

using json = nlohmann::json;

namespace geo_estimator {

double scoreCandidate(const ProviderCandidate& candidate, const GeoPoint& target, double bearing_deg) {
    if (!candidate.compass_angle_deg) {
        return std::numeric_limits<double>::infinity();
    }
    double heading_error = std::abs(wrapDelta(bearing_deg - *candidate.compass_angle_deg));
    double distance = haversineDistance(target, candidate.location);
    return heading_error + distance / SCORE_METERS_PER_DEGREE;
}

int pickBestCandidate(const std::vector<ProviderCandidate>& candidates,
                      const GeoPoint& target, double bearing_deg) {
    int best = -1;
    double best_score = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < candidates.size(); ++i) {
        double score = scoreCandidate(candidates[i], target, bearing_deg);
        // Strict comparison keeps the earliest on ties; all-infinite picks the first
        if (best < 0 || score < best_score) {
            best = static_cast<int>(i);
            best_score = score;
        }
    }
    return best;
}

PanoramaSelector::PanoramaSelector(bool verbose) : verbose_(verbose) {
}

void PanoramaSelector::addProvider(std::unique_ptr<PanoramaProvider> provider) {
    if (!provider) {
        throw std::invalid_argument("PanoramaSelector: provider must not be null");
    }
    for (auto& existing : providers_) {
        if (existing->kind() == provider->kind()) {
            existing = std::move(provider);
            return;
        }
    }
    providers_.push_back(std::move(provider));
}

PanoramaProvider* PanoramaSelector::provider(PanoramaProviderKind kind) const {
    for (const auto& p : providers_) {
        if (p->kind() == kind) {
            return p.get();
        }
    }
    return nullptr;
}

PanoramaInfo PanoramaSelector::select(
    const GeoPoint& target,
    double bearing_deg,
    const std::vector<std::string>& priority,
    double radius_m,
    const CancellationToken* cancel
) {
    for (const std::string& name : priority) {
        auto kind = parseProviderKind(name);
        if (!kind) {
            continue;
        }
        PanoramaProvider* source = provider(*kind);
        if (source == nullptr || !source->isConfigured()) {
            continue;
        }
        if (cancel != nullptr) {
            cancel->throwIfCancelled("panorama search");
        }

        std::vector<ProviderCandidate> candidates;
        try {
            candidates = source->findNearby(target, bearing_deg, radius_m, cancel);
        } catch (const UpstreamUnavailable& e) {
            if (verbose_) {
                std::cout << "[PanoramaSelector] " + toString(*kind) + " skipped: " + e.what() + "\n";
            }
            continue;
        } catch (const json::exception& e) {
            if (verbose_) {
                std::cout << "[PanoramaSelector] " + toString(*kind) + " returned invalid payload: " +
                             e.what() + "\n";
            }
            continue;
        }

        int best = pickBestCandidate(candidates, target, bearing_deg);
        if (best < 0) {
            continue;
        }

        const ProviderCandidate& chosen = candidates[static_cast<size_t>(best)];
        PanoramaInfo info;
        info.provider = toString(chosen.provider);
        info.meta = chosen.meta;
        info.thumbnail_url = chosen.thumbnail_url;
        return info;
    }
    return PanoramaInfo();
}

} // namespace geo_estimator
