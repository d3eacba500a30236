/**
 * @file common.hpp
 * @brief Common enums, constants, and string conversions for geo estimation
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace geo_estimator {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief How the horizontal angle to the target was derived
 */
enum class BearingMethod {
    INTRINSICS,  ///< Pinhole model from fx/cx
    HFOV         ///< Linear degrees-per-pixel from horizontal FOV
};

/**
 * @brief Supported street-level imagery providers
 */
enum class PanoramaProviderKind {
    GOOGLE,     ///< Google Street View (metadata lookup + static thumbnail)
    MAPILLARY   ///< Mapillary API v4 (nearby image search)
};

// ============================================================================
// String conversions
// ============================================================================

inline std::string toString(BearingMethod method) {
    switch (method) {
        case BearingMethod::INTRINSICS: return "intrinsics";
        case BearingMethod::HFOV: return "hfov";
        default: return "unknown";
    }
}

inline std::string toString(PanoramaProviderKind kind) {
    switch (kind) {
        case PanoramaProviderKind::GOOGLE: return "google";
        case PanoramaProviderKind::MAPILLARY: return "mapillary";
        default: return "unknown";
    }
}

/**
 * @brief Parse a provider tag (case-insensitive)
 * @return nullopt for unsupported providers
 */
std::optional<PanoramaProviderKind> parseProviderKind(const std::string& name);

/**
 * @brief Lower-case, drop unsupported names and duplicates, keep order
 */
std::vector<std::string> normalizeProviderPriority(const std::vector<std::string>& providers);

// ============================================================================
// Constants
// ============================================================================

constexpr double DEFAULT_ASSUMED_DISTANCE_M = 20.0;
constexpr double DEFAULT_SEARCH_RADIUS_M = 50.0;

/// Rate-limit keys, one per upstream service
constexpr const char* RATE_KEY_NOMINATIM = "nominatim";
constexpr const char* RATE_KEY_GOOGLE = "google";
constexpr const char* RATE_KEY_MAPILLARY = "mapillary";

} // namespace geo_estimator
