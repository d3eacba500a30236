/**
 * @file config.hpp
 * @brief Service configuration parameters
 */

#pragma once

#include <optional>
#include <string>

namespace geo_estimator {

/// Upper bound accepted for Config::max_http_retries
constexpr int MAX_HTTP_RETRIES = 10;

/**
 * @brief Service configuration with all tunable parameters
 *
 * Provider credentials are optional: a missing credential disables
 * that provider instead of failing the request.
 */
struct Config {
    // =========================================================================
    // RATE LIMITING
    // =========================================================================

    double rate_limit_per_sec = 5.0;    ///< Token refill rate per provider key
    double rate_limit_capacity = 5.0;   ///< Bucket size per provider key

    // =========================================================================
    // OUTBOUND HTTP
    // =========================================================================

    double http_timeout_sec = 2.5;      ///< Connect + transfer timeout per attempt
    int max_http_retries = 2;           ///< Retries after the first attempt
    double http_backoff_sec = 0.5;      ///< Backoff base, doubled per attempt
    std::string user_agent_product = "GeoEstimator/1.0";

    // =========================================================================
    // PIPELINE
    // =========================================================================

    double pipeline_timeout_sec = 6.0;  ///< Deadline for the whole request
    double default_assumed_distance_m = 20.0;
    double default_search_radius_m = 50.0;
    int geodesic_max_iterations = 200;  ///< Vincenty sigma iteration cap

    // =========================================================================
    // PROVIDERS
    // =========================================================================

    // --- Credentials (absent = provider disabled) ---
    std::optional<std::string> google_maps_api_key;
    std::optional<std::string> mapillary_token;
    std::optional<std::string> nominatim_email;   ///< Contact for Nominatim usage policy

    // --- Endpoints ---
    std::string nominatim_url = "https://nominatim.openstreetmap.org/reverse";
    std::string street_view_metadata_url = "https://maps.googleapis.com/maps/api/streetview/metadata";
    std::string street_view_image_url = "https://maps.googleapis.com/maps/api/streetview";
    std::string mapillary_url = "https://graph.mapillary.com/images";

    // --- Imagery ---
    int mapillary_limit = 5;                  ///< Max nearby candidates fetched
    std::string thumbnail_size = "640x400";
    double thumbnail_fov_deg = 80.0;
    double thumbnail_pitch_deg = 0.0;

    // =========================================================================
    // DIAGNOSTICS
    // =========================================================================

    bool verbose = false;  ///< Log retries, skips and timeouts to stdout

    /**
     * @brief Defaults plus credentials from the process environment
     *
     * Reads GOOGLE_MAPS_API_KEY, MAPILLARY_TOKEN and NOMINATIM_EMAIL.
     * Empty variables count as absent.
     */
    static Config fromEnvironment();

    /**
     * @brief Overlay keys present in a JSON file on top of @p base
     *
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static Config fromJsonFile(const std::string& path, const Config& base);

    /**
     * @brief Overlay a JSON file on the built-in defaults
     */
    static Config fromJsonFile(const std::string& path);

    /**
     * @brief Reject non-finite values and non-positive rates, timeouts and caps
     *
     * @throws std::invalid_argument
     */
    void validate() const;
};

} // namespace geo_estimator
