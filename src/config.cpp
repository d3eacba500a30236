/**
 * @file config.cpp
 * @brief Configuration loading from environment and JSON
 */

#include "geo_estimator/config.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace geo_estimator {

namespace {

std::optional<std::string> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

template <typename T>
void overlay(const json& j, const char* key, T& field) {
    if (j.contains(key) && !j.at(key).is_null()) {
        field = j.at(key).get<T>();
    }
}

void overlayOptional(const json& j, const char* key, std::optional<std::string>& field) {
    if (!j.contains(key)) {
        return;
    }
    const json& value = j.at(key);
    if (value.is_null() || (value.is_string() && value.get<std::string>().empty())) {
        field.reset();
    } else {
        field = value.get<std::string>();
    }
}

} // namespace

Config Config::fromEnvironment() {
    Config cfg;
    cfg.google_maps_api_key = readEnv("GOOGLE_MAPS_API_KEY");
    cfg.mapillary_token = readEnv("MAPILLARY_TOKEN");
    cfg.nominatim_email = readEnv("NOMINATIM_EMAIL");
    return cfg;
}

Config Config::fromJsonFile(const std::string& path, const Config& base) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config file " + path + " must contain a JSON object");
    }

    Config cfg = base;
    try {
        overlay(j, "rate_limit_per_sec", cfg.rate_limit_per_sec);
        overlay(j, "rate_limit_capacity", cfg.rate_limit_capacity);

        overlay(j, "http_timeout_sec", cfg.http_timeout_sec);
        overlay(j, "max_http_retries", cfg.max_http_retries);
        overlay(j, "http_backoff_sec", cfg.http_backoff_sec);
        overlay(j, "user_agent_product", cfg.user_agent_product);

        overlay(j, "pipeline_timeout_sec", cfg.pipeline_timeout_sec);
        overlay(j, "default_assumed_distance_m", cfg.default_assumed_distance_m);
        overlay(j, "default_search_radius_m", cfg.default_search_radius_m);
        overlay(j, "geodesic_max_iterations", cfg.geodesic_max_iterations);

        overlayOptional(j, "google_maps_api_key", cfg.google_maps_api_key);
        overlayOptional(j, "mapillary_token", cfg.mapillary_token);
        overlayOptional(j, "nominatim_email", cfg.nominatim_email);

        overlay(j, "nominatim_url", cfg.nominatim_url);
        overlay(j, "street_view_metadata_url", cfg.street_view_metadata_url);
        overlay(j, "street_view_image_url", cfg.street_view_image_url);
        overlay(j, "mapillary_url", cfg.mapillary_url);

        overlay(j, "mapillary_limit", cfg.mapillary_limit);
        overlay(j, "thumbnail_size", cfg.thumbnail_size);
        overlay(j, "thumbnail_fov_deg", cfg.thumbnail_fov_deg);
        overlay(j, "thumbnail_pitch_deg", cfg.thumbnail_pitch_deg);

        overlay(j, "verbose", cfg.verbose);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid value in config file " + path + ": " + e.what());
    }

    return cfg;
}

Config Config::fromJsonFile(const std::string& path) {
    return fromJsonFile(path, Config{});
}

void Config::validate() const {
    const std::pair<const char*, double> reals[] = {
        {"rate_limit_per_sec", rate_limit_per_sec},
        {"rate_limit_capacity", rate_limit_capacity},
        {"http_timeout_sec", http_timeout_sec},
        {"http_backoff_sec", http_backoff_sec},
        {"pipeline_timeout_sec", pipeline_timeout_sec},
        {"default_assumed_distance_m", default_assumed_distance_m},
        {"default_search_radius_m", default_search_radius_m},
        {"thumbnail_fov_deg", thumbnail_fov_deg},
        {"thumbnail_pitch_deg", thumbnail_pitch_deg},
    };
    for (const auto& [name, value] : reals) {
        if (!std::isfinite(value)) {
            throw std::invalid_argument(std::string(name) + " must be finite");
        }
    }

    if (rate_limit_per_sec < 0.0) {
        throw std::invalid_argument("rate_limit_per_sec must be >= 0");
    }
    // Every gateway attempt debits one token
    if (rate_limit_capacity < 1.0) {
        throw std::invalid_argument("rate_limit_capacity must be >= 1");
    }
    if (http_timeout_sec <= 0.0) {
        throw std::invalid_argument("http_timeout_sec must be > 0");
    }
    if (max_http_retries < 0 || max_http_retries > MAX_HTTP_RETRIES) {
        throw std::invalid_argument("max_http_retries must be in [0, " +
                                    std::to_string(MAX_HTTP_RETRIES) + "]");
    }
    if (http_backoff_sec < 0.0) {
        throw std::invalid_argument("http_backoff_sec must be >= 0");
    }
    if (pipeline_timeout_sec <= 0.0) {
        throw std::invalid_argument("pipeline_timeout_sec must be > 0");
    }
    if (default_assumed_distance_m <= 0.0 || default_search_radius_m <= 0.0) {
        throw std::invalid_argument("default distance and radius must be > 0");
    }
    if (geodesic_max_iterations < 1) {
        throw std::invalid_argument("geodesic_max_iterations must be >= 1");
    }
    if (mapillary_limit < 1) {
        throw std::invalid_argument("mapillary_limit must be >= 1");
    }
}

} // namespace geo_estimator
