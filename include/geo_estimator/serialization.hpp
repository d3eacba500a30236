/**
 * @file serialization.hpp
 * @brief JSON wire format for requests and responses
 */

#pragma once

#include "data_types.hpp"
#include <nlohmann/json.hpp>

namespace geo_estimator {

// ============================================================================
// Inbound
// ============================================================================

void to_json(nlohmann::json& j, const BoundingBox& bbox);
void from_json(const nlohmann::json& j, BoundingBox& bbox);

void to_json(nlohmann::json& j, const EstimationRequest& request);

/**
 * @brief Decode a request body
 *
 * Missing required fields and wrong types raise nlohmann::json errors;
 * range checks are left to EstimationRequest::validate().
 */
void from_json(const nlohmann::json& j, EstimationRequest& request);

// ============================================================================
// Outbound
// ============================================================================

void to_json(nlohmann::json& j, const GeoPoint& point);
void to_json(nlohmann::json& j, const EstimatedPoint& point);
void to_json(nlohmann::json& j, const AddressInfo& address);
void to_json(nlohmann::json& j, const PanoramaInfo& panorama);
void to_json(nlohmann::json& j, const DebugInfo& debug);
void to_json(nlohmann::json& j, const EstimateResponse& response);
void to_json(nlohmann::json& j, const BearingResponse& response);

/**
 * @brief Parse and validate a request body
 *
 * @throws ValidationError on malformed JSON, missing fields or bad values
 */
EstimationRequest parseEstimationRequest(const std::string& body);

/**
 * @brief Replace invalid UTF-8 sequences with U+FFFD
 *
 * nlohmann parse errors quote the offending input bytes; messages must
 * pass through this before they are stored in a JSON value.
 */
std::string toValidUtf8(const std::string& text);

} // namespace geo_estimator
