/**
 * @file endpoint_handler.hpp
 * @brief JSON-in/JSON-out handlers for /estimate and /bearing
 */

#pragma once

#include "estimation_pipeline.hpp"
#include <exception>
#include <nlohmann/json.hpp>
#include <string>

namespace geo_estimator {

/**
 * @brief HTTP status and JSON body produced by a handler
 */
struct EndpointResult {
    int status = 200;
    nlohmann::json body;
};

/**
 * @brief HTTP status for an exception escaping the pipeline
 *
 * ValidationError -> 400, PipelineTimeout -> 504, anything else -> 502.
 */
int httpStatusFor(const std::exception& error);

/**
 * @brief Transport-agnostic request handlers
 *
 * Failures are reported as {"detail": message} with the status from
 * httpStatusFor(); handlers never throw.
 */
class EndpointHandler {
public:
    explicit EndpointHandler(EstimationPipeline& pipeline);

    /// POST /estimate
    EndpointResult handleEstimate(const std::string& body);

    /// POST /bearing
    EndpointResult handleBearing(const std::string& body);

private:
    EstimationPipeline& pipeline_;
    bool verbose_;
};

} // namespace geo_estimator
