/**
 * @file endpoint_handler.cpp
 * @brief Implementation of EndpointHandler
 */

#include "geo_estimator/endpoint_handler.hpp"
#include "geo_estimator/errors.hpp"
#include "geo_estimator/serialization.hpp"
#include <iostream>

using json = nlohmann::json;

namespace geo_estimator {

int httpStatusFor(const std::exception& error) {
    if (dynamic_cast<const ValidationError*>(&error) != nullptr) {
        return 400;
    }
    if (dynamic_cast<const PipelineTimeout*>(&error) != nullptr) {
        return 504;
    }
    return 502;
}

namespace {

EndpointResult errorResult(const std::exception& error, bool verbose) {
    EndpointResult result;
    result.status = httpStatusFor(error);
    std::string detail = toValidUtf8(error.what());
    result.body = json{{"detail", detail}};
    if (verbose && result.status >= 500) {
        std::cout << "[EndpointHandler] " + std::to_string(result.status) + ": " + detail + "\n";
    }
    return result;
}

} // namespace

EndpointHandler::EndpointHandler(EstimationPipeline& pipeline)
    : pipeline_(pipeline), verbose_(pipeline.config().verbose) {
}

EndpointResult EndpointHandler::handleEstimate(const std::string& body) {
    try {
        EstimationRequest request = parseEstimationRequest(body);
        EndpointResult result;
        result.body = pipeline_.run(std::move(request));
        return result;
    } catch (const std::exception& e) {
        return errorResult(e, verbose_);
    }
}

EndpointResult EndpointHandler::handleBearing(const std::string& body) {
    try {
        EstimationRequest request = parseEstimationRequest(body);
        EndpointResult result;
        result.body = pipeline_.bearing(std::move(request));
        return result;
    } catch (const std::exception& e) {
        return errorResult(e, verbose_);
    }
}

} // namespace geo_estimator
