/**
 * @file errors.hpp
 * @brief Exception taxonomy for the estimation pipeline
 */

#pragma once

#include <stdexcept>
#include <string>

namespace geo_estimator {

/**
 * @brief Base class for all geo_estimator failures
 */
class GeoEstimatorError : public std::runtime_error {
public:
    explicit GeoEstimatorError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Request failed validation (reported as 400)
 */
class ValidationError : public GeoEstimatorError {
public:
    explicit ValidationError(const std::string& what) : GeoEstimatorError(what) {}
};

/**
 * @brief Neither an HFOV nor a pinhole intrinsics pair is usable
 */
class InvalidGeometryInput : public ValidationError {
public:
    explicit InvalidGeometryInput(const std::string& what) : ValidationError(what) {}
};

/**
 * @brief Vincenty iteration did not settle within the iteration cap
 */
class GeodesicNonConvergence : public GeoEstimatorError {
public:
    GeodesicNonConvergence(int iterations, double last_delta)
        : GeoEstimatorError("Geodesic projection did not converge after " +
                            std::to_string(iterations) + " iterations (last delta " +
                            std::to_string(last_delta) + " rad)"),
          iterations_(iterations) {}

    int iterations() const { return iterations_; }

private:
    int iterations_;
};

/**
 * @brief Enrichment did not finish before the pipeline deadline (reported as 504)
 */
class PipelineTimeout : public GeoEstimatorError {
public:
    explicit PipelineTimeout(const std::string& what) : GeoEstimatorError(what) {}
};

/**
 * @brief More tokens requested than the bucket can ever hold
 */
class InvalidTokenRequest : public GeoEstimatorError {
public:
    explicit InvalidTokenRequest(const std::string& what) : GeoEstimatorError(what) {}
};

/**
 * @brief All attempts against an upstream provider failed
 */
class UpstreamUnavailable : public GeoEstimatorError {
public:
    UpstreamUnavailable(const std::string& provider_key, const std::string& last_error)
        : GeoEstimatorError("Upstream '" + provider_key + "' unavailable: " + last_error),
          provider_key_(provider_key), last_error_(last_error) {}

    const std::string& providerKey() const { return provider_key_; }
    const std::string& lastError() const { return last_error_; }

private:
    std::string provider_key_;
    std::string last_error_;
};

/**
 * @brief A wait or transfer was interrupted by its cancellation scope
 */
class OperationCancelled : public GeoEstimatorError {
public:
    explicit OperationCancelled(const std::string& what) : GeoEstimatorError(what) {}
};

} // namespace geo_estimator
