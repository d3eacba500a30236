/**
 * @file geo_services.hpp
 * @brief Process-lifetime service graph for the estimator
 */

#pragma once

#include "config.hpp"
#include "endpoint_handler.hpp"
#include "estimation_pipeline.hpp"
#include "http_gateway.hpp"
#include "http_transport.hpp"
#include "panorama_selector.hpp"
#include "rate_limiter.hpp"
#include "reverse_geocoder.hpp"
#include <memory>

namespace geo_estimator {

/**
 * @brief Owns the limiter, transport and every client built on them
 *
 * Created once at startup and shared by all requests. Members are
 * declared in dependency order; references between them stay valid for
 * the lifetime of the object.
 *
 * Example usage:
 * ```cpp
 * auto services = createServices(Config::fromEnvironment());
 * auto [status, body] = services->handler().handleEstimate(request_json);
 * ```
 */
class GeoServices {
public:
    /**
     * @brief Build the service graph
     *
     * @param config Validated on entry
     * @param transport Outbound transport; nullptr selects libcurl
     * @throws std::invalid_argument on invalid configuration
     */
    explicit GeoServices(const Config& config, std::unique_ptr<HttpTransport> transport = nullptr);
    ~GeoServices();

    GeoServices(const GeoServices&) = delete;
    GeoServices& operator=(const GeoServices&) = delete;

    EstimationPipeline& pipeline() { return *pipeline_; }
    EndpointHandler& handler() { return *handler_; }

private:
    Config cfg_;
    std::unique_ptr<HttpTransport> transport_;
    std::unique_ptr<TokenBucketRateLimiter> limiter_;
    std::unique_ptr<HttpGateway> gateway_;
    std::unique_ptr<ReverseGeocoder> geocoder_;
    std::unique_ptr<PanoramaSelector> selector_;
    std::unique_ptr<EstimationPipeline> pipeline_;
    std::unique_ptr<EndpointHandler> handler_;
};

/**
 * @brief Convenience function to create GeoServices with the libcurl transport
 */
std::unique_ptr<GeoServices> createServices(const Config& config);

} // namespace geo_estimator
