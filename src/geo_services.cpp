/**
 * @file geo_services.cpp
 * @brief Implementation of GeoServices
 */

#include "geo_estimator/geo_services.hpp"
#include "geo_estimator/mapillary_provider.hpp"
#include "geo_estimator/street_view_provider.hpp"
#include <iostream>

namespace geo_estimator {

GeoServices::GeoServices(const Config& config, std::unique_ptr<HttpTransport> transport)
    : cfg_(config), transport_(std::move(transport)) {
    cfg_.validate();

    if (!transport_) {
        transport_ = std::make_unique<CurlHttpTransport>(cfg_.user_agent_product);
    }

    limiter_ = std::make_unique<TokenBucketRateLimiter>(cfg_.rate_limit_per_sec, cfg_.rate_limit_capacity);
    gateway_ = std::make_unique<HttpGateway>(
        *transport_, *limiter_, RetryPolicy::fromConfig(cfg_), cfg_.verbose
    );

    geocoder_ = std::make_unique<ReverseGeocoder>(*gateway_, cfg_);

    selector_ = std::make_unique<PanoramaSelector>(cfg_.verbose);
    selector_->addProvider(std::make_unique<StreetViewProvider>(*gateway_, cfg_));
    selector_->addProvider(std::make_unique<MapillaryProvider>(*gateway_, cfg_));

    pipeline_ = std::make_unique<EstimationPipeline>(*geocoder_, *selector_, cfg_);
    handler_ = std::make_unique<EndpointHandler>(*pipeline_);

    if (cfg_.verbose) {
        std::cout << "[GeoServices] providers: google="
                  << (cfg_.google_maps_api_key ? "on" : "off")
                  << ", mapillary=" << (cfg_.mapillary_token ? "on" : "off")
                  << ", nominatim contact=" << cfg_.nominatim_email.value_or("n/a") << "\n";
    }
}

GeoServices::~GeoServices() = default;

std::unique_ptr<GeoServices> createServices(const Config& config) {
    return std::make_unique<GeoServices>(config);
}

} // namespace geo_estimator
