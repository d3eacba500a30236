/**
 * @file reverse_geocoder.cpp
 * @brief Implementation of ReverseGeocoder
 */

#include "geo_estimator/reverse_geocoder.hpp"
#include "geo_estimator/errors.hpp"
#include "geo_estimator/serialization.hpp"
#include <iostream>

using json = nlohmann::json;

namespace geo_estimator {

ReverseGeocoder::ReverseGeocoder(HttpGateway& gateway, const Config& config)
    : gateway_(gateway),
      url_(config.nominatim_url),
      email_(config.nominatim_email),
      verbose_(config.verbose) {
    user_agent_ = config.user_agent_product + " (contact: " + email_.value_or("n/a") + ")";
}

HttpRequest ReverseGeocoder::buildRequest(const GeoPoint& point) const {
    HttpRequest request;
    request.url = url_;
    request.params = {
        {"format", "jsonv2"},
        {"lat", formatNumber(point.lat)},
        {"lon", formatNumber(point.lon)},
        {"zoom", std::to_string(ZOOM_LEVEL)},
        {"addressdetails", "1"},
    };
    if (email_) {
        request.params.emplace_back("email", *email_);
    }
    request.headers["User-Agent"] = user_agent_;
    return request;
}

AddressInfo ReverseGeocoder::parseResponse(const std::string& body) {
    json payload = json::parse(body);

    AddressInfo info;
    if (payload.contains("display_name") && payload["display_name"].is_string()) {
        info.display_name = payload["display_name"].get<std::string>();
    }
    if (payload.contains("address") && payload["address"].is_object()) {
        info.components = payload["address"];
    }
    return info;
}

AddressInfo ReverseGeocoder::reverse(const GeoPoint& point, const CancellationToken* cancel) {
    std::string error;
    try {
        HttpResponse response = gateway_.get(buildRequest(point), RATE_KEY_NOMINATIM, cancel);
        return parseResponse(response.body);
    } catch (const UpstreamUnavailable& e) {
        error = e.what();
    } catch (const OperationCancelled& e) {
        error = e.what();
    } catch (const json::exception& e) {
        error = std::string("invalid geocoder response: ") + e.what();
    }

    error = toValidUtf8(error);
    if (verbose_) {
        std::cout << "[ReverseGeocoder] degraded: " + error + "\n";
    }
    AddressInfo degraded;
    degraded.components = json::object({{"error", error}});
    return degraded;
}

} // namespace geo_estimator
