/**
 * @file reverse_geocoder.hpp
 * @brief Best-effort Nominatim reverse geocoding
 */

#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "http_gateway.hpp"

namespace geo_estimator {

/**
 * @brief Nominatim reverse geocoder
 *
 * Nominatim returns the nearest suitable feature, not an exact address.
 * Failures never escape: they become an AddressInfo without display name
 * and with an "error" component.
 */
class ReverseGeocoder {
public:
    static constexpr int ZOOM_LEVEL = 18;  ///< Building-level detail

    ReverseGeocoder(HttpGateway& gateway, const Config& config);

    /**
     * @brief Address nearest to @p point
     */
    AddressInfo reverse(const GeoPoint& point, const CancellationToken* cancel = nullptr);

    /**
     * @brief Request that reverse() would issue for @p point
     */
    HttpRequest buildRequest(const GeoPoint& point) const;

    /**
     * @brief Parse a jsonv2 reverse payload
     *
     * @throws nlohmann::json::exception on malformed bodies
     */
    static AddressInfo parseResponse(const std::string& body);

private:
    HttpGateway& gateway_;
    std::string url_;
    std::optional<std::string> email_;
    std::string user_agent_;
    bool verbose_;
};

} // namespace geo_estimator
