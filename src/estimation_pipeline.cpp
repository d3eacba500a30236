/**
 * @file estimation_pipeline.cpp
 * @brief Implementation of the estimation pipeline
 */

#include "geo_estimator/estimation_pipeline.hpp"
#include "geo_estimator/cancellation.hpp"
#include "geo_estimator/errors.hpp"
#include "geo_estimator/geodesic.hpp"
#include "geo_estimator/geometry.hpp"
#include <future>
#include <iostream>
#include <sstream>

namespace geo_estimator {

EstimationPipeline::EstimationPipeline(
    ReverseGeocoder& geocoder,
    PanoramaSelector& selector,
    const Config& config
) : geocoder_(geocoder), selector_(selector), cfg_(config) {
    cfg_.validate();
    timeout_ = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(cfg_.pipeline_timeout_sec));
}

ProjectionResult EstimationPipeline::project(const EstimationRequest& request) const {
    ProjectionResult result;

    cv::Point2d center = request.bbox.center();
    result.u = center.x;
    result.v = center.y;

    result.method = request.bearingMethod();
    result.bearing_deg = bearingForRequest(request);
    result.delta_yaw_deg = wrapDelta(result.bearing_deg - request.camera_heading_deg);
    result.assumed_distance_m = request.assumed_distance_m.value_or(cfg_.default_assumed_distance_m);

    GeoPoint camera{request.camera_lat, request.camera_lon};
    result.target = projectGeodesic(camera, result.bearing_deg, result.assumed_distance_m,
                                    cfg_.geodesic_max_iterations);
    return result;
}

BearingResponse EstimationPipeline::bearing(EstimationRequest request) const {
    request.validate();
    BearingResponse response;
    response.bearing_deg = bearingForRequest(request);
    return response;
}

EstimateResponse EstimationPipeline::run(EstimationRequest request) {
    const auto deadline = std::chrono::steady_clock::now() + timeout_;

    request.validate();
    ProjectionResult projection = project(request);

    const GeoPoint target = projection.target;
    const double bearing_deg = projection.bearing_deg;
    const double radius_m = request.radius_m.value_or(cfg_.default_search_radius_m);
    const std::vector<std::string> priority = request.provider_priority;

    // One scope for both tasks; must outlive them. Transfers are capped at the deadline.
    CancellationToken cancel(deadline);

    std::future<AddressInfo> address_task = std::async(std::launch::async, [&] {
        return geocoder_.reverse(target, &cancel);
    });
    std::future<PanoramaInfo> panorama_task = std::async(std::launch::async, [&] {
        return selector_.select(target, bearing_deg, priority, radius_m, &cancel);
    });

    bool address_ready = address_task.wait_until(deadline) == std::future_status::ready;
    bool panorama_ready = panorama_task.wait_until(deadline) == std::future_status::ready;

    if (!address_ready || !panorama_ready) {
        cancel.cancel();
        address_task.wait();
        panorama_task.wait();

        std::ostringstream msg;
        msg << "Enrichment did not complete within " << cfg_.pipeline_timeout_sec << " s ("
            << (address_ready ? "" : "reverse geocoding")
            << (!address_ready && !panorama_ready ? ", " : "")
            << (panorama_ready ? "" : "panorama selection") << " pending)";
        if (cfg_.verbose) {
            std::cout << "[EstimationPipeline] " + msg.str() + "\n";
        }
        throw PipelineTimeout(msg.str());
    }

    EstimateResponse response;
    response.address = address_task.get();
    response.panorama = panorama_task.get();

    response.estimated_point.lat = target.lat;
    response.estimated_point.lon = target.lon;
    response.estimated_point.bearing_deg = bearing_deg;

    response.debug.method = toString(projection.method);
    response.debug.delta_yaw_deg = projection.delta_yaw_deg;
    response.debug.assumed_distance_m = projection.assumed_distance_m;
    response.debug.notes.push_back(NOTE_NEAREST_FEATURE);
    if (response.panorama.empty()) {
        response.debug.notes.push_back(NOTE_NO_PANORAMA);
    }
    return response;
}

} // namespace geo_estimator
