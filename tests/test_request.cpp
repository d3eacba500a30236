/**
 * @file test_request.cpp
 * @brief Request validation, provider normalization and JSON wire format
 */

#include <gtest/gtest.h>

#include <geo_estimator/errors.hpp>
#include <geo_estimator/serialization.hpp>

#include <limits>

using namespace geo_estimator;
using json = nlohmann::json;

namespace {

EstimationRequest validRequest() {
    EstimationRequest request;
    request.image_width = 1920;
    request.image_height = 1080;
    request.hfov_deg = 70.0;
    request.camera_lat = 40.7128;
    request.camera_lon = -74.006;
    request.camera_heading_deg = 90.0;
    request.bbox = {900.0, 400.0, 120.0, 200.0};
    return request;
}

} // namespace

// ============================================================================
// Validation
// ============================================================================

TEST(EstimationRequest, DefaultsAreApplied) {
    EstimationRequest request = validRequest();
    EXPECT_NO_THROW(request.validate());
    EXPECT_EQ(request.provider_priority, (std::vector<std::string>{"google", "mapillary"}));
    EXPECT_EQ(request.radius_m, 50.0);
    EXPECT_FALSE(request.assumed_distance_m.has_value());
}

TEST(EstimationRequest, ProviderPriorityNormalized) {
    EstimationRequest request = validRequest();
    request.provider_priority = {"Mapillary", "bing", "GOOGLE", "mapillary"};
    request.validate();
    EXPECT_EQ(request.provider_priority, (std::vector<std::string>{"mapillary", "google"}));
}

TEST(EstimationRequest, GeometrySourceRequired) {
    EstimationRequest request = validRequest();
    request.hfov_deg.reset();
    EXPECT_THROW(request.validate(), InvalidGeometryInput);

    request.fx = 1000.0;
    EXPECT_THROW(request.validate(), InvalidGeometryInput);

    request.cx = 960.0;
    EXPECT_NO_THROW(request.validate());
    EXPECT_EQ(request.bearingMethod(), BearingMethod::INTRINSICS);
}

TEST(EstimationRequest, IntrinsicsPreferredWhenBothPresent) {
    EstimationRequest request = validRequest();
    request.fx = 1000.0;
    request.cx = 960.0;
    request.cy = 500.0;
    EXPECT_EQ(request.bearingMethod(), BearingMethod::INTRINSICS);

    auto k = request.intrinsics();
    ASSERT_TRUE(k.has_value());
    EXPECT_DOUBLE_EQ(k->fyOrDefault(), 1000.0);
    EXPECT_DOUBLE_EQ(k->cyOrDefault(), 500.0);
    EXPECT_DOUBLE_EQ(k->K()(0, 2), 960.0);
}

TEST(EstimationRequest, RejectsOutOfRangeValues) {
    auto expectInvalid = [](auto mutate) {
        EstimationRequest request = validRequest();
        mutate(request);
        EXPECT_THROW(request.validate(), ValidationError);
    };
    expectInvalid([](EstimationRequest& r) { r.image_width = 0; });
    expectInvalid([](EstimationRequest& r) { r.hfov_deg = 0.0; });
    expectInvalid([](EstimationRequest& r) { r.hfov_deg = 360.0; });
    expectInvalid([](EstimationRequest& r) { r.bbox.w = 0.0; });
    expectInvalid([](EstimationRequest& r) { r.bbox.h = -3.0; });
    expectInvalid([](EstimationRequest& r) {
        r.bbox.w = std::numeric_limits<double>::quiet_NaN();
    });
    expectInvalid([](EstimationRequest& r) { r.assumed_distance_m = -5.0; });
    expectInvalid([](EstimationRequest& r) { r.radius_m = 0.0; });
    expectInvalid([](EstimationRequest& r) { r.fx = -1.0; r.cx = 10.0; });
    expectInvalid([](EstimationRequest& r) {
        r.camera_lat = std::numeric_limits<double>::quiet_NaN();
    });
}

// ============================================================================
// JSON
// ============================================================================

TEST(Serialization, RequestRoundTripKeepsEveryField) {
    EstimationRequest request = validRequest();
    request.fx = 1400.0;
    request.fy = 1390.0;
    request.cx = 955.5;
    request.cy = 541.0;
    request.assumed_distance_m = 42.0;
    request.provider_priority = {"mapillary"};
    request.radius_m = 75.0;

    json j = request;
    EstimationRequest decoded = j.get<EstimationRequest>();

    EXPECT_EQ(decoded.image_width, request.image_width);
    EXPECT_EQ(decoded.image_height, request.image_height);
    EXPECT_EQ(decoded.hfov_deg, request.hfov_deg);
    EXPECT_EQ(decoded.fx, request.fx);
    EXPECT_EQ(decoded.fy, request.fy);
    EXPECT_EQ(decoded.cx, request.cx);
    EXPECT_EQ(decoded.cy, request.cy);
    EXPECT_EQ(decoded.camera_lat, request.camera_lat);
    EXPECT_EQ(decoded.camera_lon, request.camera_lon);
    EXPECT_EQ(decoded.camera_heading_deg, request.camera_heading_deg);
    EXPECT_EQ(decoded.bbox.x, request.bbox.x);
    EXPECT_EQ(decoded.bbox.h, request.bbox.h);
    EXPECT_EQ(decoded.assumed_distance_m, request.assumed_distance_m);
    EXPECT_EQ(decoded.provider_priority, request.provider_priority);
    EXPECT_EQ(decoded.radius_m, request.radius_m);
}

TEST(Serialization, AbsentOptionalsAreNull) {
    json j = validRequest();
    EXPECT_TRUE(j["fx"].is_null());
    EXPECT_TRUE(j["assumed_distance_m"].is_null());
    EXPECT_EQ(j["bbox"]["w"], 120.0);

    json panorama = PanoramaInfo();
    EXPECT_TRUE(panorama["provider"].is_null());
    EXPECT_TRUE(panorama["thumbnail_url"].is_null());
    EXPECT_EQ(panorama["meta"], json::object());
}

TEST(Serialization, MissingOptionalKeysKeepDefaults) {
    json j = {
        {"image_width", 640}, {"image_height", 480}, {"hfov_deg", 60.0},
        {"camera_lat", 1.0}, {"camera_lon", 2.0}, {"camera_heading_deg", 3.0},
        {"bbox", {{"x", 1}, {"y", 2}, {"w", 3}, {"h", 4}}},
    };
    EstimationRequest request = parseEstimationRequest(j.dump());
    EXPECT_EQ(request.provider_priority, (std::vector<std::string>{"google", "mapillary"}));
    EXPECT_EQ(request.radius_m, 50.0);
    EXPECT_FALSE(request.fx.has_value());
}

TEST(Serialization, ParseRejectsBadBodies) {
    EXPECT_THROW(parseEstimationRequest("{"), ValidationError);
    EXPECT_THROW(parseEstimationRequest("42"), ValidationError);
    EXPECT_THROW(parseEstimationRequest(R"({"image_width": 10})"), ValidationError);
}

TEST(Serialization, InvalidUtf8IsReplaced) {
    std::string text = toValidUtf8("a\xff" "b");
    EXPECT_EQ(text, "a\xef\xbf\xbd" "b");
    EXPECT_NO_THROW(nlohmann::json(text).dump());
    EXPECT_EQ(toValidUtf8("plain"), "plain");
}

TEST(Serialization, EstimateResponseShape) {
    EstimateResponse response;
    response.estimated_point = {1.5, 2.5, 270.0};
    response.address.display_name = "Main St";
    response.panorama.provider = "mapillary";
    response.panorama.thumbnail_url = "https://img/1";
    response.debug.method = "hfov";
    response.debug.delta_yaw_deg = -12.0;
    response.debug.notes = {"a"};

    json j = response;
    EXPECT_EQ(j["estimated_point"], json({{"lat", 1.5}, {"lon", 2.5}, {"bearing_deg", 270.0}}));
    EXPECT_EQ(j["address"]["display_name"], "Main St");
    EXPECT_EQ(j["address"]["components"], json::object());
    EXPECT_EQ(j["panorama"]["provider"], "mapillary");
    EXPECT_EQ(j["debug"]["delta_yaw_deg"], -12.0);
    EXPECT_EQ(j["debug"]["assumed_distance_m"], 20.0);
    EXPECT_EQ(j["debug"]["notes"], json::array({"a"}));
}
