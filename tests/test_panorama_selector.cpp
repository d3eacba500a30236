/**
 * @file test_panorama_selector.cpp
 * @brief Street View, Mapillary and provider-ordered selection
 */

#include "mocks/MockHttpTransport.hpp"

#include <geo_estimator/errors.hpp>
#include <geo_estimator/geodesic.hpp>
#include <geo_estimator/geometry.hpp>
#include <geo_estimator/mapillary_provider.hpp>
#include <geo_estimator/panorama_selector.hpp>
#include <geo_estimator/street_view_provider.hpp>

#include <limits>

using namespace geo_estimator;
using namespace geo_estimator::test;
using ::testing::_;
using ::testing::Return;

namespace {

const char* kStreetViewUrl = "http://streetview.test/metadata";
const char* kMapillaryUrl = "http://mapillary.test/images";

Config testConfig() {
    Config config;
    config.http_backoff_sec = 0.001;
    config.rate_limit_per_sec = 0.0;
    config.rate_limit_capacity = 20.0;
    config.street_view_metadata_url = kStreetViewUrl;
    config.street_view_image_url = "http://streetview.test/image";
    config.mapillary_url = kMapillaryUrl;
    return config;
}

ProviderCandidate candidateAt(const GeoPoint& location, std::optional<double> compass) {
    ProviderCandidate c;
    c.provider = PanoramaProviderKind::MAPILLARY;
    c.location = location;
    c.compass_angle_deg = compass;
    return c;
}

} // namespace

// ============================================================================
// Scoring
// ============================================================================

TEST(ScoreCandidate, HeadingErrorPlusDistanceFifth) {
    GeoPoint target{10.0, 10.0};
    GeoPoint ten_m_east = projectGeodesic(target, 90.0, 10.0);
    double score = scoreCandidate(candidateAt(ten_m_east, 350.0), target, 20.0);
    EXPECT_NEAR(score, 30.0 + haversineDistance(target, ten_m_east) / 5.0, 1e-9);
}

TEST(ScoreCandidate, MissingCompassIsInfinite) {
    GeoPoint target{10.0, 10.0};
    EXPECT_EQ(scoreCandidate(candidateAt(target, std::nullopt), target, 0.0),
              std::numeric_limits<double>::infinity());
}

TEST(PickBestCandidate, SmallerHeadingErrorWinsAtEqualDistance) {
    GeoPoint target{48.0, 11.0};
    GeoPoint north = projectGeodesic(target, 0.0, 15.0);
    GeoPoint south = projectGeodesic(target, 180.0, 15.0);
    std::vector<ProviderCandidate> candidates = {
        candidateAt(north, 100.0 + 40.0),
        candidateAt(south, 100.0 - 10.0),
    };
    EXPECT_EQ(pickBestCandidate(candidates, target, 100.0), 1);
}

TEST(PickBestCandidate, TiesAndAllInfiniteKeepFirst) {
    GeoPoint target{0.0, 0.0};
    std::vector<ProviderCandidate> no_compass = {
        candidateAt(target, std::nullopt),
        candidateAt(target, std::nullopt),
    };
    EXPECT_EQ(pickBestCandidate(no_compass, target, 0.0), 0);

    std::vector<ProviderCandidate> tied = {candidateAt(target, 10.0), candidateAt(target, -10.0)};
    EXPECT_EQ(pickBestCandidate(tied, target, 0.0), 0);

    EXPECT_EQ(pickBestCandidate({}, target, 0.0), -1);
}

// ============================================================================
// Providers
// ============================================================================

class PanoramaTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = testConfig();
        limiter_ = std::make_unique<TokenBucketRateLimiter>(config_.rate_limit_per_sec,
                                                            config_.rate_limit_capacity);
        gateway_ = std::make_unique<HttpGateway>(transport_, *limiter_, RetryPolicy::fromConfig(config_));
    }

    PanoramaSelector makeSelector() {
        PanoramaSelector selector;
        selector.addProvider(std::make_unique<StreetViewProvider>(*gateway_, config_));
        selector.addProvider(std::make_unique<MapillaryProvider>(*gateway_, config_));
        return selector;
    }

    Config config_;
    MockHttpTransport transport_;
    std::unique_ptr<TokenBucketRateLimiter> limiter_;
    std::unique_ptr<HttpGateway> gateway_;
};

TEST_F(PanoramaTest, StreetViewMetadataRequest) {
    config_.google_maps_api_key = "KEY";
    StreetViewProvider provider(*gateway_, config_);
    HttpRequest request = provider.buildMetadataRequest({40.7, -74.0}, 50.0);
    EXPECT_EQ(request.url, kStreetViewUrl);
    EXPECT_EQ(queryParam(request, "location"), "40.7,-74");
    EXPECT_EQ(queryParam(request, "radius"), "50");
    EXPECT_EQ(queryParam(request, "key"), "KEY");
}

TEST_F(PanoramaTest, StreetViewThumbnailUsesPanoIdOrLocation) {
    config_.google_maps_api_key = "KEY";
    StreetViewProvider provider(*gateway_, config_);

    std::string with_pano = provider.buildThumbnailUrl(std::string("abc"), {1.0, 2.0}, -30.0);
    EXPECT_EQ(with_pano,
              "http://streetview.test/image?size=640x400&fov=80&heading=330&pitch=0&key=KEY&pano=abc");

    std::string with_location = provider.buildThumbnailUrl(std::nullopt, {1.0, 2.0}, 90.0);
    EXPECT_NE(with_location.find("location=1%2C2"), std::string::npos);
    EXPECT_EQ(with_location.find("pano="), std::string::npos);
}

TEST_F(PanoramaTest, MapillarySearchRequestIsLonLat) {
    config_.mapillary_token = "TOKEN";
    MapillaryProvider provider(*gateway_, config_);
    HttpRequest request = provider.buildSearchRequest({40.5, -73.25}, 30.0);
    EXPECT_EQ(queryParam(request, "access_token"), "TOKEN");
    EXPECT_EQ(queryParam(request, "fields"), "id,compass_angle,captured_at,geometry,thumb_1024_url");
    EXPECT_EQ(queryParam(request, "limit"), "5");
    EXPECT_EQ(queryParam(request, "radius"), "30");
    EXPECT_EQ(queryParam(request, "closeto"), "-73.25,40.5");
}

TEST(MapillaryParse, CoordinatesAndThumbnailFallback) {
    GeoPoint fallback{1.0, 2.0};
    auto candidates = MapillaryProvider::parseResponse(R"({"data": [
        {"id": "a", "compass_angle": 12.5, "geometry": {"type": "Point", "coordinates": [2.0001, 1.0002]},
         "thumb_1024_url": "https://img/a1024"},
        {"id": "b", "thumb_256_url": "https://img/b256"}
    ]})", fallback);

    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_DOUBLE_EQ(candidates[0].location.lat, 1.0002);
    EXPECT_DOUBLE_EQ(candidates[0].location.lon, 2.0001);
    EXPECT_EQ(candidates[0].compass_angle_deg, 12.5);
    EXPECT_EQ(candidates[0].thumbnail_url, "https://img/a1024");
    EXPECT_EQ(candidates[0].meta["id"], "a");

    EXPECT_EQ(candidates[1].location, fallback);
    EXPECT_FALSE(candidates[1].compass_angle_deg.has_value());
    EXPECT_EQ(candidates[1].thumbnail_url, "https://img/b256");
}

// ============================================================================
// Selection
// ============================================================================

TEST_F(PanoramaTest, NoCredentialsMeansNoPanoramaAndNoTraffic) {
    PanoramaSelector selector = makeSelector();
    EXPECT_CALL(transport_, get(_, _, _)).Times(0);

    PanoramaInfo info = selector.select({1.0, 2.0}, 45.0, {"google", "mapillary"}, 50.0);
    EXPECT_TRUE(info.empty());
    EXPECT_FALSE(info.thumbnail_url.has_value());
    EXPECT_TRUE(info.meta.empty());
}

TEST_F(PanoramaTest, StreetViewOkReturnsImmediately) {
    config_.google_maps_api_key = "KEY";
    config_.mapillary_token = "TOKEN";
    PanoramaSelector selector = makeSelector();

    EXPECT_CALL(transport_, get(UrlStartsWith(kStreetViewUrl), _, _))
        .WillOnce(Return(okResponse(
            R"({"status": "OK", "pano_id": "P1", "location": {"lat": 1.00001, "lng": 2.00002}})")));
    EXPECT_CALL(transport_, get(UrlStartsWith(kMapillaryUrl), _, _)).Times(0);

    PanoramaInfo info = selector.select({1.0, 2.0}, 45.0, {"google", "mapillary"}, 50.0);
    ASSERT_FALSE(info.empty());
    EXPECT_EQ(*info.provider, "google");
    EXPECT_EQ(info.meta["pano_id"], "P1");
    ASSERT_TRUE(info.thumbnail_url.has_value());
    EXPECT_NE(info.thumbnail_url->find("pano=P1"), std::string::npos);
    EXPECT_NE(info.thumbnail_url->find("heading=45"), std::string::npos);
}

TEST_F(PanoramaTest, StreetViewZeroResultsFallsThroughToMapillary) {
    config_.google_maps_api_key = "KEY";
    config_.mapillary_token = "TOKEN";
    PanoramaSelector selector = makeSelector();

    GeoPoint target{48.0, 11.0};
    GeoPoint north = projectGeodesic(target, 0.0, 10.0);
    GeoPoint south = projectGeodesic(target, 180.0, 10.0);

    nlohmann::json body = {{"data", {
        {{"id", "far-off"}, {"compass_angle", 240.0},
         {"geometry", {{"coordinates", {north.lon, north.lat}}}}, {"thumb_1024_url", "https://img/40"}},
        {{"id", "close"}, {"compass_angle", 190.0},
         {"geometry", {{"coordinates", {south.lon, south.lat}}}}, {"thumb_1024_url", "https://img/10"}},
    }}};

    EXPECT_CALL(transport_, get(UrlStartsWith(kStreetViewUrl), _, _))
        .WillOnce(Return(okResponse(R"({"status": "ZERO_RESULTS"})")));
    EXPECT_CALL(transport_, get(UrlStartsWith(kMapillaryUrl), _, _))
        .WillOnce(Return(okResponse(body.dump())));

    PanoramaInfo info = selector.select(target, 200.0, {"google", "mapillary"}, 50.0);
    ASSERT_FALSE(info.empty());
    EXPECT_EQ(*info.provider, "mapillary");
    EXPECT_EQ(info.meta["id"], "close");
    EXPECT_EQ(info.thumbnail_url, "https://img/10");
}

TEST_F(PanoramaTest, PriorityOrderIsHonored) {
    config_.google_maps_api_key = "KEY";
    config_.mapillary_token = "TOKEN";
    PanoramaSelector selector = makeSelector();

    EXPECT_CALL(transport_, get(UrlStartsWith(kMapillaryUrl), _, _))
        .WillOnce(Return(okResponse(
            R"({"data": [{"id": "m1", "compass_angle": 0, "thumb_1024_url": "https://img/m1"}]})")));
    EXPECT_CALL(transport_, get(UrlStartsWith(kStreetViewUrl), _, _)).Times(0);

    PanoramaInfo info = selector.select({1.0, 2.0}, 0.0, {"mapillary", "google"}, 50.0);
    EXPECT_EQ(info.provider, "mapillary");
}

TEST_F(PanoramaTest, UpstreamFailureSkipsToNextProvider) {
    config_.google_maps_api_key = "KEY";
    config_.mapillary_token = "TOKEN";
    PanoramaSelector selector = makeSelector();

    EXPECT_CALL(transport_, get(UrlStartsWith(kStreetViewUrl), _, _))
        .Times(3)
        .WillRepeatedly(Return(statusResponse(500)));
    EXPECT_CALL(transport_, get(UrlStartsWith(kMapillaryUrl), _, _))
        .WillOnce(Return(okResponse(R"({"data": [{"id": "m1"}]})")));

    PanoramaInfo info = selector.select({1.0, 2.0}, 0.0, {"google", "mapillary"}, 50.0);
    EXPECT_EQ(info.provider, "mapillary");
    EXPECT_FALSE(info.thumbnail_url.has_value());
}

TEST_F(PanoramaTest, MalformedPayloadCountsAsNothingFound) {
    config_.mapillary_token = "TOKEN";
    PanoramaSelector selector = makeSelector();

    EXPECT_CALL(transport_, get(UrlStartsWith(kMapillaryUrl), _, _))
        .WillOnce(Return(okResponse("not json")));

    PanoramaInfo info = selector.select({1.0, 2.0}, 0.0, {"google", "mapillary"}, 50.0);
    EXPECT_TRUE(info.empty());
}

TEST(PanoramaSelector, RejectsNullProvider) {
    PanoramaSelector selector;
    EXPECT_THROW(selector.addProvider(nullptr), std::invalid_argument);
    EXPECT_EQ(selector.provider(PanoramaProviderKind::GOOGLE), nullptr);
}
