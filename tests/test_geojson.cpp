#include "rangeshift/core/errors.hpp"
#include "rangeshift/io/geojson_zones.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

rangeshift::Grid unit_grid(int w, int h) {
    rangeshift::Grid g;
    g.width = w;
    g.height = h;
    g.pixel_width = 1.0;
    g.pixel_height = -1.0;
    return g;
}

json square(double x0, double y0, double x1, double y1) {
    return json::array({json::array({json::array({x0, y0}), json::array({x1, y0}), json::array({x1, y1}),
                                     json::array({x0, y1}), json::array({x0, y0})})});
}

json feature(const std::string& name, const json& coords) {
    return {{"type", "Feature"},
            {"properties", {{"NAME", name}}},
            {"geometry", {{"type", "Polygon"}, {"coordinates", coords}}}};
}

} // namespace

TEST_CASE("geojson_parses_feature_collection_names") {
    json doc = {{"type", "FeatureCollection"},
                {"features", json::array({feature("ridge", square(0, 0, 2, -2)),
                                          {{"type", "Feature"}, {"properties", json::object()},
                                           {"geometry", nullptr}}})}};

    auto features = rangeshift::io::parse_geojson(doc, "NAME");

    REQUIRE(features.size() == 2);
    REQUIRE(features[0].name == "ridge");
    REQUIRE(features[0].polygons.size() == 1);
    REQUIRE(features[0].polygons[0][0].size() == 5);
    REQUIRE(features[1].name == "zone_1");
    REQUIRE(features[1].polygons.empty());
}

TEST_CASE("geojson_rejects_unsupported_geometry") {
    json doc = {{"type", "LineString"}, {"coordinates", json::array({json::array({0, 0}), json::array({1, 1})})}};
    REQUIRE_THROWS_AS(rangeshift::io::parse_geojson(doc, "NAME"), rangeshift::ValidationError);
}

TEST_CASE("rasterized_square_covers_interior_pixels") {
    json doc = feature("block", square(2, -2, 5, -5));
    auto features = rangeshift::io::parse_geojson(doc, "NAME");

    auto mask = rangeshift::io::rasterize_mask(features, unit_grid(8, 8));

    REQUIRE(mask(3, 3) == 1);
    REQUIRE(mask(2, 4) == 1);
    REQUIRE(mask(0, 0) == 0);
    REQUIRE(mask(7, 7) == 0);
    REQUIRE(mask(3, 6) == 0);
    const int filled = mask.cast<int>().sum();
    REQUIRE(filled >= 9);
    REQUIRE(filled <= 16);
}

TEST_CASE("rasterized_zones_let_later_features_win") {
    json doc = {{"type", "FeatureCollection"},
                {"features", json::array({feature("west", square(0, 0, 6, -6)),
                                          feature("east", square(3, 0, 8, -6)),
                                          feature("west", square(0, -7, 2, -8))})}};
    auto features = rangeshift::io::parse_geojson(doc, "NAME");

    auto zones = rangeshift::io::rasterize_zones(features, unit_grid(8, 8));

    REQUIRE(zones.names.size() == 2);
    REQUIRE(zones.names[0] == "west");
    REQUIRE(zones.names[1] == "east");
    REQUIRE(zones.ids(2, 1) == 0);
    REQUIRE(zones.ids(2, 4) == 1);  // overlap goes to the later feature
    REQUIRE(zones.ids(7, 0) == 0);  // second "west" polygon shares the id
    REQUIRE(zones.ids(7, 6) == rangeshift::kNoZone);
}
