#include "zonal_join/geometry/geojson.hpp"
#include "zonal_join/geometry/geometry.hpp"
#include "zonal_join/core/errors.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace zonal_join;

TEST_CASE("parse_geojson_reads_feature_collection_in_order") {
    const std::string text = R"({
        "type": "FeatureCollection",
        "features": [
            {"type": "Feature", "id": "north",
             "geometry": {"type": "Polygon",
                          "coordinates": [[[0, 5], [10, 5], [10, 10], [0, 10], [0, 5]]]}},
            {"type": "Feature", "id": 7,
             "geometry": {"type": "MultiPolygon",
                          "coordinates": [[[[0, 0], [2, 0], [2, 2], [0, 0]]],
                                          [[[5, 0], [8, 0], [8, 3], [5, 0]]]]}},
            {"type": "Feature",
             "geometry": {"type": "Polygon",
                          "coordinates": [[[0, 0], [1, 0], [1, 1], [0, 0]]]}}
        ]
    })";

    auto features = geometry::parse_geojson(text);

    REQUIRE(features.size() == 3);
    REQUIRE(features[0].id == "north");
    REQUIRE(features[0].geometry.parts.size() == 1);
    REQUIRE(features[0].geometry.parts[0].rings[0].size() == 5);
    REQUIRE(features[1].id == 7);
    REQUIRE(features[1].geometry.parts.size() == 2);
    REQUIRE(features[2].id.is_null());

    auto geoms = geometry::geometries_of(features);
    REQUIRE(geoms.size() == 3);
    REQUIRE(geoms[1].parts.size() == 2);
}

TEST_CASE("parse_geojson_accepts_bare_geometry_and_single_feature") {
    auto bare = geometry::parse_geojson(
        R"({"type": "Polygon", "coordinates": [[[0, 0], [4, 0], [4, 4], [0, 4], [0, 0]],
                                              [[1, 1], [2, 1], [2, 2], [1, 1]]]})");
    REQUIRE(bare.size() == 1);
    REQUIRE(bare[0].geometry.parts[0].rings.size() == 2);
    REQUIRE(bare[0].id.is_null());

    auto single = geometry::parse_geojson(
        R"({"type": "Feature", "id": "x",
            "geometry": {"type": "Polygon", "coordinates": [[[0, 0], [1, 0], [0, 1], [0, 0]]]}})");
    REQUIRE(single.size() == 1);
    REQUIRE(single[0].id == "x");
}

TEST_CASE("parse_geojson_rejects_unsupported_and_malformed_input") {
    REQUIRE_THROWS_AS(geometry::parse_geojson("not json"), GeometryError);
    REQUIRE_THROWS_AS(geometry::parse_geojson(R"({"features": []})"), GeometryError);
    REQUIRE_THROWS_AS(geometry::parse_geojson(R"({"type": "Point", "coordinates": [1, 2]})"),
                      GeometryError);
    REQUIRE_THROWS_AS(geometry::parse_geojson(R"({"type": "Feature", "geometry": null})"),
                      GeometryError);
    REQUIRE_THROWS_AS(
        geometry::parse_geojson(R"({"type": "Polygon", "coordinates": [[[0, 0], [1, 1], [0, 0]]]})"),
        GeometryError);
    REQUIRE_THROWS_AS(
        geometry::parse_geojson(R"({"type": "Polygon", "coordinates": [[[0, 0], ["a", 1], [1, 1]]]})"),
        GeometryError);
}

TEST_CASE("load_geojson_reports_missing_file") {
    REQUIRE_THROWS_AS(geometry::load_geojson("/nonexistent/zonal_join/features.geojson"), IOError);
}

TEST_CASE("bounds_cover_all_shells") {
    auto features = geometry::parse_geojson(
        R"({"type": "MultiPolygon",
            "coordinates": [[[[0, 0], [2, 0], [2, 2], [0, 0]]],
                            [[[5, -1], [8, -1], [8, 3], [5, -1]]]]})");

    Envelope e = geometry::bounds(features[0].geometry);
    REQUIRE(e.min_x == 0.0);
    REQUIRE(e.min_y == -1.0);
    REQUIRE(e.max_x == 8.0);
    REQUIRE(e.max_y == 3.0);
}

TEST_CASE("open_ring_drops_repeated_closing_vertex") {
    Ring closed = {{0, 0}, {1, 0}, {1, 1}, {0, 0}};
    REQUIRE(geometry::open_ring(closed).size() == 3);

    Ring open = {{0, 0}, {1, 0}, {1, 1}};
    REQUIRE(geometry::open_ring(open).size() == 3);
}
