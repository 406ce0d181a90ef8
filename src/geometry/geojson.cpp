#include "zonal_join/geometry/geojson.hpp"
#include "zonal_join/geometry/geometry.hpp"
#include "zonal_join/core/errors.hpp"
#include "zonal_join/core/utils.hpp"

namespace zonal_join::geometry {

static Point point_from_json(const json& pos) {
    if (!pos.is_array() || pos.size() < 2 || !pos[0].is_number() || !pos[1].is_number()) {
        throw GeometryError("position must be an array of at least two numbers");
    }
    return {pos[0].get<double>(), pos[1].get<double>()};
}

static Ring ring_from_json(const json& coords) {
    if (!coords.is_array()) {
        throw GeometryError("linear ring must be an array of positions");
    }
    Ring ring;
    ring.reserve(coords.size());
    for (const auto& pos : coords) {
        ring.push_back(point_from_json(pos));
    }
    return ring;
}

static Polygon polygon_from_json(const json& coords) {
    if (!coords.is_array() || coords.empty()) {
        throw GeometryError("polygon must be a non-empty array of rings");
    }
    Polygon poly;
    for (const auto& ring : coords) {
        poly.rings.push_back(ring_from_json(ring));
    }
    return poly;
}

Geometry geometry_from_json(const json& node) {
    if (!node.is_object() || !node.contains("type") || !node["type"].is_string()) {
        throw GeometryError("geometry object without a type");
    }
    const std::string type = node["type"].get<std::string>();
    if (!node.contains("coordinates")) {
        throw GeometryError(type + " without coordinates");
    }
    const json& coords = node["coordinates"];

    Geometry g;
    if (type == "Polygon") {
        g.parts.push_back(polygon_from_json(coords));
    } else if (type == "MultiPolygon") {
        if (!coords.is_array()) {
            throw GeometryError("MultiPolygon coordinates must be an array");
        }
        for (const auto& poly : coords) {
            g.parts.push_back(polygon_from_json(poly));
        }
    } else {
        throw GeometryError("unsupported geometry type: " + type);
    }

    validate(g);
    return g;
}

static Feature feature_from_json(const json& node) {
    if (!node.contains("geometry") || node["geometry"].is_null()) {
        throw GeometryError("feature without geometry");
    }
    Feature f;
    f.geometry = geometry_from_json(node["geometry"]);
    if (node.contains("id")) {
        f.id = node["id"];
    }
    return f;
}

std::vector<Feature> parse_geojson(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw GeometryError(std::string("invalid GeoJSON: ") + e.what());
    }

    if (!doc.is_object() || !doc.contains("type") || !doc["type"].is_string()) {
        throw GeometryError("GeoJSON document without a type");
    }

    std::vector<Feature> features;
    const std::string type = doc["type"].get<std::string>();
    if (type == "FeatureCollection") {
        if (!doc.contains("features") || !doc["features"].is_array()) {
            throw GeometryError("FeatureCollection without a features array");
        }
        for (const auto& f : doc["features"]) {
            features.push_back(feature_from_json(f));
        }
    } else if (type == "Feature") {
        features.push_back(feature_from_json(doc));
    } else {
        features.push_back({geometry_from_json(doc), json()});
    }
    return features;
}

std::vector<Feature> load_geojson(const fs::path& path) {
    return parse_geojson(core::read_text(path));
}

std::vector<Geometry> geometries_of(const std::vector<Feature>& features) {
    std::vector<Geometry> out;
    out.reserve(features.size());
    for (const auto& f : features) {
        out.push_back(f.geometry);
    }
    return out;
}

} // namespace zonal_join::geometry
