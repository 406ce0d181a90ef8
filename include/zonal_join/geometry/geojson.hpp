#pragma once

#include "zonal_join/core/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace zonal_join::geometry {

using json = nlohmann::json;

struct Feature {
    Geometry geometry;
    json id;  // GeoJSON "id", null when absent
};

// Accepts Polygon, MultiPolygon, Feature and FeatureCollection documents.
// Features come back in document order; their position is the feature index.
std::vector<Feature> parse_geojson(const std::string& text);
std::vector<Feature> load_geojson(const fs::path& path);

Geometry geometry_from_json(const json& node);

std::vector<Geometry> geometries_of(const std::vector<Feature>& features);

} // namespace zonal_join::geometry
