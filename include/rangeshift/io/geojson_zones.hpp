#pragma once

#include "rangeshift/core/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rangeshift::io {

// Ring vertices in grid (map) coordinates. The first ring of a polygon is
// the outer boundary, the rest are holes.
using Ring = std::vector<std::pair<double, double>>;
using Polygon = std::vector<Ring>;

struct ZoneFeature {
    std::string name;
    std::vector<Polygon> polygons;
};

// Zone-id raster plus the zone name for every id.
struct ZoneRaster {
    ZoneMatrix ids;                  // kNoZone outside every zone
    std::vector<std::string> names;  // names[id]
};

// Accepts a FeatureCollection, a single Feature or a bare geometry.
// Polygon and MultiPolygon are supported; null geometries are skipped.
std::vector<ZoneFeature> parse_geojson(const nlohmann::json& doc, const std::string& name_property);
std::vector<ZoneFeature> read_geojson(const fs::path& path, const std::string& name_property);

// Features sharing a name become one zone. Where features overlap, the one
// that appears later wins.
ZoneRaster rasterize_zones(const std::vector<ZoneFeature>& features, const Grid& grid);

// 1 inside any feature, 0 elsewhere.
MaskMatrix rasterize_mask(const std::vector<ZoneFeature>& features, const Grid& grid);

} // namespace rangeshift::io
