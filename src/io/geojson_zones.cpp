#include "rangeshift/io/geojson_zones.hpp"
#include "rangeshift/core/errors.hpp"
#include "rangeshift/core/utils.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <cmath>
#include <map>

namespace rangeshift::io {

using json = nlohmann::json;

namespace {

constexpr int kFillShift = 8;  // fractional bits for cv::fillPoly

Ring parse_ring(const json& coords) {
    if (!coords.is_array()) {
        throw ValidationError("GeoJSON ring is not an array");
    }
    Ring ring;
    ring.reserve(coords.size());
    for (const auto& pt : coords) {
        if (!pt.is_array() || pt.size() < 2) {
            throw ValidationError("GeoJSON position needs at least two coordinates");
        }
        ring.emplace_back(pt[0].get<double>(), pt[1].get<double>());
    }
    return ring;
}

Polygon parse_polygon(const json& coords) {
    if (!coords.is_array() || coords.empty()) {
        throw ValidationError("GeoJSON polygon has no rings");
    }
    Polygon poly;
    for (const auto& ring : coords) {
        poly.push_back(parse_ring(ring));
    }
    return poly;
}

void append_geometry(const json& geom, std::vector<Polygon>& out) {
    if (geom.is_null()) return;

    const std::string type = geom.value("type", "");
    if (type == "Polygon") {
        out.push_back(parse_polygon(geom.at("coordinates")));
    } else if (type == "MultiPolygon") {
        for (const auto& p : geom.at("coordinates")) {
            out.push_back(parse_polygon(p));
        }
    } else if (type == "GeometryCollection") {
        for (const auto& g : geom.at("geometries")) {
            append_geometry(g, out);
        }
    } else {
        throw ValidationError("unsupported GeoJSON geometry type '" + type + "'");
    }
}

std::string feature_name(const json& feature, const std::string& name_property, size_t index) {
    if (feature.contains("properties") && feature["properties"].is_object()) {
        const auto& props = feature["properties"];
        auto it = props.find(name_property);
        if (it != props.end() && !it->is_null()) {
            if (it->is_string()) return it->get<std::string>();
            return it->dump();
        }
    }
    return "zone_" + std::to_string(index);
}

// Grid coordinates to fixed-point OpenCV vertices. OpenCV puts integer
// coordinates on pixel centres, so shift by half a pixel.
std::vector<std::vector<cv::Point>> to_contours(const Polygon& poly, const Grid& grid) {
    const double scale = static_cast<double>(1 << kFillShift);
    std::vector<std::vector<cv::Point>> contours;
    contours.reserve(poly.size());
    for (const auto& ring : poly) {
        std::vector<cv::Point> pts;
        pts.reserve(ring.size());
        for (const auto& [gx, gy] : ring) {
            const double col = (gx - grid.origin_x) / grid.pixel_width - 0.5;
            const double row = (gy - grid.origin_y) / grid.pixel_height - 0.5;
            pts.emplace_back(static_cast<int>(std::lround(col * scale)),
                             static_cast<int>(std::lround(row * scale)));
        }
        if (pts.size() >= 3) contours.push_back(std::move(pts));
    }
    return contours;
}

void fill_feature(cv::Mat& canvas, const ZoneFeature& feature, const Grid& grid, const cv::Scalar& value) {
    for (const auto& poly : feature.polygons) {
        auto contours = to_contours(poly, grid);
        if (contours.empty()) continue;
        cv::fillPoly(canvas, contours, value, cv::LINE_8, kFillShift);
    }
}

} // namespace

std::vector<ZoneFeature> parse_geojson(const json& doc, const std::string& name_property) {
    std::vector<ZoneFeature> features;
    const std::string type = doc.value("type", "");

    auto add_feature = [&](const json& f, size_t index) {
        ZoneFeature zf;
        zf.name = feature_name(f, name_property, index);
        if (f.contains("geometry")) {
            append_geometry(f["geometry"], zf.polygons);
        }
        features.push_back(std::move(zf));
    };

    if (type == "FeatureCollection") {
        const auto& arr = doc.at("features");
        for (size_t i = 0; i < arr.size(); ++i) {
            add_feature(arr[i], i);
        }
    } else if (type == "Feature") {
        add_feature(doc, 0);
    } else {
        ZoneFeature zf;
        zf.name = "zone_0";
        append_geometry(doc, zf.polygons);
        features.push_back(std::move(zf));
    }
    return features;
}

std::vector<ZoneFeature> read_geojson(const fs::path& path, const std::string& name_property) {
    json doc;
    try {
        doc = json::parse(core::read_text(path));
    } catch (const json::exception& e) {
        throw IOError("Cannot parse GeoJSON " + path.string() + ": " + e.what());
    }
    try {
        return parse_geojson(doc, name_property);
    } catch (const json::exception& e) {
        throw ValidationError("Malformed GeoJSON " + path.string() + ": " + e.what());
    }
}

ZoneRaster rasterize_zones(const std::vector<ZoneFeature>& features, const Grid& grid) {
    ZoneRaster out;
    cv::Mat canvas(grid.height, grid.width, CV_32S, cv::Scalar(kNoZone));

    std::map<std::string, int> ids;
    for (const auto& f : features) {
        auto it = ids.find(f.name);
        int id = 0;
        if (it == ids.end()) {
            id = static_cast<int>(out.names.size());
            ids.emplace(f.name, id);
            out.names.push_back(f.name);
        } else {
            id = it->second;
        }
        fill_feature(canvas, f, grid, cv::Scalar(id));
    }

    out.ids.resize(grid.height, grid.width);
    for (int r = 0; r < grid.height; ++r) {
        const int32_t* src = canvas.ptr<int32_t>(r);
        for (int c = 0; c < grid.width; ++c) {
            out.ids(r, c) = src[c];
        }
    }
    return out;
}

MaskMatrix rasterize_mask(const std::vector<ZoneFeature>& features, const Grid& grid) {
    cv::Mat1b canvas = cv::Mat1b::zeros(grid.height, grid.width);
    for (const auto& f : features) {
        fill_feature(canvas, f, grid, cv::Scalar(1));
    }

    MaskMatrix mask(grid.height, grid.width);
    for (int r = 0; r < grid.height; ++r) {
        const uint8_t* src = canvas.ptr<uint8_t>(r);
        for (int c = 0; c < grid.width; ++c) {
            mask(r, c) = src[c];
        }
    }
    return mask;
}

} // namespace rangeshift::io
