#include "rangeshift/aggregation/zonal_totals.hpp"
#include "rangeshift/core/errors.hpp"

#include <cmath>
#include <unordered_map>

namespace rangeshift::aggregation {

AreaUnit area_unit_from_string(const std::string& s) {
    if (s == "m2") return AreaUnit::M2;
    if (s == "ha") return AreaUnit::HA;
    if (s == "km2") return AreaUnit::KM2;
    if (s == "acres") return AreaUnit::ACRES;
    throw ValidationError("unknown area unit '" + s + "'");
}

std::string area_unit_to_string(AreaUnit unit) {
    switch (unit) {
        case AreaUnit::M2: return "m2";
        case AreaUnit::HA: return "ha";
        case AreaUnit::KM2: return "km2";
        case AreaUnit::ACRES: return "acres";
        default: return "m2";
    }
}

double square_metres_per_unit(AreaUnit unit) {
    switch (unit) {
        case AreaUnit::M2: return 1.0;
        case AreaUnit::HA: return 1.0e4;
        case AreaUnit::KM2: return 1.0e6;
        case AreaUnit::ACRES: return 4046.8564224;
        default: return 1.0;
    }
}

double pixel_area_m2(const Grid& grid, int row) {
    if (!grid.geographic) {
        return std::fabs(grid.pixel_width * grid.pixel_height);
    }
    constexpr double kDegToRad = M_PI / 180.0;
    const double lat1 = (grid.origin_y + static_cast<double>(row) * grid.pixel_height) * kDegToRad;
    const double lat2 = lat1 + grid.pixel_height * kDegToRad;
    const double dlon = std::fabs(grid.pixel_width) * kDegToRad;
    return kEarthRadiusM * kEarthRadiusM * dlon * std::fabs(std::sin(lat2) - std::sin(lat1));
}

ZonalAccumulator::ZonalAccumulator(std::vector<std::string> zone_names, std::vector<int> years)
    : zone_names_(std::move(zone_names)), years_(std::move(years)) {
    const size_t n = zone_names_.size() * years_.size();
    target_area_.assign(n, 0.0);
    first_area_.assign(n, 0.0);
    target_pixels_.assign(n, 0);
}

void ZonalAccumulator::add_tile(const std::vector<IndicatorMatrix>& indicators,
                                const TransitionRaster& transition,
                                const ZoneMatrix& zones,
                                const Grid& tile_grid) {
    if (indicators.size() != years_.size()) {
        throw ShapeError(std::to_string(indicators.size()) + " indicator epochs, accumulator has " +
                         std::to_string(years_.size()) + " years");
    }
    const int rows = tile_grid.height;
    const int cols = tile_grid.width;
    if (zones.rows() != rows || zones.cols() != cols || transition.rows != rows || transition.cols != cols) {
        throw ShapeError("zone or transition raster does not match tile " + describe_grid(tile_grid));
    }

    std::unordered_map<int, size_t> year_index;
    for (size_t t = 0; t < years_.size(); ++t) year_index[years_[t]] = t;

    const int n_zones = static_cast<int>(zone_names_.size());
    for (int r = 0; r < rows; ++r) {
        const double area = pixel_area_m2(tile_grid, r);
        for (int c = 0; c < cols; ++c) {
            const int zone = zones(r, c);
            if (zone < 0 || zone >= n_zones) continue;
            if (!transition.valid(r, c)) continue;

            for (size_t t = 0; t < years_.size(); ++t) {
                if (indicators[t](r, c) == 1) {
                    target_area_[index(zone, t)] += area;
                    target_pixels_[index(zone, t)] += 1;
                }
            }

            const auto& fy = transition.at(r, c);
            if (fy) {
                auto it = year_index.find(*fy);
                if (it != year_index.end()) {
                    first_area_[index(zone, it->second)] += area;
                }
            }
        }
    }
}

void ZonalAccumulator::merge(const ZonalAccumulator& other) {
    if (other.zone_names_ != zone_names_ || other.years_ != years_) {
        throw ShapeError("cannot merge zonal accumulators with different zones or years");
    }
    for (size_t i = 0; i < target_area_.size(); ++i) {
        target_area_[i] += other.target_area_[i];
        first_area_[i] += other.first_area_[i];
        target_pixels_[i] += other.target_pixels_[i];
    }
}

std::vector<ZonalRecord> ZonalAccumulator::finalize(AreaUnit unit) const {
    const double scale = 1.0 / square_metres_per_unit(unit);
    std::vector<ZonalRecord> out;
    out.reserve(target_area_.size());
    for (size_t z = 0; z < zone_names_.size(); ++z) {
        for (size_t t = 0; t < years_.size(); ++t) {
            const size_t i = index(static_cast<int>(z), t);
            ZonalRecord rec;
            rec.zone = zone_names_[z];
            rec.year = years_[t];
            rec.target_area = target_area_[i] * scale;
            rec.first_transition_area = first_area_[i] * scale;
            rec.target_pixels = target_pixels_[i];
            out.push_back(rec);
        }
    }
    return out;
}

} // namespace rangeshift::aggregation
