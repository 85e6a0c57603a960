#pragma once

#include "rangeshift/core/types.hpp"
#include <string>
#include <vector>

namespace rangeshift::aggregation {

enum class AreaUnit { M2, HA, KM2, ACRES };

AreaUnit area_unit_from_string(const std::string& s);
std::string area_unit_to_string(AreaUnit unit);
double square_metres_per_unit(AreaUnit unit);

constexpr double kEarthRadiusM = 6371008.8;

// Area of one pixel in row `row` of `grid`, in square metres. Geographic
// grids use the spherical cell area, so the value depends on latitude.
double pixel_area_m2(const Grid& grid, int row);

// Per-zone, per-year target area. Tiles feed it independently and the
// partial results are summed with merge().
class ZonalAccumulator {
public:
    ZonalAccumulator(std::vector<std::string> zone_names, std::vector<int> years);

    // `zones`, `indicators` and `transition` all cover the window `tile_grid`.
    void add_tile(const std::vector<IndicatorMatrix>& indicators,
                  const TransitionRaster& transition,
                  const ZoneMatrix& zones,
                  const Grid& tile_grid);

    void merge(const ZonalAccumulator& other);

    // One record per (zone, year), zero rows included, in zone then year order.
    std::vector<ZonalRecord> finalize(AreaUnit unit) const;

    const std::vector<std::string>& zone_names() const { return zone_names_; }
    const std::vector<int>& years() const { return years_; }

private:
    size_t index(int zone, size_t year_index) const {
        return static_cast<size_t>(zone) * years_.size() + year_index;
    }

    std::vector<std::string> zone_names_;
    std::vector<int> years_;
    std::vector<double> target_area_;
    std::vector<double> first_area_;
    std::vector<long long> target_pixels_;
};

} // namespace rangeshift::aggregation
