#pragma once

#include "rangeshift/core/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace rangeshift::testing {

// Series over a width x height projected grid with value(band, year_index, x, y).
inline TimeSeries make_series(int width, int height, const std::vector<int>& years,
                              const std::vector<std::string>& band_names,
                              const std::function<float(int, int, int, int)>& value) {
    TimeSeries s;
    s.grid.width = width;
    s.grid.height = height;
    s.grid.pixel_width = 30.0;
    s.grid.pixel_height = -30.0;
    s.grid.crs = "EPSG:5070";
    for (size_t t = 0; t < years.size(); ++t) {
        EpochRaster e;
        e.year = years[t];
        e.band_names = band_names;
        for (size_t b = 0; b < band_names.size(); ++b) {
            Matrix2Df m(height, width);
            for (int y = 0; y < height; ++y) {
                for (int x = 0; x < width; ++x) {
                    m(y, x) = value(static_cast<int>(b), static_cast<int>(t), x, y);
                }
            }
            e.bands.push_back(m);
        }
        s.epochs.push_back(e);
    }
    return s;
}

// Two-band field: pixels on the right half drift towards high AFG over time,
// the left half stays perennial.
inline TimeSeries make_invasion_series(int width, int height, const std::vector<int>& years) {
    return make_series(width, height, years, {"AFG", "PFG"},
                       [width](int b, int t, int x, int y) {
                           const bool invaded = x >= width / 2 && t >= (y % 3) + 1;
                           const float jitter = static_cast<float>((x * 7 + y * 13 + t * 5) % 5);
                           if (b == 0) return invaded ? 60.0f + jitter : 5.0f + jitter;
                           return invaded ? 10.0f + jitter : 50.0f + jitter;
                       });
}

} // namespace rangeshift::testing
