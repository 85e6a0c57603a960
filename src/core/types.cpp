#include "rangeshift/core/types.hpp"
#include "rangeshift/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace rangeshift {

namespace {

bool nearly_equal(double a, double b) {
    const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    return std::fabs(a - b) <= 1.0e-9 * scale;
}

} // namespace

bool same_grid(const Grid& a, const Grid& b) {
    return a.width == b.width && a.height == b.height &&
           nearly_equal(a.origin_x, b.origin_x) &&
           nearly_equal(a.origin_y, b.origin_y) &&
           nearly_equal(a.pixel_width, b.pixel_width) &&
           nearly_equal(a.pixel_height, b.pixel_height) &&
           a.crs == b.crs && a.geographic == b.geographic;
}

std::string describe_grid(const Grid& g) {
    std::ostringstream oss;
    oss << g.width << "x" << g.height
        << " origin=(" << g.origin_x << "," << g.origin_y << ")"
        << " pixel=(" << g.pixel_width << "," << g.pixel_height << ")";
    if (!g.crs.empty()) oss << " crs=" << g.crs;
    if (g.geographic) oss << " geographic";
    return oss.str();
}

Grid window_grid(const Grid& parent, int x, int y, int width, int height) {
    if (x < 0 || y < 0 || width <= 0 || height <= 0 ||
        x + width > parent.width || y + height > parent.height) {
        throw ShapeError("window " + std::to_string(width) + "x" + std::to_string(height) +
                         "+" + std::to_string(x) + "+" + std::to_string(y) +
                         " outside grid " + describe_grid(parent));
    }
    Grid g = parent;
    g.width = width;
    g.height = height;
    g.origin_x = parent.origin_x + static_cast<double>(x) * parent.pixel_width;
    g.origin_y = parent.origin_y + static_cast<double>(y) * parent.pixel_height;
    return g;
}

std::vector<int> TimeSeries::years() const {
    std::vector<int> out;
    out.reserve(epochs.size());
    for (const auto& e : epochs) out.push_back(e.year);
    return out;
}

const std::vector<std::string>& TimeSeries::band_names() const {
    static const std::vector<std::string> kEmpty;
    return epochs.empty() ? kEmpty : epochs.front().band_names;
}

void TimeSeries::validate() const {
    if (epochs.empty()) {
        throw ShapeError("time series is empty");
    }

    const auto& ref = epochs.front();
    if (ref.bands.empty()) {
        throw ShapeError("epoch " + std::to_string(ref.year) + " has no bands");
    }
    if (ref.band_names.size() != ref.bands.size()) {
        throw ShapeError("epoch " + std::to_string(ref.year) +
                         " has " + std::to_string(ref.bands.size()) + " bands but " +
                         std::to_string(ref.band_names.size()) + " band names");
    }
    if (ref.rows() != grid.height || ref.cols() != grid.width) {
        throw ShapeError("epoch " + std::to_string(ref.year) + " is " +
                         std::to_string(ref.cols()) + "x" + std::to_string(ref.rows()) +
                         ", grid is " + describe_grid(grid));
    }

    for (size_t i = 0; i < epochs.size(); ++i) {
        const auto& e = epochs[i];
        if (i > 0 && e.year <= epochs[i - 1].year) {
            throw ShapeError("years must be strictly increasing: " +
                             std::to_string(epochs[i - 1].year) + " followed by " +
                             std::to_string(e.year));
        }
        if (e.band_names != ref.band_names || e.bands.size() != ref.bands.size()) {
            throw ShapeError("band set of epoch " + std::to_string(e.year) +
                             " differs from epoch " + std::to_string(ref.year));
        }
        for (const auto& b : e.bands) {
            if (b.rows() != grid.height || b.cols() != grid.width) {
                throw ShapeError("band dimensions of epoch " + std::to_string(e.year) +
                                 " do not match grid " + describe_grid(grid));
            }
        }
    }
}

} // namespace rangeshift
