#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rangeshift {

namespace fs = std::filesystem;

// Matrix types (row-major, same memory layout as a FITS plane)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using LabelMatrix = Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using IndicatorMatrix = Eigen::Matrix<int8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MaskMatrix = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using ZoneMatrix = Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;
using VectorXd = Eigen::VectorXd;
using VectorXi = Eigen::VectorXi;

constexpr int32_t kLabelNoData = -1;
constexpr int8_t kIndicatorNoData = -1;
constexpr int32_t kNoZone = -1;

// Spatial domain shared by every raster of a run.
struct Grid {
    int width = 0;
    int height = 0;
    double origin_x = 0.0;      // x of the top-left pixel corner
    double origin_y = 0.0;      // y of the top-left pixel corner
    double pixel_width = 1.0;
    double pixel_height = -1.0; // negative for north-up rasters
    std::string crs;
    bool geographic = false;    // true: degrees (lon/lat), false: projected metres

    long long pixel_count() const {
        return static_cast<long long>(width) * static_cast<long long>(height);
    }
};

bool same_grid(const Grid& a, const Grid& b);
std::string describe_grid(const Grid& g);

// Grid of the window whose top-left pixel is (x, y) in `parent`.
Grid window_grid(const Grid& parent, int x, int y, int width, int height);

// One year's multi-band snapshot.
struct EpochRaster {
    int year = 0;
    std::vector<std::string> band_names;
    std::vector<Matrix2Df> bands;  // one plane per band, all rows x cols

    int rows() const { return bands.empty() ? 0 : static_cast<int>(bands.front().rows()); }
    int cols() const { return bands.empty() ? 0 : static_cast<int>(bands.front().cols()); }
    int band_count() const { return static_cast<int>(bands.size()); }
};

// Epoch rasters ordered strictly by year. Gaps between years are allowed.
struct TimeSeries {
    Grid grid;
    std::vector<EpochRaster> epochs;

    int size() const { return static_cast<int>(epochs.size()); }
    bool empty() const { return epochs.empty(); }
    std::vector<int> years() const;
    const std::vector<std::string>& band_names() const;

    // Throws ShapeError on non-increasing years, band or dimension mismatch.
    void validate() const;
};

// Rectangular window of the grid. Tiles of one grid never overlap.
struct Tile {
    int x;       // Top-left x coordinate
    int y;       // Top-left y coordinate
    int width;
    int height;
    int row;     // Grid row index
    int col;     // Grid column index
};

struct TileGrid {
    int tile_size;
    int rows;
    int cols;
    std::vector<Tile> tiles;
};

// Per-pixel summary of the first year in the target state.
// first_year is empty both for "never" and for no-data; `valid` tells them apart.
struct TransitionRaster {
    int rows = 0;
    int cols = 0;
    std::vector<std::optional<int>> first_year;  // row-major
    MaskMatrix data_mask;                        // 1 = observed in target at least once
    LabelMatrix target_count;                    // number of years in target state
    MaskMatrix valid;                            // 1 = analysis-eligible pixel with data

    const std::optional<int>& at(int r, int c) const {
        return first_year[static_cast<size_t>(r) * static_cast<size_t>(cols) + static_cast<size_t>(c)];
    }
};

// Areal total of the target state for one zone and year.
struct ZonalRecord {
    std::string zone;
    int year = 0;
    double target_area = 0.0;
    double first_transition_area = 0.0;
    long long target_pixels = 0;
};

// One bin of a directional histogram for one zone and period.
struct HistogramRecord {
    std::string zone;
    std::string period;
    int start_year = 0;
    int end_year = 0;
    int bin = 0;
    double bin_lower = 0.0;
    double bin_upper = 0.0;
    long long count = 0;
    long long total = 0;
    std::optional<double> proportion;  // empty when no pixel was selected
};

// Pipeline phase enumeration
enum class Phase {
    SCAN_INPUT = 0,
    LOAD_STATIC = 1,
    SAMPLING = 2,
    CLUSTER_FIT = 3,
    TILE_GRID = 4,
    TILE_PROCESSING = 5,
    AGGREGATION = 6,
    DONE = 7
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_INPUT: return "SCAN_INPUT";
        case Phase::LOAD_STATIC: return "LOAD_STATIC";
        case Phase::SAMPLING: return "SAMPLING";
        case Phase::CLUSTER_FIT: return "CLUSTER_FIT";
        case Phase::TILE_GRID: return "TILE_GRID";
        case Phase::TILE_PROCESSING: return "TILE_PROCESSING";
        case Phase::AGGREGATION: return "AGGREGATION";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace rangeshift
