#pragma once

#include "rangeshift/core/types.hpp"
#include <fitsio.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rangeshift::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

// Image dimensions of the primary HDU. planes is 1 for a 2-D image.
struct FitsImageInfo {
    int width = 0;
    int height = 0;
    int planes = 0;
    FitsHeader header;
};

FitsImageInfo read_fits_info(const fs::path& path);

// First plane of a 2-D or 3-D image, as used for masks and terrain rasters.
Matrix2Df read_fits_plane(const fs::path& path);

// Grid built from the GRDX0/GRDY0/GRDDX/GRDDY/GRDCRS/GEOGRAPH keywords.
// Keywords that are absent are taken from `fallback`.
Grid grid_from_header(const FitsHeader& header, int width, int height, const Grid& fallback);
void grid_to_header(const Grid& grid, FitsHeader& header);

// Read-only handle on one FITS cube. Not shareable between threads;
// open one reader per thread.
class FitsCubeReader {
public:
    explicit FitsCubeReader(const fs::path& path);
    ~FitsCubeReader();

    FitsCubeReader(const FitsCubeReader&) = delete;
    FitsCubeReader& operator=(const FitsCubeReader&) = delete;

    const FitsImageInfo& info() const { return info_; }

    // One plane per band, each `height x width`, cut at (x, y).
    std::vector<Matrix2Df> read_region(int x, int y, int width, int height);

    // All planes at one pixel, written to out[0..planes).
    void read_pixel(int x, int y, float* out);

private:
    fs::path path_;
    fitsfile* fptr_ = nullptr;
    FitsImageInfo info_;
};

enum class FitsPixelType { INT16, INT32, FLOAT32 };

// Output cube that is filled region by region. Region writes from several
// threads must be serialized by the caller.
class FitsCubeWriter {
public:
    FitsCubeWriter(const fs::path& path, int width, int height, int planes,
                   FitsPixelType type, const FitsHeader& header);
    ~FitsCubeWriter();

    FitsCubeWriter(const FitsCubeWriter&) = delete;
    FitsCubeWriter& operator=(const FitsCubeWriter&) = delete;

    void write_region(int plane, int x, int y, const Matrix2Df& data);
    void write_region(int plane, int x, int y, const LabelMatrix& data);
    void write_region(int plane, int x, int y, const IndicatorMatrix& data);

    void close();

private:
    void write_subset(int plane, int x, int y, int w, int h, int datatype, void* buffer);

    fs::path path_;
    fitsfile* fptr_ = nullptr;
    int width_ = 0;
    int height_ = 0;
    int planes_ = 0;
};

} // namespace rangeshift::io
