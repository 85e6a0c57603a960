#pragma once

#include "rangeshift/core/types.hpp"
#include "rangeshift/io/fits_io.hpp"
#include <memory>
#include <string>
#include <vector>

namespace rangeshift::io {

struct EpochFile {
    fs::path path;
    int year = 0;
};

// Year-ordered set of epoch FITS cubes sharing one grid and one band layout.
// Windows are read on demand so a tile never loads more than its own pixels.
class EpochSource {
public:
    // Reads every header, sorts by year and checks that all cubes agree.
    // Duplicate years, band-count or grid mismatches throw ShapeError.
    static EpochSource open(const std::vector<fs::path>& files,
                            const std::vector<std::string>& band_names,
                            const std::string& year_keyword,
                            const Grid& fallback_grid);

    const Grid& grid() const { return grid_; }
    const std::vector<EpochFile>& files() const { return files_; }
    const std::vector<std::string>& band_names() const { return band_names_; }
    std::vector<int> years() const;
    int size() const { return static_cast<int>(files_.size()); }

    // Safe to call concurrently; every call opens its own readers.
    TimeSeries read_window(int x, int y, int width, int height) const;

    // Raw band vector of one pixel-year. Keeps readers open between calls and
    // must not be used from more than one thread.
    void read_pixel(int year_index, int x, int y, float* out);

private:
    Grid grid_;
    std::vector<EpochFile> files_;
    std::vector<std::string> band_names_;
    std::vector<std::unique_ptr<FitsCubeReader>> pixel_readers_;
};

} // namespace rangeshift::io
