#include "rangeshift/io/epoch_source.hpp"
#include "rangeshift/core/errors.hpp"

#include <algorithm>
#include <set>

namespace rangeshift::io {

EpochSource EpochSource::open(const std::vector<fs::path>& files,
                              const std::vector<std::string>& band_names,
                              const std::string& year_keyword,
                              const Grid& fallback_grid) {
    if (files.empty()) {
        throw ShapeError("no epoch rasters found");
    }
    if (band_names.empty()) {
        throw ShapeError("no band names configured");
    }

    EpochSource src;
    src.band_names_ = band_names;

    bool first = true;
    std::set<int> seen_years;
    for (const auto& path : files) {
        FitsImageInfo info = read_fits_info(path);

        auto year = info.header.get_int(year_keyword);
        if (!year) {
            throw ShapeError("missing " + year_keyword + " keyword: " + path.string());
        }
        if (!seen_years.insert(*year).second) {
            throw ShapeError("duplicate year " + std::to_string(*year) + ": " + path.string());
        }

        if (info.planes != static_cast<int>(band_names.size())) {
            throw ShapeError(path.string() + " has " + std::to_string(info.planes) +
                             " planes, expected " + std::to_string(band_names.size()) + " bands");
        }
        for (size_t b = 0; b < band_names.size(); ++b) {
            auto name = info.header.get_string("BAND" + std::to_string(b + 1));
            if (name && *name != band_names[b]) {
                throw ShapeError(path.string() + ": plane " + std::to_string(b + 1) +
                                 " is '" + *name + "', expected '" + band_names[b] + "'");
            }
        }

        Grid grid = grid_from_header(info.header, info.width, info.height, fallback_grid);
        if (first) {
            src.grid_ = grid;
            first = false;
        } else if (!same_grid(grid, src.grid_)) {
            throw ShapeError(path.string() + " is on grid " + describe_grid(grid) +
                             ", expected " + describe_grid(src.grid_));
        }

        src.files_.push_back(EpochFile{path, *year});
    }

    std::sort(src.files_.begin(), src.files_.end(),
              [](const EpochFile& a, const EpochFile& b) { return a.year < b.year; });
    return src;
}

std::vector<int> EpochSource::years() const {
    std::vector<int> out;
    out.reserve(files_.size());
    for (const auto& f : files_) out.push_back(f.year);
    return out;
}

TimeSeries EpochSource::read_window(int x, int y, int width, int height) const {
    TimeSeries series;
    series.grid = window_grid(grid_, x, y, width, height);
    series.epochs.reserve(files_.size());

    for (const auto& f : files_) {
        FitsCubeReader reader(f.path);
        EpochRaster epoch;
        epoch.year = f.year;
        epoch.band_names = band_names_;
        epoch.bands = reader.read_region(x, y, width, height);
        series.epochs.push_back(std::move(epoch));
    }
    return series;
}

void EpochSource::read_pixel(int year_index, int x, int y, float* out) {
    if (year_index < 0 || year_index >= size()) {
        throw ShapeError("year index " + std::to_string(year_index) + " out of range");
    }
    if (pixel_readers_.size() != files_.size()) {
        pixel_readers_.resize(files_.size());
    }
    auto& reader = pixel_readers_[static_cast<size_t>(year_index)];
    if (!reader) {
        reader = std::make_unique<FitsCubeReader>(files_[static_cast<size_t>(year_index)].path);
    }
    reader->read_pixel(x, y, out);
}

} // namespace rangeshift::io
