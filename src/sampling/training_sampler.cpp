#include "rangeshift/sampling/training_sampler.hpp"
#include "rangeshift/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace rangeshift::sampling {

void SamplerParams::validate() const {
    if (sample_size < 1) {
        throw ValidationError("sample_size must be >= 1");
    }
    if (!(oversample_factor >= 1.0f)) {
        throw ValidationError("oversample_factor must be >= 1");
    }
    if (strata_rows < 1 || strata_cols < 1) {
        throw ValidationError("strata_rows and strata_cols must be >= 1");
    }
}

Matrix2Df TrainingSample::matrix() const {
    const int d = static_cast<int>(band_names.size());
    Matrix2Df m(static_cast<int>(points.size()), d);
    for (size_t i = 0; i < points.size(); ++i) {
        for (int j = 0; j < d; ++j) {
            m(static_cast<int>(i), j) = points[i].values[static_cast<size_t>(j)];
        }
    }
    return m;
}

namespace {

struct Stratum {
    int x0, y0, x1, y1;  // half-open
};

std::vector<Stratum> build_strata(const Grid& grid, int strata_rows, int strata_cols) {
    std::vector<Stratum> strata;
    const long long W = grid.width;
    const long long H = grid.height;
    for (int sr = 0; sr < strata_rows; ++sr) {
        const int y0 = static_cast<int>(H * sr / strata_rows);
        const int y1 = static_cast<int>(H * (sr + 1) / strata_rows);
        if (y1 <= y0) continue;
        for (int sc = 0; sc < strata_cols; ++sc) {
            const int x0 = static_cast<int>(W * sc / strata_cols);
            const int x1 = static_cast<int>(W * (sc + 1) / strata_cols);
            if (x1 <= x0) continue;
            strata.push_back(Stratum{x0, y0, x1, y1});
        }
    }
    return strata;
}

bool mask_allows(const MaskMatrix& mask, int x, int y) {
    return mask.size() == 0 || mask(y, x) != 0;
}

void check_mask(const MaskMatrix& mask, const Grid& grid, const char* what) {
    if (mask.size() != 0 && (mask.rows() != grid.height || mask.cols() != grid.width)) {
        throw ShapeError(std::string(what) + " is " + std::to_string(mask.cols()) + "x" +
                         std::to_string(mask.rows()) + ", grid is " + describe_grid(grid));
    }
}

} // namespace

TrainingSample draw_training_sample(const Grid& grid,
                                    const std::vector<int>& years,
                                    const std::vector<std::string>& band_names,
                                    const MaskMatrix& analysis_mask,
                                    const MaskMatrix& study_area,
                                    const PixelReader& reader,
                                    const SamplerParams& params) {
    params.validate();
    if (years.empty()) {
        throw InsufficientDataError("no epochs to sample from");
    }
    if (band_names.empty()) {
        throw ShapeError("no bands to sample");
    }
    if (grid.width <= 0 || grid.height <= 0) {
        throw ShapeError("empty grid " + describe_grid(grid));
    }
    check_mask(analysis_mask, grid, "analysis mask");
    check_mask(study_area, grid, "study area mask");

    const auto strata = build_strata(grid, params.strata_rows, params.strata_cols);
    const long long n_candidates = static_cast<long long>(
        std::ceil(static_cast<double>(params.sample_size) * static_cast<double>(params.oversample_factor)));

    std::mt19937 rng(params.seed);
    std::uniform_int_distribution<int> year_dist(0, static_cast<int>(years.size()) - 1);

    TrainingSample sample;
    sample.band_names = band_names;
    sample.candidates = static_cast<int>(n_candidates);
    sample.points.reserve(static_cast<size_t>(params.sample_size));

    std::vector<float> buf(band_names.size());
    for (long long i = 0; i < n_candidates; ++i) {
        const Stratum& s = strata[static_cast<size_t>(i % static_cast<long long>(strata.size()))];
        std::uniform_int_distribution<int> x_dist(s.x0, s.x1 - 1);
        std::uniform_int_distribution<int> y_dist(s.y0, s.y1 - 1);
        const int x = x_dist(rng);
        const int y = y_dist(rng);
        const int t = year_dist(rng);

        // Draws continue after the sample is full so the random stream, and
        // therefore the sample, does not depend on how many candidates survive.
        if (static_cast<int>(sample.points.size()) >= params.sample_size) continue;

        if (!mask_allows(analysis_mask, x, y) || !mask_allows(study_area, x, y)) {
            ++sample.dropped_mask;
            continue;
        }

        reader(t, x, y, buf.data());
        const bool finite = std::all_of(buf.begin(), buf.end(), [](float v) { return std::isfinite(v); });
        if (!finite) {
            ++sample.dropped_nodata;
            continue;
        }

        SamplePoint p;
        p.x = x;
        p.y = y;
        p.year_index = t;
        p.year = years[static_cast<size_t>(t)];
        p.values = buf;
        sample.points.push_back(std::move(p));
    }

    if (static_cast<int>(sample.points.size()) < params.sample_size) {
        throw InsufficientDataError("training sample has " + std::to_string(sample.points.size()) +
                                    " valid points of " + std::to_string(params.sample_size) +
                                    " requested (" + std::to_string(n_candidates) + " candidates, " +
                                    std::to_string(sample.dropped_mask) + " masked, " +
                                    std::to_string(sample.dropped_nodata) + " no-data)");
    }
    return sample;
}

PixelReader series_pixel_reader(const TimeSeries& series) {
    return [&series](int year_index, int x, int y, float* out) {
        const auto& epoch = series.epochs.at(static_cast<size_t>(year_index));
        for (size_t b = 0; b < epoch.bands.size(); ++b) {
            out[b] = epoch.bands[b](y, x);
        }
    };
}

} // namespace rangeshift::sampling
