#pragma once

#include "rangeshift/core/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace rangeshift::sampling {

// Writes the raw band vector of pixel (x, y) in epoch `year_index` to out.
using PixelReader = std::function<void(int year_index, int x, int y, float* out)>;

struct SamplerParams {
    int sample_size = 5000;
    float oversample_factor = 2.0f;
    int strata_rows = 8;
    int strata_cols = 8;
    unsigned int seed = 42;

    void validate() const;
};

struct SamplePoint {
    int x = 0;
    int y = 0;
    int year_index = 0;
    int year = 0;
    std::vector<float> values;
};

struct TrainingSample {
    std::vector<std::string> band_names;
    std::vector<SamplePoint> points;
    int candidates = 0;
    int dropped_mask = 0;
    int dropped_nodata = 0;

    // points x bands, row-major.
    Matrix2Df matrix() const;
};

// Stratified spatial and temporal draw of raw band vectors. Candidates are
// spread round-robin over strata_rows x strata_cols blocks, each with an
// independent uniform year. Candidates outside either mask or with a
// non-finite band are dropped, and the survivors are truncated to
// sample_size in draw order. An empty mask matrix means "no restriction".
// Throws InsufficientDataError when fewer than sample_size survive.
TrainingSample draw_training_sample(const Grid& grid,
                                    const std::vector<int>& years,
                                    const std::vector<std::string>& band_names,
                                    const MaskMatrix& analysis_mask,
                                    const MaskMatrix& study_area,
                                    const PixelReader& reader,
                                    const SamplerParams& params);

// Reader over an in-memory series. The series must outlive the reader.
PixelReader series_pixel_reader(const TimeSeries& series);

} // namespace rangeshift::sampling
