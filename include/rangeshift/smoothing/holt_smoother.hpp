#pragma once

#include "rangeshift/core/types.hpp"
#include <vector>

namespace rangeshift::smoothing {

struct HoltParams {
    float alpha = 0.25f;  // level weight, (0,1]
    float beta = 0.01f;   // trend weight, [0,1]

    // Throws ValidationError when a weight is out of range.
    void validate() const;
};

struct HoltState {
    float level = 0.0f;
    float trend = 0.0f;
};

struct HoltStep {
    HoltState state;
    float output = 0.0f;
};

// First observation. The level is clamped at zero; trend starts at zero.
HoltStep holt_init(float raw);

// One year of the double-exponential recurrence. Never returns a negative level.
HoltStep holt_step(const HoltState& state, float raw, const HoltParams& params);

// Folds holt_step over one pixel's observations. A non-finite observation
// makes the whole trajectory non-finite.
std::vector<float> smooth_trajectory(const std::vector<float>& values, const HoltParams& params);

// Smooths every pixel and band of `series` independently. Returns a new
// series with the same grid, years and band names.
TimeSeries smooth_series(const TimeSeries& series, const HoltParams& params);

} // namespace rangeshift::smoothing
