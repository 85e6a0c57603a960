#include "rangeshift/smoothing/holt_smoother.hpp"
#include "rangeshift/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace rangeshift::smoothing {

void HoltParams::validate() const {
    if (!(alpha > 0.0f && alpha <= 1.0f)) {
        throw ValidationError("alpha must be in (0,1], got " + std::to_string(alpha));
    }
    if (!(beta >= 0.0f && beta <= 1.0f)) {
        throw ValidationError("beta must be in [0,1], got " + std::to_string(beta));
    }
}

HoltStep holt_init(float raw) {
    HoltStep step;
    step.state.level = std::max(raw, 0.0f);
    step.state.trend = 0.0f;
    if (!std::isfinite(raw)) {
        step.state.level = raw;
    }
    step.output = step.state.level;
    return step;
}

HoltStep holt_step(const HoltState& state, float raw, const HoltParams& params) {
    const float a = params.alpha;
    const float b = params.beta;

    float level = a * raw + (1.0f - a) * (state.level + state.trend);
    // Comparison with NaN is false, so no-data propagates through the clamp.
    if (level < 0.0f) level = 0.0f;
    const float trend = b * (level - state.level) + (1.0f - b) * state.trend;

    HoltStep step;
    step.state.level = level;
    step.state.trend = trend;
    step.output = level;
    return step;
}

std::vector<float> smooth_trajectory(const std::vector<float>& values, const HoltParams& params) {
    std::vector<float> out;
    if (values.empty()) return out;
    out.reserve(values.size());

    const bool all_finite = std::all_of(values.begin(), values.end(),
                                        [](float v) { return std::isfinite(v); });
    if (!all_finite) {
        out.assign(values.size(), std::numeric_limits<float>::quiet_NaN());
        return out;
    }

    HoltStep step = holt_init(values.front());
    out.push_back(step.output);
    for (size_t t = 1; t < values.size(); ++t) {
        step = holt_step(step.state, values[t], params);
        out.push_back(step.output);
    }
    return out;
}

TimeSeries smooth_series(const TimeSeries& series, const HoltParams& params) {
    params.validate();
    series.validate();

    const int n_years = series.size();
    const int n_bands = series.epochs.front().band_count();
    const int rows = series.grid.height;
    const int cols = series.grid.width;
    const float nan = std::numeric_limits<float>::quiet_NaN();

    TimeSeries out;
    out.grid = series.grid;
    out.epochs.resize(static_cast<size_t>(n_years));
    for (int t = 0; t < n_years; ++t) {
        auto& e = out.epochs[static_cast<size_t>(t)];
        e.year = series.epochs[static_cast<size_t>(t)].year;
        e.band_names = series.epochs[static_cast<size_t>(t)].band_names;
        e.bands.assign(static_cast<size_t>(n_bands), Matrix2Df(rows, cols));
    }

    std::vector<HoltState> states(static_cast<size_t>(rows) * static_cast<size_t>(cols));
    std::vector<uint8_t> bad(states.size());

    for (int b = 0; b < n_bands; ++b) {
        std::fill(bad.begin(), bad.end(), uint8_t(0));

        // A pixel with any no-data year is no-data in every year of this band.
        for (int t = 0; t < n_years; ++t) {
            const Matrix2Df& raw = series.epochs[static_cast<size_t>(t)].bands[static_cast<size_t>(b)];
            for (int r = 0; r < rows; ++r) {
                for (int c = 0; c < cols; ++c) {
                    if (!std::isfinite(raw(r, c))) {
                        bad[static_cast<size_t>(r) * cols + c] = 1;
                    }
                }
            }
        }

        for (int t = 0; t < n_years; ++t) {
            const Matrix2Df& raw = series.epochs[static_cast<size_t>(t)].bands[static_cast<size_t>(b)];
            Matrix2Df& dst = out.epochs[static_cast<size_t>(t)].bands[static_cast<size_t>(b)];
            for (int r = 0; r < rows; ++r) {
                for (int c = 0; c < cols; ++c) {
                    const size_t idx = static_cast<size_t>(r) * cols + c;
                    if (bad[idx]) {
                        dst(r, c) = nan;
                        continue;
                    }
                    HoltStep step = t == 0 ? holt_init(raw(r, c))
                                           : holt_step(states[idx], raw(r, c), params);
                    states[idx] = step.state;
                    dst(r, c) = step.output;
                }
            }
        }
    }

    return out;
}

} // namespace rangeshift::smoothing
