#include "rangeshift/aggregation/directional_histogram.hpp"
#include "rangeshift/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace rangeshift::aggregation {

Covariate covariate_from_string(const std::string& s) {
    if (s == "northness") return Covariate::NORTHNESS;
    if (s == "eastness") return Covariate::EASTNESS;
    throw ValidationError("unknown covariate '" + s + "'");
}

std::string covariate_to_string(Covariate c) {
    return c == Covariate::EASTNESS ? "eastness" : "northness";
}

double covariate_value(Covariate c, float aspect_deg) {
    constexpr double D2R = M_PI / 180.0;
    const double a = static_cast<double>(aspect_deg) * D2R;
    return c == Covariate::EASTNESS ? std::sin(a) : std::cos(a);
}

void HistogramParams::validate() const {
    if (bins < 1) {
        throw ValidationError("histogram bins must be >= 1");
    }
    if (!(range_min < range_max)) {
        throw ValidationError("histogram range must have min < max");
    }
    std::vector<Period> sorted = periods;
    std::sort(sorted.begin(), sorted.end(),
              [](const Period& a, const Period& b) { return a.start_year < b.start_year; });
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (sorted[i].start_year > sorted[i].end_year) {
            throw ValidationError("period '" + sorted[i].name + "' ends before it starts");
        }
        if (i > 0 && sorted[i].start_year <= sorted[i - 1].end_year) {
            throw ValidationError("periods '" + sorted[i - 1].name + "' and '" + sorted[i].name +
                                  "' overlap");
        }
    }
}

int bin_index(double v, int bins, double lo, double hi) {
    if (!std::isfinite(v) || v < lo || v > hi) return -1;
    if (v == hi) return bins - 1;
    int b = static_cast<int>(std::floor((v - lo) / (hi - lo) * static_cast<double>(bins)));
    return std::clamp(b, 0, bins - 1);
}

HistogramAccumulator::HistogramAccumulator(std::vector<std::string> zone_names, HistogramParams params)
    : zone_names_(std::move(zone_names)), params_(std::move(params)) {
    params_.validate();
    counts_.assign(zone_names_.size() * params_.periods.size() * static_cast<size_t>(params_.bins), 0);
}

void HistogramAccumulator::add_tile(const TransitionRaster& transition,
                                    const ZoneMatrix& zones,
                                    const Matrix2Df& aspect,
                                    const Matrix2Df& slope) {
    const int rows = transition.rows;
    const int cols = transition.cols;
    if (zones.rows() != rows || zones.cols() != cols || aspect.rows() != rows ||
        aspect.cols() != cols || slope.rows() != rows || slope.cols() != cols) {
        throw ShapeError("zone or terrain raster does not match the transition raster");
    }

    const int n_zones = static_cast<int>(zone_names_.size());
    const int n_periods = static_cast<int>(params_.periods.size());
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const int zone = zones(r, c);
            if (zone < 0 || zone >= n_zones) continue;
            if (!transition.valid(r, c)) continue;

            const auto& fy = transition.at(r, c);
            if (!fy) continue;

            const float s = slope(r, c);
            const float a = aspect(r, c);
            if (!std::isfinite(s) || !std::isfinite(a) || s < params_.min_slope_deg) continue;

            const int bin = bin_index(covariate_value(params_.covariate, a), params_.bins,
                                      params_.range_min, params_.range_max);
            if (bin < 0) continue;

            for (int p = 0; p < n_periods; ++p) {
                const auto& period = params_.periods[static_cast<size_t>(p)];
                if (*fy >= period.start_year && *fy <= period.end_year) {
                    counts_[index(zone, p, bin)] += 1;
                    break;
                }
            }
        }
    }
}

void HistogramAccumulator::merge(const HistogramAccumulator& other) {
    if (other.zone_names_ != zone_names_ || other.counts_.size() != counts_.size()) {
        throw ShapeError("cannot merge histogram accumulators with different layouts");
    }
    for (size_t i = 0; i < counts_.size(); ++i) {
        counts_[i] += other.counts_[i];
    }
}

std::vector<HistogramRecord> HistogramAccumulator::finalize() const {
    std::vector<HistogramRecord> out;
    out.reserve(counts_.size());
    const double width = (params_.range_max - params_.range_min) / static_cast<double>(params_.bins);

    for (size_t z = 0; z < zone_names_.size(); ++z) {
        for (size_t p = 0; p < params_.periods.size(); ++p) {
            long long total = 0;
            for (int b = 0; b < params_.bins; ++b) {
                total += counts_[index(static_cast<int>(z), static_cast<int>(p), b)];
            }
            for (int b = 0; b < params_.bins; ++b) {
                HistogramRecord rec;
                rec.zone = zone_names_[z];
                rec.period = params_.periods[p].name;
                rec.start_year = params_.periods[p].start_year;
                rec.end_year = params_.periods[p].end_year;
                rec.bin = b;
                rec.bin_lower = params_.range_min + width * b;
                rec.bin_upper = b == params_.bins - 1 ? params_.range_max : params_.range_min + width * (b + 1);
                rec.count = counts_[index(static_cast<int>(z), static_cast<int>(p), b)];
                rec.total = total;
                if (total > 0) {
                    rec.proportion = static_cast<double>(rec.count) / static_cast<double>(total);
                }
                out.push_back(rec);
            }
        }
    }
    return out;
}

} // namespace rangeshift::aggregation
