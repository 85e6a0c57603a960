#pragma once

#include "rangeshift/core/types.hpp"
#include <string>
#include <vector>

namespace rangeshift::aggregation {

enum class Covariate { NORTHNESS, EASTNESS };

Covariate covariate_from_string(const std::string& s);
std::string covariate_to_string(Covariate c);

// cos(aspect) for northness, sin(aspect) for eastness; aspect in degrees.
double covariate_value(Covariate c, float aspect_deg);

struct Period {
    std::string name;
    int start_year = 0;
    int end_year = 0;  // inclusive
};

struct HistogramParams {
    Covariate covariate = Covariate::NORTHNESS;
    int bins = 80;
    double range_min = -1.0;
    double range_max = 1.0;
    float min_slope_deg = 5.0f;
    std::vector<Period> periods;

    // Throws ValidationError for empty bins, an empty range or overlapping periods.
    void validate() const;
};

// Bin of `v` in [lo, hi] split into `bins` equal bins. The upper edge goes to
// the last bin; values outside the range return -1.
int bin_index(double v, int bins, double lo, double hi);

// Counts of newly transitioned pixels per (zone, period, covariate bin).
class HistogramAccumulator {
public:
    HistogramAccumulator(std::vector<std::string> zone_names, HistogramParams params);

    // All rasters cover the same tile window.
    void add_tile(const TransitionRaster& transition,
                  const ZoneMatrix& zones,
                  const Matrix2Df& aspect,
                  const Matrix2Df& slope);

    void merge(const HistogramAccumulator& other);

    long long count(int zone, int period, int bin) const {
        return counts_[index(zone, period, bin)];
    }

    // Proportions per (zone, period); a (zone, period) with no pixels gets
    // empty proportions in every bin.
    std::vector<HistogramRecord> finalize() const;

    const HistogramParams& params() const { return params_; }
    const std::vector<std::string>& zone_names() const { return zone_names_; }

private:
    size_t index(int zone, int period, int bin) const {
        return (static_cast<size_t>(zone) * params_.periods.size() + static_cast<size_t>(period)) *
                   static_cast<size_t>(params_.bins) +
               static_cast<size_t>(bin);
    }

    std::vector<std::string> zone_names_;
    HistogramParams params_;
    std::vector<long long> counts_;
};

} // namespace rangeshift::aggregation
