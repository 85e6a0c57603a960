#pragma once

#include "rangeshift/core/types.hpp"
#include <optional>
#include <vector>

namespace rangeshift::transition {

// 1 where label == target, 0 for any other label, -1 for no-data.
IndicatorMatrix indicator_epoch(const LabelMatrix& labels, int target_label);
std::vector<IndicatorMatrix> indicator_series(const std::vector<LabelMatrix>& labels, int target_label);

// Earlier of two candidate first years; a present year beats an absent one.
inline std::optional<int> combine_first_year(const std::optional<int>& a, const std::optional<int>& b) {
    if (!a) return b;
    if (!b) return a;
    return *a < *b ? a : b;
}

// Pixel-wise reduction over strictly increasing years. A pixel outside
// `valid_mask` (empty = all eligible) or without data in any year is
// invalid, which is distinct from "never in target".
TransitionRaster detect_first_transition(const std::vector<IndicatorMatrix>& indicators,
                                         const std::vector<int>& years,
                                         const MaskMatrix& valid_mask);

// First-year band: the year, `never_sentinel` for valid never-target pixels,
// `nodata_value` for invalid ones.
LabelMatrix to_first_year_band(const TransitionRaster& raster, int never_sentinel = 9999,
                               int nodata_value = -1);
LabelMatrix to_data_mask_band(const TransitionRaster& raster);

} // namespace rangeshift::transition
