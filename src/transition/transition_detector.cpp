#include "rangeshift/transition/transition_detector.hpp"
#include "rangeshift/core/errors.hpp"

namespace rangeshift::transition {

IndicatorMatrix indicator_epoch(const LabelMatrix& labels, int target_label) {
    IndicatorMatrix out(labels.rows(), labels.cols());
    for (Eigen::Index r = 0; r < labels.rows(); ++r) {
        for (Eigen::Index c = 0; c < labels.cols(); ++c) {
            const int32_t l = labels(r, c);
            if (l < 0) {
                out(r, c) = kIndicatorNoData;
            } else {
                out(r, c) = l == target_label ? 1 : 0;
            }
        }
    }
    return out;
}

std::vector<IndicatorMatrix> indicator_series(const std::vector<LabelMatrix>& labels, int target_label) {
    std::vector<IndicatorMatrix> out;
    out.reserve(labels.size());
    for (const auto& l : labels) {
        out.push_back(indicator_epoch(l, target_label));
    }
    return out;
}

TransitionRaster detect_first_transition(const std::vector<IndicatorMatrix>& indicators,
                                         const std::vector<int>& years,
                                         const MaskMatrix& valid_mask) {
    if (indicators.empty()) {
        throw ShapeError("no indicator epochs");
    }
    if (indicators.size() != years.size()) {
        throw ShapeError(std::to_string(indicators.size()) + " indicator epochs but " +
                         std::to_string(years.size()) + " years");
    }
    for (size_t t = 1; t < years.size(); ++t) {
        if (years[t] <= years[t - 1]) {
            throw ShapeError("years must be strictly increasing: " + std::to_string(years[t - 1]) +
                             " followed by " + std::to_string(years[t]));
        }
    }

    const int rows = static_cast<int>(indicators.front().rows());
    const int cols = static_cast<int>(indicators.front().cols());
    for (const auto& ind : indicators) {
        if (ind.rows() != rows || ind.cols() != cols) {
            throw ShapeError("indicator epochs differ in size");
        }
    }
    if (valid_mask.size() != 0 && (valid_mask.rows() != rows || valid_mask.cols() != cols)) {
        throw ShapeError("valid mask does not match indicator size");
    }

    TransitionRaster out;
    out.rows = rows;
    out.cols = cols;
    out.first_year.assign(static_cast<size_t>(rows) * static_cast<size_t>(cols), std::nullopt);
    out.data_mask = MaskMatrix::Zero(rows, cols);
    out.target_count = LabelMatrix::Zero(rows, cols);
    out.valid = MaskMatrix::Zero(rows, cols);

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (valid_mask.size() != 0 && valid_mask(r, c) == 0) continue;

            std::optional<int> first;
            int count = 0;
            bool observed = false;
            for (size_t t = 0; t < indicators.size(); ++t) {
                const int8_t v = indicators[t](r, c);
                if (v == kIndicatorNoData) continue;
                observed = true;
                if (v == 1) {
                    ++count;
                    first = combine_first_year(first, years[t]);
                }
            }
            if (!observed) continue;

            out.valid(r, c) = 1;
            out.target_count(r, c) = count;
            out.data_mask(r, c) = count >= 1 ? 1 : 0;
            out.first_year[static_cast<size_t>(r) * static_cast<size_t>(cols) + static_cast<size_t>(c)] = first;
        }
    }
    return out;
}

LabelMatrix to_first_year_band(const TransitionRaster& raster, int never_sentinel, int nodata_value) {
    LabelMatrix band(raster.rows, raster.cols);
    for (int r = 0; r < raster.rows; ++r) {
        for (int c = 0; c < raster.cols; ++c) {
            if (!raster.valid(r, c)) {
                band(r, c) = nodata_value;
            } else {
                const auto& fy = raster.at(r, c);
                band(r, c) = fy ? *fy : never_sentinel;
            }
        }
    }
    return band;
}

LabelMatrix to_data_mask_band(const TransitionRaster& raster) {
    return raster.data_mask.cast<int32_t>();
}

} // namespace rangeshift::transition
