#include "rangeshift/io/artifacts.hpp"

namespace rangeshift::io {

json zonal_records_to_json(const std::vector<ZonalRecord>& records, aggregation::AreaUnit unit) {
    json rows = json::array();
    for (const auto& r : records) {
        rows.push_back({
            {"zone", r.zone},
            {"year", r.year},
            {"target_area", r.target_area},
            {"first_transition_area", r.first_transition_area},
            {"target_pixels", r.target_pixels}
        });
    }
    return {
        {"area_unit", aggregation::area_unit_to_string(unit)},
        {"rows", rows}
    };
}

json histogram_records_to_json(const std::vector<HistogramRecord>& records,
                               const aggregation::HistogramParams& params) {
    json rows = json::array();
    for (const auto& r : records) {
        json row = {
            {"zone", r.zone},
            {"period", r.period},
            {"start_year", r.start_year},
            {"end_year", r.end_year},
            {"bin", r.bin},
            {"bin_lower", r.bin_lower},
            {"bin_upper", r.bin_upper},
            {"count", r.count},
            {"total", r.total}
        };
        row["proportion"] = r.proportion ? json(*r.proportion) : json(nullptr);
        rows.push_back(row);
    }
    return {
        {"covariate", aggregation::covariate_to_string(params.covariate)},
        {"bins", params.bins},
        {"range", {params.range_min, params.range_max}},
        {"min_slope_deg", params.min_slope_deg},
        {"rows", rows}
    };
}

json training_sample_to_json(const sampling::TrainingSample& sample) {
    json points = json::array();
    for (const auto& p : sample.points) {
        points.push_back({
            {"x", p.x},
            {"y", p.y},
            {"year", p.year},
            {"values", p.values}
        });
    }
    return {
        {"band_names", sample.band_names},
        {"candidates", sample.candidates},
        {"dropped_mask", sample.dropped_mask},
        {"dropped_nodata", sample.dropped_nodata},
        {"size", sample.points.size()},
        {"points", points}
    };
}

json cluster_fit_to_json(const clustering::KMeansFit& fit, int target_label,
                         const clustering::TargetSelection& selection) {
    json j = clustering::model_to_json(*fit.model, target_label);
    j["target_selection"] = selection.rule == clustering::TargetRule::FIXED ? "fixed" : "max_band";
    if (selection.rule == clustering::TargetRule::MAX_BAND) {
        j["target_band"] = selection.band;
    }
    j["iterations"] = fit.iterations;
    j["converged"] = fit.converged;
    j["inertia"] = fit.inertia;
    j["cluster_sizes"] = fit.cluster_sizes;
    return j;
}

json tile_report_to_json(const pipeline::TileRunReport& report, const std::vector<Tile>& tiles) {
    json failed = json::array();
    for (const auto& f : report.failures) {
        json entry = {
            {"tile_index", f.tile_index},
            {"attempts", f.attempts},
            {"error", f.error}
        };
        if (f.tile_index >= 0 && static_cast<size_t>(f.tile_index) < tiles.size()) {
            const Tile& t = tiles[static_cast<size_t>(f.tile_index)];
            entry["x"] = t.x;
            entry["y"] = t.y;
            entry["width"] = t.width;
            entry["height"] = t.height;
        }
        failed.push_back(entry);
    }
    return {
        {"tiles_total", report.tiles_total},
        {"tiles_ok", report.tiles_ok},
        {"tiles_failed", report.failures.size()},
        {"failed", failed}
    };
}

} // namespace rangeshift::io
