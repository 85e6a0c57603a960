#pragma once

#include "rangeshift/aggregation/directional_histogram.hpp"
#include "rangeshift/aggregation/zonal_totals.hpp"
#include "rangeshift/clustering/kmeans.hpp"
#include "rangeshift/pipeline/tile_pipeline.hpp"
#include "rangeshift/sampling/training_sampler.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace rangeshift::io {

using json = nlohmann::json;

// Row sets with stable column keys, written as the run's JSON artifacts.

json zonal_records_to_json(const std::vector<ZonalRecord>& records, aggregation::AreaUnit unit);

// Undefined proportions are written as null.
json histogram_records_to_json(const std::vector<HistogramRecord>& records,
                               const aggregation::HistogramParams& params);

json training_sample_to_json(const sampling::TrainingSample& sample);

json cluster_fit_to_json(const clustering::KMeansFit& fit, int target_label,
                         const clustering::TargetSelection& selection);

json tile_report_to_json(const pipeline::TileRunReport& report, const std::vector<Tile>& tiles);

} // namespace rangeshift::io
