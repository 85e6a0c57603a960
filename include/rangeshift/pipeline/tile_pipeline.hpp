#pragma once

#include "rangeshift/aggregation/directional_histogram.hpp"
#include "rangeshift/aggregation/zonal_totals.hpp"
#include "rangeshift/clustering/kmeans.hpp"
#include "rangeshift/core/types.hpp"
#include "rangeshift/smoothing/holt_smoother.hpp"

#include <functional>
#include <string>
#include <vector>

namespace rangeshift::pipeline {

// Grid-sized layers shared read-only by every tile. Empty matrices mean the
// layer was not supplied. `study_area` restricts the training sample only.
struct StaticLayers {
    MaskMatrix analysis_mask;
    MaskMatrix study_area;
    ZoneMatrix zones;
    std::vector<std::string> zone_names;
    Matrix2Df aspect;
    Matrix2Df slope;

    bool has_terrain() const { return aspect.size() != 0 && slope.size() != 0; }

    // Cut of every layer under `t`.
    StaticLayers window(const Tile& t) const;
};

// Run-wide parameters of the per-tile map step.
struct TileContext {
    smoothing::HoltParams holt;
    clustering::KMeansModelPtr model;
    int target_label = 0;
    std::vector<int> years;
    aggregation::HistogramParams histogram;
    bool keep_smoothed = false;
};

struct TileResult {
    Tile tile{};
    std::vector<LabelMatrix> labels;
    std::vector<IndicatorMatrix> indicators;
    TimeSeries smoothed;  // only filled when TileContext::keep_smoothed
    TransitionRaster transition;
    aggregation::ZonalAccumulator zonal;
    aggregation::HistogramAccumulator histogram;
};

// Smoothing, classification, indicators, first transition and both
// accumulators for one tile. `raw` and `layers` cover the tile window.
TileResult process_tile(const Tile& tile,
                        const TimeSeries& raw,
                        const StaticLayers& layers,
                        const TileContext& ctx);

// Whole-grid rasters and totals assembled from tile results. Pasting tiles
// at their offsets and summing accumulators is order independent.
class TileMerger {
public:
    TileMerger(int width, int height, const std::vector<int>& years,
               const std::vector<std::string>& zone_names,
               const aggregation::HistogramParams& histogram, bool keep_rasters);

    void add(const TileResult& result);

    const std::vector<LabelMatrix>& labels() const { return labels_; }
    const std::vector<IndicatorMatrix>& indicators() const { return indicators_; }
    const TransitionRaster& transition() const { return transition_; }
    const aggregation::ZonalAccumulator& zonal() const { return zonal_; }
    const aggregation::HistogramAccumulator& histogram() const { return histogram_; }
    int tiles_merged() const { return tiles_merged_; }

private:
    bool keep_rasters_;
    std::vector<LabelMatrix> labels_;
    std::vector<IndicatorMatrix> indicators_;
    TransitionRaster transition_;
    aggregation::ZonalAccumulator zonal_;
    aggregation::HistogramAccumulator histogram_;
    int tiles_merged_ = 0;
};

struct TileFailure {
    int tile_index = 0;
    int attempts = 0;
    std::string error;
};

struct TileRunOptions {
    int workers = 1;
    int retries = 0;
};

struct TileRunReport {
    int tiles_total = 0;
    int tiles_ok = 0;
    std::vector<TileFailure> failures;
};

// Runs `map` over every tile on a bounded worker pool. `sink` receives each
// successful result and is called under a lock. A failing tile is retried up
// to `retries` times; ShapeError is not retried and ModelStateError stops the
// run and is rethrown once all workers have joined.
TileRunReport run_tiles(const std::vector<Tile>& tiles,
                        const std::function<TileResult(const Tile&)>& map,
                        const std::function<void(TileResult&&)>& sink,
                        const TileRunOptions& options,
                        const std::function<void(int tile_index, int attempt, bool will_retry,
                                                 const std::string& error)>& on_failure = nullptr,
                        const std::function<void(size_t done, size_t total)>& on_progress = nullptr);

int compute_worker_count(int requested, size_t task_count);

} // namespace rangeshift::pipeline
