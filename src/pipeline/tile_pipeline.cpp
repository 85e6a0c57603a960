#include "rangeshift/pipeline/tile_pipeline.hpp"
#include "rangeshift/core/errors.hpp"
#include "rangeshift/pipeline/tile_grid.hpp"
#include "rangeshift/transition/transition_detector.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace rangeshift::pipeline {

StaticLayers StaticLayers::window(const Tile& t) const {
    StaticLayers w;
    w.analysis_mask = extract_window(analysis_mask, t);
    w.study_area = extract_window(study_area, t);
    w.zones = extract_window(zones, t);
    w.zone_names = zone_names;
    w.aspect = extract_window(aspect, t);
    w.slope = extract_window(slope, t);
    return w;
}

TileResult process_tile(const Tile& tile,
                        const TimeSeries& raw,
                        const StaticLayers& layers,
                        const TileContext& ctx) {
    if (!ctx.model) {
        throw ModelStateError("tile " + std::to_string(tile.row) + "," + std::to_string(tile.col) +
                              " started without a fitted cluster model");
    }
    if (raw.grid.width != tile.width || raw.grid.height != tile.height) {
        throw ShapeError("tile data is " + std::to_string(raw.grid.width) + "x" +
                         std::to_string(raw.grid.height) + ", tile is " +
                         std::to_string(tile.width) + "x" + std::to_string(tile.height));
    }
    if (raw.years() != ctx.years) {
        throw ShapeError("tile years differ from the run years");
    }

    TileResult result{tile,
                      {},
                      {},
                      {},
                      {},
                      aggregation::ZonalAccumulator(layers.zone_names, ctx.years),
                      aggregation::HistogramAccumulator(layers.zone_names, ctx.histogram)};

    TimeSeries smoothed = smoothing::smooth_series(raw, ctx.holt);

    // The study area only bounds the training sample; every pixel the
    // analysis mask allows is classified.
    result.labels = clustering::classify_series(ctx.model, smoothed, layers.analysis_mask);
    result.indicators = transition::indicator_series(result.labels, ctx.target_label);
    result.transition = transition::detect_first_transition(result.indicators, ctx.years, layers.analysis_mask);

    if (layers.zones.size() != 0) {
        result.zonal.add_tile(result.indicators, result.transition, layers.zones, raw.grid);
        if (layers.has_terrain()) {
            result.histogram.add_tile(result.transition, layers.zones, layers.aspect, layers.slope);
        }
    }

    if (ctx.keep_smoothed) {
        result.smoothed = std::move(smoothed);
    }
    return result;
}

TileMerger::TileMerger(int width, int height, const std::vector<int>& years,
                       const std::vector<std::string>& zone_names,
                       const aggregation::HistogramParams& histogram, bool keep_rasters)
    : keep_rasters_(keep_rasters),
      zonal_(zone_names, years),
      histogram_(zone_names, histogram) {
    if (keep_rasters_) {
        labels_.assign(years.size(), LabelMatrix::Constant(height, width, kLabelNoData));
        indicators_.assign(years.size(), IndicatorMatrix::Constant(height, width, kIndicatorNoData));
        transition_.rows = height;
        transition_.cols = width;
        transition_.first_year.assign(static_cast<size_t>(width) * static_cast<size_t>(height), std::nullopt);
        transition_.data_mask = MaskMatrix::Zero(height, width);
        transition_.target_count = LabelMatrix::Zero(height, width);
        transition_.valid = MaskMatrix::Zero(height, width);
    }
}

void TileMerger::add(const TileResult& result) {
    zonal_.merge(result.zonal);
    histogram_.merge(result.histogram);
    ++tiles_merged_;
    if (!keep_rasters_) return;

    const Tile& t = result.tile;
    if (result.labels.size() != labels_.size()) {
        throw ShapeError("tile result has " + std::to_string(result.labels.size()) + " epochs, expected " +
                         std::to_string(labels_.size()));
    }
    for (size_t i = 0; i < labels_.size(); ++i) {
        paste_window(labels_[i], result.labels[i], t);
        paste_window(indicators_[i], result.indicators[i], t);
    }

    const TransitionRaster& tr = result.transition;
    paste_window(transition_.data_mask, tr.data_mask, t);
    paste_window(transition_.target_count, tr.target_count, t);
    paste_window(transition_.valid, tr.valid, t);
    for (int r = 0; r < t.height; ++r) {
        for (int c = 0; c < t.width; ++c) {
            const size_t dst = static_cast<size_t>(t.y + r) * static_cast<size_t>(transition_.cols) +
                               static_cast<size_t>(t.x + c);
            transition_.first_year[dst] = tr.at(r, c);
        }
    }
}

int compute_worker_count(int requested, size_t task_count) {
    int workers = requested;
    if (workers < 1) {
        workers = 1;
    }
    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0) {
        workers = std::min(workers, static_cast<int>(std::max<size_t>(1, task_count)));
    }
    return std::max(1, workers);
}

TileRunReport run_tiles(const std::vector<Tile>& tiles,
                        const std::function<TileResult(const Tile&)>& map,
                        const std::function<void(TileResult&&)>& sink,
                        const TileRunOptions& options,
                        const std::function<void(int, int, bool, const std::string&)>& on_failure,
                        const std::function<void(size_t, size_t)>& on_progress) {
    TileRunReport report;
    report.tiles_total = static_cast<int>(tiles.size());

    const int n_workers = compute_worker_count(options.workers, tiles.size());
    const int max_attempts = std::max(0, options.retries) + 1;

    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};
    std::atomic<int> ok{0};
    std::atomic<bool> aborted{false};
    std::mutex sink_mutex;
    std::mutex report_mutex;
    std::exception_ptr fatal;

    auto notify_failure = [&](int ti, int attempt, bool will_retry, const std::string& msg) {
        if (!on_failure) return;
        std::lock_guard<std::mutex> lock(report_mutex);
        on_failure(ti, attempt, will_retry, msg);
    };

    auto record_failure = [&](int ti, int attempts, const std::string& msg) {
        std::lock_guard<std::mutex> lock(report_mutex);
        report.failures.push_back(TileFailure{ti, attempts, msg});
    };

    auto worker = [&]() {
        while (!aborted.load(std::memory_order_relaxed)) {
            const size_t ti = next.fetch_add(1);
            if (ti >= tiles.size()) {
                break;
            }
            const int tile_index = static_cast<int>(ti);

            for (int attempt = 1; attempt <= max_attempts; ++attempt) {
                try {
                    TileResult result = map(tiles[ti]);
                    {
                        std::lock_guard<std::mutex> lock(sink_mutex);
                        sink(std::move(result));
                    }
                    ok.fetch_add(1);
                    break;
                } catch (const ModelStateError& e) {
                    aborted.store(true, std::memory_order_relaxed);
                    notify_failure(tile_index, attempt, false, e.what());
                    std::lock_guard<std::mutex> lock(report_mutex);
                    if (!fatal) fatal = std::current_exception();
                    break;
                } catch (const ShapeError& e) {
                    notify_failure(tile_index, attempt, false, e.what());
                    record_failure(tile_index, attempt, e.what());
                    break;
                } catch (const std::exception& e) {
                    const bool will_retry = attempt < max_attempts;
                    notify_failure(tile_index, attempt, will_retry, e.what());
                    if (!will_retry) {
                        record_failure(tile_index, attempt, e.what());
                    }
                }
            }

            const size_t d = done.fetch_add(1) + 1;
            if (on_progress) {
                std::lock_guard<std::mutex> lock(report_mutex);
                on_progress(d, tiles.size());
            }
        }
    };

    if (n_workers > 1) {
        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(n_workers));
        for (int w = 0; w < n_workers; ++w) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    if (fatal) {
        std::rethrow_exception(fatal);
    }

    std::sort(report.failures.begin(), report.failures.end(),
              [](const TileFailure& a, const TileFailure& b) { return a.tile_index < b.tile_index; });
    report.tiles_ok = ok.load();
    return report;
}

} // namespace rangeshift::pipeline
