#include "runner_pipeline.hpp"

#include "rangeshift/aggregation/directional_histogram.hpp"
#include "rangeshift/aggregation/zonal_totals.hpp"
#include "rangeshift/clustering/kmeans.hpp"
#include "rangeshift/config/configuration.hpp"
#include "rangeshift/core/errors.hpp"
#include "rangeshift/core/events.hpp"
#include "rangeshift/core/types.hpp"
#include "rangeshift/core/utils.hpp"
#include "rangeshift/io/artifacts.hpp"
#include "rangeshift/io/epoch_source.hpp"
#include "rangeshift/io/fits_io.hpp"
#include "rangeshift/io/geojson_zones.hpp"
#include "rangeshift/pipeline/tile_grid.hpp"
#include "rangeshift/pipeline/tile_pipeline.hpp"
#include "rangeshift/sampling/training_sampler.hpp"
#include "rangeshift/transition/transition_detector.hpp"

#include "runner_shared.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using namespace rangeshift;
using json = nlohmann::json;

MaskMatrix mask_from_plane(const Matrix2Df &plane) {
  MaskMatrix m(plane.rows(), plane.cols());
  for (Eigen::Index i = 0; i < plane.size(); ++i) {
    const float v = plane.data()[i];
    m.data()[i] = (std::isfinite(v) && v != 0.0f) ? 1 : 0;
  }
  return m;
}

Matrix2Df read_static_plane(const fs::path &path, const Grid &grid,
                            const std::string &what) {
  Matrix2Df plane = io::read_fits_plane(path);
  if (plane.rows() != grid.height || plane.cols() != grid.width) {
    throw ShapeError(what + " " + path.string() + " is " +
                     std::to_string(plane.cols()) + "x" +
                     std::to_string(plane.rows()) + ", grid is " +
                     describe_grid(grid));
  }
  return plane;
}

fs::path resolve_input(const std::string &p, const fs::path &in_dir) {
  fs::path path(p);
  if (path.is_relative() && !fs::exists(path)) {
    path = in_dir / path;
  }
  return path;
}

// FITS cubes written tile by tile. Region writes are serialized here.
class OutputCubes {
public:
  OutputCubes(const fs::path &out_dir, const Grid &grid,
              const std::vector<int> &years,
              const std::vector<std::string> &band_names,
              const config::Config &cfg)
      : cfg_(cfg) {
    const int w = grid.width;
    const int h = grid.height;
    const int n = static_cast<int>(years.size());

    io::FitsHeader header;
    io::grid_to_header(grid, header);
    header.set("YEAR0", years.front());
    header.set("YEARN", years.back());
    header.set("NYEARS", n);

    if (cfg.output.write_labels) {
      io::FitsHeader h_labels = header;
      h_labels.set("NODATA", static_cast<int>(kLabelNoData));
      labels_ = std::make_unique<io::FitsCubeWriter>(
          out_dir / "labels.fits", w, h, n, io::FitsPixelType::INT32, h_labels);
      paths_.push_back(out_dir / "labels.fits");
    }
    if (cfg.output.write_indicators) {
      io::FitsHeader h_ind = header;
      h_ind.set("NODATA", static_cast<int>(kIndicatorNoData));
      indicators_ = std::make_unique<io::FitsCubeWriter>(
          out_dir / "indicators.fits", w, h, n, io::FitsPixelType::INT16, h_ind);
      paths_.push_back(out_dir / "indicators.fits");
    }
    if (cfg.output.write_smoothed) {
      for (const auto &b : band_names) {
        fs::path p = out_dir / ("smoothed_" + b + ".fits");
        io::FitsHeader h_s = header;
        h_s.set("BAND", b);
        smoothed_.push_back(std::make_unique<io::FitsCubeWriter>(
            p, w, h, n, io::FitsPixelType::FLOAT32, h_s));
        paths_.push_back(p);
      }
    }

    io::FitsHeader h_tr = header;
    h_tr.set("NEVER", cfg.transition.never_sentinel);
    h_tr.set("NODATA", cfg.transition.nodata_value);
    h_tr.set("PLANE1", std::string("FIRST_YEAR"));
    h_tr.set("PLANE2", std::string("DATA_MASK"));
    transition_ = std::make_unique<io::FitsCubeWriter>(
        out_dir / "transition.fits", w, h, 2, io::FitsPixelType::INT32, h_tr);
    paths_.push_back(out_dir / "transition.fits");
  }

  void write_tile(const pipeline::TileResult &r) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Tile &t = r.tile;
    for (size_t i = 0; i < r.labels.size(); ++i) {
      const int plane = static_cast<int>(i);
      if (labels_) labels_->write_region(plane, t.x, t.y, r.labels[i]);
      if (indicators_) indicators_->write_region(plane, t.x, t.y, r.indicators[i]);
      for (size_t b = 0; b < smoothed_.size(); ++b) {
        smoothed_[b]->write_region(plane, t.x, t.y,
                                   r.smoothed.epochs[i].bands[b]);
      }
    }
    transition_->write_region(
        0, t.x, t.y,
        transition::to_first_year_band(r.transition,
                                       cfg_.transition.never_sentinel,
                                       cfg_.transition.nodata_value));
    transition_->write_region(1, t.x, t.y,
                              transition::to_data_mask_band(r.transition));
  }

  void close() {
    if (labels_) labels_->close();
    if (indicators_) indicators_->close();
    for (auto &s : smoothed_) s->close();
    transition_->close();
  }

  const std::vector<fs::path> &paths() const { return paths_; }

private:
  const config::Config &cfg_;
  std::mutex mutex_;
  std::unique_ptr<io::FitsCubeWriter> labels_;
  std::unique_ptr<io::FitsCubeWriter> indicators_;
  std::vector<std::unique_ptr<io::FitsCubeWriter>> smoothed_;
  std::unique_ptr<io::FitsCubeWriter> transition_;
  std::vector<fs::path> paths_;
};

aggregation::HistogramParams histogram_params(const config::Config &cfg) {
  aggregation::HistogramParams p;
  p.covariate = aggregation::covariate_from_string(cfg.histogram.covariate);
  p.bins = cfg.histogram.bins;
  p.range_min = cfg.histogram.range[0];
  p.range_max = cfg.histogram.range[1];
  p.min_slope_deg = cfg.histogram.min_slope_deg;
  for (const auto &period : cfg.histogram.periods) {
    p.periods.push_back({period.name, period.start_year, period.end_year});
  }
  return p;
}

Grid fallback_grid(const config::Config &cfg) {
  Grid g;
  g.origin_x = cfg.grid.origin_x;
  g.origin_y = cfg.grid.origin_y;
  g.pixel_width = cfg.grid.pixel_width;
  g.pixel_height = cfg.grid.pixel_height;
  g.crs = cfg.grid.crs;
  g.geographic = cfg.grid.geographic;
  return g;
}

} // namespace

int run_pipeline_command(const std::string &config_path,
                         const std::string &input_dir,
                         const std::string &runs_dir,
                         const std::string &run_id_override, bool dry_run,
                         int max_tiles) {
  using namespace rangeshift;

  fs::path cfg_path(config_path);
  fs::path in_dir(input_dir);
  fs::path runs(runs_dir);

  if (!fs::exists(in_dir)) {
    std::cerr << "Error: Input directory not found: " << input_dir << std::endl;
    return 1;
  }

  config::Config cfg;
  try {
    cfg = config::Config::load(cfg_path);
    cfg.validate();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::vector<fs::path> files;
  try {
    files = core::discover_files(in_dir, cfg.data.input_pattern);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  if (files.empty()) {
    std::cerr << "Error: No epoch rasters matching '" << cfg.data.input_pattern
              << "' in " << input_dir << std::endl;
    return 1;
  }

  std::string run_id =
      run_id_override.empty() ? core::get_run_id() : run_id_override;
  fs::path run_dir = fs::absolute(runs / run_id);
  fs::path out_dir = run_dir / cfg.output.outputs_dir;
  fs::path artifacts_dir = run_dir / cfg.output.artifacts_dir;
  try {
    fs::create_directories(run_dir / "logs");
    fs::create_directories(out_dir);
    fs::create_directories(artifacts_dir);
    fs::copy_file(cfg_path, run_dir / "config.yaml",
                  fs::copy_options::overwrite_existing);
  } catch (const fs::filesystem_error &e) {
    std::cerr << "Error: cannot prepare run directory " << run_dir << ": "
              << e.what() << std::endl;
    return 1;
  }

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl",
                               std::ios::out | std::ios::trunc);
  if (!event_log_file.is_open()) {
    std::cerr << "Error: cannot open events log file: "
              << (run_dir / "logs" / "run_events.jsonl") << std::endl;
    return 1;
  }
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"config_path", config_path},
                     {"input_dir", input_dir},
                     {"run_dir", run_dir.string()},
                     {"epochs_discovered", files.size()},
                     {"input_bytes", runner::format_bytes(
                                         runner::estimate_total_file_bytes(files))},
                     {"dry_run", dry_run}},
                    log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Epochs: " << files.size() << std::endl;
  std::cout << "Output: " << run_dir.string() << std::endl;
  if (max_tiles > 0) {
    std::cout << "Max tiles: " << max_tiles << std::endl;
  }

  auto fail = [&](Phase phase, const std::exception &e) {
    emitter.phase_end(run_id, phase, "error", {{"error", e.what()}}, log_file);
    emitter.run_end(run_id, false, "error", log_file);
    std::cerr << "Error during " << phase_to_string(phase) << ": " << e.what()
              << std::endl;
    return 1;
  };

  // Phase 0: SCAN_INPUT
  emitter.phase_start(run_id, Phase::SCAN_INPUT, log_file);
  std::unique_ptr<io::EpochSource> source;
  try {
    source = std::make_unique<io::EpochSource>(io::EpochSource::open(
        files, cfg.data.band_names, cfg.data.year_keyword, fallback_grid(cfg)));
  } catch (const std::exception &e) {
    return fail(Phase::SCAN_INPUT, e);
  }
  const Grid grid = source->grid();
  const std::vector<int> years = source->years();
  std::cout << "[SCAN_INPUT] " << years.size() << " epochs "
            << years.front() << ".." << years.back() << ", grid "
            << describe_grid(grid) << std::endl;
  emitter.phase_end(run_id, Phase::SCAN_INPUT, "ok",
                    {{"years", years},
                     {"width", grid.width},
                     {"height", grid.height},
                     {"bands", cfg.data.band_names}},
                    log_file);

  for (int y : years) {
    if (y >= cfg.transition.never_sentinel) {
      std::runtime_error e("year " + std::to_string(y) +
                           " is not below transition.never_sentinel");
      return fail(Phase::SCAN_INPUT, e);
    }
  }

  if (dry_run) {
    std::cout << "Dry run - no processing" << std::endl;
    emitter.run_end(run_id, true, "ok", log_file);
    return 0;
  }

  // Phase 1: LOAD_STATIC
  emitter.phase_start(run_id, Phase::LOAD_STATIC, log_file);
  pipeline::StaticLayers layers;
  std::vector<fs::path> static_inputs;
  try {
    if (!cfg.inputs.analysis_mask.empty()) {
      fs::path p = resolve_input(cfg.inputs.analysis_mask, in_dir);
      layers.analysis_mask =
          mask_from_plane(read_static_plane(p, grid, "analysis mask"));
      static_inputs.push_back(p);
    }
    if (!cfg.inputs.study_area.empty()) {
      fs::path p = resolve_input(cfg.inputs.study_area, in_dir);
      layers.study_area = io::rasterize_mask(
          io::read_geojson(p, cfg.inputs.zone_name_property), grid);
      static_inputs.push_back(p);
    }
    if (!cfg.inputs.zones.empty()) {
      fs::path p = resolve_input(cfg.inputs.zones, in_dir);
      io::ZoneRaster zr = io::rasterize_zones(
          io::read_geojson(p, cfg.inputs.zone_name_property), grid);
      layers.zones = std::move(zr.ids);
      layers.zone_names = std::move(zr.names);
      static_inputs.push_back(p);
    } else {
      layers.zones = ZoneMatrix::Zero(grid.height, grid.width);
      layers.zone_names = {"study_area"};
    }
    if (!cfg.inputs.aspect.empty() && !cfg.inputs.slope.empty()) {
      fs::path pa = resolve_input(cfg.inputs.aspect, in_dir);
      fs::path ps = resolve_input(cfg.inputs.slope, in_dir);
      layers.aspect = read_static_plane(pa, grid, "aspect");
      layers.slope = read_static_plane(ps, grid, "slope");
      static_inputs.push_back(pa);
      static_inputs.push_back(ps);
    } else {
      emitter.warning(run_id,
                      "inputs.aspect/inputs.slope not configured; "
                      "directional histograms will be empty",
                      log_file);
    }
  } catch (const std::exception &e) {
    return fail(Phase::LOAD_STATIC, e);
  }
  std::cout << "[LOAD_STATIC] zones=" << layers.zone_names.size()
            << " mask=" << (layers.analysis_mask.size() ? "yes" : "no")
            << " study_area=" << (layers.study_area.size() ? "yes" : "no")
            << " terrain=" << (layers.has_terrain() ? "yes" : "no")
            << std::endl;
  emitter.phase_end(run_id, Phase::LOAD_STATIC, "ok",
                    {{"zones", layers.zone_names.size()},
                     {"terrain", layers.has_terrain()}},
                    log_file);

  // Phase 2: SAMPLING
  emitter.phase_start(run_id, Phase::SAMPLING, log_file);
  sampling::TrainingSample sample;
  try {
    sampling::SamplerParams sp;
    sp.sample_size = cfg.sampling.sample_size;
    sp.oversample_factor = cfg.sampling.oversample_factor;
    sp.strata_rows = cfg.sampling.strata_rows;
    sp.strata_cols = cfg.sampling.strata_cols;
    sp.seed = cfg.sampling.seed;
    io::EpochSource *src = source.get();
    sample = sampling::draw_training_sample(
        grid, years, cfg.data.band_names, layers.analysis_mask,
        layers.study_area,
        [src](int t, int x, int y, float *out) { src->read_pixel(t, x, y, out); },
        sp);
    runner::write_json_file(artifacts_dir / "training_sample.json",
                            io::training_sample_to_json(sample));
  } catch (const std::exception &e) {
    return fail(Phase::SAMPLING, e);
  }
  std::cout << "[SAMPLING] " << sample.points.size() << " points from "
            << sample.candidates << " candidates" << std::endl;
  emitter.phase_end(run_id, Phase::SAMPLING, "ok",
                    {{"size", sample.points.size()},
                     {"candidates", sample.candidates},
                     {"dropped_mask", sample.dropped_mask},
                     {"dropped_nodata", sample.dropped_nodata}},
                    log_file);

  // Phase 3: CLUSTER_FIT
  emitter.phase_start(run_id, Phase::CLUSTER_FIT, log_file);
  clustering::KMeansFit fit;
  int target_label = 0;
  try {
    clustering::KMeansParams kp;
    kp.k = cfg.clustering.k;
    kp.max_iterations = cfg.clustering.max_iterations;
    kp.seed = cfg.clustering.seed;
    fit = clustering::fit_kmeans(sample.matrix(), sample.band_names, kp);

    clustering::TargetSelection sel;
    sel.rule = clustering::target_rule_from_string(cfg.clustering.target_selection);
    sel.band = cfg.data.annual_grass_band;
    sel.fixed_label = cfg.clustering.target_label;
    target_label = clustering::select_target_cluster(*fit.model, sel);

    runner::write_json_file(artifacts_dir / "cluster_model.json",
                            io::cluster_fit_to_json(fit, target_label, sel));
  } catch (const std::exception &e) {
    return fail(Phase::CLUSTER_FIT, e);
  }
  std::cout << "[CLUSTER_FIT] k=" << fit.model->k()
            << " iterations=" << fit.iterations
            << (fit.converged ? " converged" : " max_iterations reached")
            << " target_label=" << target_label << std::endl;
  if (!fit.converged) {
    emitter.warning(run_id, "k-means stopped at max_iterations without converging",
                    log_file);
  }
  emitter.phase_end(run_id, Phase::CLUSTER_FIT, "ok",
                    {{"iterations", fit.iterations},
                     {"converged", fit.converged},
                     {"inertia", fit.inertia},
                     {"target_label", target_label}},
                    log_file);

  // Phase 4: TILE_GRID
  emitter.phase_start(run_id, Phase::TILE_GRID, log_file);
  TileGrid tile_grid;
  try {
    tile_grid = pipeline::build_tile_grid(grid.width, grid.height, cfg.tile.size);
  } catch (const std::exception &e) {
    return fail(Phase::TILE_GRID, e);
  }
  std::vector<Tile> tiles = tile_grid.tiles;
  if (max_tiles > 0 && tiles.size() > static_cast<size_t>(max_tiles)) {
    tiles.resize(static_cast<size_t>(max_tiles));
    emitter.warning(run_id,
                    "--max-tiles " + std::to_string(max_tiles) +
                        ": outputs cover only part of the grid",
                    log_file);
  }
  std::cout << "[TILE_GRID] " << tile_grid.cols << "x" << tile_grid.rows
            << " tiles of " << tile_grid.tile_size << " px, processing "
            << tiles.size() << std::endl;
  emitter.phase_end(run_id, Phase::TILE_GRID, "ok",
                    {{"tile_size", tile_grid.tile_size},
                     {"rows", tile_grid.rows},
                     {"cols", tile_grid.cols},
                     {"tiles", tiles.size()}},
                    log_file);

  // Phase 5: TILE_PROCESSING
  emitter.phase_start(run_id, Phase::TILE_PROCESSING, log_file);
  const aggregation::HistogramParams hist_params = histogram_params(cfg);

  pipeline::TileContext ctx;
  ctx.holt.alpha = cfg.smoothing.alpha;
  ctx.holt.beta = cfg.smoothing.beta;
  ctx.model = fit.model;
  ctx.target_label = target_label;
  ctx.years = years;
  ctx.histogram = hist_params;
  ctx.keep_smoothed = cfg.output.write_smoothed;

  pipeline::TileMerger merger(grid.width, grid.height, years, layers.zone_names,
                              hist_params, false);
  pipeline::TileRunReport report;
  std::unique_ptr<OutputCubes> cubes;
  try {
    cubes = std::make_unique<OutputCubes>(out_dir, grid, years,
                                          cfg.data.band_names, cfg);

    const int workers =
        pipeline::compute_worker_count(cfg.runtime_limits.parallel_workers, tiles.size());
    std::cout << "[TILE_PROCESSING] Using " << workers
              << " parallel workers for " << tiles.size() << " tiles"
              << std::endl;

    const io::EpochSource &src = *source;
    auto map = [&](const Tile &t) {
      TimeSeries raw = src.read_window(t.x, t.y, t.width, t.height);
      return pipeline::process_tile(t, raw, layers.window(t), ctx);
    };
    auto sink = [&](pipeline::TileResult &&r) {
      cubes->write_tile(r);
      merger.add(r);
    };
    auto on_failure = [&](int ti, int attempt, bool will_retry,
                          const std::string &msg) {
      emitter.tile_failed(run_id, ti, attempt, will_retry, msg, log_file);
    };
    auto on_progress = [&](size_t done, size_t total) {
      if (done % 4 == 0 || done == total) {
        emitter.phase_progress(run_id, Phase::TILE_PROCESSING, done, total,
                               "tiles", log_file);
      }
    };

    report = pipeline::run_tiles(tiles, map, sink,
                                 {cfg.runtime_limits.parallel_workers,
                                  cfg.runtime_limits.tile_retries},
                                 on_failure, on_progress);
    cubes->close();
  } catch (const std::exception &e) {
    return fail(Phase::TILE_PROCESSING, e);
  }

  const std::string tile_status = report.failures.empty() ? "ok" : "partial";
  std::cout << "[TILE_PROCESSING] " << report.tiles_ok << "/"
            << report.tiles_total << " tiles ok" << std::endl;
  emitter.phase_end(run_id, Phase::TILE_PROCESSING, tile_status,
                    {{"tiles_ok", report.tiles_ok},
                     {"tiles_failed", report.failures.size()}},
                    log_file);

  // Phase 6: AGGREGATION
  emitter.phase_start(run_id, Phase::AGGREGATION, log_file);
  std::vector<fs::path> json_outputs = {
      out_dir / "zonal_totals.json", out_dir / "directional_histograms.json",
      out_dir / "tile_report.json"};
  try {
    const auto unit = aggregation::area_unit_from_string(cfg.zonal.area_unit);
    runner::write_json_file(
        json_outputs[0],
        io::zonal_records_to_json(merger.zonal().finalize(unit), unit));
    runner::write_json_file(
        json_outputs[1],
        io::histogram_records_to_json(merger.histogram().finalize(), hist_params));
    runner::write_json_file(json_outputs[2],
                            io::tile_report_to_json(report, tiles));
  } catch (const std::exception &e) {
    return fail(Phase::AGGREGATION, e);
  }
  emitter.phase_end(run_id, Phase::AGGREGATION, "ok",
                    {{"zones", layers.zone_names.size()},
                     {"years", years.size()}},
                    log_file);

  // Phase 7: DONE (manifest)
  emitter.phase_start(run_id, Phase::DONE, log_file);
  try {
    json manifest;
    manifest["run_id"] = run_id;
    manifest["created"] = core::get_iso_timestamp();
    manifest["years"] = years;
    manifest["band_names"] = cfg.data.band_names;
    manifest["grid"] = {{"width", grid.width},
                        {"height", grid.height},
                        {"origin_x", grid.origin_x},
                        {"origin_y", grid.origin_y},
                        {"pixel_width", grid.pixel_width},
                        {"pixel_height", grid.pixel_height},
                        {"crs", grid.crs},
                        {"geographic", grid.geographic}};
    manifest["config"] = (run_dir / "config.yaml").string();
    manifest["tiles_failed"] = report.failures.size();

    std::vector<fs::path> outputs = cubes->paths();
    outputs.insert(outputs.end(), json_outputs.begin(), json_outputs.end());
    outputs.push_back(artifacts_dir / "cluster_model.json");
    outputs.push_back(artifacts_dir / "training_sample.json");

    json out_list = json::array();
    for (const auto &p : outputs) {
      out_list.push_back(fs::relative(p, run_dir).string());
    }
    manifest["outputs"] = out_list;

    if (cfg.output.checksums) {
      json sums = json::object();
      sums[(run_dir / "config.yaml").string()] =
          core::sha256_file(run_dir / "config.yaml");
      for (const auto &f : files) sums[f.string()] = core::sha256_file(f);
      for (const auto &f : static_inputs) sums[f.string()] = core::sha256_file(f);
      for (const auto &p : outputs) {
        sums[fs::relative(p, run_dir).string()] = core::sha256_file(p);
      }
      manifest["sha256"] = sums;
    }
    runner::write_json_file(run_dir / "run_manifest.json", manifest);
  } catch (const std::exception &e) {
    return fail(Phase::DONE, e);
  }
  emitter.phase_end(run_id, Phase::DONE, "ok", json::object(), log_file);

  const bool success = report.failures.empty() || !cfg.pipeline.abort_on_fail;
  emitter.run_end(run_id, success, report.failures.empty() ? "ok" : "partial",
                  log_file);
  if (!report.failures.empty()) {
    std::cerr << report.failures.size()
              << " tile(s) failed, see outputs/tile_report.json" << std::endl;
  }
  return success ? 0 : 1;
}
