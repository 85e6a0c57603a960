#include "rangeshift/config/configuration.hpp"
#include "rangeshift/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

namespace rangeshift::config {

static void read_double_pair(const YAML::Node& n, std::array<double, 2>& out) {
    if (n && n.IsSequence() && n.size() == 2) {
        out[0] = n[0].as<double>();
        out[1] = n[1].as<double>();
    }
}

static void read_string_list(const YAML::Node& n, std::vector<std::string>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& it : n) {
            out.push_back(it.as<std::string>());
        }
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["pipeline"]) {
        auto p = node["pipeline"];
        if (p["mode"]) cfg.pipeline.mode = p["mode"].as<std::string>();
        if (p["abort_on_fail"]) cfg.pipeline.abort_on_fail = p["abort_on_fail"].as<bool>();
    }

    if (node["data"]) {
        auto d = node["data"];
        read_string_list(d["band_names"], cfg.data.band_names);
        if (d["input_pattern"]) cfg.data.input_pattern = d["input_pattern"].as<std::string>();
        if (d["year_keyword"]) cfg.data.year_keyword = d["year_keyword"].as<std::string>();
        if (d["annual_grass_band"]) cfg.data.annual_grass_band = d["annual_grass_band"].as<std::string>();
    }

    if (node["grid"]) {
        auto g = node["grid"];
        if (g["origin_x"]) cfg.grid.origin_x = g["origin_x"].as<double>();
        if (g["origin_y"]) cfg.grid.origin_y = g["origin_y"].as<double>();
        if (g["pixel_width"]) cfg.grid.pixel_width = g["pixel_width"].as<double>();
        if (g["pixel_height"]) cfg.grid.pixel_height = g["pixel_height"].as<double>();
        if (g["crs"]) cfg.grid.crs = g["crs"].as<std::string>();
        if (g["geographic"]) cfg.grid.geographic = g["geographic"].as<bool>();
    }

    if (node["inputs"]) {
        auto in = node["inputs"];
        if (in["analysis_mask"]) cfg.inputs.analysis_mask = in["analysis_mask"].as<std::string>();
        if (in["study_area"]) cfg.inputs.study_area = in["study_area"].as<std::string>();
        if (in["zones"]) cfg.inputs.zones = in["zones"].as<std::string>();
        if (in["zone_name_property"]) cfg.inputs.zone_name_property = in["zone_name_property"].as<std::string>();
        if (in["aspect"]) cfg.inputs.aspect = in["aspect"].as<std::string>();
        if (in["slope"]) cfg.inputs.slope = in["slope"].as<std::string>();
    }

    if (node["smoothing"]) {
        auto s = node["smoothing"];
        if (s["alpha"]) cfg.smoothing.alpha = s["alpha"].as<float>();
        if (s["beta"]) cfg.smoothing.beta = s["beta"].as<float>();
    }

    if (node["sampling"]) {
        auto s = node["sampling"];
        if (s["sample_size"]) cfg.sampling.sample_size = s["sample_size"].as<int>();
        if (s["oversample_factor"]) cfg.sampling.oversample_factor = s["oversample_factor"].as<float>();
        if (s["strata_rows"]) cfg.sampling.strata_rows = s["strata_rows"].as<int>();
        if (s["strata_cols"]) cfg.sampling.strata_cols = s["strata_cols"].as<int>();
        if (s["seed"]) cfg.sampling.seed = s["seed"].as<unsigned int>();
    }

    if (node["clustering"]) {
        auto cl = node["clustering"];
        if (cl["k"]) cfg.clustering.k = cl["k"].as<int>();
        if (cl["max_iterations"]) cfg.clustering.max_iterations = cl["max_iterations"].as<int>();
        if (cl["seed"]) cfg.clustering.seed = cl["seed"].as<unsigned int>();
        if (cl["target_selection"]) cfg.clustering.target_selection = cl["target_selection"].as<std::string>();
        if (cl["target_label"]) cfg.clustering.target_label = cl["target_label"].as<int>();
    }

    if (node["transition"]) {
        auto t = node["transition"];
        if (t["never_sentinel"]) cfg.transition.never_sentinel = t["never_sentinel"].as<int>();
        if (t["nodata_value"]) cfg.transition.nodata_value = t["nodata_value"].as<int>();
    }

    if (node["zonal"]) {
        auto z = node["zonal"];
        if (z["area_unit"]) cfg.zonal.area_unit = z["area_unit"].as<std::string>();
    }

    if (node["histogram"]) {
        auto h = node["histogram"];
        if (h["covariate"]) cfg.histogram.covariate = h["covariate"].as<std::string>();
        if (h["bins"]) cfg.histogram.bins = h["bins"].as<int>();
        read_double_pair(h["range"], cfg.histogram.range);
        if (h["min_slope_deg"]) cfg.histogram.min_slope_deg = h["min_slope_deg"].as<float>();
        if (h["periods"] && h["periods"].IsSequence()) {
            cfg.histogram.periods.clear();
            for (const auto& it : h["periods"]) {
                PeriodConfig p;
                p.start_year = it["start_year"].as<int>();
                p.end_year = it["end_year"].as<int>();
                p.name = it["name"] ? it["name"].as<std::string>()
                                    : std::to_string(p.start_year) + "-" + std::to_string(p.end_year);
                cfg.histogram.periods.push_back(p);
            }
        }
    }

    if (node["tile"]) {
        auto t = node["tile"];
        if (t["size"]) cfg.tile.size = t["size"].as<int>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["outputs_dir"]) cfg.output.outputs_dir = o["outputs_dir"].as<std::string>();
        if (o["artifacts_dir"]) cfg.output.artifacts_dir = o["artifacts_dir"].as<std::string>();
        if (o["write_smoothed"]) cfg.output.write_smoothed = o["write_smoothed"].as<bool>();
        if (o["write_labels"]) cfg.output.write_labels = o["write_labels"].as<bool>();
        if (o["write_indicators"]) cfg.output.write_indicators = o["write_indicators"].as<bool>();
        if (o["checksums"]) cfg.output.checksums = o["checksums"].as<bool>();
    }

    if (node["runtime_limits"]) {
        auto rl = node["runtime_limits"];
        if (rl["parallel_workers"]) cfg.runtime_limits.parallel_workers = rl["parallel_workers"].as<int>();
        if (rl["tile_retries"]) cfg.runtime_limits.tile_retries = rl["tile_retries"].as<int>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pipeline"]["mode"] = pipeline.mode;
    node["pipeline"]["abort_on_fail"] = pipeline.abort_on_fail;

    for (const auto& b : data.band_names) {
        node["data"]["band_names"].push_back(b);
    }
    node["data"]["input_pattern"] = data.input_pattern;
    node["data"]["year_keyword"] = data.year_keyword;
    node["data"]["annual_grass_band"] = data.annual_grass_band;

    node["grid"]["origin_x"] = grid.origin_x;
    node["grid"]["origin_y"] = grid.origin_y;
    node["grid"]["pixel_width"] = grid.pixel_width;
    node["grid"]["pixel_height"] = grid.pixel_height;
    node["grid"]["crs"] = grid.crs;
    node["grid"]["geographic"] = grid.geographic;

    node["inputs"]["analysis_mask"] = inputs.analysis_mask;
    node["inputs"]["study_area"] = inputs.study_area;
    node["inputs"]["zones"] = inputs.zones;
    node["inputs"]["zone_name_property"] = inputs.zone_name_property;
    node["inputs"]["aspect"] = inputs.aspect;
    node["inputs"]["slope"] = inputs.slope;

    node["smoothing"]["alpha"] = smoothing.alpha;
    node["smoothing"]["beta"] = smoothing.beta;

    node["sampling"]["sample_size"] = sampling.sample_size;
    node["sampling"]["oversample_factor"] = sampling.oversample_factor;
    node["sampling"]["strata_rows"] = sampling.strata_rows;
    node["sampling"]["strata_cols"] = sampling.strata_cols;
    node["sampling"]["seed"] = sampling.seed;

    node["clustering"]["k"] = clustering.k;
    node["clustering"]["max_iterations"] = clustering.max_iterations;
    node["clustering"]["seed"] = clustering.seed;
    node["clustering"]["target_selection"] = clustering.target_selection;
    node["clustering"]["target_label"] = clustering.target_label;

    node["transition"]["never_sentinel"] = transition.never_sentinel;
    node["transition"]["nodata_value"] = transition.nodata_value;

    node["zonal"]["area_unit"] = zonal.area_unit;

    node["histogram"]["covariate"] = histogram.covariate;
    node["histogram"]["bins"] = histogram.bins;
    node["histogram"]["range"].push_back(histogram.range[0]);
    node["histogram"]["range"].push_back(histogram.range[1]);
    node["histogram"]["min_slope_deg"] = histogram.min_slope_deg;
    for (const auto& p : histogram.periods) {
        YAML::Node pn;
        pn["name"] = p.name;
        pn["start_year"] = p.start_year;
        pn["end_year"] = p.end_year;
        node["histogram"]["periods"].push_back(pn);
    }

    node["tile"]["size"] = tile.size;

    node["output"]["outputs_dir"] = output.outputs_dir;
    node["output"]["artifacts_dir"] = output.artifacts_dir;
    node["output"]["write_smoothed"] = output.write_smoothed;
    node["output"]["write_labels"] = output.write_labels;
    node["output"]["write_indicators"] = output.write_indicators;
    node["output"]["checksums"] = output.checksums;

    node["runtime_limits"]["parallel_workers"] = runtime_limits.parallel_workers;
    node["runtime_limits"]["tile_retries"] = runtime_limits.tile_retries;

    return node;
}

void Config::validate() const {
    if (pipeline.mode != "production" && pipeline.mode != "test") {
        throw ValidationError("pipeline.mode must be 'production' or 'test'");
    }

    if (data.band_names.empty()) {
        throw ValidationError("data.band_names must not be empty");
    }
    {
        std::set<std::string> uniq(data.band_names.begin(), data.band_names.end());
        if (uniq.size() != data.band_names.size()) {
            throw ValidationError("data.band_names must be unique");
        }
    }
    if (data.year_keyword.empty() || data.year_keyword.size() > 8) {
        throw ValidationError("data.year_keyword must be a FITS keyword (1-8 characters)");
    }

    if (grid.pixel_width == 0.0 || grid.pixel_height == 0.0) {
        throw ValidationError("grid.pixel_width and grid.pixel_height must be non-zero");
    }

    if (!(smoothing.alpha > 0.0f && smoothing.alpha <= 1.0f)) {
        throw ValidationError("smoothing.alpha must be in (0,1]");
    }
    if (smoothing.beta < 0.0f || smoothing.beta > 1.0f) {
        throw ValidationError("smoothing.beta must be in [0,1]");
    }

    if (sampling.sample_size < 1) {
        throw ValidationError("sampling.sample_size must be >= 1");
    }
    if (sampling.oversample_factor < 1.0f) {
        throw ValidationError("sampling.oversample_factor must be >= 1");
    }
    if (sampling.strata_rows < 1 || sampling.strata_cols < 1) {
        throw ValidationError("sampling.strata_rows/strata_cols must be >= 1");
    }

    if (clustering.k < 2) {
        throw ValidationError("clustering.k must be >= 2");
    }
    if (clustering.max_iterations < 1) {
        throw ValidationError("clustering.max_iterations must be >= 1");
    }
    if (clustering.target_selection != "max_band" && clustering.target_selection != "fixed") {
        throw ValidationError("clustering.target_selection must be 'max_band' or 'fixed'");
    }
    if (clustering.target_selection == "fixed" &&
        (clustering.target_label < 0 || clustering.target_label >= clustering.k)) {
        throw ValidationError("clustering.target_label must be in [0,k)");
    }
    if (clustering.target_selection == "max_band" &&
        std::find(data.band_names.begin(), data.band_names.end(), data.annual_grass_band) ==
            data.band_names.end()) {
        throw ValidationError("data.annual_grass_band '" + data.annual_grass_band +
                              "' is not one of data.band_names");
    }
    if (clustering.k > sampling.sample_size) {
        throw ValidationError("clustering.k must be <= sampling.sample_size");
    }

    if (transition.never_sentinel <= 9998) {
        throw ValidationError("transition.never_sentinel must be larger than any calendar year (> 9998)");
    }
    if (transition.nodata_value == transition.never_sentinel) {
        throw ValidationError("transition.nodata_value must differ from transition.never_sentinel");
    }

    if (zonal.area_unit != "m2" && zonal.area_unit != "ha" &&
        zonal.area_unit != "km2" && zonal.area_unit != "acres") {
        throw ValidationError("zonal.area_unit must be one of m2, ha, km2, acres");
    }

    if (histogram.covariate != "northness" && histogram.covariate != "eastness") {
        throw ValidationError("histogram.covariate must be 'northness' or 'eastness'");
    }
    if (histogram.bins < 1) {
        throw ValidationError("histogram.bins must be >= 1");
    }
    if (!(histogram.range[0] < histogram.range[1])) {
        throw ValidationError("histogram.range must be [min,max] with min < max");
    }
    if (histogram.min_slope_deg < 0.0f || histogram.min_slope_deg > 90.0f) {
        throw ValidationError("histogram.min_slope_deg must be in [0,90]");
    }
    {
        std::vector<PeriodConfig> sorted = histogram.periods;
        std::sort(sorted.begin(), sorted.end(),
                  [](const PeriodConfig& a, const PeriodConfig& b) { return a.start_year < b.start_year; });
        std::set<std::string> names;
        for (size_t i = 0; i < sorted.size(); ++i) {
            if (sorted[i].start_year > sorted[i].end_year) {
                throw ValidationError("histogram.periods: '" + sorted[i].name + "' has start_year > end_year");
            }
            if (i > 0 && sorted[i].start_year <= sorted[i - 1].end_year) {
                throw ValidationError("histogram.periods must be disjoint: '" + sorted[i - 1].name +
                                      "' overlaps '" + sorted[i].name + "'");
            }
            if (!names.insert(sorted[i].name).second) {
                throw ValidationError("histogram.periods: duplicate name '" + sorted[i].name + "'");
            }
        }
    }

    if (tile.size < 16) {
        throw ValidationError("tile.size must be >= 16");
    }

    if (runtime_limits.parallel_workers < 1 || runtime_limits.parallel_workers > 256) {
        throw ValidationError("runtime_limits.parallel_workers must be in [1,256]");
    }
    if (runtime_limits.tile_retries < 0 || runtime_limits.tile_retries > 10) {
        throw ValidationError("runtime_limits.tile_retries must be in [0,10]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "pipeline": {
      "type": "object",
      "properties": {
        "mode": {"type": "string", "enum": ["production", "test"]},
        "abort_on_fail": {"type": "boolean"}
      }
    },
    "data": {
      "type": "object",
      "properties": {
        "band_names": {"type": "array", "items": {"type": "string"}, "minItems": 1},
        "input_pattern": {"type": "string"},
        "year_keyword": {"type": "string", "maxLength": 8},
        "annual_grass_band": {"type": "string"}
      }
    },
    "smoothing": {
      "type": "object",
      "properties": {
        "alpha": {"type": "number", "exclusiveMinimum": 0, "maximum": 1},
        "beta": {"type": "number", "minimum": 0, "maximum": 1}
      }
    },
    "sampling": {
      "type": "object",
      "properties": {
        "sample_size": {"type": "integer", "minimum": 1},
        "oversample_factor": {"type": "number", "minimum": 1},
        "strata_rows": {"type": "integer", "minimum": 1},
        "strata_cols": {"type": "integer", "minimum": 1},
        "seed": {"type": "integer", "minimum": 0}
      }
    },
    "clustering": {
      "type": "object",
      "properties": {
        "k": {"type": "integer", "minimum": 2},
        "max_iterations": {"type": "integer", "minimum": 1},
        "seed": {"type": "integer", "minimum": 0},
        "target_selection": {"type": "string", "enum": ["max_band", "fixed"]},
        "target_label": {"type": "integer", "minimum": 0}
      }
    },
    "transition": {
      "type": "object",
      "properties": {
        "never_sentinel": {"type": "integer", "minimum": 9999},
        "nodata_value": {"type": "integer"}
      }
    },
    "zonal": {
      "type": "object",
      "properties": {
        "area_unit": {"type": "string", "enum": ["m2", "ha", "km2", "acres"]}
      }
    },
    "histogram": {
      "type": "object",
      "properties": {
        "covariate": {"type": "string", "enum": ["northness", "eastness"]},
        "bins": {"type": "integer", "minimum": 1},
        "range": {"type": "array", "items": {"type": "number"}, "minItems": 2, "maxItems": 2},
        "min_slope_deg": {"type": "number", "minimum": 0, "maximum": 90},
        "periods": {
          "type": "array",
          "items": {
            "type": "object",
            "properties": {
              "name": {"type": "string"},
              "start_year": {"type": "integer"},
              "end_year": {"type": "integer"}
            },
            "required": ["start_year", "end_year"]
          }
        }
      }
    },
    "tile": {
      "type": "object",
      "properties": {
        "size": {"type": "integer", "minimum": 16}
      }
    },
    "runtime_limits": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 256},
        "tile_retries": {"type": "integer", "minimum": 0, "maximum": 10}
      }
    }
  }
})";
}

} // namespace rangeshift::config
