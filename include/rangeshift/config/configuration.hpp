#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace rangeshift::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  std::string mode = "production";
  bool abort_on_fail = true;
};

struct DataConfig {
  std::vector<std::string> band_names{"AFG", "PFG", "SHR", "TRE", "BGR", "LTR"};
  std::string input_pattern = "*.fits;*.fit;*.fts";
  std::string year_keyword = "YEAR";
  std::string annual_grass_band = "AFG";
};

// Georeference used when the epoch FITS headers carry none.
struct GridConfig {
  double origin_x = 0.0;
  double origin_y = 0.0;
  double pixel_width = 30.0;
  double pixel_height = -30.0;
  std::string crs = "EPSG:5070";
  bool geographic = false;
};

struct InputsConfig {
  std::string analysis_mask;   // single-band FITS, non-zero = eligible
  std::string study_area;      // GeoJSON, empty = whole grid
  std::string zones;           // GeoJSON
  std::string zone_name_property = "NAME";
  std::string aspect;          // degrees clockwise from north
  std::string slope;           // degrees
};

struct SmoothingConfig {
  float alpha = 0.25f;
  float beta = 0.01f;
};

struct SamplingConfig {
  int sample_size = 5000;
  float oversample_factor = 2.0f;
  int strata_rows = 8;
  int strata_cols = 8;
  unsigned int seed = 42;
};

struct ClusteringConfig {
  int k = 5;
  int max_iterations = 100;
  unsigned int seed = 7;
  std::string target_selection = "max_band"; // max_band | fixed
  int target_label = 0;                      // used when target_selection = fixed
};

struct TransitionConfig {
  int never_sentinel = 9999;
  int nodata_value = -1;
};

struct ZonalConfig {
  std::string area_unit = "ha"; // m2 | ha | km2 | acres
};

struct PeriodConfig {
  std::string name;
  int start_year = 0;
  int end_year = 0;
};

struct HistogramConfig {
  std::string covariate = "northness"; // northness | eastness
  int bins = 80;
  std::array<double, 2> range{-1.0, 1.0};
  float min_slope_deg = 5.0f;
  std::vector<PeriodConfig> periods{{"1986-1995", 1986, 1995},
                                    {"1996-2005", 1996, 2005},
                                    {"2006-2015", 2006, 2015},
                                    {"2016-2025", 2016, 2025}};
};

struct TileConfig {
  int size = 512;
};

struct OutputConfig {
  std::string outputs_dir = "outputs";
  std::string artifacts_dir = "artifacts";
  bool write_smoothed = false;
  bool write_labels = true;
  bool write_indicators = true;
  bool checksums = true;
};

struct RuntimeLimitsConfig {
  int parallel_workers = 4;
  int tile_retries = 2;
};

struct Config {
  PipelineConfig pipeline;
  DataConfig data;
  GridConfig grid;
  InputsConfig inputs;
  SmoothingConfig smoothing;
  SamplingConfig sampling;
  ClusteringConfig clustering;
  TransitionConfig transition;
  ZonalConfig zonal;
  HistogramConfig histogram;
  TileConfig tile;
  OutputConfig output;
  RuntimeLimitsConfig runtime_limits;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace rangeshift::config
