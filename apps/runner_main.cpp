#include "rangeshift/config/configuration.hpp"
#include "rangeshift/core/errors.hpp"

#include "runner_pipeline.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>

namespace {

int validate_config_command(const std::string &config_path) {
  using namespace rangeshift;
  try {
    config::Config cfg = config::Config::load(config_path);
    cfg.validate();
  } catch (const RangeshiftError &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  std::cout << "OK: " << config_path << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"rangeshift runner"};

  std::string config_path, input_dir, runs_dir, run_id;
  bool dry_run = false;
  int max_tiles = 0;

  auto run_cmd = app.add_subcommand("run", "Run the pipeline");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--input-dir", input_dir, "Directory of epoch FITS cubes")
      ->required();
  run_cmd->add_option("--runs-dir", runs_dir, "Runs directory")->required();
  run_cmd->add_option("--run-id", run_id, "Run id (default: timestamp)");
  run_cmd->add_option("--max-tiles", max_tiles,
                      "Limit number of tiles (0 = no limit)");
  run_cmd->add_flag("--dry-run", dry_run, "Scan inputs only");

  auto validate_cmd =
      app.add_subcommand("validate-config", "Validate a configuration file");
  validate_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();

  auto schema_cmd =
      app.add_subcommand("get-schema", "Print the configuration JSON schema");

  app.require_subcommand(1);
  CLI11_PARSE(app, argc, argv);

  try {
    if (run_cmd->parsed()) {
      return run_pipeline_command(config_path, input_dir, runs_dir, run_id,
                                  dry_run, max_tiles);
    }
    if (validate_cmd->parsed()) {
      return validate_config_command(config_path);
    }
    if (schema_cmd->parsed()) {
      std::cout << rangeshift::config::get_schema_json() << std::endl;
      return 0;
    }
  } catch (const std::exception &e) {
    std::cerr << "Fatal: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
