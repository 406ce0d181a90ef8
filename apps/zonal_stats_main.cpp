#include "zonal_join/config/configuration.hpp"
#include "zonal_join/core/errors.hpp"
#include "zonal_join/core/types.hpp"
#include "zonal_join/geometry/geojson.hpp"
#include "zonal_join/index/grid_indexer.hpp"
#include "zonal_join/io/raster_reader.hpp"
#include "zonal_join/io/result_json.hpp"
#include "zonal_join/join/join_driver.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

std::atomic<bool> g_interrupted{false};

void on_sigint(int) { g_interrupted.store(true); }

void print_json(const json &j, int indent) {
  std::cout << j.dump(indent, ' ', false, json::error_handler_t::replace) << std::endl;
}

zonal_join::config::Config load_config(const std::string &config_path) {
  zonal_join::config::Config cfg;
  if (!config_path.empty()) {
    cfg = zonal_join::config::Config::load(config_path);
  }
  return cfg;
}

int stats_command(const std::vector<std::string> &rasters,
                  const std::string &geometry_path,
                  const std::string &config_path, int band, double timeout,
                  bool quiet) {
  using namespace zonal_join;

  config::Config cfg = load_config(config_path);
  if (band > 0) cfg.join.band = band;
  if (timeout >= 0.0) cfg.limits.timeout_seconds = timeout;
  if (quiet) cfg.logging.events = false;
  cfg.validate();

  auto features = geometry::load_geojson(geometry_path);
  std::vector<json> ids;
  ids.reserve(features.size());
  for (const auto &f : features) ids.push_back(f.id);

  join::JoinOptions options = join::JoinOptions::from_config(cfg);
  options.event_out = cfg.logging.events ? &std::cerr : nullptr;

  std::signal(SIGINT, on_sigint);
  CancelCheck should_stop = join::any_of_checks(
      join::deadline_check(cfg.limits.timeout_seconds),
      []() { return g_interrupted.load(); });

  std::vector<std::filesystem::path> paths(rasters.begin(), rasters.end());
  join::JoinResult result = join::zonal_statistics(
      paths, geometry::geometries_of(features), options, should_stop);

  print_json(io::to_json(result, ids), cfg.output.json_indent);
  return result.status == JoinStatus::Incomplete ? 3 : 0;
}

int index_command(const std::vector<std::string> &rasters,
                  const std::string &geometry_path, int band) {
  using namespace zonal_join;

  auto geometries = geometry::geometries_of(geometry::load_geojson(geometry_path));

  json out = json::array();
  for (const auto &path : rasters) {
    auto reader = io::open_raster(path, band);
    const RasterGrid grid = reader->grid();
    reader->close();

    auto ranges = index::compute_intersections(geometries, grid);
    out.push_back({{"path", path},
                   {"width", grid.width},
                   {"height", grid.height},
                   {"cells", index::count_cells(ranges)},
                   {"ranges", io::to_json(ranges)}});
  }
  print_json(out, 2);
  return 0;
}

int validate_config_command(const std::string &config_path) {
  auto cfg = zonal_join::config::Config::load(config_path);
  cfg.validate();

  json result;
  result["ok"] = true;
  result["path"] = config_path;
  print_json(result, 2);
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Zonal statistics of rasters under polygons"};
  app.require_subcommand(1);

  std::vector<std::string> rasters;
  std::string geometry_path;
  std::string config_path;
  int band = 0;
  double timeout = -1.0;
  bool quiet = false;

  auto stats_cmd = app.add_subcommand("stats", "Compute per-feature statistics");
  stats_cmd->add_option("--raster,-r", rasters, "Raster file (repeatable)")
      ->required();
  stats_cmd->add_option("--geometry,-g", geometry_path, "GeoJSON polygons")
      ->required();
  stats_cmd->add_option("--config,-c", config_path, "Path to config.yaml");
  stats_cmd->add_option("--band", band, "1-based band, overrides the config");
  stats_cmd->add_option("--timeout", timeout,
                        "Seconds before the join is cancelled (0 = none)");
  stats_cmd->add_flag("--quiet,-q", quiet, "Do not emit events on stderr");

  std::vector<std::string> index_rasters;
  std::string index_geometry;
  int index_band = 1;
  auto index_cmd = app.add_subcommand("index", "Print pixel ranges per raster");
  index_cmd->add_option("--raster,-r", index_rasters, "Raster file (repeatable)")
      ->required();
  index_cmd->add_option("--geometry,-g", index_geometry, "GeoJSON polygons")
      ->required();
  index_cmd->add_option("--band", index_band, "1-based band");

  std::string validate_path;
  auto validate_cmd = app.add_subcommand("validate-config", "Validate a config file");
  validate_cmd->add_option("path", validate_path, "Path to config.yaml")->required();

  CLI11_PARSE(app, argc, argv);

  try {
    if (stats_cmd->parsed()) {
      return stats_command(rasters, geometry_path, config_path, band, timeout, quiet);
    }
    if (index_cmd->parsed()) {
      return index_command(index_rasters, index_geometry, index_band);
    }
    if (validate_cmd->parsed()) {
      return validate_config_command(validate_path);
    }
  } catch (const zonal_join::ZonalJoinError &e) {
    json err;
    err["ok"] = false;
    err["error"] = e.what();
    print_json(err, 2);
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
