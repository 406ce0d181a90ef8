#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace zonal_join::config {

namespace fs = std::filesystem;

struct JoinConfig {
  int band = 1;                                // 1-based
  std::int64_t exact_threshold = 5000000;      // largest run sorted in full
};

struct LimitsConfig {
  double timeout_seconds = 0.0;  // 0 = no deadline
  int cancel_check_rows = 1;
};

struct LoggingConfig {
  bool events = true;
};

struct OutputConfig {
  int json_indent = 2;  // -1 = compact
};

struct Config {
  JoinConfig join;
  LimitsConfig limits;
  LoggingConfig logging;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace zonal_join::config
