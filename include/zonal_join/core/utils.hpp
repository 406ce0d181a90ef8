#pragma once

#include <filesystem>
#include <string>

namespace zonal_join::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);

} // namespace zonal_join::core
