#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <ostream>
#include <string>

namespace zonal_join::core {

using json = nlohmann::json;

class EventEmitter {
public:
    EventEmitter() = default;

    void join_start(const std::string& run_id, size_t n_rasters, size_t n_features,
                    const json& extra, std::ostream& out);
    void join_end(const std::string& run_id, JoinStatus status, size_t n_features,
                  std::ostream& out);

    void raster_indexed(const std::string& run_id, size_t raster_idx, const std::string& path,
                        size_t n_ranges, std::int64_t n_cells, std::ostream& out);
    void raster_skipped(const std::string& run_id, size_t raster_idx, const std::string& path,
                        std::ostream& out);
    void raster_streamed(const std::string& run_id, size_t raster_idx, const std::string& path,
                         std::int64_t n_samples, bool cancelled, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

} // namespace zonal_join::core
