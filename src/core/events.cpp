#include "zonal_join/core/events.hpp"
#include "zonal_join/core/utils.hpp"

namespace zonal_join::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    // Paths are bytes on Linux; invalid UTF-8 is replaced rather than thrown
    out << event.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out.flush();
}

void EventEmitter::join_start(const std::string& run_id, size_t n_rasters, size_t n_features,
                              const json& extra, std::ostream& out) {
    json event = base_event("join_start", run_id);
    event["rasters"] = n_rasters;
    event["features"] = n_features;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::join_end(const std::string& run_id, JoinStatus status, size_t n_features,
                            std::ostream& out) {
    json event = base_event("join_end", run_id);
    event["success"] = status != JoinStatus::Incomplete;
    event["status"] = join_status_to_string(status);
    event["features"] = n_features;
    emit(event, out);
}

void EventEmitter::raster_indexed(const std::string& run_id, size_t raster_idx,
                                  const std::string& path, size_t n_ranges,
                                  std::int64_t n_cells, std::ostream& out) {
    json event = base_event("raster_indexed", run_id);
    event["raster_idx"] = raster_idx;
    event["path"] = path;
    event["ranges"] = n_ranges;
    event["cells"] = n_cells;
    emit(event, out);
}

void EventEmitter::raster_skipped(const std::string& run_id, size_t raster_idx,
                                  const std::string& path, std::ostream& out) {
    json event = base_event("raster_skipped", run_id);
    event["raster_idx"] = raster_idx;
    event["path"] = path;
    event["reason"] = "no_intersection";
    emit(event, out);
}

void EventEmitter::raster_streamed(const std::string& run_id, size_t raster_idx,
                                   const std::string& path, std::int64_t n_samples,
                                   bool cancelled, std::ostream& out) {
    json event = base_event("raster_streamed", run_id);
    event["raster_idx"] = raster_idx;
    event["path"] = path;
    event["samples"] = n_samples;
    event["cancelled"] = cancelled;
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace zonal_join::core
