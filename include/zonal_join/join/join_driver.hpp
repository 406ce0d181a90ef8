#pragma once

#include "zonal_join/config/configuration.hpp"
#include "zonal_join/core/types.hpp"
#include "zonal_join/io/raster_reader.hpp"
#include "zonal_join/stats/statistics.hpp"
#include "zonal_join/stream/cell_value_stream.hpp"

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace zonal_join::join {

using RasterOpener = std::function<std::unique_ptr<io::RasterReader>(const fs::path&, int band)>;

struct JoinOptions {
    int band = 1;
    std::int64_t exact_threshold = stats::kDefaultExactThreshold;
    int cancel_check_rows = 1;
    RasterOpener opener;                 // io::open_raster when empty
    std::ostream* event_out = nullptr;   // JSON-lines events; nullptr = silent
    std::string run_id;                  // generated when empty

    static JoinOptions from_config(const config::Config& cfg);
};

struct JoinResult {
    JoinStatus status = JoinStatus::NoResults;
    stats::StatisticsMap statistics;  // one entry per feature when status is Ok

    bool ok() const { return status == JoinStatus::Ok; }
};

struct IndexedRaster {
    size_t raster_idx;
    fs::path path;
    std::vector<PixelRange> ranges;
};

struct IndexPass {
    std::vector<IndexedRaster> kept;  // rasters with at least one range
    bool cancelled = false;
};

// Opens, indexes and closes each raster in turn
IndexPass index_rasters(const std::vector<fs::path>& raster_paths,
                        const std::vector<Geometry>& geometries,
                        const JoinOptions& options,
                        const CancelCheck& should_stop = nullptr);

// One CellValueStream per kept raster, opened lazily and flattened into a
// single pass over all samples. `rasters` must outlive the returned stream.
std::unique_ptr<stream::ChainedSampleStream> chain_streams(
    const std::vector<IndexedRaster>& rasters,
    const JoinOptions& options,
    const CancelCheck& should_stop = nullptr,
    stream::ChainedSampleStream::PartDone on_part_done = nullptr);

// Fail-fast: GeometryError and IOError abort the whole join.
JoinResult zonal_statistics(const std::vector<fs::path>& raster_paths,
                            const std::vector<Geometry>& geometries,
                            const JoinOptions& options = {},
                            const CancelCheck& should_stop = nullptr);

JoinResult zonal_statistics(const fs::path& raster_path,
                            const std::vector<Geometry>& geometries,
                            const JoinOptions& options = {},
                            const CancelCheck& should_stop = nullptr);

// Fires once `seconds` of wall-clock time have passed; empty when seconds <= 0
CancelCheck deadline_check(double seconds);

CancelCheck any_of_checks(CancelCheck a, CancelCheck b);

} // namespace zonal_join::join
