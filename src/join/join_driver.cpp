#include "zonal_join/join/join_driver.hpp"
#include "zonal_join/core/errors.hpp"
#include "zonal_join/core/events.hpp"
#include "zonal_join/core/utils.hpp"
#include "zonal_join/geometry/geometry.hpp"
#include "zonal_join/index/grid_indexer.hpp"

#include <chrono>

namespace zonal_join::join {

namespace {

std::unique_ptr<io::RasterReader> open_with(const JoinOptions& options,
                                            const fs::path& path) {
    std::unique_ptr<io::RasterReader> reader =
        options.opener ? options.opener(path, options.band)
                       : io::open_raster(path, options.band);
    if (!reader) {
        throw IOError("Cannot open raster: " + path.string());
    }
    return reader;
}

} // namespace

JoinOptions JoinOptions::from_config(const config::Config& cfg) {
    JoinOptions o;
    o.band = cfg.join.band;
    o.exact_threshold = cfg.join.exact_threshold;
    o.cancel_check_rows = cfg.limits.cancel_check_rows;
    return o;
}

IndexPass index_rasters(const std::vector<fs::path>& raster_paths,
                        const std::vector<Geometry>& geometries,
                        const JoinOptions& options,
                        const CancelCheck& should_stop) {
    core::EventEmitter emitter;
    IndexPass pass;

    for (size_t i = 0; i < raster_paths.size(); ++i) {
        if (should_stop && should_stop()) {
            pass.cancelled = true;
            return pass;
        }

        const fs::path& path = raster_paths[i];
        std::vector<PixelRange> ranges;
        {
            auto reader = open_with(options, path);
            ranges = index::index_validated(geometries, reader->grid());
            reader->close();
        }

        if (ranges.empty()) {
            if (options.event_out) {
                emitter.raster_skipped(options.run_id, i, path.string(), *options.event_out);
            }
            continue;
        }
        if (options.event_out) {
            emitter.raster_indexed(options.run_id, i, path.string(), ranges.size(),
                                   index::count_cells(ranges), *options.event_out);
        }
        pass.kept.push_back({i, path, std::move(ranges)});
    }
    return pass;
}

std::unique_ptr<stream::ChainedSampleStream> chain_streams(
    const std::vector<IndexedRaster>& rasters,
    const JoinOptions& options,
    const CancelCheck& should_stop,
    stream::ChainedSampleStream::PartDone on_part_done) {
    std::vector<stream::StreamFactory> parts;
    parts.reserve(rasters.size());
    for (const auto& raster : rasters) {
        parts.push_back([&raster, options, should_stop]() -> std::unique_ptr<stream::SampleStream> {
            return std::make_unique<stream::CellValueStream>(
                open_with(options, raster.path), raster.ranges, should_stop,
                options.cancel_check_rows);
        });
    }
    return std::make_unique<stream::ChainedSampleStream>(std::move(parts), should_stop,
                                                         std::move(on_part_done));
}

JoinResult zonal_statistics(const std::vector<fs::path>& raster_paths,
                            const std::vector<Geometry>& geometries,
                            const JoinOptions& options,
                            const CancelCheck& should_stop) {
    JoinOptions opts = options;
    if (opts.run_id.empty()) {
        opts.run_id = core::get_run_id();
    }
    if (opts.band < 1) {
        throw ValidationError("band must be >= 1");
    }
    // Once per join, not once per raster
    for (const auto& g : geometries) {
        geometry::validate(g);
    }

    core::EventEmitter emitter;
    if (opts.event_out) {
        emitter.join_start(opts.run_id, raster_paths.size(), geometries.size(),
                           {{"band", opts.band}, {"exact_threshold", opts.exact_threshold}},
                           *opts.event_out);
    }

    JoinResult result;
    try {
        IndexPass pass = index_rasters(raster_paths, geometries, opts, should_stop);
        if (pass.cancelled) {
            result.status = JoinStatus::Incomplete;
        } else if (pass.kept.empty()) {
            result.status = JoinStatus::NoResults;
        } else {
            auto on_part_done = [&](size_t part, std::int64_t emitted, bool cancelled) {
                if (opts.event_out) {
                    const auto& raster = pass.kept[part];
                    emitter.raster_streamed(opts.run_id, raster.raster_idx, raster.path.string(),
                                            emitted, cancelled, *opts.event_out);
                    if (!cancelled && emitted == 0) {
                        emitter.warning(opts.run_id,
                                        "raster " + raster.path.string() +
                                            " has only nodata cells under the geometries",
                                        *opts.event_out);
                    }
                }
            };
            auto samples = chain_streams(pass.kept, opts, should_stop, on_part_done);
            auto statistics = stats::aggregate(*samples, geometries.size(), opts.exact_threshold);

            // Partial statistics are never reported
            if (samples->cancelled()) {
                result.status = JoinStatus::Incomplete;
            } else {
                result.status = JoinStatus::Ok;
                result.statistics = std::move(statistics);
            }
        }
    } catch (const ZonalJoinError& e) {
        if (opts.event_out) {
            emitter.error(opts.run_id, e.what(), *opts.event_out);
        }
        throw;
    }

    if (opts.event_out) {
        emitter.join_end(opts.run_id, result.status, result.statistics.size(), *opts.event_out);
    }
    return result;
}

JoinResult zonal_statistics(const fs::path& raster_path,
                            const std::vector<Geometry>& geometries,
                            const JoinOptions& options,
                            const CancelCheck& should_stop) {
    return zonal_statistics(std::vector<fs::path>{raster_path}, geometries, options, should_stop);
}

CancelCheck deadline_check(double seconds) {
    if (seconds <= 0.0) return nullptr;
    const auto deadline = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(seconds));
    return [deadline]() { return std::chrono::steady_clock::now() >= deadline; };
}

CancelCheck any_of_checks(CancelCheck a, CancelCheck b) {
    if (!a) return b;
    if (!b) return a;
    return [a = std::move(a), b = std::move(b)]() { return a() || b(); };
}

} // namespace zonal_join::join
