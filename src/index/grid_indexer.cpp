#include "zonal_join/index/grid_indexer.hpp"
#include "zonal_join/geometry/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace zonal_join::index {

namespace {

bool range_less(const PixelRange& a, const PixelRange& b) {
    if (a.row != b.row) return a.row < b.row;
    if (a.col_start != b.col_start) return a.col_start < b.col_start;
    return a.feature < b.feature;
}

// First cell whose center is at or right of the fractional column c
double first_cell_at(double c) {
    return std::ceil(c - 0.5);
}

void scan_polygon(const Polygon& poly, const RasterGrid& grid, std::int64_t feature,
                  std::vector<PixelRange>& out) {
    if (poly.rings.empty()) return;

    Envelope env;
    for (const auto& p : poly.rings.front()) {
        env.expand(p.x, p.y);
    }
    if (!env.intersects(grid.extent())) return;

    std::vector<Ring> rings;
    rings.reserve(poly.rings.size());
    for (const auto& r : poly.rings) {
        rings.push_back(geometry::open_ring(r));
    }

    const double ra = grid.row_of(env.min_y);
    const double rb = grid.row_of(env.max_y);
    const double row_lo = std::max(0.0, first_cell_at(std::min(ra, rb)));
    const double row_hi = std::min(static_cast<double>(grid.height),
                                   std::floor(std::max(ra, rb) - 0.5) + 1.0);

    std::vector<double> crossings;
    for (int row = static_cast<int>(row_lo); row < static_cast<int>(row_hi); ++row) {
        const double yc = grid.y_of_row(row + 0.5);

        crossings.clear();
        for (const Ring& ring : rings) {
            const size_t n = ring.size();
            for (size_t i = 0; i < n; ++i) {
                const Point& a = ring[i];
                const Point& b = ring[(i + 1) % n];
                // Half-open in y so a shared vertex is counted once
                if ((a.y <= yc && yc < b.y) || (b.y <= yc && yc < a.y)) {
                    const double x = a.x + (yc - a.y) * (b.x - a.x) / (b.y - a.y);
                    crossings.push_back(grid.col_of(x));
                }
            }
        }
        std::sort(crossings.begin(), crossings.end());

        for (size_t i = 0; i + 1 < crossings.size(); i += 2) {
            const double c0 = std::max(0.0, first_cell_at(crossings[i]));
            const double c1 = std::min(static_cast<double>(grid.width),
                                       first_cell_at(crossings[i + 1]));
            if (c0 < c1) {
                out.push_back({row, static_cast<int>(c0), static_cast<int>(c1), feature});
            }
        }
    }
}

} // namespace

std::vector<PixelRange> index_geometry(const Geometry& geometry,
                                       const RasterGrid& grid,
                                       std::int64_t feature) {
    std::vector<PixelRange> ranges;
    if (grid.width <= 0 || grid.height <= 0) return ranges;

    for (const auto& part : geometry.parts) {
        scan_polygon(part, grid, feature, ranges);
    }
    if (geometry.parts.size() < 2) return ranges;

    // Overlapping parts must not count a cell twice
    std::sort(ranges.begin(), ranges.end(), range_less);
    std::vector<PixelRange> merged;
    merged.reserve(ranges.size());
    for (const auto& r : ranges) {
        if (!merged.empty() && merged.back().row == r.row && r.col_start <= merged.back().col_end) {
            merged.back().col_end = std::max(merged.back().col_end, r.col_end);
        } else {
            merged.push_back(r);
        }
    }
    return merged;
}

std::vector<PixelRange> index_validated(const std::vector<Geometry>& geometries,
                                        const RasterGrid& grid) {
    std::vector<PixelRange> all;
    for (size_t i = 0; i < geometries.size(); ++i) {
        auto ranges = index_geometry(geometries[i], grid, static_cast<std::int64_t>(i));
        all.insert(all.end(), ranges.begin(), ranges.end());
    }
    std::sort(all.begin(), all.end(), range_less);
    return all;
}

std::vector<PixelRange> compute_intersections(const std::vector<Geometry>& geometries,
                                              const RasterGrid& grid) {
    for (const auto& g : geometries) {
        geometry::validate(g);
    }
    return index_validated(geometries, grid);
}

std::int64_t count_cells(const std::vector<PixelRange>& ranges) {
    std::int64_t n = 0;
    for (const auto& r : ranges) {
        n += r.size();
    }
    return n;
}

} // namespace zonal_join::index
