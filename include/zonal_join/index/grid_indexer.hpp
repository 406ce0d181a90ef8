#pragma once

#include "zonal_join/core/types.hpp"
#include <cstdint>
#include <vector>

namespace zonal_join::index {

// Scanline rasterization of one geometry against a grid. A cell belongs to the
// geometry when its center lies inside under the even-odd rule; holes and
// shells of one polygon share the parity pass, parts of a multi-polygon are
// rasterized separately and unioned. Result is sorted by (row, col_start) with
// no overlapping ranges. Empty when the envelope misses the grid extent.
std::vector<PixelRange> index_geometry(const Geometry& geometry,
                                       const RasterGrid& grid,
                                       std::int64_t feature);

// All features against one grid, tagged with their position in `geometries`
// and ordered by (row, col_start, feature). Throws GeometryError on the first
// malformed geometry.
std::vector<PixelRange> compute_intersections(const std::vector<Geometry>& geometries,
                                              const RasterGrid& grid);

// compute_intersections() for geometries that already passed geometry::validate
std::vector<PixelRange> index_validated(const std::vector<Geometry>& geometries,
                                        const RasterGrid& grid);

std::int64_t count_cells(const std::vector<PixelRange>& ranges);

} // namespace zonal_join::index
