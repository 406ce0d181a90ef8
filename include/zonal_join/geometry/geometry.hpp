#pragma once

#include "zonal_join/core/types.hpp"

namespace zonal_join::geometry {

Envelope bounds(const Geometry& geometry);

// Throws GeometryError for empty geometries, rings with fewer than three
// distinct positions and non-finite coordinates.
void validate(const Geometry& geometry);

// Closing vertex dropped when it repeats the first one
Ring open_ring(const Ring& ring);

} // namespace zonal_join::geometry
