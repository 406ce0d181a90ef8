#include "zonal_join/geometry/geometry.hpp"
#include "zonal_join/core/errors.hpp"

#include <cmath>

namespace zonal_join::geometry {

Envelope bounds(const Geometry& geometry) {
    Envelope e;
    for (const auto& part : geometry.parts) {
        // Holes lie inside the shell
        if (part.rings.empty()) continue;
        for (const auto& p : part.rings.front()) {
            e.expand(p.x, p.y);
        }
    }
    return e;
}

Ring open_ring(const Ring& ring) {
    Ring out = ring;
    if (out.size() > 1 && out.front().x == out.back().x && out.front().y == out.back().y) {
        out.pop_back();
    }
    return out;
}

void validate(const Geometry& geometry) {
    if (geometry.parts.empty()) {
        throw GeometryError("geometry has no polygons");
    }
    for (size_t pi = 0; pi < geometry.parts.size(); ++pi) {
        const auto& part = geometry.parts[pi];
        if (part.rings.empty()) {
            throw GeometryError("polygon " + std::to_string(pi) + " has no rings");
        }
        for (size_t ri = 0; ri < part.rings.size(); ++ri) {
            const Ring& ring = part.rings[ri];
            for (const auto& p : ring) {
                if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
                    throw GeometryError("non-finite coordinate in polygon " +
                                        std::to_string(pi) + ", ring " + std::to_string(ri));
                }
            }
            if (open_ring(ring).size() < 3) {
                throw GeometryError("ring " + std::to_string(ri) + " of polygon " +
                                    std::to_string(pi) + " has fewer than 3 positions");
            }
        }
    }
}

} // namespace zonal_join::geometry
