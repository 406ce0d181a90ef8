#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <string>
#include <vector>

namespace zonal_join {

namespace fs = std::filesystem;

// Row-major so that one raster row is contiguous in memory
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;

// Polled between rows and between rasters; returning true stops the join.
using CancelCheck = std::function<bool()>;

struct Envelope {
    double min_x = std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();

    bool empty() const { return min_x > max_x || min_y > max_y; }

    void expand(double x, double y) {
        min_x = std::min(min_x, x);
        min_y = std::min(min_y, y);
        max_x = std::max(max_x, x);
        max_y = std::max(max_y, y);
    }

    bool intersects(const Envelope& o) const {
        if (empty() || o.empty()) return false;
        return min_x <= o.max_x && o.min_x <= max_x &&
               min_y <= o.max_y && o.min_y <= max_y;
    }
};

// North-up grid: world x = x0 + col * sx, world y = y0 + row * sy.
// sy is negative for the usual top-left origin (GeoTIFF) and positive for
// bottom-left origins (FITS).
struct RasterGrid {
    double x0 = 0.0;
    double y0 = 0.0;
    double sx = 1.0;
    double sy = -1.0;
    int width = 0;
    int height = 0;
    bool has_nodata = false;
    float nodata = 0.0f;

    // Fractional cell coordinates; cell c spans [c, c + 1)
    double col_of(double x) const { return (x - x0) / sx; }
    double row_of(double y) const { return (y - y0) / sy; }

    double x_of_col(double col) const { return x0 + col * sx; }
    double y_of_row(double row) const { return y0 + row * sy; }

    Envelope extent() const {
        Envelope e;
        e.expand(x_of_col(0.0), y_of_row(0.0));
        e.expand(x_of_col(width), y_of_row(height));
        return e;
    }

    bool is_nodata(float v) const {
        if (v != v) return true;  // NaN is never a measurement
        return has_nodata && v == nodata;
    }
};

struct Point {
    double x;
    double y;
};

using Ring = std::vector<Point>;

// First ring is the shell, the rest are holes
struct Polygon {
    std::vector<Ring> rings;
};

// A polygon is a geometry with a single part
struct Geometry {
    std::vector<Polygon> parts;
};

struct PixelRange {
    int row;
    int col_start;  // inclusive
    int col_end;    // exclusive
    std::int64_t feature;

    int size() const { return col_end - col_start; }
};

inline bool operator==(const PixelRange& a, const PixelRange& b) {
    return a.row == b.row && a.col_start == b.col_start &&
           a.col_end == b.col_end && a.feature == b.feature;
}

struct ValueSample {
    std::int64_t feature;
    float value;
};

struct Statistics {
    float min;
    float max;
    float median;
    float sum;
    float mode;
    float stddev;
    std::int64_t count;
    float mean;
    float lower_quart;
    float upper_quart;
};

inline Statistics empty_statistics() {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    return {nan, nan, nan, nan, nan, nan, 0, nan, nan, nan};
}

inline bool is_empty(const Statistics& s) {
    return s.count == 0;
}

enum class JoinStatus {
    Ok,
    NoResults,   // no raster intersected any geometry
    Incomplete   // cancelled before all values were consumed
};

inline std::string join_status_to_string(JoinStatus status) {
    switch (status) {
        case JoinStatus::Ok: return "ok";
        case JoinStatus::NoResults: return "no_results";
        case JoinStatus::Incomplete: return "incomplete";
        default: return "unknown";
    }
}

} // namespace zonal_join
