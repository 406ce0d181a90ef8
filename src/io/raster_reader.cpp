#include "zonal_join/io/raster_reader.hpp"
#include "zonal_join/io/fits_raster.hpp"
#include "zonal_join/io/gdal_raster.hpp"
#include "zonal_join/core/errors.hpp"
#include "zonal_join/core/utils.hpp"

#include <algorithm>

namespace zonal_join::io {

MemoryRasterReader::MemoryRasterReader(Matrix2Df data, RasterGrid grid)
    : data_(std::move(data)), grid_(grid) {
    grid_.width = static_cast<int>(data_.cols());
    grid_.height = static_cast<int>(data_.rows());
}

void MemoryRasterReader::read_row(int row, int col_start, int col_end, float* out) {
    if (!open_) {
        throw IOError("read from a closed in-memory raster");
    }
    check_row_request(grid_, row, col_start, col_end, "in-memory raster");
    const float* src = data_.data() + static_cast<Eigen::Index>(row) * data_.cols();
    std::copy(src + col_start, src + col_end, out);
    ++row_reads_;
}

bool is_fits_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

std::unique_ptr<RasterReader> open_raster(const fs::path& path, int band) {
    if (!fs::exists(path)) {
        throw IOError("Raster not found: " + path.string());
    }
    if (is_fits_path(path)) {
        return std::make_unique<FitsRasterReader>(path, band);
    }
    return std::make_unique<GdalRasterReader>(path, band);
}

void check_row_request(const RasterGrid& grid, int row, int col_start, int col_end,
                       const std::string& source) {
    if (row < 0 || row >= grid.height || col_start < 0 || col_end > grid.width ||
        col_start > col_end) {
        throw IOError("row request out of bounds for " + source + ": row " +
                      std::to_string(row) + ", cols [" + std::to_string(col_start) +
                      ", " + std::to_string(col_end) + ")");
    }
}

} // namespace zonal_join::io
