#pragma once

#include "zonal_join/core/types.hpp"
#include <memory>

namespace zonal_join::io {

// Row-oriented access to one band of a raster. Readers own their file handle;
// close() releases it early and is idempotent.
class RasterReader {
public:
    virtual ~RasterReader() = default;

    virtual const RasterGrid& grid() const = 0;

    // Reads cells [col_start, col_end) of `row` into out[0 .. col_end - col_start)
    virtual void read_row(int row, int col_start, int col_end, float* out) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

class MemoryRasterReader : public RasterReader {
public:
    // Width and height of `grid` are taken from `data`
    MemoryRasterReader(Matrix2Df data, RasterGrid grid);

    const RasterGrid& grid() const override { return grid_; }
    void read_row(int row, int col_start, int col_end, float* out) override;
    void close() override { open_ = false; }
    bool is_open() const override { return open_; }

    int row_reads() const { return row_reads_; }

private:
    Matrix2Df data_;
    RasterGrid grid_;
    bool open_ = true;
    int row_reads_ = 0;
};

bool is_fits_path(const fs::path& path);

// FITS for .fit/.fits/.fts, GDAL for everything else. `band` is 1-based.
std::unique_ptr<RasterReader> open_raster(const fs::path& path, int band);

// Shared bounds check for read_row implementations
void check_row_request(const RasterGrid& grid, int row, int col_start, int col_end,
                       const std::string& source);

} // namespace zonal_join::io
