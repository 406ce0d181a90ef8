#pragma once

#include "zonal_join/io/raster_reader.hpp"

#include <fitsio.h>

namespace zonal_join::io {

// FITS image with a linear world transform:
//   x = CRVAL1 + (col + 0.5 - CRPIX1) * CDELT1   (likewise for y with axis 2)
// Without the keywords the world grid is the pixel grid. FITS row 1 is grid
// row 0. `band` selects the plane along NAXIS3.
class FitsRasterReader : public RasterReader {
public:
    FitsRasterReader(const fs::path& path, int band);
    ~FitsRasterReader() override;

    FitsRasterReader(const FitsRasterReader&) = delete;
    FitsRasterReader& operator=(const FitsRasterReader&) = delete;

    const RasterGrid& grid() const override { return grid_; }
    void read_row(int row, int col_start, int col_end, float* out) override;
    void close() override;
    bool is_open() const override { return fptr_ != nullptr; }

private:
    fs::path path_;
    fitsfile* fptr_ = nullptr;
    int band_ = 1;
    RasterGrid grid_;
};

// Single-plane float image carrying the transform and NODATA keywords
void write_fits_raster(const fs::path& path, const Matrix2Df& data, const RasterGrid& grid);

} // namespace zonal_join::io
