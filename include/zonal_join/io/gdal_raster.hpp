#pragma once

#include "zonal_join/io/raster_reader.hpp"

#include <gdal_priv.h>

namespace zonal_join::io {

// Any GDAL raster with a north-up geotransform
class GdalRasterReader : public RasterReader {
public:
    GdalRasterReader(const fs::path& path, int band);
    ~GdalRasterReader() override;

    GdalRasterReader(const GdalRasterReader&) = delete;
    GdalRasterReader& operator=(const GdalRasterReader&) = delete;

    const RasterGrid& grid() const override { return grid_; }
    void read_row(int row, int col_start, int col_end, float* out) override;
    void close() override;
    bool is_open() const override { return dataset_ != nullptr; }

private:
    fs::path path_;
    GDALDatasetUniquePtr dataset_;
    GDALRasterBand* band_ = nullptr;
    RasterGrid grid_;
};

} // namespace zonal_join::io
