#include "zonal_join/io/gdal_raster.hpp"
#include "zonal_join/core/errors.hpp"

#include <cpl_error.h>

namespace zonal_join::io {

GdalRasterReader::GdalRasterReader(const fs::path& path, int band)
    : path_(path) {
    GDALAllRegister();

    dataset_ = GDALDatasetUniquePtr(GDALDataset::Open(
        path.string().c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
    if (!dataset_) {
        throw GdalError("Cannot open raster " + path.string() + ": " + CPLGetLastErrorMsg());
    }

    if (band < 1 || band > dataset_->GetRasterCount()) {
        const int count = dataset_->GetRasterCount();
        close();
        throw GdalError("Band " + std::to_string(band) + " out of range [1, " +
                        std::to_string(count) + "] in " + path.string());
    }
    band_ = dataset_->GetRasterBand(band);

    double gt[6];
    if (dataset_->GetGeoTransform(gt) != CE_None) {
        close();
        throw GdalError("Raster has no geotransform: " + path.string());
    }
    if (gt[2] != 0.0 || gt[4] != 0.0) {
        close();
        throw GdalError("Rotated geotransforms are not supported: " + path.string());
    }

    grid_.x0 = gt[0];
    grid_.sx = gt[1];
    grid_.y0 = gt[3];
    grid_.sy = gt[5];
    grid_.width = dataset_->GetRasterXSize();
    grid_.height = dataset_->GetRasterYSize();

    int has_nodata = 0;
    double nodata = band_->GetNoDataValue(&has_nodata);
    grid_.has_nodata = has_nodata != 0;
    grid_.nodata = static_cast<float>(nodata);
}

GdalRasterReader::~GdalRasterReader() {
    close();
}

void GdalRasterReader::read_row(int row, int col_start, int col_end, float* out) {
    if (!dataset_) {
        throw GdalError("Read from closed raster: " + path_.string());
    }
    check_row_request(grid_, row, col_start, col_end, path_.string());
    const int n = col_end - col_start;
    if (n == 0) return;

    CPLErr err = band_->RasterIO(GF_Read,
                                 col_start, row,
                                 n, 1,
                                 out,
                                 n, 1,
                                 GDT_Float32,
                                 0, 0);
    if (err != CE_None) {
        throw GdalError("Cannot read row " + std::to_string(row) + " of " +
                        path_.string() + ": " + CPLGetLastErrorMsg());
    }
}

void GdalRasterReader::close() {
    band_ = nullptr;
    dataset_.reset();
}

} // namespace zonal_join::io
