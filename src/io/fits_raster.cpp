#include "zonal_join/io/fits_raster.hpp"
#include "zonal_join/core/errors.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace zonal_join::io {

static double read_double_key(fitsfile* fptr, const char* key, double fallback, bool* found = nullptr) {
    int status = 0;
    double value = 0.0;
    fits_read_key(fptr, TDOUBLE, key, &value, nullptr, &status);
    if (found) *found = (status == 0);
    if (status) return fallback;
    return value;
}

FitsRasterReader::FitsRasterReader(const fs::path& path, int band)
    : path_(path), band_(band) {
    int status = 0;
    if (fits_open_file(&fptr_, path.string().c_str(), READONLY, &status)) {
        fptr_ = nullptr;
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;
    fits_get_img_param(fptr_, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        close();
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }
    if (naxis < 2) {
        close();
        throw FitsError("FITS file has less than 2 dimensions: " + path.string());
    }

    const long planes = (naxis >= 3) ? naxes[2] : 1;
    if (band < 1 || band > planes) {
        close();
        throw FitsError("Band " + std::to_string(band) + " out of range [1, " +
                        std::to_string(planes) + "] in " + path.string());
    }

    if (read_double_key(fptr_, "CROTA2", 0.0) != 0.0) {
        close();
        throw FitsError("Rotated world transforms are not supported: " + path.string());
    }

    const double crpix1 = read_double_key(fptr_, "CRPIX1", 0.5);
    const double crpix2 = read_double_key(fptr_, "CRPIX2", 0.5);
    const double crval1 = read_double_key(fptr_, "CRVAL1", 0.0);
    const double crval2 = read_double_key(fptr_, "CRVAL2", 0.0);
    const double cdelt1 = read_double_key(fptr_, "CDELT1", 1.0);
    const double cdelt2 = read_double_key(fptr_, "CDELT2", 1.0);
    if (cdelt1 == 0.0 || cdelt2 == 0.0) {
        close();
        throw FitsError("CDELT1/CDELT2 must be non-zero: " + path.string());
    }

    grid_.sx = cdelt1;
    grid_.sy = cdelt2;
    grid_.x0 = crval1 + (0.5 - crpix1) * cdelt1;
    grid_.y0 = crval2 + (0.5 - crpix2) * cdelt2;
    grid_.width = static_cast<int>(naxes[0]);
    grid_.height = static_cast<int>(naxes[1]);

    bool has_nodata = false;
    const double nodata = read_double_key(fptr_, "NODATA", 0.0, &has_nodata);
    grid_.has_nodata = has_nodata;
    grid_.nodata = static_cast<float>(nodata);
}

FitsRasterReader::~FitsRasterReader() {
    close();
}

void FitsRasterReader::read_row(int row, int col_start, int col_end, float* out) {
    if (!fptr_) {
        throw FitsError("Read from closed FITS file: " + path_.string());
    }
    check_row_request(grid_, row, col_start, col_end, path_.string());
    const long n = col_end - col_start;
    if (n == 0) return;

    // Undefined (BLANK) pixels come back as NaN and are dropped downstream
    float nulval = std::numeric_limits<float>::quiet_NaN();
    int anynul = 0;
    int status = 0;
    long fpixel[3] = {col_start + 1L, row + 1L, static_cast<long>(band_)};
    fits_read_pix(fptr_, TFLOAT, fpixel, n, &nulval, out, &anynul, &status);
    if (status) {
        throw FitsError("Cannot read row " + std::to_string(row) + " of " + path_.string());
    }
}

void FitsRasterReader::close() {
    if (fptr_) {
        int status = 0;
        fits_close_file(fptr_, &status);
        fptr_ = nullptr;
    }
}

void write_fits_raster(const fs::path& path, const Matrix2Df& data, const RasterGrid& grid) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};

    fits_create_img(fptr, FLOAT_IMG, 2, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    double crpix = 0.5;
    double crval1 = grid.x0;
    double crval2 = grid.y0;
    double cdelt1 = grid.sx;
    double cdelt2 = grid.sy;
    fits_update_key(fptr, TDOUBLE, "CRPIX1", &crpix, nullptr, &status);
    fits_update_key(fptr, TDOUBLE, "CRPIX2", &crpix, nullptr, &status);
    fits_update_key(fptr, TDOUBLE, "CRVAL1", &crval1, nullptr, &status);
    fits_update_key(fptr, TDOUBLE, "CRVAL2", &crval2, nullptr, &status);
    fits_update_key(fptr, TDOUBLE, "CDELT1", &cdelt1, nullptr, &status);
    fits_update_key(fptr, TDOUBLE, "CDELT2", &cdelt2, nullptr, &status);
    if (grid.has_nodata) {
        double nodata = grid.nodata;
        fits_update_key(fptr, TDOUBLE, "NODATA", &nodata, nullptr, &status);
    }
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    // Row-major matrix, so FITS row y + 1 is matrix row y
    std::vector<float> buffer(data.data(), data.data() + data.size());
    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, static_cast<LONGLONG>(buffer.size()), buffer.data(), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
}

} // namespace zonal_join::io
