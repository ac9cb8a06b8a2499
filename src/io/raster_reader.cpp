#include "io/raster_reader.hpp"
#include "io/coordinate_system_utils.hpp"
#include <gdal.h>
#include <cpl_conv.h>
#include <cpl_error.h>
#include <algorithm>
#include <iostream>

namespace climextract {
namespace io {

RasterReader::RasterReader(const RasterReaderConfig& config)
    : config_(config), dataset_(nullptr), width_(0), height_(0), band_count_(0),
      geo_transform_{0.0, 1.0, 0.0, 0.0, 0.0, 1.0}, grib_units_overridden_(false) {
    initGDAL();
}

RasterReader::~RasterReader() {
    close();
}

void RasterReader::initGDAL() {
    GDALAllRegister();
}

void RasterReader::close() {
    if (dataset_) {
        GDALClose(dataset_);
        dataset_ = nullptr;
    }
    restoreGribUnits();
}

void RasterReader::overrideGribUnits() {
    if (grib_units_overridden_) {
        return;
    }
    const char* previous = CPLGetThreadLocalConfigOption("GRIB_NORMALIZE_UNITS", nullptr);
    if (previous) {
        previous_grib_units_ = std::string(previous);
    } else {
        previous_grib_units_.reset();
    }
    // The GRIB driver reads lazily, so the option must outlive GDALOpenEx
    CPLSetThreadLocalConfigOption("GRIB_NORMALIZE_UNITS", "NO");
    grib_units_overridden_ = true;
}

void RasterReader::restoreGribUnits() {
    if (!grib_units_overridden_) {
        return;
    }
    CPLSetThreadLocalConfigOption("GRIB_NORMALIZE_UNITS",
                                  previous_grib_units_ ? previous_grib_units_->c_str() : nullptr);
    previous_grib_units_.reset();
    grib_units_overridden_ = false;
}

bool RasterReader::open() {
    close();
    last_error_.clear();

    overrideGribUnits();
    dataset_ = GDALOpenEx(config_.file_path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr, nullptr);
    if (!dataset_) {
        last_error_ = "Failed to open raster file: " + config_.file_path;
        const char* gdal_msg = CPLGetLastErrorMsg();
        if (gdal_msg && gdal_msg[0] != '\0') {
            last_error_ += " (" + std::string(gdal_msg) + ")";
        }
        std::cerr << last_error_ << std::endl;
        restoreGribUnits();
        return false;
    }

    width_ = GDALGetRasterXSize(dataset_);
    height_ = GDALGetRasterYSize(dataset_);
    band_count_ = GDALGetRasterCount(dataset_);

    double gt[6];
    if (GDALGetGeoTransform(dataset_, gt) == CE_None) {
        std::copy(gt, gt + 6, geo_transform_.begin());
    } else {
        std::cerr << "Warning: Raster has no geotransform; using pixel coordinates" << std::endl;
    }

    const char* wkt = GDALGetProjectionRef(dataset_);
    coordinate_system_wkt_ = wkt ? std::string(wkt) : "";

    std::cout << "Raster driver: " << GDALGetDriverShortName(GDALGetDatasetDriver(dataset_)) << std::endl;
    std::cout << "Raster size: " << width_ << " x " << height_ << ", band count: " << band_count_ << std::endl;
    std::cout << "Raster coordinate system: "
              << CoordinateSystemUtils::describeCoordinateSystem(coordinate_system_wkt_) << std::endl;

    return true;
}

bool RasterReader::readBand(int band_index, extract::BandGrid& grid) {
    if (!dataset_) {
        last_error_ = "Raster dataset is not open";
        return false;
    }
    if (band_index < 1 || band_index > band_count_) {
        last_error_ = "Band index " + std::to_string(band_index) + " is out of range. Raster has "
                      + std::to_string(band_count_) + " bands.";
        return false;
    }

    GDALRasterBandH band = GDALGetRasterBand(dataset_, band_index);
    if (!band) {
        last_error_ = "Failed to get raster band " + std::to_string(band_index);
        return false;
    }

    grid.band_index = band_index;
    grid.width = width_;
    grid.height = height_;
    grid.values.assign(static_cast<size_t>(width_) * static_cast<size_t>(height_), 0.0);

    CPLErr err = GDALRasterIO(band, GF_Read, 0, 0, width_, height_,
                              grid.values.data(), width_, height_, GDT_Float64, 0, 0);
    if (err != CE_None) {
        last_error_ = "RasterIO failed for band " + std::to_string(band_index) + ": " + CPLGetLastErrorMsg();
        grid.values.clear();
        return false;
    }

    int has_nodata = 0;
    double nodata = GDALGetRasterNoDataValue(band, &has_nodata);
    if (has_nodata) {
        grid.nodata_value = nodata;
    } else {
        grid.nodata_value.reset();
    }

    return true;
}

} // namespace io
} // namespace climextract
