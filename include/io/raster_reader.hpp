#ifndef CLIMEXTRACT_RASTER_READER_HPP
#define CLIMEXTRACT_RASTER_READER_HPP

#include <string>
#include <vector>
#include <optional>
#include <gdal.h>
#include "extract/common.hpp"

namespace climextract {
namespace io {

// Raster reader configuration
struct RasterReaderConfig {
    std::string file_path;          // Input raster path (GRIB, GeoTIFF, NetCDF, ...)

    RasterReaderConfig() = default;
};

/**
 * Read-only access to a multi-band raster. The dataset is opened once and
 * released when the reader is destroyed.
 */
class RasterReader {
public:
    explicit RasterReader(const RasterReaderConfig& config);
    ~RasterReader();

    // Disable copy constructor and assignment
    RasterReader(const RasterReader&) = delete;
    RasterReader& operator=(const RasterReader&) = delete;

    /**
     * Open the raster dataset and load its metadata
     * @return true if successful, false otherwise
     */
    bool open();

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    int getBandCount() const { return band_count_; }

    /**
     * Get the affine geotransform (identity-like default when the file has none)
     */
    const extract::GeoTransform& getGeoTransform() const { return geo_transform_; }

    /**
     * Get the coordinate system as WKT string (empty if the raster declares none)
     */
    std::string getCoordinateSystemWKT() const { return coordinate_system_wkt_; }

    /**
     * Read one full band into memory as double values
     * @param band_index 1-based band index
     * @param grid Output grid
     * @return true if successful, false otherwise (see getLastError())
     */
    bool readBand(int band_index, extract::BandGrid& grid);

    std::string getLastError() const { return last_error_; }

private:
    RasterReaderConfig config_;
    GDALDatasetH dataset_;
    int width_;
    int height_;
    int band_count_;
    extract::GeoTransform geo_transform_;
    bool grib_units_overridden_;       // GRIB_NORMALIZE_UNITS set by open()
    std::optional<std::string> previous_grib_units_;
    std::string coordinate_system_wkt_;
    std::string last_error_;

    void initGDAL();

    void close();

    /**
     * Keep GRIB values in the units stored in the file (Kelvin, metres) while the
     * dataset is open, and restore the caller's setting afterwards
     */
    void overrideGribUnits();
    void restoreGribUnits();
};

} // namespace io
} // namespace climextract

#endif // CLIMEXTRACT_RASTER_READER_HPP
