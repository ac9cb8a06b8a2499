#ifndef CLIMEXTRACT_COORDINATE_SYSTEM_UTILS_HPP
#define CLIMEXTRACT_COORDINATE_SYSTEM_UTILS_HPP

#include <string>
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_spatialref.h>

namespace climextract {
namespace io {

/**
 * Coordinate system utility functions for WGS84 validation
 */
class CoordinateSystemUtils {
public:
    /**
     * Check if coordinate system is EPSG:4326 (WGS84)
     * @param spatial_ref OGRSpatialReference handle
     * @return true if EPSG:4326, false otherwise
     */
    static bool isEPSG4326(OGRSpatialReferenceH spatial_ref);

    /**
     * Get coordinate system as WKT string from a vector layer
     * @param layer OGR layer handle
     * @return WKT string of coordinate system (empty if undefined)
     */
    static std::string getCoordinateSystemWKT(OGRLayerH layer);

    /**
     * Short human-readable description of a coordinate system
     * @param wkt WKT string (may be empty)
     * @return "EPSG:xxxx", the CRS name, or "undefined"
     */
    static std::string describeCoordinateSystem(const std::string& wkt);

    /**
     * Check that a dataset is in WGS84 longitude/latitude, printing a warning otherwise.
     * An undefined coordinate system is assumed to be WGS84.
     * @param wkt WKT string of the dataset coordinate system
     * @param dataset_label Label used in messages (e.g. "Raster")
     * @return true if EPSG:4326 or undefined, false otherwise
     */
    static bool checkWGS84(const std::string& wkt, const std::string& dataset_label);

private:
    // Disable instantiation
    CoordinateSystemUtils() = delete;
};

} // namespace io
} // namespace climextract

#endif // CLIMEXTRACT_COORDINATE_SYSTEM_UTILS_HPP
