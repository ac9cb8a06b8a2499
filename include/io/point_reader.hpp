#ifndef CLIMEXTRACT_POINT_READER_HPP
#define CLIMEXTRACT_POINT_READER_HPP

#include <string>
#include <vector>
#include <gdal.h>
#include <ogr_api.h>
#include "extract/common.hpp"

namespace climextract {
namespace io {

// Point reader configuration
struct PointReaderConfig {
    std::string file_path;          // Input file path (GeoPackage, Shapefile, GeoJSON, ...)
    int layer_index;                // Layer index to read from
    std::string id_field;           // Field name for the unique point ID
    std::string name_field;         // Field name for the point name
    std::string date_field;         // Field name for the observation date

    PointReaderConfig()
        : layer_index(0), id_field("OBS_NUM"), name_field("OBS_NAME"), date_field("OBS_DATE") {}
};

class PointReader {
public:
    explicit PointReader(const PointReaderConfig& config);
    ~PointReader();

    // Disable copy constructor and assignment
    PointReader(const PointReader&) = delete;
    PointReader& operator=(const PointReader&) = delete;

    /**
     * Read point features from file
     * @return true if successful, false otherwise
     */
    bool read();

    /**
     * Get all point features in file order
     * @return Vector of point features
     */
    const std::vector<extract::PointFeature>& getPointFeatures() const { return points_; }

    /**
     * Collect IDs that occur more than once, in order of first repetition
     * @return Duplicate IDs (empty if all IDs are unique)
     */
    std::vector<std::string> findDuplicateIds() const;

    /**
     * Get the coordinate system as WKT string
     * @return WKT string (empty if the layer declares none)
     */
    std::string getCoordinateSystemWKT() const { return coordinate_system_wkt_; }

    std::string getLastError() const { return last_error_; }

private:
    PointReaderConfig config_;
    GDALDatasetH dataset_;
    std::vector<extract::PointFeature> points_;

    // Coordinate system information
    std::string coordinate_system_wkt_;
    std::string last_error_;

    void initGDAL();

    /**
     * Read features from the configured layer
     * @return true if successful, false otherwise
     */
    bool readFeatures();

    /**
     * Get a field value as text; OGR date fields are rendered as YYYY-MM-DD
     * @param feature OGR feature handle
     * @param field_idx Field index
     * @return Field text (empty if unset or null)
     */
    std::string getFieldValueAsString(OGRFeatureH feature, int field_idx) const;
};

} // namespace io
} // namespace climextract

#endif // CLIMEXTRACT_POINT_READER_HPP
