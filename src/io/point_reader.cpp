#include "io/point_reader.hpp"
#include "io/coordinate_system_utils.hpp"
#include <gdal.h>
#include <ogr_api.h>
#include <iostream>
#include <cstdio>
#include <unordered_map>

namespace climextract {
namespace io {

PointReader::PointReader(const PointReaderConfig& config)
    : config_(config), dataset_(nullptr) {
    initGDAL();
}

PointReader::~PointReader() {
    points_.clear();

    if (dataset_) {
        GDALClose(dataset_);
        dataset_ = nullptr;
    }
}

void PointReader::initGDAL() {
    GDALAllRegister();
}

bool PointReader::read() {
    // Clear any existing features
    points_.clear();
    last_error_.clear();

    // Close any existing dataset
    if (dataset_) {
        GDALClose(dataset_);
        dataset_ = nullptr;
    }

    dataset_ = GDALOpenEx(config_.file_path.c_str(), GDAL_OF_VECTOR, nullptr, nullptr, nullptr);
    if (!dataset_) {
        last_error_ = "Failed to open point file: " + config_.file_path;
        std::cerr << last_error_ << std::endl;
        return false;
    }

    return readFeatures();
}

bool PointReader::readFeatures() {
    points_.clear();

    // Check if layer index is valid
    int layer_count = GDALDatasetGetLayerCount(dataset_);
    if (config_.layer_index < 0 || config_.layer_index >= layer_count) {
        last_error_ = "Layer index " + std::to_string(config_.layer_index) + " is out of range. Dataset has "
                      + std::to_string(layer_count) + " layers.";
        std::cerr << "Error: " << last_error_ << std::endl;
        return false;
    }

    OGRLayerH layer = GDALDatasetGetLayer(dataset_, config_.layer_index);
    if (!layer) {
        last_error_ = "No layer found at index " + std::to_string(config_.layer_index) + " in point dataset";
        std::cerr << last_error_ << std::endl;
        return false;
    }

    // Print layer info
    std::cout << "Point layer " << config_.layer_index << " name: " << OGR_L_GetName(layer) << std::endl;
    std::cout << "Point feature count: " << OGR_L_GetFeatureCount(layer, 1) << std::endl;

    coordinate_system_wkt_ = CoordinateSystemUtils::getCoordinateSystemWKT(layer);
    std::cout << "Point dataset coordinate system: "
              << CoordinateSystemUtils::describeCoordinateSystem(coordinate_system_wkt_) << std::endl;

    // All three attribute columns are required
    OGRFeatureDefnH layer_defn = OGR_L_GetLayerDefn(layer);
    int id_idx = OGR_FD_GetFieldIndex(layer_defn, config_.id_field.c_str());
    int name_idx = OGR_FD_GetFieldIndex(layer_defn, config_.name_field.c_str());
    int date_idx = OGR_FD_GetFieldIndex(layer_defn, config_.date_field.c_str());

    std::string missing;
    if (id_idx < 0) missing += " '" + config_.id_field + "'";
    if (name_idx < 0) missing += " '" + config_.name_field + "'";
    if (date_idx < 0) missing += " '" + config_.date_field + "'";
    if (!missing.empty()) {
        last_error_ = "Point layer is missing required field(s):" + missing;
        std::cerr << "Error: " << last_error_ << std::endl;
        return false;
    }

    OGR_L_ResetReading(layer);

    size_t skipped = 0;
    OGRFeatureH feature = nullptr;
    while ((feature = OGR_L_GetNextFeature(layer)) != nullptr) {
        GIntBig fid = OGR_F_GetFID(feature);

        if (!OGR_F_IsFieldSetAndNotNull(feature, id_idx)) {
            std::cerr << "Warning: Feature " << fid << " has no value in ID field '" << config_.id_field
                      << "'. Skipping." << std::endl;
            ++skipped;
            OGR_F_Destroy(feature);
            continue;
        }

        OGRGeometryH geom = OGR_F_GetGeometryRef(feature);
        if (!geom || OGR_G_IsEmpty(geom) || wkbFlatten(OGR_G_GetGeometryType(geom)) != wkbPoint) {
            std::cerr << "Warning: Feature " << fid << " does not have a point geometry. Skipping." << std::endl;
            ++skipped;
            OGR_F_Destroy(feature);
            continue;
        }

        extract::Point point(OGR_G_GetX(geom, 0), OGR_G_GetY(geom, 0));

        points_.emplace_back(getFieldValueAsString(feature, id_idx),
                             getFieldValueAsString(feature, name_idx),
                             getFieldValueAsString(feature, date_idx),
                             point);

        OGR_F_Destroy(feature);
    }

    if (skipped > 0) {
        std::cerr << "Warning: Skipped " << skipped << " point features" << std::endl;
    }

    // Check if we have any valid points
    if (points_.empty()) {
        last_error_ = "No valid point features found in dataset";
        std::cerr << "Error: " << last_error_ << std::endl;
        return false;
    }

    std::cout << "Successfully read " << points_.size() << " point features" << std::endl;
    return true;
}

std::string PointReader::getFieldValueAsString(OGRFeatureH feature, int field_idx) const {
    if (!OGR_F_IsFieldSetAndNotNull(feature, field_idx)) {
        return "";
    }

    OGRFieldDefnH field_defn = OGR_F_GetFieldDefnRef(feature, field_idx);
    OGRFieldType field_type = OGR_Fld_GetType(field_defn);

    if (field_type == OFTDate || field_type == OFTDateTime) {
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, tz_flag = 0;
        float second = 0.0f;
        if (OGR_F_GetFieldAsDateTimeEx(feature, field_idx, &year, &month, &day,
                                       &hour, &minute, &second, &tz_flag)) {
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
            return std::string(buffer);
        }
    }

    const char* value = OGR_F_GetFieldAsString(feature, field_idx);
    return value ? std::string(value) : "";
}

std::vector<std::string> PointReader::findDuplicateIds() const {
    std::unordered_map<std::string, size_t> occurrences;
    std::vector<std::string> duplicates;

    for (const auto& point : points_) {
        size_t count = ++occurrences[point.id];
        if (count == 2) {
            duplicates.push_back(point.id);
        }
    }

    return duplicates;
}

} // namespace io
} // namespace climextract
