#include "io/coordinate_system_utils.hpp"
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_spatialref.h>
#include <cpl_conv.h>
#include <iostream>

namespace climextract {
namespace io {

bool CoordinateSystemUtils::isEPSG4326(OGRSpatialReferenceH spatial_ref) {
    if (!spatial_ref) {
        return false;
    }

    // Check if it's WGS84
    OGRSpatialReferenceH wgs84 = OSRNewSpatialReference(nullptr);
    OSRImportFromEPSG(wgs84, 4326);

    bool is_same = OSRIsSame(spatial_ref, wgs84);

    OSRDestroySpatialReference(wgs84);
    return is_same;
}

std::string CoordinateSystemUtils::getCoordinateSystemWKT(OGRLayerH layer) {
    if (!layer) {
        return "";
    }

    OGRSpatialReferenceH srs = OGR_L_GetSpatialRef(layer);
    if (!srs) {
        return "";
    }

    char* wkt = nullptr;
    OSRExportToWkt(srs, &wkt);
    std::string result = wkt ? std::string(wkt) : "";
    CPLFree(wkt);
    return result;
}

std::string CoordinateSystemUtils::describeCoordinateSystem(const std::string& wkt) {
    if (wkt.empty()) {
        return "undefined";
    }

    OGRSpatialReferenceH spatial_ref = OSRNewSpatialReference(nullptr);
    if (OSRSetFromUserInput(spatial_ref, wkt.c_str()) != OGRERR_NONE) {
        OSRDestroySpatialReference(spatial_ref);
        return "unparseable";
    }

    std::string description;
    OSRAutoIdentifyEPSG(spatial_ref);
    const char* authority_name = OSRGetAuthorityName(spatial_ref, nullptr);
    const char* authority_code = OSRGetAuthorityCode(spatial_ref, nullptr);
    if (authority_name && authority_code) {
        description = std::string(authority_name) + ":" + authority_code;
    } else {
        const char* name = OSRGetName(spatial_ref);
        description = name ? std::string(name) : "unnamed";
    }

    OSRDestroySpatialReference(spatial_ref);
    return description;
}

bool CoordinateSystemUtils::checkWGS84(const std::string& wkt, const std::string& dataset_label) {
    if (wkt.empty()) {
        std::cout << dataset_label << " declares no coordinate system; assuming WGS84 (EPSG:4326)" << std::endl;
        return true;
    }

    OGRSpatialReferenceH spatial_ref = OSRNewSpatialReference(nullptr);
    if (OSRSetFromUserInput(spatial_ref, wkt.c_str()) != OGRERR_NONE) {
        OSRDestroySpatialReference(spatial_ref);
        std::cerr << "Warning: " << dataset_label << " coordinate system could not be parsed; assuming WGS84" << std::endl;
        return false;
    }

    bool is_wgs84 = isEPSG4326(spatial_ref);
    if (!is_wgs84) {
        if (OSRIsGeographic(spatial_ref)) {
            std::cerr << "Warning: " << dataset_label << " uses geographic coordinate system '"
                      << describeCoordinateSystem(wkt) << "' rather than EPSG:4326; "
                      << "coordinates are used as WGS84 longitude/latitude" << std::endl;
        } else {
            std::cerr << "Warning: " << dataset_label << " uses projected coordinate system '"
                      << describeCoordinateSystem(wkt) << "'; no reprojection is performed and "
                      << "cell addresses will be wrong unless points share this system" << std::endl;
        }
    }

    OSRDestroySpatialReference(spatial_ref);
    return is_wgs84;
}

} // namespace io
} // namespace climextract
