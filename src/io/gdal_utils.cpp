#include "io/gdal_utils.hpp"
#include <gdal.h>
#include <algorithm>
#include <iostream>
#include <cstring>
#include <boost/filesystem.hpp>

namespace climextract {
namespace io {

namespace fs = boost::filesystem;

bool GDALUtils::isDriverAvailable(const std::string& driver_name, bool via_create_copy) {
    GDALAllRegister();

    GDALDriverH driver = GDALGetDriverByName(driver_name.c_str());
    if (!driver) {
        std::cout << "WARNING: GDAL driver '" << driver_name << "' is not available." << std::endl;
        return false;
    }

    // Check if the driver supports writing the way it will be used
    const char* capability = via_create_copy ? GDAL_DCAP_CREATECOPY : GDAL_DCAP_CREATE;
    const char* support = GDALGetMetadataItem(driver, capability, nullptr);
    if (!support || strcmp(support, "YES") != 0) {
        // Drivers that implement Create also work through CreateCopy
        const char* create_support = GDALGetMetadataItem(driver, GDAL_DCAP_CREATE, nullptr);
        if (!via_create_copy || !create_support || strcmp(create_support, "YES") != 0) {
            std::cout << "WARNING: GDAL driver '" << driver_name << "' does not support creation." << std::endl;
            return false;
        }
    }

    return true;
}

std::string GDALUtils::determineImageFormatAndModifyPath(std::string& file_path) {
    fs::path path(file_path);
    std::string extension = path.extension().string();

    // Convert to lowercase for case-insensitive comparison
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);

    std::string format;
    bool needs_modification = false;

    if (extension == ".png") {
        if (isDriverAvailable("PNG", true)) {
            format = "PNG";
        } else {
            format = "GTiff";
            needs_modification = true;
        }
    } else if (extension == ".jpg" || extension == ".jpeg") {
        if (isDriverAvailable("JPEG", true)) {
            format = "JPEG";
        } else {
            format = "GTiff";
            needs_modification = true;
        }
    } else if (extension == ".tif" || extension == ".tiff") {
        format = "GTiff";
    } else {
        // Unknown extension, default to GeoTIFF
        format = "GTiff";
        needs_modification = true;
    }

    // Modify file path if format fallback occurred
    if (needs_modification) {
        std::string new_path = path.replace_extension(".tif").string();
        std::cout << "WARNING: Changing output file extension from '" << extension
                  << "' to '.tif' due to format fallback." << std::endl;
        std::cout << "New output file: " << new_path << std::endl;
        file_path = new_path;
    }

    return format;
}

} // namespace io
} // namespace climextract
