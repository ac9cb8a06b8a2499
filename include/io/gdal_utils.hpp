#ifndef CLIMEXTRACT_GDAL_UTILS_HPP
#define CLIMEXTRACT_GDAL_UTILS_HPP

#include <string>

namespace climextract {
namespace io {

/**
 * GDAL utility functions for format detection and validation
 */
class GDALUtils {
public:
    /**
     * Check if a specific GDAL driver is available and can write files
     * @param driver_name GDAL driver name
     * @param via_create_copy true if the driver is used through GDALCreateCopy rather than GDALCreate
     * @return true if driver is available and supports writing, false otherwise
     */
    static bool isDriverAvailable(const std::string& driver_name, bool via_create_copy = false);

    /**
     * Determine GDAL image format and modify file path if driver is not available
     * @param file_path File path with extension (will be modified if format fallback occurs)
     * @return GDAL format string
     */
    static std::string determineImageFormatAndModifyPath(std::string& file_path);

private:
    // Disable instantiation
    GDALUtils() = delete;
};

} // namespace io
} // namespace climextract

#endif // CLIMEXTRACT_GDAL_UTILS_HPP
