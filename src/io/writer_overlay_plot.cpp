#include "io/writer_overlay_plot.hpp"
#include "io/gdal_utils.hpp"
#include <gdal.h>
#include <cpl_error.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

namespace climextract {
namespace io {

namespace {

bool isValidCell(double value, const extract::BandGrid& band) {
    if (!std::isfinite(value)) {
        return false;
    }
    return !(band.nodata_value && value == *band.nodata_value);
}

} // namespace

OverlayPlotWriter::OverlayPlotWriter() {
    // Register GDAL drivers
    GDALAllRegister();
}

std::vector<unsigned char> OverlayPlotWriter::renderGrayscale(const extract::BandGrid& band) {
    double min_value = std::numeric_limits<double>::max();
    double max_value = std::numeric_limits<double>::lowest();
    for (double value : band.values) {
        if (isValidCell(value, band)) {
            min_value = std::min(min_value, value);
            max_value = std::max(max_value, value);
        }
    }

    std::vector<unsigned char> pixels(band.values.size(), 255);
    const double range = max_value - min_value;
    for (size_t i = 0; i < band.values.size(); ++i) {
        double value = band.values[i];
        if (!isValidCell(value, band)) {
            continue;
        }
        double scaled = range > 0.0 ? 1.0 + (value - min_value) / range * 254.0 : 128.0;
        pixels[i] = static_cast<unsigned char>(std::lround(scaled));
    }
    return pixels;
}

bool OverlayPlotWriter::writeOverlay(const OverlayPlotWriterConfig& config, const extract::BandGrid& band,
                                     const std::vector<extract::CellAddress>& addresses) {
    last_error_.clear();

    if (band.width <= 0 || band.height <= 0 || band.values.empty()) {
        last_error_ = "Band is empty; nothing to plot";
        return false;
    }

    std::vector<unsigned char> pixels = renderGrayscale(band);

    // Draw point markers
    for (const auto& address : addresses) {
        if (!address.isWithin(band.height, band.width)) {
            continue;
        }
        for (long dr = -config.marker_radius; dr <= config.marker_radius; ++dr) {
            for (long dc = -config.marker_radius; dc <= config.marker_radius; ++dc) {
                extract::CellAddress cell(address.row + dr, address.col + dc);
                if (cell.isWithin(band.height, band.width)) {
                    pixels[static_cast<size_t>(cell.row) * static_cast<size_t>(band.width)
                           + static_cast<size_t>(cell.col)] = 0;
                }
            }
        }
    }

    std::string output_file_path = config.output_file_path;
    std::string format = GDALUtils::determineImageFormatAndModifyPath(output_file_path);

    GDALDriverH mem_driver = GDALGetDriverByName("MEM");
    GDALDriverH out_driver = GDALGetDriverByName(format.c_str());
    if (!mem_driver || !out_driver) {
        last_error_ = "Failed to get GDAL driver for format: " + format;
        return false;
    }

    try {
        fs::path output_path(output_file_path);
        if (output_path.has_parent_path() && !fs::exists(output_path.parent_path())) {
            fs::create_directories(output_path.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        last_error_ = "Failed to create output directory for " + output_file_path + ": " + e.what();
        return false;
    }

    GDALDatasetH mem_dataset = GDALCreate(mem_driver, "", band.width, band.height, 1, GDT_Byte, nullptr);
    if (!mem_dataset) {
        last_error_ = "Failed to create in-memory image";
        return false;
    }

    GDALRasterBandH mem_band = GDALGetRasterBand(mem_dataset, 1);
    CPLErr err = GDALRasterIO(mem_band, GF_Write, 0, 0, band.width, band.height,
                              pixels.data(), band.width, band.height, GDT_Byte, 0, 0);
    if (err != CE_None) {
        last_error_ = "Failed to fill in-memory image: " + std::string(CPLGetLastErrorMsg());
        GDALClose(mem_dataset);
        return false;
    }

    GDALDatasetH out_dataset = GDALCreateCopy(out_driver, output_file_path.c_str(), mem_dataset,
                                              FALSE, nullptr, nullptr, nullptr);
    GDALClose(mem_dataset);
    if (!out_dataset) {
        last_error_ = "Failed to write overlay image " + output_file_path + ": " + CPLGetLastErrorMsg();
        return false;
    }
    GDALClose(out_dataset);

    std::cout << "Wrote overlay of band " << band.band_index << " to " << output_file_path << std::endl;
    return true;
}

} // namespace io
} // namespace climextract
