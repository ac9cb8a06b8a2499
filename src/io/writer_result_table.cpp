#include "io/writer_result_table.hpp"
#include "io/gdal_utils.hpp"
#include <gdal.h>
#include <ogr_api.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <iostream>
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

namespace climextract {
namespace io {

ResultTableWriter::ResultTableWriter() {
    // Register GDAL drivers
    GDALAllRegister();
}

bool ResultTableWriter::writeResultTable(const ResultTableWriterConfig& config, const extract::ResultTable& table) {
    last_error_.clear();

    if (!GDALUtils::isDriverAvailable("CSV")) {
        last_error_ = "GDAL CSV driver is not available";
        return false;
    }

    // Ensure the output directory exists and no stale file blocks creation
    try {
        fs::path output_path(config.output_file_path);
        if (output_path.has_parent_path() && !fs::exists(output_path.parent_path())) {
            fs::create_directories(output_path.parent_path());
            std::cout << "Created output directory: " << output_path.parent_path().string() << std::endl;
        }
        if (fs::exists(output_path)) {
            fs::remove(output_path);
        }
    } catch (const fs::filesystem_error& e) {
        last_error_ = "Failed to prepare output path " + config.output_file_path + ": " + e.what();
        return false;
    }

    GDALDatasetH dataset = createDataset(config.output_file_path, table);
    if (!dataset) {
        return false;
    }

    OGRLayerH layer = GDALDatasetGetLayer(dataset, 0);
    if (!layer) {
        last_error_ = "Failed to get layer from CSV dataset";
        GDALClose(dataset);
        return false;
    }

    OGRFeatureDefnH layer_defn = OGR_L_GetLayerDefn(layer);
    bool success = true;

    for (size_t row_index = 0; row_index < table.rows.size() && success; ++row_index) {
        const auto& row = table.rows[row_index];
        if (row.size() != table.header.size()) {
            last_error_ = "Row " + std::to_string(row_index + 1) + " has " + std::to_string(row.size())
                          + " cells but the header has " + std::to_string(table.header.size()) + " columns";
            success = false;
            break;
        }

        OGRFeatureH feature = OGR_F_Create(layer_defn);
        for (size_t col = 0; col < row.size(); ++col) {
            if (!row[col].empty()) {
                OGR_F_SetFieldString(feature, static_cast<int>(col), row[col].c_str());
            }
        }

        if (OGR_L_CreateFeature(layer, feature) != OGRERR_NONE) {
            last_error_ = "Failed to write row " + std::to_string(row_index + 1) + ": " + CPLGetLastErrorMsg();
            success = false;
        }
        OGR_F_Destroy(feature);
    }

    // Closing flushes the file
    GDALClose(dataset);

    if (success) {
        std::cout << "Wrote " << table.rows.size() << " rows to " << config.output_file_path << std::endl;
    }
    return success;
}

GDALDatasetH ResultTableWriter::createDataset(const std::string& output_file_path, const extract::ResultTable& table) {
    GDALDriverH driver = GDALGetDriverByName("CSV");
    if (!driver) {
        last_error_ = "Failed to get GDAL driver for format: CSV";
        return nullptr;
    }

    GDALDatasetH dataset = GDALCreate(driver, output_file_path.c_str(), 0, 0, 0, GDT_Unknown, nullptr);
    if (!dataset) {
        last_error_ = "Failed to create GDAL dataset: " + output_file_path;
        return nullptr;
    }

    // Quote only where the CSV syntax requires it
    char** layer_options = nullptr;
    layer_options = CSLSetNameValue(layer_options, "STRING_QUOTING", "IF_NEEDED");

    std::string layer_name = fs::path(output_file_path).stem().string();
    OGRLayerH layer = GDALDatasetCreateLayer(dataset, layer_name.c_str(), nullptr, wkbNone, layer_options);
    CSLDestroy(layer_options);

    if (!layer) {
        last_error_ = "Failed to create layer in dataset";
        GDALClose(dataset);
        return nullptr;
    }

    // Create fields
    for (const auto& column : table.header) {
        OGRFieldDefnH field = OGR_Fld_Create(column.c_str(), OFTString);
        OGRErr err = OGR_L_CreateField(layer, field, 1);
        OGR_Fld_Destroy(field);
        if (err != OGRERR_NONE) {
            last_error_ = "Failed to create field '" + column + "'";
            GDALClose(dataset);
            return nullptr;
        }
    }

    return dataset;
}

} // namespace io
} // namespace climextract
