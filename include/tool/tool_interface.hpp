#ifndef CLIMEXTRACT_TOOL_INTERFACE_HPP
#define CLIMEXTRACT_TOOL_INTERFACE_HPP

#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "extract/climate_extraction.hpp"
#include "io/point_reader.hpp"
#include "io/raster_reader.hpp"

namespace tool_interface {

/**
 * Output settings of one run
 */
struct WriterSettings {
    std::string output_dir;     // Directory receiving the CSV and the overlay image
    bool plot;                  // Write the band 1 overlay image

    WriterSettings() : output_dir("output"), plot(true) {}
};

/**
 * Parse the point reader configuration
 * Keys: file_path, layer_index, id_field, name_field, date_field
 */
climextract::io::PointReaderConfig parsePointReaderConfig(const nlohmann::json& config_json);

/**
 * Parse the raster reader configuration
 * Keys: file_path
 */
climextract::io::RasterReaderConfig parseRasterReaderConfig(const nlohmann::json& config_json);

/**
 * Parse and validate the extraction configuration
 * Keys: variable ("temp" | "precip"), start_period ("YYYY-MM"), standard_date (bool)
 * @throws std::invalid_argument if the variable kind or the start period is missing or invalid
 */
climextract::extract::ExtractionConfig parseExtractionConfig(const nlohmann::json& config_json);

/**
 * Parse the writer configuration
 * Keys: output_dir, plot
 */
WriterSettings parseWriterSettings(const nlohmann::json& config_json);

/**
 * Split the command line into "--key value" pairs. The switches --standard-date,
 * --no-plot, --help and --version never take a value; any other key without a
 * value maps to "true"
 */
std::unordered_map<std::string, std::string> parseCommandLineArgs(int argc, const char* const argv[]);

/**
 * Output CSV path for a run: {output_dir}/{kind}_{today YYYY-MM-DD}.csv
 */
std::string buildOutputFilePath(const std::string& output_dir, climextract::extract::VariableKind kind);

/**
 * Climate Extraction Tool
 * Samples a monthly raster at the points, matches each point's observation month
 * and writes the result table as CSV (plus an optional overlay image)
 * @param writer_config_json JSON string for writer configuration (output_dir, plot)
 * @param point_config_json JSON string for point reader configuration
 * @param raster_config_json JSON string for raster reader configuration
 * @param extraction_config_json JSON string for extraction configuration (variable, start_period, standard_date)
 * @return Result message (success or error)
 */
std::string processClimateExtractionTool(
    const std::string& writer_config_json,
    const std::string& point_config_json,
    const std::string& raster_config_json,
    const std::string& extraction_config_json
);

} // namespace tool_interface

#endif // CLIMEXTRACT_TOOL_INTERFACE_HPP
