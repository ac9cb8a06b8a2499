#include <iostream>
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <boost/filesystem.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

#include "tool/tool_interface.hpp"
#include "extract/climate_extraction.hpp"
#include "extract/period.hpp"
#include "extract/unit_converter.hpp"
#include "io/writer_result_table.hpp"
#include "io/writer_overlay_plot.hpp"

using namespace climextract;
namespace fs = boost::filesystem;

namespace tool_interface {

namespace {

// Accept JSON booleans as well as the "true"/"false" strings the CLI produces
bool parseFlag(const nlohmann::json& value, const std::string& key) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        std::string text = value.get<std::string>();
        if (text == "true" || text == "1") return true;
        if (text == "false" || text == "0") return false;
    }
    throw std::invalid_argument("'" + key + "' must be true or false");
}

} // namespace

io::PointReaderConfig parsePointReaderConfig(const nlohmann::json& config_json) {
    io::PointReaderConfig config;

    if (config_json.contains("file_path")) {
        config.file_path = config_json["file_path"].get<std::string>();
    }
    if (config_json.contains("layer_index")) {
        config.layer_index = config_json["layer_index"].get<int>();
    }
    if (config_json.contains("id_field")) {
        config.id_field = config_json["id_field"].get<std::string>();
    }
    if (config_json.contains("name_field")) {
        config.name_field = config_json["name_field"].get<std::string>();
    }
    if (config_json.contains("date_field")) {
        config.date_field = config_json["date_field"].get<std::string>();
    }

    return config;
}

io::RasterReaderConfig parseRasterReaderConfig(const nlohmann::json& config_json) {
    io::RasterReaderConfig config;

    if (config_json.contains("file_path")) {
        config.file_path = config_json["file_path"].get<std::string>();
    }

    return config;
}

extract::ExtractionConfig parseExtractionConfig(const nlohmann::json& config_json) {
    extract::ExtractionConfig config;

    if (!config_json.contains("variable")) {
        throw std::invalid_argument("variable kind is required (temp or precip)");
    }
    config.variable_kind = extract::parseVariableKind(config_json["variable"].get<std::string>());

    if (!config_json.contains("start_period")) {
        throw std::invalid_argument("start period is required (YYYY-MM)");
    }
    config.start_period = extract::parsePeriod(config_json["start_period"].get<std::string>());

    if (config_json.contains("standard_date")) {
        bool standard_date = parseFlag(config_json["standard_date"], "standard_date");
        config.date_format = standard_date ? extract::DateFormat::STANDARD : extract::DateFormat::MONTH_DAY_YEAR;
    }

    return config;
}

WriterSettings parseWriterSettings(const nlohmann::json& config_json) {
    WriterSettings settings;

    if (config_json.contains("output_dir")) {
        settings.output_dir = config_json["output_dir"].get<std::string>();
    }
    if (config_json.contains("plot")) {
        settings.plot = parseFlag(config_json["plot"], "plot");
    }

    return settings;
}

std::unordered_map<std::string, std::string> parseCommandLineArgs(int argc, const char* const argv[]) {
    static const std::unordered_set<std::string> switches = {"standard-date", "no-plot", "help", "version"};
    std::unordered_map<std::string, std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "-v") {
            args[arg.substr(1)] = "true";
        } else if (arg.substr(0, 2) == "--") {
            std::string key = arg.substr(2);

            if (switches.count(key) == 0 && i + 1 < argc && argv[i + 1][0] != '-') {
                args[key] = argv[i + 1];
                i++; // Skip the value in next iteration
            } else {
                args[key] = "true";
            }
        }
    }

    return args;
}

std::string buildOutputFilePath(const std::string& output_dir, extract::VariableKind kind) {
    std::string today = boost::gregorian::to_iso_extended_string(boost::gregorian::day_clock::local_day());
    fs::path path = fs::path(output_dir) / (extract::variableKindName(kind) + "_" + today + ".csv");
    return path.string();
}

// Climate Extraction Tool
std::string processClimateExtractionTool(
    const std::string& writer_config_json,
    const std::string& point_config_json,
    const std::string& raster_config_json,
    const std::string& extraction_config_json) {

    try {
        // Parse configurations
        nlohmann::json writer_config = nlohmann::json::parse(writer_config_json);
        nlohmann::json point_config = nlohmann::json::parse(point_config_json);
        nlohmann::json raster_config = nlohmann::json::parse(raster_config_json);
        nlohmann::json extraction_config = nlohmann::json::parse(extraction_config_json);

        // Create configurations; invalid values abort here, before any file is opened
        WriterSettings writer_settings = parseWriterSettings(writer_config);
        io::PointReaderConfig point_cfg = parsePointReaderConfig(point_config);
        io::RasterReaderConfig raster_cfg = parseRasterReaderConfig(raster_config);
        extract::ExtractionConfig extraction_cfg = parseExtractionConfig(extraction_config);

        if (point_cfg.file_path.empty()) {
            return "Error: Point file path is required";
        }
        if (raster_cfg.file_path.empty()) {
            return "Error: Raster file path is required";
        }

        // Run extraction
        extract::ClimateExtraction extraction(extraction_cfg);
        if (!extraction.processExtractionMode(point_cfg, raster_cfg)) {
            return "Error: " + extraction.getLastError();
        }

        extract::ResultTable table = extraction.buildResultTable();

        // Write results
        io::ResultTableWriterConfig table_cfg;
        table_cfg.output_file_path = buildOutputFilePath(writer_settings.output_dir, extraction_cfg.variable_kind);

        io::ResultTableWriter table_writer;
        if (!table_writer.writeResultTable(table_cfg, table)) {
            return "Error: Failed to write result table: " + table_writer.getLastError();
        }

        // Diagnostic overlay of band 1; failure does not affect the result table
        if (writer_settings.plot && extraction.getFirstBand()) {
            std::vector<extract::CellAddress> addresses;
            for (const auto& record : extraction.getResults()) {
                addresses.push_back(record.cell);
            }

            io::OverlayPlotWriterConfig overlay_cfg;
            fs::path table_path(table_cfg.output_file_path);
            overlay_cfg.output_file_path =
                (table_path.parent_path() / (table_path.stem().string() + "_overlay.png")).string();

            io::OverlayPlotWriter overlay_writer;
            if (!overlay_writer.writeOverlay(overlay_cfg, *extraction.getFirstBand(), addresses)) {
                std::cerr << "Warning: Failed to write overlay image: " << overlay_writer.getLastError() << std::endl;
            }
        }

        const extract::ExtractionSummary& summary = extraction.getSummary();
        std::string kind_name = extract::variableKindName(extraction_cfg.variable_kind);

        // Row count includes the header row
        return "Success: Done, wrote " + std::to_string(table.rows.size() + 1) + " rows with "
               + std::to_string(table.getColumnCount()) + " values for " + kind_name + " data to "
               + table_cfg.output_file_path
               + " (" + std::to_string(summary.point_count) + " points, "
               + std::to_string(summary.band_count) + " bands, "
               + std::to_string(summary.out_of_grid_count) + " outside the raster, "
               + std::to_string(summary.out_of_range_count) + " observation dates out of range, "
               + std::to_string(summary.date_parse_failure_count) + " unparseable dates)";

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

} // namespace tool_interface
