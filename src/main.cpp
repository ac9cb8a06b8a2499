#include <iostream>
#include <string>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>
#include "tool/tool_interface.hpp"

using namespace tool_interface;


void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --point-file-path <path> --raster-file-path <path> --variable <kind> --start-period <YYYY-MM> [options]\n"
              << "\nRequired arguments (may also come from --config):\n"
              << "  --point-file-path <path>     Path to the point file (observation locations)\n"
              << "  --raster-file-path <path>    Path to the multi-band monthly raster\n"
              << "  --variable <kind>            Variable kind: 'temp' (Kelvin to Celsius) or 'precip' (metres to millimetres)\n"
              << "  --start-period <YYYY-MM>     Year and month covered by raster band 1\n"
              << "\nOptional arguments:\n"
              << "  --id-field <name>            Field name for the unique point ID (default: OBS_NUM)\n"
              << "  --name-field <name>          Field name for the point name (default: OBS_NAME)\n"
              << "  --date-field <name>          Field name for the observation date (default: OBS_DATE)\n"
              << "  --standard-date              Observation dates are YYYY-MM-DD (default: MM/DD/YYYY)\n"
              << "  --output-dir <path>          Output directory, created if absent (default: output)\n"
              << "  --point-layer-index <index>  Layer index in the point file (default: 0)\n"
              << "  --no-plot                    Do not write the overlay image\n"
              << "  --config <path>              JSON file with the same settings (snake_case keys)\n"
              << "\nExamples:\n"
              << "  " << programName << " --point-file-path stations.geojson --raster-file-path era5_t2m.grib --variable temp --start-period 2018-01\n"
              << "  " << programName << " --config run.json --output-dir results\n"
              << "\nUse --help for detailed parameter explanations and examples.\n"
              << "Use --version to display version information.\n";
}

void printDetailedHelp(const char* programName) {
    std::cout << "ClimExtract - Point Climate Time Series Extraction Tool\n"
              << "=======================================================\n\n"
              << "ClimExtract samples a monthly multi-band climate raster (one band per calendar month,\n"
              << "no gaps) at a set of observation points, converts the values to physical units and\n"
              << "matches each point's own observation month.\n\n"
              << "OUTPUT:\n"
              << "  {variable}_{today YYYY-MM-DD}.csv in the output directory with the columns\n"
              << "  ID, NAME, DATE, RASTER_ROW, RASTER_COL, one YM-YYYY-MM column per band, MATCH_VALUE.\n"
              << "  Points outside the raster have empty values. MATCH_VALUE is empty when the\n"
              << "  observation month is not covered by the raster or the date cannot be parsed.\n"
              << "  {variable}_{today}_overlay.png shows band 1 with the points as black markers.\n\n"
              << "   Required Arguments:\n"
              << "     --point-file-path <path>    Path to the point file (any OGR vector format)\n"
              << "     --raster-file-path <path>   Path to the raster (any GDAL raster format)\n"
              << "     --variable <kind>           'temp' or 'precip'\n"
              << "     --start-period <YYYY-MM>    Month of band 1\n\n"
              << "   Optional Arguments:\n"
              << "     --id-field <name>           Unique point ID field (default: OBS_NUM)\n"
              << "     --name-field <name>         Point name field (default: OBS_NAME)\n"
              << "     --date-field <name>         Observation date field (default: OBS_DATE)\n"
              << "     --standard-date             Dates are YYYY-MM-DD instead of MM/DD/YYYY\n"
              << "     --output-dir <path>         Output directory (default: output)\n"
              << "     --point-layer-index <index> Point layer index (default: 0)\n"
              << "     --no-plot                   Skip the overlay image\n"
              << "     --config <path>             JSON configuration file; command line values take precedence\n"
              << "     --standard-date and --no-plot are switches and never consume the next argument\n\n"
              << "   Example:\n"
              << "     " << programName << " --point-file-path stations.gpkg --raster-file-path era5_tp.nc --variable precip --start-period 2019-06 --standard-date\n\n"
              << "CONFIGURATION FILE:\n"
              << "  {\n"
              << "    \"point_file_path\": \"stations.geojson\",\n"
              << "    \"raster_file_path\": \"era5_t2m.grib\",\n"
              << "    \"variable\": \"temp\",\n"
              << "    \"start_period\": \"2018-01\",\n"
              << "    \"id_field\": \"OBS_NUM\",\n"
              << "    \"standard_date\": false,\n"
              << "    \"output_dir\": \"output\",\n"
              << "    \"plot\": true\n"
              << "  }\n\n"
              << "INPUT DATASET RECOMMENDATIONS:\n\n"
              << "Coordinate System:\n"
              << "  - Points and raster are expected in WGS84 (EPSG:4326); no reprojection is done\n"
              << "  - A raster without a coordinate system is assumed to be WGS84\n\n"
              << "Point Dataset:\n"
              << "  - Point geometries only; the unique ID field must not contain duplicates\n\n"
              << "OTHER OPTIONS:\n"
              << "  --help, -h     Show this detailed help message\n"
              << "  --version, -v  Show version information\n";
}

nlohmann::json loadConfigFile(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }
    nlohmann::json config = nlohmann::json::parse(input);
    if (!config.is_object()) {
        throw std::runtime_error("Configuration file must contain a JSON object: " + path);
    }
    return config;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto args = parseCommandLineArgs(argc, argv);

        // Check for help flag first
        if (args.count("help") > 0 || args.count("h") > 0) {
            printDetailedHelp(argv[0]);
            return 0;
        }

        // Check for version flag
        if (args.count("version") > 0 || args.count("v") > 0) {
            std::cout << "ClimExtract v1.0.0\n";
            std::cout << "Point Climate Time Series Extraction Tool\n";
            std::cout << "MIT License\n";
            return 0;
        }

        // Settings from the configuration file, overridden by the command line
        nlohmann::json settings = nlohmann::json::object();
        if (args.count("config")) {
            settings = loadConfigFile(args.at("config"));
        }

        const std::pair<const char*, const char*> cli_keys[] = {
            {"point-file-path", "point_file_path"},
            {"raster-file-path", "raster_file_path"},
            {"variable", "variable"},
            {"start-period", "start_period"},
            {"id-field", "id_field"},
            {"name-field", "name_field"},
            {"date-field", "date_field"},
            {"output-dir", "output_dir"},
        };
        for (const auto& key : cli_keys) {
            if (args.count(key.first)) {
                settings[key.second] = args.at(key.first);
            }
        }
        if (args.count("point-layer-index")) {
            settings["point_layer_index"] = std::stoi(args.at("point-layer-index"));
        }
        if (args.count("standard-date")) {
            settings["standard_date"] = true;
        }
        if (args.count("no-plot")) {
            settings["plot"] = false;
        }

        // Check for required arguments
        const std::pair<const char*, const char*> required[] = {
            {"point_file_path", "--point-file-path"},
            {"raster_file_path", "--raster-file-path"},
            {"variable", "--variable"},
            {"start_period", "--start-period"},
        };
        for (const auto& key : required) {
            if (!settings.contains(key.first)) {
                std::cerr << "Error: " << key.second << " is required" << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        // Convert settings to JSON configurations
        nlohmann::json writer_config = nlohmann::json::object();
        if (settings.contains("output_dir")) writer_config["output_dir"] = settings["output_dir"];
        if (settings.contains("plot")) writer_config["plot"] = settings["plot"];

        nlohmann::json point_config = nlohmann::json::object();
        point_config["file_path"] = settings["point_file_path"];
        if (settings.contains("point_layer_index")) point_config["layer_index"] = settings["point_layer_index"];
        if (settings.contains("id_field")) point_config["id_field"] = settings["id_field"];
        if (settings.contains("name_field")) point_config["name_field"] = settings["name_field"];
        if (settings.contains("date_field")) point_config["date_field"] = settings["date_field"];

        nlohmann::json raster_config = nlohmann::json::object();
        raster_config["file_path"] = settings["raster_file_path"];

        nlohmann::json extraction_config = nlohmann::json::object();
        extraction_config["variable"] = settings["variable"];
        extraction_config["start_period"] = settings["start_period"];
        if (settings.contains("standard_date")) extraction_config["standard_date"] = settings["standard_date"];

        std::string result = processClimateExtractionTool(
            writer_config.dump(),
            point_config.dump(),
            raster_config.dump(),
            extraction_config.dump()
        );

        std::cout << result << std::endl;

        // Check if result indicates an error
        if (result.substr(0, 5) == "Error") {
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
