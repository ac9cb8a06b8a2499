#include "tool/tool_interface.hpp"
#include "extract/temporal_sampler.hpp"
#include "io/raster_reader.hpp"
#include "io/writer_overlay_plot.hpp"

#include <gdal.h>
#include <ogr_api.h>
#include <ogr_srs_api.h>
#include <cpl_conv.h>

#include <cmath>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <boost/filesystem.hpp>

using namespace climextract;
namespace fs = boost::filesystem;

namespace {

const double kNoData = -9999.0;

int expect_true(bool cond, const std::string& message) {
    if (!cond) {
        std::cerr << "[extraction-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_row(const std::vector<std::string>& actual, const std::vector<std::string>& expected,
               const std::string& label) {
    if (actual != expected) {
        std::cerr << "[extraction-regression] FAIL: " << label << " actual=[";
        for (size_t i = 0; i < actual.size(); ++i) {
            std::cerr << (i > 0 ? "|" : "") << actual[i];
        }
        std::cerr << "]" << std::endl;
        return 1;
    }
    return 0;
}

// Split one CSV line, honouring double-quoted cells
std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> cells(1);
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\r') {
            continue;
        }
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                cells.back() += '"';
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == ',' && !quoted) {
            cells.emplace_back();
        } else {
            cells.back() += c;
        }
    }
    return cells;
}

std::vector<std::vector<std::string>> readCsv(const std::string& path) {
    std::vector<std::vector<std::string>> rows;
    std::ifstream input(path);
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line != "\r") {
            rows.push_back(splitCsvLine(line));
        }
    }
    return rows;
}

/**
 * 4 x 4 cells of 1 degree with the upper-left corner at 10E 50N, three monthly
 * bands in Kelvin; cell (2, 2) of band 2 is NoData
 */
bool writeMonthlyRaster(const std::string& path) {
    GDALAllRegister();
    GDALDriverH driver = GDALGetDriverByName("GTiff");
    if (!driver) {
        return false;
    }

    const int size = 4;
    GDALDatasetH dataset = GDALCreate(driver, path.c_str(), size, size, 3, GDT_Float64, nullptr);
    if (!dataset) {
        return false;
    }

    double geo_transform[6] = {10.0, 1.0, 0.0, 50.0, 0.0, -1.0};
    GDALSetGeoTransform(dataset, geo_transform);

    OGRSpatialReferenceH srs = OSRNewSpatialReference(nullptr);
    OSRImportFromEPSG(srs, 4326);
    char* wkt = nullptr;
    OSRExportToWkt(srs, &wkt);
    GDALSetProjection(dataset, wkt);
    CPLFree(wkt);
    OSRDestroySpatialReference(srs);

    const double kelvin[3] = {273.15, 283.15, 293.65};
    bool ok = true;
    for (int band_index = 1; band_index <= 3; ++band_index) {
        std::vector<double> values(size * size, kelvin[band_index - 1]);
        if (band_index == 2) {
            values[2 * size + 2] = kNoData;
        }
        GDALRasterBandH band = GDALGetRasterBand(dataset, band_index);
        GDALSetRasterNoDataValue(band, kNoData);
        if (GDALRasterIO(band, GF_Write, 0, 0, size, size, values.data(), size, size, GDT_Float64, 0, 0) != CE_None) {
            ok = false;
        }
    }

    GDALClose(dataset);
    return ok;
}

std::string pointFeature(const std::string& id_json, const std::string& name, const std::string& date,
                         double lon, double lat) {
    nlohmann::json feature = {
        {"type", "Feature"},
        {"properties", {{"OBS_NUM", nlohmann::json::parse(id_json)}, {"OBS_NAME", name}, {"OBS_DATE", date}}},
        {"geometry", {{"type", "Point"}, {"coordinates", {lon, lat}}}}
    };
    return feature.dump();
}

bool writePointFile(const std::string& path, const std::vector<std::string>& features) {
    std::ofstream output(path);
    output << "{\"type\": \"FeatureCollection\", \"features\": [";
    for (size_t i = 0; i < features.size(); ++i) {
        output << (i > 0 ? "," : "") << features[i];
    }
    output << "]}";
    return static_cast<bool>(output);
}

/**
 * Shapefile whose OBS_DATE field is a native date column
 */
bool writeDatedShapefile(const std::string& path) {
    GDALDriverH driver = GDALGetDriverByName("ESRI Shapefile");
    if (!driver) {
        return false;
    }
    GDALDatasetH dataset = GDALCreate(driver, path.c_str(), 0, 0, 0, GDT_Unknown, nullptr);
    if (!dataset) {
        return false;
    }
    OGRLayerH layer = GDALDatasetCreateLayer(dataset, "stations", nullptr, wkbPoint, nullptr);
    bool ok = layer != nullptr;

    const std::pair<const char*, OGRFieldType> fields[] = {
        {"OBS_NUM", OFTInteger}, {"OBS_NAME", OFTString}, {"OBS_DATE", OFTDate}};
    for (const auto& field : fields) {
        if (!ok) {
            break;
        }
        OGRFieldDefnH defn = OGR_Fld_Create(field.first, field.second);
        ok = OGR_L_CreateField(layer, defn, TRUE) == OGRERR_NONE;
        OGR_Fld_Destroy(defn);
    }

    struct Station { int id; const char* name; int year; int month; int day; double lon; double lat; };
    const Station stations[] = {
        {1, "Station A", 2018, 2, 10, 11.5, 48.5},
        {2, "Station B", 2020, 7, 4, 10.5, 49.5},
    };
    for (const auto& station : stations) {
        if (!ok) {
            break;
        }
        OGRFeatureH feature = OGR_F_Create(OGR_L_GetLayerDefn(layer));
        OGR_F_SetFieldInteger(feature, 0, station.id);
        OGR_F_SetFieldString(feature, 1, station.name);
        OGR_F_SetFieldDateTime(feature, 2, station.year, station.month, station.day, 0, 0, 0, 0);
        OGRGeometryH point = OGR_G_CreateGeometry(wkbPoint);
        OGR_G_SetPoint_2D(point, 0, station.lon, station.lat);
        OGR_F_SetGeometry(feature, point);
        OGR_G_DestroyGeometry(point);
        ok = OGR_L_CreateFeature(layer, feature) == OGRERR_NONE;
        OGR_F_Destroy(feature);
    }

    GDALClose(dataset);
    return ok;
}

std::string runTool(const std::string& output_dir, const std::string& point_path, const std::string& raster_path,
                    const std::string& variable, bool plot, bool standard_date = false) {
    nlohmann::json writer_config = {{"output_dir", output_dir}, {"plot", plot}};
    nlohmann::json point_config = {{"file_path", point_path}};
    nlohmann::json raster_config = {{"file_path", raster_path}};
    nlohmann::json extraction_config = {{"variable", variable}, {"start_period", "2018-01"},
                                        {"standard_date", standard_date}};
    return tool_interface::processClimateExtractionTool(
        writer_config.dump(), point_config.dump(), raster_config.dump(), extraction_config.dump());
}

int test_end_to_end(const fs::path& work_dir, const std::string& raster_path) {
    int failures = 0;

    std::string point_path = (work_dir / "stations.geojson").string();
    failures += expect_true(writePointFile(point_path, {
        pointFeature("1", "Station A", "02/10/2018", 11.5, 48.5),     // in grid, in range
        pointFeature("2", "Station B", "03/01/2018", 100.0, 0.0),     // outside the raster
        pointFeature("3", "Station C", "07/04/2020", 12.5, 47.5),     // NoData in band 2, out of range
        pointFeature("4", "North, D", "13/45/2018", 10.5, 49.5),      // unparseable date
    }), "point file written");

    std::string output_dir = (work_dir / "out").string();
    std::string result = runTool(output_dir, point_path, raster_path, "temp", true);
    failures += expect_true(result.rfind("Success", 0) == 0, "run succeeds: " + result);
    failures += expect_true(result.find("wrote 5 rows with 9 values for temp data") != std::string::npos,
                            "summary counts header row and columns: " + result);

    std::string csv_path = tool_interface::buildOutputFilePath(output_dir, extract::VariableKind::TEMPERATURE);
    failures += expect_true(fs::exists(csv_path), "CSV written to " + csv_path);

    std::vector<std::vector<std::string>> rows = readCsv(csv_path);
    failures += expect_true(rows.size() == 5, "header plus one row per point");
    if (rows.size() != 5) {
        return failures;
    }

    failures += expect_row(rows[0], {"OBS_NUM", "OBS_NAME", "OBS_DATE", "RASTER_ROW", "RASTER_COL",
                                     "YM-2018-01", "YM-2018-02", "YM-2018-03", "MATCH_VALUE"}, "header");
    failures += expect_row(rows[1], {"1", "Station A", "02/10/2018", "1", "1", "0.0", "10.0", "20.5", "10.0"},
                           "in-grid point matches February");
    failures += expect_row(rows[2], {"2", "Station B", "03/01/2018", "50", "90", "", "", "", ""},
                           "out-of-grid point is null everywhere");
    failures += expect_row(rows[3], {"3", "Station C", "07/04/2020", "2", "2", "0.0", "", "20.5", ""},
                           "NoData cell is null and 2020 is out of range");
    failures += expect_row(rows[4], {"4", "North, D", "13/45/2018", "0", "0", "0.0", "10.0", "20.5", ""},
                           "unparseable date gives null match");

    fs::path overlay_png = fs::path(output_dir) / (fs::path(csv_path).stem().string() + "_overlay.png");
    fs::path overlay_tif = fs::path(output_dir) / (fs::path(csv_path).stem().string() + "_overlay.tif");
    failures += expect_true(fs::exists(overlay_png) || fs::exists(overlay_tif), "overlay image written");

    // A second run replaces the table
    result = runTool(output_dir, point_path, raster_path, "temp", false);
    failures += expect_true(result.rfind("Success", 0) == 0, "second run succeeds: " + result);
    failures += expect_true(readCsv(csv_path).size() == 5, "table replaced, not appended");

    return failures;
}

int test_standard_dates(const fs::path& work_dir, const std::string& raster_path) {
    int failures = 0;

    const std::vector<std::string> expected_in_range = {
        "1", "Station A", "2018-02-10", "1", "1", "0.0", "10.0", "20.5", "10.0"};
    const std::vector<std::string> expected_out_of_range = {
        "2", "Station B", "2020-07-04", "0", "0", "0.0", "10.0", "20.5", ""};

    // ISO dates in a GeoJSON property
    std::string point_path = (work_dir / "iso_dates.geojson").string();
    failures += expect_true(writePointFile(point_path, {
        pointFeature("1", "Station A", "2018-02-10", 11.5, 48.5),
        pointFeature("2", "Station B", "2020-07-04", 10.5, 49.5),
    }), "ISO date point file written");

    std::string output_dir = (work_dir / "iso_out").string();
    std::string result = runTool(output_dir, point_path, raster_path, "temp", false, true);
    failures += expect_true(result.rfind("Success", 0) == 0, "ISO date run succeeds: " + result);
    failures += expect_true(result.find("1 observation dates out of range, 0 unparseable dates") != std::string::npos,
                            "ISO dates parse: " + result);

    std::vector<std::vector<std::string>> rows =
        readCsv(tool_interface::buildOutputFilePath(output_dir, extract::VariableKind::TEMPERATURE));
    failures += expect_true(rows.size() == 3, "header plus two ISO-dated rows");
    if (rows.size() == 3) {
        failures += expect_row(rows[1], expected_in_range, "ISO date matches February");
        failures += expect_row(rows[2], expected_out_of_range, "ISO date outside the raster months is null");
    }

    // Native date column, rendered as YYYY-MM-DD before parsing
    std::string shapefile_path = (work_dir / "dated_stations.shp").string();
    failures += expect_true(writeDatedShapefile(shapefile_path), "dated shapefile written");

    output_dir = (work_dir / "shp_out").string();
    result = runTool(output_dir, shapefile_path, raster_path, "temp", false, true);
    failures += expect_true(result.rfind("Success", 0) == 0, "date column run succeeds: " + result);

    rows = readCsv(tool_interface::buildOutputFilePath(output_dir, extract::VariableKind::TEMPERATURE));
    failures += expect_true(rows.size() == 3, "header plus two rows from the date column");
    if (rows.size() == 3) {
        failures += expect_row(rows[1], expected_in_range, "date column matches February");
        failures += expect_row(rows[2], expected_out_of_range, "date column outside the raster months is null");
    }

    return failures;
}

int test_null_id_skipped(const fs::path& work_dir, const std::string& raster_path) {
    int failures = 0;

    std::string point_path = (work_dir / "null_id.geojson").string();
    failures += expect_true(writePointFile(point_path, {
        pointFeature("1", "Kept", "02/10/2018", 11.5, 48.5),
        pointFeature("null", "No ID", "02/10/2018", 12.5, 48.5),
    }), "null ID point file written");

    std::string output_dir = (work_dir / "null_out").string();
    std::string result = runTool(output_dir, point_path, raster_path, "temp", false);
    failures += expect_true(result.rfind("Success", 0) == 0, "null ID is not fatal: " + result);
    failures += expect_true(result.find("(1 points,") != std::string::npos, "feature without ID skipped: " + result);

    std::vector<std::vector<std::string>> rows =
        readCsv(tool_interface::buildOutputFilePath(output_dir, extract::VariableKind::TEMPERATURE));
    failures += expect_true(rows.size() == 2 && rows[1][1] == "Kept", "only the identified point is written");
    return failures;
}

int test_duplicate_ids_abort_before_raster(const fs::path& work_dir) {
    int failures = 0;

    std::string point_path = (work_dir / "duplicates.geojson").string();
    failures += expect_true(writePointFile(point_path, {
        pointFeature("7", "First", "01/15/2018", 11.5, 48.5),
        pointFeature("7", "Second", "01/20/2018", 12.5, 48.5),
    }), "duplicate point file written");

    // The raster does not exist: the duplicate check must fire first
    std::string output_dir = (work_dir / "dup_out").string();
    std::string missing_raster = (work_dir / "missing.tif").string();
    std::string result = runTool(output_dir, point_path, missing_raster, "temp", true);

    failures += expect_true(result.rfind("Error", 0) == 0, "duplicate IDs are fatal");
    failures += expect_true(result.find("duplicate") != std::string::npos, "message names the duplicates: " + result);
    failures += expect_true(!fs::exists(tool_interface::buildOutputFilePath(output_dir, extract::VariableKind::TEMPERATURE)),
                            "no CSV written");
    return failures;
}

int test_invalid_variable_rejected(const fs::path& work_dir, const std::string& raster_path) {
    int failures = 0;

    std::string point_path = (work_dir / "single.geojson").string();
    failures += expect_true(writePointFile(point_path, {pointFeature("1", "Only", "01/15/2018", 11.5, 48.5)}),
                            "single point file written");

    std::string output_dir = (work_dir / "bad_out").string();
    std::string result = runTool(output_dir, point_path, raster_path, "humidity", true);
    failures += expect_true(result.rfind("Error", 0) == 0, "invalid variable kind is fatal");
    failures += expect_true(!fs::exists(output_dir), "nothing written for an invalid variable kind");
    return failures;
}

int test_sampler_reads_each_band_once(const std::string& raster_path) {
    int failures = 0;

    io::RasterReaderConfig config;
    config.file_path = raster_path;
    io::RasterReader raster(config);
    failures += expect_true(raster.open(), "raster opens");
    failures += expect_true(raster.getBandCount() == 3, "three bands");

    std::vector<extract::CellAddress> addresses = {
        extract::CellAddress(2, 2), extract::CellAddress(0, 3), extract::CellAddress(-1, 0)};

    extract::TemporalSampler sampler(extract::VariableKind::PRECIPITATION, extract::parsePeriod("2018-11"));
    extract::TimeSeriesSet series = sampler.sample(raster, addresses);

    failures += expect_true(series.size() == 3, "one series per address");
    failures += expect_true(series[0].size() == 3 && series[2].size() == 3, "one entry per band for every point");
    failures += expect_true(series[0][2].period_label == "2019-01", "labels roll over the year");
    failures += expect_true(!series[0][1].value, "NoData cell is null");
    failures += expect_true(series[1][0].value && std::abs(*series[1][0].value - 273150.0) < 1.0e-6, "metres to millimetres");
    failures += expect_true(!series[2][0].value && !series[2][1].value && !series[2][2].value,
                            "out-of-grid address is null in every period");
    failures += expect_true(sampler.getDecodeFailureCount() == 1, "only the NoData cell counts as a decode failure");
    failures += expect_true(sampler.getFirstBand() && sampler.getFirstBand()->band_index == 1, "band 1 kept");
    return failures;
}

int test_sample_band_in_memory() {
    int failures = 0;

    extract::BandGrid grid;
    grid.band_index = 1;
    grid.width = 2;
    grid.height = 1;
    grid.values = {std::numeric_limits<double>::quiet_NaN(), 300.0};

    extract::TemporalSampler sampler(extract::VariableKind::TEMPERATURE, extract::parsePeriod("2018-01"));
    extract::TimeSeriesSet series(2);
    std::vector<extract::CellAddress> addresses = {extract::CellAddress(0, 0), extract::CellAddress(0, 1)};
    sampler.sampleBand("2018-01", &grid, addresses, series);

    failures += expect_true(!series[0][0].value, "NaN cell is null");
    failures += expect_true(series[1][0].value && *series[1][0].value == 26.85, "converted and rounded");
    failures += expect_true(sampler.getDecodeFailureCount() == 1, "NaN counted");
    return failures;
}

int test_sample_band_out_of_range_values() {
    int failures = 0;

    extract::BandGrid grid;
    grid.band_index = 1;
    grid.width = 4;
    grid.height = 1;
    grid.values = {1.0e302, 1.0e307, -1.0e307, std::numeric_limits<double>::infinity()};

    extract::TemporalSampler sampler(extract::VariableKind::PRECIPITATION, extract::parsePeriod("2018-01"));
    extract::TimeSeriesSet series(4);
    std::vector<extract::CellAddress> addresses = {
        extract::CellAddress(0, 0), extract::CellAddress(0, 1), extract::CellAddress(0, 2), extract::CellAddress(0, 3)};
    sampler.sampleBand("2018-01", &grid, addresses, series);

    failures += expect_true(series[0][0].value && std::isfinite(*series[0][0].value)
                            && std::abs(*series[0][0].value / 1.0e305 - 1.0) < 1.0e-12,
                            "large finite value survives conversion");
    failures += expect_true(!series[1][0].value && !series[2][0].value, "overflow to infinity is null");
    failures += expect_true(!series[3][0].value, "infinite cell is null");
    failures += expect_true(sampler.getDecodeFailureCount() == 3, "each failed cell counted once");

    // A second band adds to the count
    sampler.sampleBand("2018-02", &grid, addresses, series);
    failures += expect_true(sampler.getDecodeFailureCount() == 6, "failures accumulate across bands");
    return failures;
}

int test_grib_units_left_raw(const std::string& raster_path) {
    int failures = 0;

    io::RasterReaderConfig config;
    config.file_path = raster_path;

    CPLSetThreadLocalConfigOption("GRIB_NORMALIZE_UNITS", "YES");
    {
        io::RasterReader raster(config);
        failures += expect_true(raster.open(), "raster opens");
        const char* value = CPLGetConfigOption("GRIB_NORMALIZE_UNITS", nullptr);
        failures += expect_true(value && std::strcmp(value, "NO") == 0, "GRIB normalisation off while open");

        // Reopening keeps the caller's value for restoration
        failures += expect_true(raster.open(), "raster reopens");
        value = CPLGetConfigOption("GRIB_NORMALIZE_UNITS", nullptr);
        failures += expect_true(value && std::strcmp(value, "NO") == 0, "still off after reopening");
    }
    const char* restored = CPLGetThreadLocalConfigOption("GRIB_NORMALIZE_UNITS", nullptr);
    failures += expect_true(restored && std::strcmp(restored, "YES") == 0, "caller's value restored on close");

    CPLSetThreadLocalConfigOption("GRIB_NORMALIZE_UNITS", nullptr);
    {
        io::RasterReaderConfig missing;
        missing.file_path = raster_path + ".missing";
        io::RasterReader raster(missing);
        failures += expect_true(!raster.open(), "missing raster fails to open");
        failures += expect_true(CPLGetThreadLocalConfigOption("GRIB_NORMALIZE_UNITS", nullptr) == nullptr,
                                "failed open leaves the option unset");
    }
    return failures;
}

int test_command_line_switches() {
    int failures = 0;

    const char* argv[] = {"climextract", "--standard-date", "stations.geojson", "--no-plot", "extra",
                          "--variable", "temp", "--output-dir", "--point-file-path", "p.geojson"};
    auto args = tool_interface::parseCommandLineArgs(10, argv);

    failures += expect_true(args.count("standard-date") && args.at("standard-date") == "true",
                            "--standard-date takes no value");
    failures += expect_true(args.count("no-plot") && args.at("no-plot") == "true", "--no-plot takes no value");
    failures += expect_true(args.count("variable") && args.at("variable") == "temp", "key with value");
    failures += expect_true(args.count("output-dir") && args.at("output-dir") == "true",
                            "key followed by another key has no value");
    failures += expect_true(args.count("point-file-path") && args.at("point-file-path") == "p.geojson",
                            "last key keeps its value");
    return failures;
}

int test_overlay_rendering() {
    int failures = 0;

    extract::BandGrid grid;
    grid.width = 3;
    grid.height = 1;
    grid.values = {10.0, kNoData, 20.0};
    grid.nodata_value = kNoData;

    std::vector<unsigned char> pixels = io::OverlayPlotWriter::renderGrayscale(grid);
    failures += expect_true(pixels.size() == 3, "one pixel per cell");
    failures += expect_true(pixels[0] == 1 && pixels[2] == 255, "linear stretch between min and max");
    failures += expect_true(pixels[1] == 255, "NoData renders white");
    return failures;
}

} // namespace

int main() {
    int failures = 0;

    fs::path work_dir = fs::temp_directory_path() / fs::unique_path("climextract-%%%%-%%%%-%%%%");
    fs::create_directories(work_dir);
    std::string raster_path = (work_dir / "monthly.tif").string();

    failures += expect_true(writeMonthlyRaster(raster_path), "synthetic raster written");
    if (failures == 0) {
        failures += test_end_to_end(work_dir, raster_path);
        failures += test_standard_dates(work_dir, raster_path);
        failures += test_null_id_skipped(work_dir, raster_path);
        failures += test_duplicate_ids_abort_before_raster(work_dir);
        failures += test_invalid_variable_rejected(work_dir, raster_path);
        failures += test_sampler_reads_each_band_once(raster_path);
        failures += test_grib_units_left_raw(raster_path);
    }
    failures += test_sample_band_in_memory();
    failures += test_sample_band_out_of_range_values();
    failures += test_command_line_switches();
    failures += test_overlay_rendering();

    boost::system::error_code ec;
    fs::remove_all(work_dir, ec);

    if (failures > 0) {
        std::cerr << "[extraction-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[extraction-regression] all checks passed" << std::endl;
    return 0;
}
