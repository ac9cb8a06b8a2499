#include "extract/climate_extraction.hpp"
#include "extract/spatial_indexer.hpp"
#include "extract/temporal_sampler.hpp"
#include "extract/date_resolver.hpp"
#include "extract/result_assembler.hpp"
#include "extract/unit_converter.hpp"
#include "io/coordinate_system_utils.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace climextract {
namespace extract {

ClimateExtraction::ClimateExtraction(const ExtractionConfig& config)
    : config_(config) {}

bool ClimateExtraction::fail(const std::string& message) {
    last_error_ = message;
    std::cerr << "ERROR: " << message << std::endl;
    return false;
}

bool ClimateExtraction::processExtractionMode(const io::PointReaderConfig& point_config,
                                              const io::RasterReaderConfig& raster_config) {
    std::cout << "=== Climate Extraction Mode (" << variableKindName(config_.variable_kind) << ") ===" << std::endl;

    results_.clear();
    first_band_.reset();
    summary_ = ExtractionSummary();
    last_error_.clear();

    id_field_ = point_config.id_field;
    name_field_ = point_config.name_field;
    date_field_ = point_config.date_field;

    // Step 1: Read points
    std::cout << "Step 1: Reading point features..." << std::endl;
    io::PointReader point_reader(point_config);
    if (!point_reader.read()) {
        return fail("Failed to read point file: " + point_reader.getLastError());
    }
    const std::vector<PointFeature>& points = point_reader.getPointFeatures();
    summary_.point_count = points.size();

    // Step 2: Unique ID precondition, checked before any raster I/O
    std::cout << "Step 2: Checking unique IDs..." << std::endl;
    std::vector<std::string> duplicates = point_reader.findDuplicateIds();
    if (!duplicates.empty()) {
        std::string listed;
        for (size_t i = 0; i < duplicates.size(); ++i) {
            listed += (i > 0 ? ", " : "") + duplicates[i];
        }
        return fail("unique ID column '" + id_field_ + "' in the input file contains duplicate values, cannot proceed ("
                    + listed + ")");
    }
    io::CoordinateSystemUtils::checkWGS84(point_reader.getCoordinateSystemWKT(), "Point dataset");

    // Step 3: Open the raster once for indexing and sampling
    std::cout << "Step 3: Opening raster..." << std::endl;
    io::RasterReader raster(raster_config);
    if (!raster.open()) {
        return fail(raster.getLastError());
    }
    io::CoordinateSystemUtils::checkWGS84(raster.getCoordinateSystemWKT(), "Raster");
    summary_.band_count = static_cast<size_t>(raster.getBandCount());

    // Step 4: Cell address of every point
    std::cout << "Step 4: Locating points in the raster grid..." << std::endl;
    std::vector<CellAddress> addresses;
    try {
        SpatialIndexer indexer(raster.getGeoTransform());
        addresses = indexer.locateAll(points);
    } catch (const std::invalid_argument& e) {
        return fail(e.what());
    }
    for (size_t i = 0; i < addresses.size(); ++i) {
        if (!addresses[i].isWithin(raster.getHeight(), raster.getWidth())) {
            ++summary_.out_of_grid_count;
            std::cout << "Point " << points[i].id << " falls outside the raster (row " << addresses[i].row
                      << ", column " << addresses[i].col << "); its values will be null" << std::endl;
        }
    }

    // Step 5: Time series per point
    std::cout << "Step 5: Sampling " << raster.getBandCount() << " bands..." << std::endl;
    TemporalSampler sampler(config_.variable_kind, config_.start_period);
    TimeSeriesSet series = sampler.sample(raster, addresses);
    summary_.decode_failure_count = sampler.getDecodeFailureCount();
    first_band_ = sampler.getFirstBand();

    // Step 6: Match each point's own observation period
    DateResolver resolver(config_.date_format);
    std::cout << "Step 6: Resolving observation dates (" << resolver.getPatternDescription() << ")..." << std::endl;
    std::vector<std::optional<double>> match_values(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        try {
            std::string period_key = resolver.resolve(points[i].id, points[i].raw_date);
            if (DateResolver::containsPeriod(series[i], period_key)) {
                match_values[i] = DateResolver::lookupMatchValue(series[i], period_key);
            } else {
                ++summary_.out_of_range_count;
            }
        } catch (const DateParseError& e) {
            ++summary_.date_parse_failure_count;
            std::cerr << "Warning: " << e.what() << ". MATCH_VALUE set to null." << std::endl;
        }
    }

    // Step 7: Assemble records in point order
    std::cout << "Step 7: Assembling results..." << std::endl;
    ResultAssembler assembler(id_field_, name_field_, date_field_);
    results_.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        results_.push_back(assembler.assembleRecord(points[i], addresses[i], std::move(series[i]), match_values[i]));
    }

    return true;
}

ResultTable ClimateExtraction::buildResultTable() const {
    ResultAssembler assembler(id_field_, name_field_, date_field_);
    return assembler.buildTable(results_);
}

} // namespace extract
} // namespace climextract
