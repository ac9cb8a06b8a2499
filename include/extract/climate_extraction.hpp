#ifndef CLIMEXTRACT_CLIMATE_EXTRACTION_HPP
#define CLIMEXTRACT_CLIMATE_EXTRACTION_HPP

#include <string>
#include <vector>
#include <optional>
#include "extract/common.hpp"
#include "extract/period.hpp"
#include "io/point_reader.hpp"
#include "io/raster_reader.hpp"

namespace climextract {
namespace extract {

/**
 * Immutable settings of one extraction run
 */
struct ExtractionConfig {
    VariableKind variable_kind;
    gregorian::date start_period;   // First day of the month covered by band 1
    DateFormat date_format;

    ExtractionConfig()
        : variable_kind(VariableKind::TEMPERATURE), start_period(2018, 1, 1), date_format(DateFormat::MONTH_DAY_YEAR) {}
};

/**
 * Counters reported after a run
 */
struct ExtractionSummary {
    size_t point_count = 0;
    size_t band_count = 0;
    size_t out_of_grid_count = 0;       // Points outside the raster grid
    size_t out_of_range_count = 0;      // Observation periods not covered by the bands
    size_t date_parse_failure_count = 0;
    size_t decode_failure_count = 0;    // (point, band) cells that could not be decoded
};

class ClimateExtraction {
public:
    explicit ClimateExtraction(const ExtractionConfig& config);
    ~ClimateExtraction() = default;

    // Disable copy constructor and assignment
    ClimateExtraction(const ClimateExtraction&) = delete;
    ClimateExtraction& operator=(const ClimateExtraction&) = delete;

    /**
     * Run the complete extraction workflow: read points, check IDs, open the
     * raster once, locate, sample, resolve observation dates, assemble.
     * Duplicate IDs abort the run before the raster is opened.
     * @param point_config Point reader configuration
     * @param raster_config Raster reader configuration
     * @return true if successful, false otherwise (see getLastError())
     */
    bool processExtractionMode(const io::PointReaderConfig& point_config, const io::RasterReaderConfig& raster_config);

    /**
     * Get the assembled records in point order
     */
    const std::vector<ResultRecord>& getResults() const { return results_; }

    /**
     * Build the output table using the point file's column names
     */
    ResultTable buildResultTable() const;

    /**
     * First raster band of the run, if it could be read
     */
    const std::optional<BandGrid>& getFirstBand() const { return first_band_; }

    const ExtractionSummary& getSummary() const { return summary_; }

    std::string getLastError() const { return last_error_; }

private:
    ExtractionConfig config_;
    std::string id_field_;
    std::string name_field_;
    std::string date_field_;
    std::vector<ResultRecord> results_;
    std::optional<BandGrid> first_band_;
    ExtractionSummary summary_;
    std::string last_error_;

    bool fail(const std::string& message);
};

} // namespace extract
} // namespace climextract

#endif // CLIMEXTRACT_CLIMATE_EXTRACTION_HPP
