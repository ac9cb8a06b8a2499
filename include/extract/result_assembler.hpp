#ifndef CLIMEXTRACT_RESULT_ASSEMBLER_HPP
#define CLIMEXTRACT_RESULT_ASSEMBLER_HPP

#include <string>
#include <vector>
#include <optional>
#include "extract/common.hpp"

namespace climextract {
namespace extract {

// Fixed output column names
constexpr const char* RASTER_ROW_COLUMN = "RASTER_ROW";
constexpr const char* RASTER_COL_COLUMN = "RASTER_COL";
constexpr const char* PERIOD_COLUMN_PREFIX = "YM-";
constexpr const char* MATCH_VALUE_COLUMN = "MATCH_VALUE";

/**
 * Merges point identity, cell address, time series and match value into one
 * record per point, and turns records into a header plus rows.
 */
class ResultAssembler {
public:
    /**
     * @param id_field Name of the unique ID column in the point file
     * @param name_field Name of the name column
     * @param date_field Name of the observation date column
     */
    ResultAssembler(const std::string& id_field, const std::string& name_field, const std::string& date_field);
    ~ResultAssembler() = default;

    /**
     * Build the record of one point
     */
    ResultRecord assembleRecord(const PointFeature& point, const CellAddress& address,
                                std::vector<TimeSeriesEntry> time_series,
                                const std::optional<double>& match_value) const;

    /**
     * Convert records to a table. The header is derived from the first
     * record; all records share the same periods by construction.
     * @param records Records in point order
     * @return Header and one row per record
     */
    ResultTable buildTable(const std::vector<ResultRecord>& records) const;

    /**
     * Format a stored value: empty for null, otherwise up to 4 decimals with
     * trailing zeros trimmed (at least one decimal digit kept)
     */
    static std::string formatValue(const std::optional<double>& value);

private:
    std::string id_field_;
    std::string name_field_;
    std::string date_field_;
};

} // namespace extract
} // namespace climextract

#endif // CLIMEXTRACT_RESULT_ASSEMBLER_HPP
