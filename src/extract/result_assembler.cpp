#include "extract/result_assembler.hpp"
#include "extract/unit_converter.hpp"
#include <cmath>
#include <cstdio>
#include <utility>
#include <vector>

namespace climextract {
namespace extract {

ResultAssembler::ResultAssembler(const std::string& id_field, const std::string& name_field,
                                 const std::string& date_field)
    : id_field_(id_field), name_field_(name_field), date_field_(date_field) {}

ResultRecord ResultAssembler::assembleRecord(const PointFeature& point, const CellAddress& address,
                                             std::vector<TimeSeriesEntry> time_series,
                                             const std::optional<double>& match_value) const {
    ResultRecord record(point.id, point.name, point.raw_date, address);
    record.time_series = std::move(time_series);
    record.match_value = match_value;
    return record;
}

ResultTable ResultAssembler::buildTable(const std::vector<ResultRecord>& records) const {
    ResultTable table;

    table.header = {id_field_, name_field_, date_field_, RASTER_ROW_COLUMN, RASTER_COL_COLUMN};
    if (!records.empty()) {
        for (const auto& entry : records.front().time_series) {
            table.header.push_back(PERIOD_COLUMN_PREFIX + entry.period_label);
        }
    }
    table.header.push_back(MATCH_VALUE_COLUMN);

    table.rows.reserve(records.size());
    for (const auto& record : records) {
        std::vector<std::string> row;
        row.reserve(table.header.size());

        row.push_back(record.id);
        row.push_back(record.name);
        row.push_back(record.raw_date);
        row.push_back(std::to_string(record.cell.row));
        row.push_back(std::to_string(record.cell.col));
        for (const auto& entry : record.time_series) {
            row.push_back(formatValue(entry.value));
        }
        row.push_back(formatValue(record.match_value));

        table.rows.push_back(std::move(row));
    }

    return table;
}

std::string ResultAssembler::formatValue(const std::optional<double>& value) {
    if (!value || !std::isfinite(*value)) {
        return "";
    }

    double rounded = roundToDecimals(*value, STORED_DECIMALS);
    if (rounded == 0.0) {
        rounded = 0.0;  // no "-0.0"
    }

    int length = std::snprintf(nullptr, 0, "%.*f", STORED_DECIMALS, rounded);
    if (length <= 0) {
        return "";
    }
    std::vector<char> buffer(static_cast<size_t>(length) + 1);
    std::snprintf(buffer.data(), buffer.size(), "%.*f", STORED_DECIMALS, rounded);
    std::string text(buffer.data(), static_cast<size_t>(length));

    // Trim trailing zeros, keep one digit after the point
    size_t point = text.find('.');
    if (point != std::string::npos) {
        size_t last = text.find_last_not_of('0');
        if (last == point) {
            last = point + 1;
        }
        text.erase(last + 1);
    }

    return text;
}

} // namespace extract
} // namespace climextract
