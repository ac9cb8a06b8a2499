#ifndef CLIMEXTRACT_PERIOD_HPP
#define CLIMEXTRACT_PERIOD_HPP

#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace climextract {
namespace extract {

namespace gregorian = boost::gregorian;

/**
 * Parse a "YYYY-MM" period into the first day of that month
 * @param text Period text
 * @return First day of the month
 * @throws std::invalid_argument if the text is not a valid year-month
 */
gregorian::date parsePeriod(const std::string& text);

/**
 * Shift a month-start date by a number of calendar months
 */
gregorian::date addMonths(const gregorian::date& period_start, int months);

/**
 * Format a date as its "YYYY-MM" period label
 */
std::string formatPeriodLabel(const gregorian::date& date);

/**
 * Build consecutive monthly labels, one per band
 * @param start First period
 * @param count Number of bands
 * @return Labels start, start + 1 month, ... (count entries)
 */
std::vector<std::string> buildPeriodLabels(const gregorian::date& start, size_t count);

} // namespace extract
} // namespace climextract

#endif // CLIMEXTRACT_PERIOD_HPP
