#ifndef CLIMEXTRACT_DATE_RESOLVER_HPP
#define CLIMEXTRACT_DATE_RESOLVER_HPP

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include "extract/common.hpp"

namespace climextract {
namespace extract {

/**
 * Raised when an observation date does not match the configured format
 */
class DateParseError : public std::runtime_error {
public:
    DateParseError(const std::string& point_id, const std::string& raw_date, const std::string& reason);

    const std::string& getPointId() const { return point_id_; }
    const std::string& getRawDate() const { return raw_date_; }

private:
    std::string point_id_;
    std::string raw_date_;
};

/**
 * Resolves a point's observation date to the "YYYY-MM" period key used by
 * the sampled time series.
 */
class DateResolver {
public:
    explicit DateResolver(DateFormat format);
    ~DateResolver() = default;

    /**
     * Parse a raw observation date and return its period key (day discarded)
     * @param point_id ID of the point, reported on failure
     * @param raw_date Date as stored in the point file
     * @return "YYYY-MM" key
     * @throws DateParseError if the date does not match the configured format
     */
    std::string resolve(const std::string& point_id, const std::string& raw_date) const;

    /**
     * Find the value recorded for a period in a point's series
     * @param series Time series of the point
     * @param period_key "YYYY-MM" key
     * @return Stored value, or nullopt if the period was not sampled or its value is null
     */
    static std::optional<double> lookupMatchValue(const std::vector<TimeSeriesEntry>& series,
                                                  const std::string& period_key);

    /**
     * Check whether a period was sampled at all
     */
    static bool containsPeriod(const std::vector<TimeSeriesEntry>& series, const std::string& period_key);

    /**
     * Human-readable pattern of the configured format, for messages
     */
    std::string getPatternDescription() const;

private:
    DateFormat format_;
};

} // namespace extract
} // namespace climextract

#endif // CLIMEXTRACT_DATE_RESOLVER_HPP
