#include "extract/date_resolver.hpp"
#include "extract/period.hpp"
#include <algorithm>
#include <cctype>

namespace climextract {
namespace extract {

namespace {

bool isDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// Split on a single separator character, keeping empty parts
std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(separator, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace

DateParseError::DateParseError(const std::string& point_id, const std::string& raw_date, const std::string& reason)
    : std::runtime_error("Cannot parse observation date '" + raw_date + "' of point " + point_id + ": " + reason),
      point_id_(point_id), raw_date_(raw_date) {}

DateResolver::DateResolver(DateFormat format) : format_(format) {}

std::string DateResolver::getPatternDescription() const {
    return format_ == DateFormat::STANDARD ? "YYYY-MM-DD" : "MM/DD/YYYY";
}

std::string DateResolver::resolve(const std::string& point_id, const std::string& raw_date) const {
    std::string text = trim(raw_date);
    if (text.empty()) {
        throw DateParseError(point_id, raw_date, "date is empty");
    }

    std::string year_text;
    std::string month_text;
    std::string day_text;

    if (format_ == DateFormat::STANDARD) {
        std::vector<std::string> parts = split(text, '-');
        if (parts.size() != 3 || parts[0].size() != 4 || parts[1].size() != 2 || parts[2].size() != 2) {
            throw DateParseError(point_id, raw_date, "expected " + getPatternDescription());
        }
        year_text = parts[0];
        month_text = parts[1];
        day_text = parts[2];
    } else {
        std::vector<std::string> parts = split(text, '/');
        if (parts.size() != 3 || parts[0].empty() || parts[0].size() > 2 ||
            parts[1].empty() || parts[1].size() > 2 || parts[2].size() != 4) {
            throw DateParseError(point_id, raw_date, "expected " + getPatternDescription());
        }
        month_text = parts[0];
        day_text = parts[1];
        year_text = parts[2];
    }

    if (!isDigits(year_text) || !isDigits(month_text) || !isDigits(day_text)) {
        throw DateParseError(point_id, raw_date, "expected " + getPatternDescription());
    }

    int year = std::stoi(year_text);
    int month = std::stoi(month_text);
    int day = std::stoi(day_text);

    // Validate the calendar date (e.g. rejects 02/30/2019)
    try {
        gregorian::date date(static_cast<unsigned short>(year),
                             static_cast<unsigned short>(month),
                             static_cast<unsigned short>(day));
        return formatPeriodLabel(date);
    } catch (const std::out_of_range& e) {
        throw DateParseError(point_id, raw_date, e.what());
    }
}

std::optional<double> DateResolver::lookupMatchValue(const std::vector<TimeSeriesEntry>& series,
                                                     const std::string& period_key) {
    auto it = std::find_if(series.begin(), series.end(), [&period_key](const TimeSeriesEntry& entry) {
        return entry.period_label == period_key;
    });
    if (it == series.end()) {
        return std::nullopt;
    }
    return it->value;
}

bool DateResolver::containsPeriod(const std::vector<TimeSeriesEntry>& series, const std::string& period_key) {
    return std::any_of(series.begin(), series.end(), [&period_key](const TimeSeriesEntry& entry) {
        return entry.period_label == period_key;
    });
}

} // namespace extract
} // namespace climextract
