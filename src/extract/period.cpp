#include "extract/period.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace climextract {
namespace extract {

gregorian::date parsePeriod(const std::string& text) {
    // Exactly YYYY-MM
    bool well_formed = text.size() == 7 && text[4] == '-';
    for (size_t i = 0; well_formed && i < text.size(); ++i) {
        if (i != 4 && !std::isdigit(static_cast<unsigned char>(text[i]))) {
            well_formed = false;
        }
    }
    if (!well_formed) {
        throw std::invalid_argument("Period must be written as YYYY-MM (got \"" + text + "\")");
    }

    int year = std::stoi(text.substr(0, 4));
    int month = std::stoi(text.substr(5, 2));

    try {
        return gregorian::date(static_cast<unsigned short>(year), static_cast<unsigned short>(month), 1);
    } catch (const std::out_of_range& e) {
        throw std::invalid_argument("Invalid period \"" + text + "\": " + e.what());
    }
}

gregorian::date addMonths(const gregorian::date& period_start, int months) {
    return period_start + gregorian::months(months);
}

std::string formatPeriodLabel(const gregorian::date& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d",
                  static_cast<int>(date.year()), static_cast<int>(date.month()));
    return std::string(buffer);
}

std::vector<std::string> buildPeriodLabels(const gregorian::date& start, size_t count) {
    std::vector<std::string> labels;
    labels.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        labels.push_back(formatPeriodLabel(addMonths(start, static_cast<int>(i))));
    }
    return labels;
}

} // namespace extract
} // namespace climextract
