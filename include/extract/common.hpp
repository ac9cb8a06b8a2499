#ifndef CLIMEXTRACT_COMMON_HPP
#define CLIMEXTRACT_COMMON_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <optional>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>

namespace climextract {
namespace extract {

// Boost Geometry namespace alias
namespace bg = boost::geometry;

// 2D geographic point (x = longitude, y = latitude)
using Point = bg::model::point<double, 2, bg::cs::cartesian>;

// GDAL-ordered affine coefficients
using GeoTransform = std::array<double, 6>;

// Climate variable stored in the raster
enum class VariableKind {
    TEMPERATURE,    // Kelvin in the raster, reported in Celsius
    PRECIPITATION,  // Metres in the raster, reported in millimetres
    UNCONVERTED     // Values are passed through unchanged
};

// Encoding of the observation-date column
enum class DateFormat {
    STANDARD,       // YYYY-MM-DD
    MONTH_DAY_YEAR  // MM/DD/YYYY
};

// Point feature structure
struct PointFeature {
    std::string id;         // Unique ID rendered as text
    std::string name;
    std::string raw_date;   // Observation date exactly as stored
    Point geometry;

    PointFeature(const std::string& feature_id, const std::string& feature_name,
                 const std::string& date, const Point& geom)
        : id(feature_id), name(feature_name), raw_date(date), geometry(geom) {}
};

// Raster cell address; may lie outside the grid
struct CellAddress {
    long row;
    long col;

    CellAddress() : row(0), col(0) {}
    CellAddress(long r, long c) : row(r), col(c) {}

    bool isWithin(long height, long width) const {
        return row >= 0 && row < height && col >= 0 && col < width;
    }

    bool operator==(const CellAddress& other) const {
        return row == other.row && col == other.col;
    }
};

// One full band held in memory, row-major (row * width + col)
struct BandGrid {
    int band_index;                     // 1-based
    int width;
    int height;
    std::vector<double> values;
    std::optional<double> nodata_value;

    BandGrid() : band_index(0), width(0), height(0) {}

    double at(long row, long col) const {
        return values[static_cast<size_t>(row) * static_cast<size_t>(width) + static_cast<size_t>(col)];
    }
};

// Period label paired with a converted value (nullopt means null)
struct TimeSeriesEntry {
    std::string period_label;   // YYYY-MM
    std::optional<double> value;

    TimeSeriesEntry(const std::string& label, const std::optional<double>& val)
        : period_label(label), value(val) {}
};

/**
 * Structure representing one output record per point
 */
struct ResultRecord {
    std::string id;
    std::string name;
    std::string raw_date;
    CellAddress cell;
    std::vector<TimeSeriesEntry> time_series;
    std::optional<double> match_value;

    ResultRecord(const std::string& record_id, const std::string& record_name, const std::string& date,
                 const CellAddress& address)
        : id(record_id), name(record_name), raw_date(date), cell(address) {}
};

/**
 * Header plus rows ready for tabular serialization; empty cells are nulls
 */
struct ResultTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    size_t getColumnCount() const { return header.size(); }
};

} // namespace extract
} // namespace climextract

#endif // CLIMEXTRACT_COMMON_HPP
