#ifndef CLIMEXTRACT_UNIT_CONVERTER_HPP
#define CLIMEXTRACT_UNIT_CONVERTER_HPP

#include <string>
#include "extract/common.hpp"

namespace climextract {
namespace extract {

// Offset between Kelvin and Celsius
constexpr double KELVIN_OFFSET = 273.15;

// Metres to millimetres
constexpr double METRES_TO_MILLIMETRES = 1000.0;

// Decimal places kept for every stored value
constexpr int STORED_DECIMALS = 4;

/**
 * Parse a variable name into a VariableKind
 * @param name "temp" or "precip"
 * @return Variable kind
 * @throws std::invalid_argument for any other name
 */
VariableKind parseVariableKind(const std::string& name);

/**
 * Short variable name used in output file names
 * @param kind Variable kind
 * @return "temp", "precip" or "raw"
 */
std::string variableKindName(VariableKind kind);

/**
 * Convert a raw raster value to the physical unit reported for the variable
 * @param kind Variable kind
 * @param raw_value Value as stored in the raster
 * @return Converted value (identity for unconverted kinds)
 */
double convertUnits(VariableKind kind, double raw_value);

/**
 * Round half away from zero to a fixed number of decimals. Values too large to
 * scale are returned unchanged
 */
double roundToDecimals(double value, int decimals);

} // namespace extract
} // namespace climextract

#endif // CLIMEXTRACT_UNIT_CONVERTER_HPP
