#include "extract/unit_converter.hpp"
#include <cmath>
#include <stdexcept>

namespace climextract {
namespace extract {

VariableKind parseVariableKind(const std::string& name) {
    if (name == "temp") {
        return VariableKind::TEMPERATURE;
    }
    if (name == "precip") {
        return VariableKind::PRECIPITATION;
    }
    throw std::invalid_argument("variable name must be set to either \"temp\" or \"precip\" (got \"" + name + "\")");
}

std::string variableKindName(VariableKind kind) {
    switch (kind) {
        case VariableKind::TEMPERATURE:
            return "temp";
        case VariableKind::PRECIPITATION:
            return "precip";
        default:
            return "raw";
    }
}

double convertUnits(VariableKind kind, double raw_value) {
    switch (kind) {
        case VariableKind::TEMPERATURE:
            return raw_value - KELVIN_OFFSET;
        case VariableKind::PRECIPITATION:
            return raw_value * METRES_TO_MILLIMETRES;
        default:
            return raw_value;
    }
}

double roundToDecimals(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    const double scaled = value * scale;
    if (!std::isfinite(scaled)) {
        return value;  // too large to carry fractional digits anyway
    }
    return std::round(scaled) / scale;
}

} // namespace extract
} // namespace climextract
