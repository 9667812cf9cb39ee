#include "core/EquationFormatter.hpp"
#include "core/Conversion.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace tempconv::core {

namespace {

const char* kDegree = "\xC2\xB0";  // UTF-8 '°'

// NaN prints unsigned as "NaN"; everything else uses the stream's settings
void writeNumber(std::ostream& out, double value) {
    if (std::isnan(value)) {
        out << "NaN";
    } else {
        out << value;
    }
}

} // namespace

bool isWholeNumber(double value) {
    return std::isfinite(value) && std::trunc(value) == value;
}

std::string formatEquation(
    double original_value,
    TemperatureUnit original_unit,
    double converted_value,
    TemperatureUnit converted_unit
) {
    int precision = isWholeNumber(converted_value) ? 0 : 1;

    std::ostringstream out;
    out << std::fixed << std::setprecision(precision);
    out << "\n(";
    writeNumber(out, original_value);
    out << kDegree << unitSymbol(original_unit);

    if (original_unit == TemperatureUnit::FAHRENHEIT) {
        out << " - 32) * (5/9) = ";
    } else {
        out << " * 9/5) + 32 = ";
    }

    writeNumber(out, converted_value);
    out << kDegree << unitSymbol(converted_unit);
    return out.str();
}

std::string formatEquation(const Conversion& conversion) {
    return formatEquation(
        conversion.source.value, conversion.source.unit,
        conversion.target.value, conversion.target.unit);
}

} // namespace tempconv::core
