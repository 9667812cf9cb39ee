#pragma once
#include "core/Types.hpp"
#include <string>

namespace tempconv::core {

/// Render a conversion as a printable equation, prefixed with a line break
///
/// Fahrenheit source: "(v°F - 32) * (5/9) = v'°C"
/// Celsius source:    "(v°C * 9/5) + 32 = v'°F"
///
/// The converted value decides the precision of BOTH numbers: one decimal
/// place when it has a fractional part, none when it is a whole number.
/// The original value is rounded accordingly (98.6°F -> "99°F").
std::string formatEquation(
    double original_value,
    TemperatureUnit original_unit,
    double converted_value,
    TemperatureUnit converted_unit
);

std::string formatEquation(const Conversion& conversion);

/// True when `value` is finite and has no fractional part
bool isWholeNumber(double value);

} // namespace tempconv::core
