#pragma once
#include "core/Types.hpp"
#include <optional>
#include <string>

namespace tempconv::core {

/// Trim Unicode whitespace from both ends and lower-case ASCII letters
std::string sanitizeInput(const std::string& line);

/// Parse a unit token: "f", "fahrenheit", "c" or "celcius" (any case)
/// @return std::nullopt for anything else
std::optional<TemperatureUnit> parseUnit(const std::string& text);

/// Parse a whole string as one floating-point literal
/// Accepts sign, fraction, exponent, "inf"/"infinity"/"nan".
/// Rejects empty text, trailing characters and hexadecimal literals.
std::optional<double> parseValue(const std::string& text);

/// Single-letter display symbol ("F" or "C")
const char* unitSymbol(TemperatureUnit unit);

/// The scale a reading in `unit` gets converted to
TemperatureUnit oppositeUnit(TemperatureUnit unit);

/// Convert a raw value between scales (identity when from == to)
double convert(double value, TemperatureUnit from, TemperatureUnit to);

/// Convert a reading, returning a new Temperature in `target`
Temperature convertTo(const Temperature& temperature, TemperatureUnit target);

} // namespace tempconv::core
