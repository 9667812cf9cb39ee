#include "core/Conversion.hpp"
#include "core/Utf8.hpp"
#include <cctype>
#include <cstdlib>

namespace tempconv::core {

std::string sanitizeInput(const std::string& line) {
    std::string result = trimWhitespace(line);
    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::optional<TemperatureUnit> parseUnit(const std::string& text) {
    std::string token = text;
    for (auto& c : token) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (token == "c" || token == "celcius") {
        return TemperatureUnit::CELSIUS;
    }
    if (token == "f" || token == "fahrenheit") {
        return TemperatureUnit::FAHRENHEIT;
    }
    return std::nullopt;
}

std::optional<double> parseValue(const std::string& text) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }
    // strtod also takes hex floats and "nan(...)" payloads; plain decimals only here
    if (text.find_first_of("xX(") != std::string::npos) {
        return std::nullopt;
    }

    const char* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end != begin + text.size()) {
        return std::nullopt;
    }
    // ERANGE is ignored: overflow gives +-HUGE_VAL (inf), underflow gives ~0
    return value;
}

const char* unitSymbol(TemperatureUnit unit) {
    switch (unit) {
        case TemperatureUnit::FAHRENHEIT: return "F";
        case TemperatureUnit::CELSIUS:    return "C";
    }
    return "?";
}

TemperatureUnit oppositeUnit(TemperatureUnit unit) {
    return unit == TemperatureUnit::CELSIUS
        ? TemperatureUnit::FAHRENHEIT
        : TemperatureUnit::CELSIUS;
}

double convert(double value, TemperatureUnit from, TemperatureUnit to) {
    if (from == TemperatureUnit::FAHRENHEIT && to == TemperatureUnit::CELSIUS) {
        return (value - 32.0) * (5.0 / 9.0);
    }
    if (from == TemperatureUnit::CELSIUS && to == TemperatureUnit::FAHRENHEIT) {
        return (value * (9.0 / 5.0)) + 32.0;
    }
    return value;
}

Temperature convertTo(const Temperature& temperature, TemperatureUnit target) {
    Temperature result;
    result.value = convert(temperature.value, temperature.unit, target);
    result.unit = target;
    return result;
}

} // namespace tempconv::core
