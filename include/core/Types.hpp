#pragma once

namespace tempconv::core {

/// Supported temperature scales
enum class TemperatureUnit {
    FAHRENHEIT,
    CELSIUS
};

/// Temperature reading: a value tagged with its scale
struct Temperature {
    double value = 0.0;
    TemperatureUnit unit = TemperatureUnit::CELSIUS;

    bool operator==(const Temperature& other) const {
        return value == other.value && unit == other.unit;
    }
    bool operator!=(const Temperature& other) const { return !(*this == other); }
};

/// Result of one conversion cycle
struct Conversion {
    Temperature source;
    Temperature target;
};

} // namespace tempconv::core
