#pragma once
#include <cstdint>

namespace TS {

// Physical units a device may declare for a property range.
enum class MetricUnit : std::int32_t {
    Default     = 0,
    Inches      = 1,
    Centimeters = 2,
    Degrees     = 3,
    Radians     = 4,
    Seconds     = 5, // arcseconds
    Pounds      = 6,
    Grams       = 7,
};

} // namespace TS
