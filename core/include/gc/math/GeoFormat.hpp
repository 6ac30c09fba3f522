#pragma once
#include <string>

namespace gc {

// Fractional digits needed to print multiples of `step` exactly (0..6).
int decimalsForStep(double step);

// "30°", "-12.5°"
std::string formatDegrees(double value, int decimals);

// "120°E", "60°W", "0°", "180°". Values are wrapped into (-180, 180].
std::string formatLongitude(double value, int decimals);

// "30°N", "45°S", "0°"
std::string formatLatitude(double value, int decimals);

} // namespace gc
