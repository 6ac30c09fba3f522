#include "gc/math/GeoFormat.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace gc {

static const char* kDegree = "\xC2\xB0"; // U+00B0

int decimalsForStep(double step) {
  step = std::fabs(step);
  if (!std::isfinite(step) || step == 0.0) return 0;
  int d = 0;
  double scaled = step;
  while (d < 6 && std::fabs(scaled - std::round(scaled)) > 1e-6 * std::max(1.0, scaled)) {
    scaled *= 10.0;
    ++d;
  }
  return d;
}

static std::string fixed(double v, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
  return buf;
}

// True when `v` prints as zero at this precision.
static bool roundsToZero(double v, int decimals) {
  return std::fabs(v) < 0.5 * std::pow(10.0, -decimals);
}

std::string formatDegrees(double value, int decimals) {
  if (roundsToZero(value, decimals)) value = 0.0;
  return fixed(value, decimals) + kDegree;
}

std::string formatLongitude(double value, int decimals) {
  value = std::remainder(value, 360.0);
  if (value <= -180.0) value = 180.0;
  if (roundsToZero(value, decimals)) return fixed(0.0, decimals) + kDegree;
  if (roundsToZero(value - 180.0, decimals)) return fixed(180.0, decimals) + kDegree;
  return fixed(std::fabs(value), decimals) + kDegree + (value > 0 ? "E" : "W");
}

std::string formatLatitude(double value, int decimals) {
  if (roundsToZero(value, decimals)) return fixed(0.0, decimals) + kDegree;
  return fixed(std::fabs(value), decimals) + kDegree + (value > 0 ? "N" : "S");
}

} // namespace gc
