#include "gc/geo/TickGenerator.hpp"
#include "gc/math/GeoFormat.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gc {

namespace {

// Smallest gap between consecutive values; 0 for fewer than two.
double minSpacing(const std::vector<double>& values) {
  double best = 0;
  for (std::size_t i = 1; i < values.size(); ++i) {
    const double d = std::fabs(values[i] - values[i - 1]);
    if (d > 0 && (best == 0 || d < best)) best = d;
  }
  return best;
}

template <typename Fn>
TickFormatter perValue(Fn fn) {
  return [fn](const std::vector<double>& values) {
    const double spacing = minSpacing(values);
    const int decimals = decimalsForStep(spacing > 0 || values.empty() ? spacing : values.front());
    std::vector<std::string> out;
    out.reserve(values.size());
    for (double v : values) out.push_back(fn(v, decimals));
    return out;
  };
}

} // namespace

TickFormatter longitudeFormatter() { return perValue(formatLongitude); }
TickFormatter latitudeFormatter()  { return perValue(formatLatitude); }
TickFormatter degreeFormatter()    { return perValue(formatDegrees); }

TickLabels generateTicks(double lo, double hi, const TickPolicy& policy,
                         const TickFormatter& formatter) {
  TickLabels out;

  if (!policy.explicitValues.empty()) {
    const double a = std::min(lo, hi);
    const double b = std::max(lo, hi);
    const double tol = 1e-9 * std::max(1.0, b - a);
    for (double v : policy.explicitValues) {
      if (std::isfinite(v) && v >= a - tol && v <= b + tol) out.values.push_back(v);
    }
    out.step = minSpacing(out.values);
  } else {
    NiceTicks nice = computeNiceTicks(lo, hi, policy.targetCount, policy.ladder);
    out.values = std::move(nice.values);
    out.step = nice.step;
  }

  out.labels = formatter ? formatter(out.values) : degreeFormatter()(out.values);

  if (out.labels.size() != out.values.size()) {
    throw std::runtime_error("TickGenerator: formatter returned " +
                             std::to_string(out.labels.size()) + " labels for " +
                             std::to_string(out.values.size()) + " ticks");
  }
  return out;
}

} // namespace gc
