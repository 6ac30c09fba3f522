#include "gc/viewport/DataLimits.hpp"
#include "gc/scene/Scene.hpp"

#include <algorithm>
#include <limits>

namespace gc {

bool DataLimits::compute(const std::vector<LonLatSeries>& series, const Scene& scene,
                         ViewLimits& out) const {
  double xLo = std::numeric_limits<double>::max();
  double xHi = std::numeric_limits<double>::lowest();
  double yLo = xLo, yHi = xHi;
  bool found = false;

  for (const auto& s : series) {
    const DrawItem* di = scene.getDrawItem(s.drawItemId);
    if (!di || !di->visible || !di->autoLimits || !s.points) continue;

    for (const GeoPoint& p : *s.points) {
      if (!isFinitePoint(p)) continue;
      xLo = std::min(xLo, p.x);
      xHi = std::max(xHi, p.x);
      yLo = std::min(yLo, p.y);
      yHi = std::max(yHi, p.y);
      found = true;
    }
  }

  if (!found) return false;

  yLo = std::min(std::max(yLo, -90.0), 90.0);
  yHi = std::min(std::max(yHi, -90.0), 90.0);

  auto pad = [this](double& lo, double& hi) {
    double span = hi - lo;
    if (span < 1e-12) span = 1.0; // avoid zero span
    const double margin = span * config_.marginFraction;
    lo -= margin;
    hi += margin;
    if (hi - lo < 1e-12) { lo -= 0.5; hi += 0.5; }
  };
  pad(xLo, xHi);
  pad(yLo, yHi);

  out.xmin = xLo;
  out.xmax = xHi;
  // Padding may reach past a pole; the clamped span stays positive.
  out.ymin = std::max(yLo, -90.0);
  out.ymax = std::min(yHi, 90.0);
  return true;
}

} // namespace gc
