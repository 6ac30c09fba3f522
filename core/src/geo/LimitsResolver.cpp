#include "gc/geo/LimitsResolver.hpp"
#include "gc/proj/Transform.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace gc {

namespace {

struct Extreme {
  double projected;
  double input;
};

} // namespace

bool findTransformLimits(const Transform& transform, ViewLimits& out, int samplesPerEdge) {
  if (samplesPerEdge < 2) samplesPerEdge = 2;
  const GeoDomain& dom = transform.domain();

  const double inf = std::numeric_limits<double>::infinity();
  Extreme xLo{inf, 0}, xHi{-inf, 0}, yLo{inf, 0}, yHi{-inf, 0};
  bool found = false;

  const int n = samplesPerEdge;
  for (int i = 0; i < n; ++i) {
    const double lon = dom.lonMin + (dom.lonMax - dom.lonMin) * i / (n - 1);
    for (int j = 0; j < n; ++j) {
      const double lat = dom.latMin + (dom.latMax - dom.latMin) * j / (n - 1);
      double x = 0, y = 0;
      if (!transform.forward(lon, lat, x, y)) continue;

      // Strict comparisons keep the first sample on ties.
      if (x < xLo.projected) xLo = {x, lon};
      if (x > xHi.projected) xHi = {x, lon};
      if (y < yLo.projected) yLo = {y, lat};
      if (y > yHi.projected) yHi = {y, lat};
      found = true;
    }
  }

  if (!found) return false;

  out.xmin = std::min(xLo.input, xHi.input);
  out.xmax = std::max(xLo.input, xHi.input);
  out.ymin = std::min(yLo.input, yHi.input);
  out.ymax = std::max(yLo.input, yHi.input);
  return true;
}

ViewLimits resolveLimits(const LimitRequest& lon, const LimitRequest& lat,
                         const Transform& transform, const ViewLimits& previous) {
  ViewLimits out = previous;

  ViewLimits automatic;
  const bool needAuto = lon.automatic || lat.automatic;
  const bool haveAuto = needAuto && findTransformLimits(transform, automatic);

  if (lon.automatic) {
    if (haveAuto) {
      out.xmin = automatic.xmin;
      out.xmax = automatic.xmax;
    }
  } else if (std::isfinite(lon.lo) && std::isfinite(lon.hi)) {
    out.xmin = std::min(lon.lo, lon.hi);
    out.xmax = std::max(lon.lo, lon.hi);
  }

  if (lat.automatic) {
    if (haveAuto) {
      out.ymin = automatic.ymin;
      out.ymax = automatic.ymax;
    }
  } else if (std::isfinite(lat.lo) && std::isfinite(lat.hi)) {
    out.ymin = std::min(lat.lo, lat.hi);
    out.ymax = std::max(lat.lo, lat.hi);
  }

  return out;
}

} // namespace gc
