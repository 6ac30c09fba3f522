#include "gc/geo/GridSampler.hpp"

#include <algorithm>

namespace gc {

int clampLineDensity(int density) {
  return std::max(kMinLineDensity, std::min(kMaxLineDensity, density));
}

std::vector<double> linspace(double a, double b, int n) {
  n = std::max(n, 2);
  std::vector<double> out(static_cast<std::size_t>(n));
  const double step = (b - a) / static_cast<double>(n - 1);
  for (int i = 0; i < n; ++i) out[static_cast<std::size_t>(i)] = a + step * i;
  out.back() = b;
  return out;
}

namespace {

// Appends one line per fixed coordinate; `vertical` lines vary y.
void appendLines(GeoLine& out, const std::vector<double>& fixed,
                 const std::vector<double>& along, bool vertical) {
  if (fixed.empty()) return;
  out.reserve(fixed.size() * (along.size() + 1) - 1);
  for (std::size_t i = 0; i < fixed.size(); ++i) {
    if (i > 0) out.push_back(kBreakPoint);
    for (double t : along) {
      out.push_back(vertical ? GeoPoint{fixed[i], t} : GeoPoint{t, fixed[i]});
    }
  }
}

GeoLine edge(const std::vector<double>& along, double fixed, bool vertical) {
  GeoLine line;
  line.reserve(along.size());
  for (double t : along) line.push_back(vertical ? GeoPoint{fixed, t} : GeoPoint{t, fixed});
  return line;
}

} // namespace

SampledGrid sampleGrid(const ViewLimits& limits,
                       const std::vector<double>& xTicks,
                       const std::vector<double>& yTicks,
                       int density) {
  SampledGrid g;
  g.density = clampLineDensity(density);

  const std::vector<double> xs = linspace(limits.xmin, limits.xmax, g.density);
  const std::vector<double> ys = linspace(limits.ymin, limits.ymax, g.density);

  appendLines(g.xGrid, xTicks, ys, true);
  appendLines(g.yGrid, yTicks, xs, false);

  g.spines[static_cast<int>(Spine::Top)]    = edge(xs, limits.ymax, false);
  g.spines[static_cast<int>(Spine::Bottom)] = edge(xs, limits.ymin, false);
  g.spines[static_cast<int>(Spine::Left)]   = edge(ys, limits.xmin, true);
  g.spines[static_cast<int>(Spine::Right)]  = edge(ys, limits.xmax, true);
  return g;
}

GeoLine xTickAnchors(const ViewLimits& limits, const std::vector<double>& xTicks) {
  return edge(xTicks, limits.ymin, false);
}

GeoLine yTickAnchors(const ViewLimits& limits, const std::vector<double>& yTicks) {
  return edge(yTicks, limits.xmin, true);
}

} // namespace gc
