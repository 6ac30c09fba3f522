#pragma once
#include "gc/geo/GeoTypes.hpp"

#include <array>
#include <vector>

namespace gc {

inline constexpr int kMinLineDensity = 2;
inline constexpr int kMaxLineDensity = 10000;

int clampLineDensity(int density);

// `n` evenly spaced values from a to b inclusive (n >= 2).
std::vector<double> linspace(double a, double b, int n);

enum class Spine : int { Top = 0, Bottom = 1, Left = 2, Right = 3 };

// Input-space (lon/lat) sample lines for one recompute.
struct SampledGrid {
  // One polyline per tick, joined by kBreakPoint, no trailing break:
  // K ticks -> K*(D+1) - 1 points, 0 ticks -> empty.
  GeoLine xGrid;
  GeoLine yGrid;
  // Indexed by Spine; each exactly D points.
  std::array<GeoLine, 4> spines;
  int density{0};
};

// x gridlines run from ymin to ymax at each x tick; y gridlines run from
// xmin to xmax at each y tick.
SampledGrid sampleGrid(const ViewLimits& limits,
                       const std::vector<double>& xTicks,
                       const std::vector<double>& yTicks,
                       int density);

// x tick anchors sit on the bottom edge (x, ymin); y tick anchors on the
// left edge (xmin, y).
GeoLine xTickAnchors(const ViewLimits& limits, const std::vector<double>& xTicks);
GeoLine yTickAnchors(const ViewLimits& limits, const std::vector<double>& yTicks);

} // namespace gc
