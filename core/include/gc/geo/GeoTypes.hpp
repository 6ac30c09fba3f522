#pragma once
#include <cmath>
#include <limits>
#include <vector>

namespace gc {

// A point in input space (lon/lat degrees), plane space or pixel space,
// depending on which stage produced it.
struct GeoPoint {
  double x{0}, y{0};
};

// Separates distinct polylines inside one flat point sequence.
inline constexpr GeoPoint kBreakPoint{std::numeric_limits<double>::quiet_NaN(),
                                      std::numeric_limits<double>::quiet_NaN()};

inline bool isBreak(const GeoPoint& p) { return std::isnan(p.x) || std::isnan(p.y); }
inline bool isFinitePoint(const GeoPoint& p) { return std::isfinite(p.x) && std::isfinite(p.y); }

using GeoLine = std::vector<GeoPoint>;

// Visible lon/lat rectangle in degrees. Always ordered and finite.
struct ViewLimits {
  double xmin{-180}, xmax{180};
  double ymin{-90}, ymax{90};

  double width() const { return xmax - xmin; }
  double height() const { return ymax - ymin; }
  bool isFinite() const {
    return std::isfinite(xmin) && std::isfinite(xmax) &&
           std::isfinite(ymin) && std::isfinite(ymax);
  }
  bool isOrdered() const { return xmin <= xmax && ymin <= ymax; }
};

inline bool operator==(const ViewLimits& a, const ViewLimits& b) {
  return a.xmin == b.xmin && a.xmax == b.xmax && a.ymin == b.ymin && a.ymax == b.ymax;
}
inline bool operator!=(const ViewLimits& a, const ViewLimits& b) { return !(a == b); }

// Requested limits for one axis: a literal (lo, hi) or "derive from the
// transform's domain".
struct LimitRequest {
  bool automatic{false};
  double lo{0}, hi{0};

  static LimitRequest fixed(double lo, double hi) { return LimitRequest{false, lo, hi}; }
  static LimitRequest fromTransform() { return LimitRequest{true, 0, 0}; }
};

enum class TickAxis : int { X = 0, Y = 1 };

} // namespace gc
