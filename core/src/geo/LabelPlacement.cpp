#include "gc/geo/LabelPlacement.hpp"
#include "gc/geo/BatchProjector.hpp"
#include "gc/proj/Transform.hpp"
#include "gc/text/TextMeasurer.hpp"
#include "gc/viewport/Viewport.hpp"

#include <cmath>

namespace gc {

namespace {

constexpr double kProbeFraction = 0.01;

bool finiteBox(const PixelBox& b) {
  return std::isfinite(b.cx) && std::isfinite(b.cy);
}

// Greedy pass in index order against everything already kept.
void keepNonOverlapping(const std::vector<PixelBox>& boxes, std::vector<bool>& visible) {
  for (std::size_t i = 0; i < boxes.size(); ++i) {
    if (!visible[i]) continue;
    for (std::size_t j = 0; j < i; ++j) {
      if (visible[j] && boxes[i].overlaps(boxes[j])) {
        visible[i] = false;
        break;
      }
    }
  }
}

} // namespace

bool PixelBox::overlaps(const PixelBox& o) const {
  return std::fabs(cx - o.cx) < halfW + o.halfW &&
         std::fabs(cy - o.cy) < halfH + o.halfH;
}

GeoPoint directionalPad(const Transform& transform, const Viewport& viewport,
                        const ViewLimits& limits, const GeoPoint& anchorInput,
                        TickAxis axis, const std::string& label,
                        const LabelStyle& style, const TextMeasurer& measurer) {
  GeoPoint probeInput = anchorInput;
  if (axis == TickAxis::X) {
    probeInput.y += kProbeFraction * (limits.ymax - limits.ymin);
  } else {
    probeInput.x += kProbeFraction * (limits.xmax - limits.xmin);
  }

  double dx = (axis == TickAxis::X) ? 0.0 : -1.0;
  double dy = (axis == TickAxis::X) ? -1.0 : 0.0;

  const GeoPoint a = projectToPixel(transform, viewport, anchorInput);
  const GeoPoint p = projectToPixel(transform, viewport, probeInput);
  if (isFinitePoint(a) && isFinitePoint(p)) {
    const double vx = a.x - p.x;
    const double vy = a.y - p.y;
    const double len = std::hypot(vx, vy);
    if (std::isfinite(len) && len > 1e-9) {
      dx = vx / len;
      dy = vy / len;
    }
  }

  const TextExtent ext = measurer.measure(label, style.fontSize, style.rotation);
  const double dist = static_cast<double>(style.pad) +
                      0.5 * (std::fabs(dx) * ext.width + std::fabs(dy) * ext.height);
  return GeoPoint{dx * dist, dy * dist};
}

PixelBox labelBox(const GeoPoint& centerPx, const std::string& label,
                  const LabelStyle& style, const TextMeasurer& measurer) {
  const TextExtent ext = measurer.measure(label, style.fontSize, style.rotation);
  PixelBox b;
  b.cx = centerPx.x;
  b.cy = centerPx.y;
  b.halfW = 0.5 * ext.width;
  b.halfH = 0.5 * ext.height;
  return b;
}

OverlapState resolveOverlaps(const std::vector<PixelBox>& xBoxes, bool xAxisVisible,
                             const std::vector<PixelBox>& yBoxes, bool yAxisVisible,
                             bool removeOverlapping) {
  OverlapState s;
  s.xVisible.assign(xBoxes.size(), xAxisVisible);
  s.yVisible.assign(yBoxes.size(), yAxisVisible);

  for (std::size_t i = 0; i < xBoxes.size(); ++i) {
    if (!finiteBox(xBoxes[i])) s.xVisible[i] = false;
  }
  for (std::size_t i = 0; i < yBoxes.size(); ++i) {
    if (!finiteBox(yBoxes[i])) s.yVisible[i] = false;
  }

  if (!removeOverlapping) return s;

  keepNonOverlapping(yBoxes, s.yVisible);

  for (std::size_t i = 0; i < xBoxes.size(); ++i) {
    if (!s.xVisible[i]) continue;
    for (std::size_t j = 0; j < yBoxes.size(); ++j) {
      if (s.yVisible[j] && xBoxes[i].overlaps(yBoxes[j])) {
        s.xVisible[i] = false;
        break;
      }
    }
  }

  keepNonOverlapping(xBoxes, s.xVisible);
  return s;
}

} // namespace gc
