#pragma once
#include "gc/geo/GeoTypes.hpp"

#include <string>
#include <vector>

namespace gc {

class TextMeasurer;
class Transform;
class Viewport;

struct LabelStyle {
  float fontSize{12.0f};
  float rotation{0.0f};   // radians
  float pad{5.0f};        // pixels between anchor and label box
  bool visible{true};
};

// Centred, axis-aligned label box in pixels.
struct PixelBox {
  double cx{0}, cy{0};
  double halfW{0}, halfH{0};

  // Touching edges do not overlap.
  bool overlaps(const PixelBox& o) const;
};

struct OverlapState {
  std::vector<bool> xVisible;
  std::vector<bool> yVisible;
};

// Offset (pixels) from a tick anchor to the centre of its label. The outward
// direction is the negated pixel direction of a small step into the axis
// interior (towards ymax for x labels, towards xmax for y labels); down or
// left when that probe is unusable. Length is pad plus half the rotated label
// extent along the direction.
GeoPoint directionalPad(const Transform& transform, const Viewport& viewport,
                        const ViewLimits& limits, const GeoPoint& anchorInput,
                        TickAxis axis, const std::string& label,
                        const LabelStyle& style, const TextMeasurer& measurer);

PixelBox labelBox(const GeoPoint& centerPx, const std::string& label,
                  const LabelStyle& style, const TextMeasurer& measurer);

// Visibility flags, pure and idempotent:
//  1. y labels among themselves in tick order (later overlapping label hidden)
//  2. x labels overlapping any visible y label are hidden
//  3. x labels among themselves in tick order
// Switched-off axes get all-false flags. With removeOverlapping=false every
// label of a visible axis stays visible. Boxes with a non-finite centre are
// hidden.
OverlapState resolveOverlaps(const std::vector<PixelBox>& xBoxes, bool xAxisVisible,
                             const std::vector<PixelBox>& yBoxes, bool yAxisVisible,
                             bool removeOverlapping = true);

} // namespace gc
