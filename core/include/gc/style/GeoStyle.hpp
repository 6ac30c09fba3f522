#pragma once
#include "gc/ids/Id.hpp"
#include <string>
#include <vector>

namespace gc {

// Draw items a GeoAxis owns. Values index GeoAxisStyle::lines.
enum class GeoDecoration : int {
  XGrid = 0,
  YGrid,
  TopSpine,
  BottomSpine,
  LeftSpine,
  RightSpine,
  XTickLabels,
  YTickLabels,
  XTickAnchors,
  YTickAnchors,
  Coastlines,
  Count
};

const char* toString(GeoDecoration d);

struct LineStyle {
  float color[4] = {0.0f, 0.0f, 0.0f, 1.0f};
  float lineWidth{1.0f};
  float dashLength{0.0f}; // 0 = solid
  float gapLength{0.0f};
  bool visible{true};
};

// Colours, widths and dash patterns of every decoration. Tick label entries
// only use color and visible; anchor entries use lineWidth as point size.
struct GeoAxisStyle {
  std::string name;
  float backgroundColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  LineStyle lines[static_cast<int>(GeoDecoration::Count)];

  LineStyle& operator[](GeoDecoration d) { return lines[static_cast<int>(d)]; }
  const LineStyle& operator[](GeoDecoration d) const { return lines[static_cast<int>(d)]; }
};

GeoAxisStyle lightGeoStyle();
GeoAxisStyle darkGeoStyle();

// setDrawItemStyle with color, lineWidth and dash pattern.
std::string makeLineStyleCmd(Id drawItemId, const LineStyle& style);
// setDrawItemVisible
std::string makeVisibleCmd(Id drawItemId, bool visible);

} // namespace gc
