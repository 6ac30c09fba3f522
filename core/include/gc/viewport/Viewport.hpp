#pragma once

namespace gc {

// Pixel rectangle of an axis inside the scene. y grows upwards and the
// origin is the scene's lower-left corner, so anchors land in scene pixels.
struct PixelRect {
  double x{0}, y{0};
  double width{800}, height{600};
};

// Visible range in projected plane units.
struct PlaneRange {
  double xMin{0}, xMax{1}, yMin{0}, yMax{1};
};

class Viewport {
public:
  void setPlaneRange(double xMin, double xMax, double yMin, double yMax);
  void setPixelArea(const PixelRect& area);

  // Grow the plane range about its centre until one plane unit covers the
  // same number of pixels on both axes.
  void fitDataAspect();

  // Coordinate mapping
  void planeToPixel(double x, double y, double& px, double& py) const;
  void pixelToPlane(double px, double py, double& x, double& y) const;

  bool containsPixel(double px, double py) const;
  double pixelsPerUnitX() const;
  double pixelsPerUnitY() const;

  const PlaneRange& planeRange() const { return plane_; }
  const PixelRect& pixelArea() const { return area_; }

private:
  PlaneRange plane_{};
  PixelRect area_{};
};

} // namespace gc
