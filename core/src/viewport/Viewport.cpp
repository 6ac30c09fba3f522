#include "gc/viewport/Viewport.hpp"

namespace gc {

void Viewport::setPlaneRange(double xMin, double xMax, double yMin, double yMax) {
  plane_.xMin = xMin;
  plane_.xMax = xMax;
  plane_.yMin = yMin;
  plane_.yMax = yMax;
}

void Viewport::setPixelArea(const PixelRect& area) {
  area_ = area;
}

void Viewport::fitDataAspect() {
  const double w = plane_.xMax - plane_.xMin;
  const double h = plane_.yMax - plane_.yMin;
  if (w <= 0.0 || h <= 0.0 || area_.width <= 0.0 || area_.height <= 0.0) return;

  const double unitsPerPxX = w / area_.width;
  const double unitsPerPxY = h / area_.height;

  if (unitsPerPxX > unitsPerPxY) {
    const double newH = unitsPerPxX * area_.height;
    const double cy = 0.5 * (plane_.yMin + plane_.yMax);
    plane_.yMin = cy - 0.5 * newH;
    plane_.yMax = cy + 0.5 * newH;
  } else if (unitsPerPxY > unitsPerPxX) {
    const double newW = unitsPerPxY * area_.width;
    const double cx = 0.5 * (plane_.xMin + plane_.xMax);
    plane_.xMin = cx - 0.5 * newW;
    plane_.xMax = cx + 0.5 * newW;
  }
}

void Viewport::planeToPixel(double x, double y, double& px, double& py) const {
  const double tx = (x - plane_.xMin) / (plane_.xMax - plane_.xMin);
  const double ty = (y - plane_.yMin) / (plane_.yMax - plane_.yMin);
  px = area_.x + tx * area_.width;
  py = area_.y + ty * area_.height;
}

void Viewport::pixelToPlane(double px, double py, double& x, double& y) const {
  const double tx = (px - area_.x) / area_.width;
  const double ty = (py - area_.y) / area_.height;
  x = plane_.xMin + tx * (plane_.xMax - plane_.xMin);
  y = plane_.yMin + ty * (plane_.yMax - plane_.yMin);
}

bool Viewport::containsPixel(double px, double py) const {
  return px >= area_.x && px <= area_.x + area_.width &&
         py >= area_.y && py <= area_.y + area_.height;
}

double Viewport::pixelsPerUnitX() const {
  const double w = plane_.xMax - plane_.xMin;
  if (w <= 0.0) return 0.0;
  return area_.width / w;
}

double Viewport::pixelsPerUnitY() const {
  const double h = plane_.yMax - plane_.yMin;
  if (h <= 0.0) return 0.0;
  return area_.height / h;
}

} // namespace gc
