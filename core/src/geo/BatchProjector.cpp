#include "gc/geo/BatchProjector.hpp"
#include "gc/proj/Transform.hpp"
#include "gc/viewport/Viewport.hpp"

namespace gc {

GeoLine projectPoints(const Transform& transform, const GeoLine& points) {
  GeoLine out;
  out.reserve(points.size());
  for (const GeoPoint& p : points) {
    GeoPoint q = kBreakPoint;
    if (!isBreak(p) && !transform.forward(p, q)) q = kBreakPoint;
    out.push_back(q);
  }
  return out;
}

GeoLine planeToPixels(const Viewport& viewport, const GeoLine& points) {
  GeoLine out;
  out.reserve(points.size());
  for (const GeoPoint& p : points) {
    if (isBreak(p)) {
      out.push_back(kBreakPoint);
      continue;
    }
    GeoPoint q;
    viewport.planeToPixel(p.x, p.y, q.x, q.y);
    out.push_back(q);
  }
  return out;
}

GeoPoint projectToPixel(const Transform& transform, const Viewport& viewport,
                        const GeoPoint& lonlat) {
  GeoPoint plane;
  if (!transform.forward(lonlat, plane)) return kBreakPoint;
  GeoPoint px;
  viewport.planeToPixel(plane.x, plane.y, px.x, px.y);
  return px;
}

bool pixelToLonLat(const Transform& transform, const Viewport& viewport,
                   double px, double py, GeoPoint& lonlat) {
  GeoPoint plane;
  viewport.pixelToPlane(px, py, plane.x, plane.y);
  return transform.inverse(plane, lonlat);
}

void appendVertices(const GeoLine& points, std::vector<float>& out) {
  out.reserve(out.size() + points.size() * 2);
  for (const GeoPoint& p : points) {
    out.push_back(static_cast<float>(p.x));
    out.push_back(static_cast<float>(p.y));
  }
}

} // namespace gc
