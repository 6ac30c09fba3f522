#pragma once
#include "gc/geo/GeoTypes.hpp"

namespace gc {

class Transform;
class Viewport;

// Pointwise forward projection in order. Break points pass through; points
// the projection cannot map become break points.
GeoLine projectPoints(const Transform& transform, const GeoLine& points);

// Plane -> pixel for every point; breaks pass through.
GeoLine planeToPixels(const Viewport& viewport, const GeoLine& points);

// Single lon/lat -> pixel; kBreakPoint when unmappable.
GeoPoint projectToPixel(const Transform& transform, const Viewport& viewport,
                        const GeoPoint& lonlat);

// Pixel -> lon/lat through the viewport and the inverse transform.
bool pixelToLonLat(const Transform& transform, const Viewport& viewport,
                   double px, double py, GeoPoint& lonlat);

// Flatten to x,y float pairs for a pos2 vertex buffer.
void appendVertices(const GeoLine& points, std::vector<float>& out);

} // namespace gc
