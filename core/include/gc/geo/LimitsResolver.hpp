#pragma once
#include "gc/geo/GeoTypes.hpp"

namespace gc {

class Transform;

// Samples the transform's lon/lat domain on a regular lattice (edges
// included), projects every sample and keeps, per projected axis, the input
// coordinate at which the projected minimum and maximum are attained.
// Returns false when no sample projects to a finite point.
bool findTransformLimits(const Transform& transform, ViewLimits& out,
                         int samplesPerEdge = 73);

// Literal requests pass through (ordered); automatic ones come from
// findTransformLimits. Anything unresolved or non-finite keeps `previous`.
ViewLimits resolveLimits(const LimitRequest& lon, const LimitRequest& lat,
                         const Transform& transform, const ViewLimits& previous);

} // namespace gc
