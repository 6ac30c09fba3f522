#pragma once
#include "gc/geo/GeoTypes.hpp"
#include "gc/ids/Id.hpp"
#include <vector>

namespace gc {

class Scene;

// Lon/lat source points of one data draw item.
struct LonLatSeries {
  Id drawItemId{0};
  const std::vector<GeoPoint>* points{nullptr};
};

struct DataLimitsConfig {
  float marginFraction{0.0f};   // padding on each side, fraction of the span
};

class DataLimits {
public:
  void setConfig(const DataLimitsConfig& cfg) { config_ = cfg; }

  // Bounding lon/lat rectangle of the series whose draw items are visible
  // and take part in limits. Decorations (autoLimits=false), hidden items and
  // non-finite points are skipped. Returns false if nothing qualifies.
  bool compute(const std::vector<LonLatSeries>& series, const Scene& scene,
               ViewLimits& out) const;

private:
  DataLimitsConfig config_;
};

} // namespace gc
