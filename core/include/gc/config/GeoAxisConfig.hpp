#pragma once
#include "gc/geo/GeoTypes.hpp"
#include "gc/geo/LabelPlacement.hpp"
#include "gc/geo/TickGenerator.hpp"
#include "gc/style/GeoStyle.hpp"

#include <memory>
#include <string>

namespace gc {

class Transform;

struct GeoAxisConfig {
  // Projection. A non-null `transformation` wins over the strings.
  std::string source{"+proj=longlat +datum=WGS84"};
  std::string dest{"+proj=natearth"};
  std::shared_ptr<const Transform> transformation;

  LimitRequest lonLimits{LimitRequest::fixed(-180.0, 180.0)};
  LimitRequest latLimits{LimitRequest::fixed(-90.0, 90.0)};

  bool coastlines{false};
  std::string coastlinePath;          // GeoJSON; empty = no coastline data

  int lineDensity{1000};
  bool removeOverlappingTicks{true};
  bool keepDataAspect{true};

  TickPolicy xTickPolicy{};
  TickPolicy yTickPolicy{};
  TickFormatter xTickFormat{longitudeFormatter()};
  TickFormatter yTickFormat{latitudeFormatter()};

  LabelStyle xLabelStyle{};
  LabelStyle yLabelStyle{};

  GeoAxisStyle style{lightGeoStyle()};
};

// Formatters and a prebuilt transformation are not serialized. The style is
// stored by preset name ("Light" / "Dark").
std::string serializeGeoAxisConfig(const GeoAxisConfig& config);

// Missing keys keep the values already in `out`. Returns false on a parse
// error, a non-object document or a known key of the wrong type.
bool deserializeGeoAxisConfig(const std::string& json, GeoAxisConfig& out);

} // namespace gc
