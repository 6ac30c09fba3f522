#pragma once
#include "gc/scene/Geometry.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace gc {

struct PipelineSpec {
  std::string name;   // "lineStrip"
  int version{1};     // 1
  VertexFormat requiredVertexFormat{VertexFormat::Pos2_Plane};
  // Non-finite vertices split the strip (NaN-separated multi-polylines).
  bool breaksOnNonFinite{false};
};

inline std::string pipelineKey(const std::string& name, int version) {
  return name + "@" + std::to_string(version);
}

// Pipelines the geo axis draws with:
//   lineStrip@1   pos2_plane, NaN pen-up (grids, spines, coastlines, data lines)
//   points@1      pos2_plane (scatter data)
//   labelAnchor@1 pos2_pixel (tick anchor markers)
//   textSDF@1     glyph8 (tick labels)
class PipelineCatalog {
public:
  PipelineCatalog();

  const PipelineSpec* find(const std::string& key) const;
  std::vector<std::string> keys() const;

private:
  void add(const std::string& name, int version, VertexFormat fmt, bool breaks);

  std::unordered_map<std::string, PipelineSpec> specs_;
};

} // namespace gc
