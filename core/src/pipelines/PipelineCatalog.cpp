#include "gc/pipelines/PipelineCatalog.hpp"
#include <algorithm>

namespace gc {

PipelineCatalog::PipelineCatalog() {
  add("lineStrip", 1, VertexFormat::Pos2_Plane, true);
  add("points", 1, VertexFormat::Pos2_Plane, false);
  add("labelAnchor", 1, VertexFormat::Pos2_Pixel, false);
  add("textSDF", 1, VertexFormat::Glyph8, false);
}

void PipelineCatalog::add(const std::string& name, int version, VertexFormat fmt, bool breaks) {
  PipelineSpec spec;
  spec.name = name;
  spec.version = version;
  spec.requiredVertexFormat = fmt;
  spec.breaksOnNonFinite = breaks;
  specs_.emplace(pipelineKey(name, version), std::move(spec));
}

const PipelineSpec* PipelineCatalog::find(const std::string& key) const {
  auto it = specs_.find(key);
  return it == specs_.end() ? nullptr : &it->second;
}

std::vector<std::string> PipelineCatalog::keys() const {
  std::vector<std::string> out;
  for (const auto& kv : specs_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace gc
