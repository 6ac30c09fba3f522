#include "gc/recipe/GeoAxisRecipe.hpp"
#include "gc/text/GlyphAtlas.hpp"
#include "gc/text/TextLayout.hpp"
#include <algorithm>
#include <string>

namespace gc {

static constexpr int kDecorationCount = static_cast<int>(GeoDecoration::Count);

static GeoDecoration decorationAt(int i) {
  return static_cast<GeoDecoration>(i);
}

GeoAxisRecipe::GeoAxisRecipe(Id idBase, const GeoAxisRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

VertexFormat GeoAxisRecipe::formatOf(GeoDecoration d) {
  switch (d) {
    case GeoDecoration::XTickLabels:
    case GeoDecoration::YTickLabels:
      return VertexFormat::Glyph8;
    case GeoDecoration::XTickAnchors:
    case GeoDecoration::YTickAnchors:
      return VertexFormat::Pos2_Pixel;
    default:
      return VertexFormat::Pos2_Plane;
  }
}

const char* GeoAxisRecipe::pipelineOf(GeoDecoration d) {
  switch (formatOf(d)) {
    case VertexFormat::Glyph8:     return "textSDF@1";
    case VertexFormat::Pos2_Pixel: return "labelAnchor@1";
    default:                       return "lineStrip@1";
  }
}

Id GeoAxisRecipe::layerOf(GeoDecoration d) const {
  switch (d) {
    case GeoDecoration::Coastlines:  return coastlineLayerId();
    case GeoDecoration::XTickLabels:
    case GeoDecoration::YTickLabels: return labelLayerId();
    default:                         return decorationLayerId();
  }
}

bool GeoAxisRecipe::initiallyVisible(GeoDecoration d) const {
  if (d == GeoDecoration::Coastlines) return config_.coastlines;
  return config_.style[d].visible;
}

std::vector<Id> GeoAxisRecipe::drawItemIds() const {
  std::vector<Id> ids;
  ids.reserve(kDecorationCount);
  for (int i = 0; i < kDecorationCount; i++) {
    ids.push_back(drawItemId(decorationAt(i)));
  }
  return ids;
}

std::vector<CmdString> GeoAxisRecipe::styleCommands(const GeoAxisStyle& style) const {
  std::vector<CmdString> cmds;
  for (int i = 0; i < kDecorationCount; i++) {
    const GeoDecoration d = decorationAt(i);
    cmds.push_back(makeLineStyleCmd(drawItemId(d), style[d]));
  }
  return cmds;
}

RecipeBuildResult GeoAxisRecipe::build() const {
  RecipeBuildResult result;
  const std::string& name = config_.name;
  auto append = [](std::vector<CmdString>& dst, std::vector<CmdString> src) {
    dst.insert(dst.end(), src.begin(), src.end());
  };

  // Layers, bottom to top.
  const struct { Id id; const char* suffix; } layers[] = {
    {decorationLayerId(), "_decorations"},
    {dataLayerId(), "_data"},
    {coastlineLayerId(), "_coastlines"},
    {labelLayerId(), "_labels"},
  };
  for (const auto& l : layers) {
    result.createCommands.push_back(createLayerCommand(l.id, config_.paneId, name + l.suffix));
  }

  for (int i = 0; i < kDecorationCount; i++) {
    const GeoDecoration d = decorationAt(i);
    append(result.createCommands,
           createChainCommands(chain(d), layerOf(d), name + "_" + toString(d),
                               formatOf(d), pipelineOf(d), false));
    result.createCommands.push_back(makeLineStyleCmd(drawItemId(d), config_.style[d]));
    result.createCommands.push_back(makeVisibleCmd(drawItemId(d), initiallyVisible(d)));
  }

  // Dispose (reverse order)
  for (int i = kDecorationCount - 1; i >= 0; i--) {
    append(result.disposeCommands, disposeChainCommands(chain(decorationAt(i))));
  }
  for (int i = 3; i >= 0; i--) {
    result.disposeCommands.push_back(R"({"cmd":"delete","id":)" + idStr(layers[i].id) + "}");
  }

  return result;
}

int GeoAxisRecipe::computeLabelGlyphs(const GlyphAtlas& atlas, const GeoLine& positions,
                                      const std::vector<std::string>& labels,
                                      const std::vector<bool>& visible, float fontSize,
                                      std::vector<float>& out) {
  int count = 0;
  const std::size_t n = std::min(positions.size(), labels.size());
  for (std::size_t i = 0; i < n; i++) {
    if (i < visible.size() && !visible[i]) continue;
    if (!isFinitePoint(positions[i])) continue;

    TextLayoutResult r = layoutTextCentered(atlas, labels[i],
                                            static_cast<float>(positions[i].x),
                                            static_cast<float>(positions[i].y),
                                            fontSize);
    out.insert(out.end(), r.glyphInstances.begin(), r.glyphInstances.end());
    count += r.glyphCount;
  }
  return count;
}

} // namespace gc
