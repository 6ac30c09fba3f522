#pragma once
#include "gc/geo/GeoTypes.hpp"
#include "gc/recipe/Recipe.hpp"
#include "gc/scene/Geometry.hpp"
#include "gc/style/GeoStyle.hpp"
#include <string>
#include <vector>

namespace gc {

class GlyphAtlas;

// Decoration draw items of one geo axis.
//
// ID layout (offsets from idBase, 37 slots):
//   0:      decoration layer (grids, spines, anchors)
//   1:      data layer
//   2:      coastline layer
//   3:      label layer
//   4-36:   one buf/geom/di triple per GeoDecoration, in enum order,
//           at 4 + 3 * decoration
// Data draw items added later by GeoAxis take triples from idBase + ID_SLOTS
// up to idBase + ID_BLOCK. Axes sharing a scene need idBase values at least
// ID_BLOCK apart.
struct GeoAxisRecipeConfig {
  Id paneId{0};
  std::string name{"geoaxis"};
  GeoAxisStyle style{lightGeoStyle()};
  bool coastlines{false};   // overrides style[Coastlines].visible
};

class GeoAxisRecipe : public Recipe {
public:
  static constexpr std::uint32_t ID_SLOTS = 4 + 3 * static_cast<std::uint32_t>(GeoDecoration::Count);
  static constexpr std::uint32_t MAX_DATA_SERIES = 64;
  static constexpr std::uint32_t ID_BLOCK = ID_SLOTS + 3 * MAX_DATA_SERIES;

  GeoAxisRecipe(Id idBase, const GeoAxisRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override;

  Id decorationLayerId() const { return rid(0); }
  Id dataLayerId() const       { return rid(1); }
  Id coastlineLayerId() const  { return rid(2); }
  Id labelLayerId() const      { return rid(3); }

  DrawChain chain(GeoDecoration d) const { return chainAt(slot(d)); }
  Id bufferId(GeoDecoration d) const   { return rid(slot(d)); }
  Id geometryId(GeoDecoration d) const { return rid(slot(d) + 1); }
  Id drawItemId(GeoDecoration d) const { return rid(slot(d) + 2); }

  static VertexFormat formatOf(GeoDecoration d);
  static const char* pipelineOf(GeoDecoration d);
  Id layerOf(GeoDecoration d) const;

  bool initiallyVisible(GeoDecoration d) const;

  // Restyle commands for every decoration (no visibility changes).
  std::vector<CmdString> styleCommands(const GeoAxisStyle& style) const;

  const GeoAxisRecipeConfig& config() const { return config_; }

  // Glyph8 instances for a set of labels centred on their positions.
  // Hidden labels and labels at break points emit no glyphs.
  static int computeLabelGlyphs(const GlyphAtlas& atlas, const GeoLine& positions,
                                const std::vector<std::string>& labels,
                                const std::vector<bool>& visible, float fontSize,
                                std::vector<float>& out);

private:
  static std::uint32_t slot(GeoDecoration d) {
    return 4 + 3 * static_cast<std::uint32_t>(d);
  }

  GeoAxisRecipeConfig config_;
};

} // namespace gc
