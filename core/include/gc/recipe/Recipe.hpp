#pragma once
#include "gc/ids/Id.hpp"
#include "gc/scene/Geometry.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace gc {

// A single JSON command string to be applied via CommandProcessor.
using CmdString = std::string;

// Result of building a recipe: the commands to create and dispose it.
struct RecipeBuildResult {
  std::vector<CmdString> createCommands;
  std::vector<CmdString> disposeCommands; // already in teardown order
};

// Buffer -> geometry -> draw item, the unit every drawn thing is made of.
struct DrawChain {
  Id bufferId{0};
  Id geometryId{0};
  Id drawItemId{0};
};

// Empty buffer and geometry, a draw item on `layerId`, bound to `pipeline`.
std::vector<CmdString> createChainCommands(const DrawChain& chain, Id layerId,
                                           const std::string& name, VertexFormat format,
                                           const std::string& pipeline, bool autoLimits);

// Deletes draw item, geometry and buffer, in that order.
std::vector<CmdString> disposeChainCommands(const DrawChain& chain);

CmdString createLayerCommand(Id layerId, Id paneId, const std::string& name);

// Base class for recipes. A recipe translates a declarative description
// into engine commands using deterministic ID allocation (idBase + offset).
class Recipe {
public:
  explicit Recipe(Id idBase) : idBase_(idBase) {}
  virtual ~Recipe() = default;

  Id idBase() const { return idBase_; }

  virtual RecipeBuildResult build() const = 0;

  // IDs of all DrawItems created by this recipe.
  virtual std::vector<Id> drawItemIds() const { return {}; }

protected:
  Id idBase_;

  Id rid(std::uint32_t offset) const {
    return idBase_ + static_cast<Id>(offset);
  }

  // Three consecutive ids starting at `offset`.
  DrawChain chainAt(std::uint32_t offset) const {
    return DrawChain{rid(offset), rid(offset + 1), rid(offset + 2)};
  }
};

} // namespace gc
