#include "gc/recipe/Recipe.hpp"

namespace gc {

std::vector<CmdString> createChainCommands(const DrawChain& chain, Id layerId,
                                           const std::string& name, VertexFormat format,
                                           const std::string& pipeline, bool autoLimits) {
  std::vector<CmdString> cmds;
  cmds.reserve(4);
  cmds.push_back(
    R"({"cmd":"createBuffer","id":)" + idStr(chain.bufferId) + R"(,"byteLength":0})");
  cmds.push_back(
    R"({"cmd":"createGeometry","id":)" + idStr(chain.geometryId) +
    R"(,"vertexBufferId":)" + idStr(chain.bufferId) +
    R"(,"format":")" + toString(format) + R"(","vertexCount":0})");
  cmds.push_back(
    R"({"cmd":"createDrawItem","id":)" + idStr(chain.drawItemId) +
    R"(,"layerId":)" + idStr(layerId) +
    R"(,"name":")" + name +
    R"(","autoLimits":)" + (autoLimits ? "true" : "false") + "}");
  cmds.push_back(
    R"({"cmd":"bindDrawItem","drawItemId":)" + idStr(chain.drawItemId) +
    R"(,"pipeline":")" + pipeline +
    R"(","geometryId":)" + idStr(chain.geometryId) + "}");
  return cmds;
}

std::vector<CmdString> disposeChainCommands(const DrawChain& chain) {
  return {
    R"({"cmd":"delete","id":)" + idStr(chain.drawItemId) + "}",
    R"({"cmd":"delete","id":)" + idStr(chain.geometryId) + "}",
    R"({"cmd":"delete","id":)" + idStr(chain.bufferId) + "}",
  };
}

CmdString createLayerCommand(Id layerId, Id paneId, const std::string& name) {
  return R"({"cmd":"createLayer","id":)" + idStr(layerId) +
         R"(,"paneId":)" + idStr(paneId) +
         R"(,"name":")" + name + R"("})";
}

} // namespace gc
