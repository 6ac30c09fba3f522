#pragma once
#include "gc/scene/Scene.hpp"
#include "gc/scene/ResourceRegistry.hpp"
#include "gc/ids/Id.hpp"
#include "gc/pipelines/PipelineCatalog.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace gc {

struct CmdError {
  std::string code;     // e.g. "VALIDATION_MISSING_GEOMETRY"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Id createdId{0};
};

class CommandProcessor {
public:
  CommandProcessor(Scene& scene, ResourceRegistry& registry);

  // Apply a single JSON command object.
  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

  // Returns a JSON string (for logging / tests).
  std::string listResourcesJson() const;

  const Scene& scene() const { return scene_; }
  const PipelineCatalog& catalog() const { return catalog_; }
  bool inFrame() const { return inFrame_; }
  std::uint64_t committedFrames() const { return committedFrames_; }

private:
  Scene& scene_;
  ResourceRegistry& reg_;
  PipelineCatalog catalog_;

  bool inFrame_{false};
  std::uint64_t frameCounter_{0};
  std::uint64_t committedFrames_{0};

  // ---- handlers ----
  CmdResult cmdHello(const rapidjson::Value& obj);
  CmdResult cmdBeginFrame(const rapidjson::Value& obj);
  CmdResult cmdCommitFrame(const rapidjson::Value& obj);

  CmdResult cmdCreatePane(const rapidjson::Value& obj);
  CmdResult cmdCreateLayer(const rapidjson::Value& obj);
  CmdResult cmdCreateDrawItem(const rapidjson::Value& obj);

  CmdResult cmdDelete(const rapidjson::Value& obj);

  CmdResult cmdCreateBuffer(const rapidjson::Value& obj);
  CmdResult cmdCreateGeometry(const rapidjson::Value& obj);
  CmdResult cmdBindDrawItem(const rapidjson::Value& obj);
  CmdResult cmdSetGeometryVertexCount(const rapidjson::Value& obj);

  CmdResult cmdSetDrawItemStyle(const rapidjson::Value& obj);
  CmdResult cmdSetDrawItemVisible(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static Id getIdOrZero(const rapidjson::Value& obj, const char* key);
  static bool getFloat(const rapidjson::Value& obj, const char* key, float& out);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
  static CmdResult okResult(Id createdId = 0);
  CmdResult reserveOrAllocate(const rapidjson::Value& obj, ResourceKind kind,
                              const char* cmdName, Id& out);
  CmdResult validateDrawItem(const DrawItem& di) const;
};

} // namespace gc
