#include "gc/commands/CommandProcessor.hpp"

#include "gc/pipelines/PipelineCatalog.hpp"
#include "gc/scene/Geometry.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace gc {

CommandProcessor::CommandProcessor(Scene& scene, ResourceRegistry& registry)
  : scene_(scene), reg_(registry) {}

CmdResult CommandProcessor::fail(const std::string& code,
                                 const std::string& message,
                                 const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  r.createdId = 0;
  return r;
}

CmdResult CommandProcessor::okResult(Id createdId) {
  CmdResult r;
  r.ok = true;
  r.createdId = createdId;
  return r;
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string CommandProcessor::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (v->IsString()) return v->GetString();
  return {};
}

Id CommandProcessor::getIdOrZero(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return 0;

  if (v->IsUint64()) return static_cast<Id>(v->GetUint64());
  if (v->IsInt64() && v->GetInt64() > 0) return static_cast<Id>(v->GetInt64());
  if (v->IsString()) return parseIdString(v->GetString());
  return 0;
}

bool CommandProcessor::getFloat(const rapidjson::Value& obj, const char* key, float& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsNumber()) return false;
  out = static_cast<float>(v->GetDouble());
  return true;
}

CmdResult CommandProcessor::reserveOrAllocate(const rapidjson::Value& obj, ResourceKind kind,
                                              const char* cmdName, Id& out) {
  Id id = getIdOrZero(obj, "id");
  if (id != 0) {
    if (!reg_.reserve(id, kind)) {
      return fail("ID_TAKEN", std::string(cmdName) + ": id already exists",
                  std::string(R"({"id":)") + idStr(id) + "}");
    }
  } else {
    id = reg_.allocate(kind);
  }
  out = id;
  return okResult(id);
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  // Malformed id strings surface as BAD_COMMAND instead of escaping.
  try {
    if (cmd == "hello") return cmdHello(obj);
    if (cmd == "beginFrame") return cmdBeginFrame(obj);
    if (cmd == "commitFrame") return cmdCommitFrame(obj);

    if (cmd == "createPane") return cmdCreatePane(obj);
    if (cmd == "createLayer") return cmdCreateLayer(obj);
    if (cmd == "createDrawItem") return cmdCreateDrawItem(obj);
    if (cmd == "delete") return cmdDelete(obj);

    if (cmd == "createBuffer") return cmdCreateBuffer(obj);
    if (cmd == "createGeometry") return cmdCreateGeometry(obj);
    if (cmd == "bindDrawItem") return cmdBindDrawItem(obj);
    if (cmd == "setGeometryVertexCount") return cmdSetGeometryVertexCount(obj);

    if (cmd == "setDrawItemStyle") return cmdSetDrawItemStyle(obj);
    if (cmd == "setDrawItemVisible") return cmdSetDrawItemVisible(obj);
  } catch (const std::runtime_error& e) {
    return fail("BAD_COMMAND", cmd + ": " + e.what());
  }

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

// -------------------- frame handlers --------------------

CmdResult CommandProcessor::cmdHello(const rapidjson::Value&) {
  return okResult();
}

CmdResult CommandProcessor::cmdBeginFrame(const rapidjson::Value&) {
  if (inFrame_) {
    return fail("BAD_COMMAND", "beginFrame: already in frame");
  }

  inFrame_ = true;
  frameCounter_++;
  return okResult();
}

CmdResult CommandProcessor::cmdCommitFrame(const rapidjson::Value&) {
  if (!inFrame_) {
    return fail("BAD_COMMAND", "commitFrame: not in frame");
  }

  inFrame_ = false;
  committedFrames_++;
  return okResult();
}

// -------------------- scene graph --------------------

CmdResult CommandProcessor::cmdCreatePane(const rapidjson::Value& obj) {
  Id id = 0;
  CmdResult r = reserveOrAllocate(obj, ResourceKind::Pane, "createPane", id);
  if (!r.ok) return r;

  Pane p;
  p.id = id;
  p.name = getStringOrEmpty(obj, "name");
  scene_.addPane(std::move(p));
  return r;
}

CmdResult CommandProcessor::cmdCreateLayer(const rapidjson::Value& obj) {
  const Id paneId = getIdOrZero(obj, "paneId");
  if (paneId == 0 || !scene_.hasPane(paneId)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createLayer: invalid paneId",
                std::string(R"({"field":"paneId","paneId":)") + idStr(paneId) + "}");
  }

  Id id = 0;
  CmdResult r = reserveOrAllocate(obj, ResourceKind::Layer, "createLayer", id);
  if (!r.ok) return r;

  Layer l;
  l.id = id;
  l.paneId = paneId;
  l.name = getStringOrEmpty(obj, "name");
  scene_.addLayer(std::move(l));
  return r;
}

CmdResult CommandProcessor::cmdCreateDrawItem(const rapidjson::Value& obj) {
  const Id layerId = getIdOrZero(obj, "layerId");
  if (layerId == 0 || !scene_.hasLayer(layerId)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createDrawItem: invalid layerId",
                std::string(R"({"field":"layerId","layerId":)") + idStr(layerId) + "}");
  }

  Id id = 0;
  CmdResult r = reserveOrAllocate(obj, ResourceKind::DrawItem, "createDrawItem", id);
  if (!r.ok) return r;

  DrawItem d;
  d.id = id;
  d.layerId = layerId;
  d.name = getStringOrEmpty(obj, "name");
  if (const auto* al = getMember(obj, "autoLimits"); al && al->IsBool()) {
    d.autoLimits = al->GetBool();
  }
  // pipeline + geometry bindings default empty/0; set by bindDrawItem
  scene_.addDrawItem(std::move(d));
  return r;
}

CmdResult CommandProcessor::cmdDelete(const rapidjson::Value& obj) {
  const Id id = getIdOrZero(obj, "id");
  if (id == 0) {
    return fail("BAD_COMMAND", "delete: missing/invalid id");
  }

  if (!reg_.exists(id)) {
    return fail("NOT_FOUND",
                "delete: id does not exist",
                std::string(R"({"id":)") + idStr(id) + "}");
  }

  std::vector<Id> deleted;
  switch (reg_.kindOf(id)) {
    case ResourceKind::Pane:     deleted = scene_.deletePane(id); break;
    case ResourceKind::Layer:    deleted = scene_.deleteLayer(id); break;
    case ResourceKind::DrawItem: deleted = scene_.deleteDrawItem(id); break;
    case ResourceKind::Buffer:   deleted = scene_.deleteBuffer(id); break;
    case ResourceKind::Geometry: deleted = scene_.deleteGeometry(id); break;
  }

  if (deleted.empty()) {
    return fail("DELETE_FAILED",
                "delete: failed",
                std::string(R"({"id":)") + idStr(id) + "}");
  }

  for (Id did : deleted) {
    reg_.release(did);
  }
  return okResult();
}

// -------------------- buffers / geometry --------------------

CmdResult CommandProcessor::cmdCreateBuffer(const rapidjson::Value& obj) {
  const auto* bl = getMember(obj, "byteLength");
  if (!bl || !bl->IsUint()) {
    return fail("BAD_COMMAND", "createBuffer: missing uint byteLength");
  }

  Id id = 0;
  CmdResult r = reserveOrAllocate(obj, ResourceKind::Buffer, "createBuffer", id);
  if (!r.ok) return r;

  Buffer b;
  b.id = id;
  b.byteLength = bl->GetUint();
  scene_.addBuffer(std::move(b));
  return r;
}

CmdResult CommandProcessor::cmdCreateGeometry(const rapidjson::Value& obj) {
  const Id vb = getIdOrZero(obj, "vertexBufferId");
  if (vb == 0 || !scene_.hasBuffer(vb)) {
    return fail("MISSING_BUFFER",
                "createGeometry: invalid vertexBufferId",
                std::string(R"({"field":"vertexBufferId","vertexBufferId":)") + idStr(vb) + "}");
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "createGeometry: missing uint vertexCount");
  }

  VertexFormat fmt = VertexFormat::Pos2_Plane;
  if (const auto* f = getMember(obj, "format"); f && f->IsString()) {
    if (!parseVertexFormat(f->GetString(), fmt)) {
      return fail("UNSUPPORTED_VERTEX_FORMAT",
                  "createGeometry: unsupported format",
                  R"({"supported":["pos2_plane","pos2_pixel","glyph8"]})");
    }
  }

  Id id = 0;
  CmdResult r = reserveOrAllocate(obj, ResourceKind::Geometry, "createGeometry", id);
  if (!r.ok) return r;

  Geometry g;
  g.id = id;
  g.vertexBufferId = vb;
  g.format = fmt;
  g.vertexCount = vc->GetUint();
  scene_.addGeometry(std::move(g));
  return r;
}

CmdResult CommandProcessor::cmdSetGeometryVertexCount(const rapidjson::Value& obj) {
  const Id geomId = getIdOrZero(obj, "geometryId");
  Geometry* g = scene_.getGeometryMutable(geomId);
  if (!g) {
    return fail("MISSING_GEOMETRY",
                "setGeometryVertexCount: geometryId does not exist",
                std::string(R"({"geometryId":)") + idStr(geomId) + "}");
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "setGeometryVertexCount: missing uint vertexCount");
  }

  g->vertexCount = vc->GetUint();
  return okResult();
}

CmdResult CommandProcessor::cmdBindDrawItem(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  if (drawItemId == 0) {
    return fail("BAD_COMMAND", "bindDrawItem: missing/invalid drawItemId");
  }

  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "bindDrawItem: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + idStr(drawItemId) + "}");
  }

  const std::string pipeline = getStringOrEmpty(obj, "pipeline");
  if (pipeline.empty()) {
    return fail("BAD_COMMAND", "bindDrawItem: missing pipeline");
  }

  const Id geomId = getIdOrZero(obj, "geometryId");
  if (geomId == 0) {
    return fail("BAD_COMMAND", "bindDrawItem: missing geometryId");
  }

  // Validate on a copy so a rejected bind leaves the draw item untouched.
  DrawItem candidate = *di;
  candidate.pipeline = pipeline;
  candidate.geometryId = geomId;
  CmdResult r = validateDrawItem(candidate);
  if (r.ok) *di = std::move(candidate);
  return r;
}

CmdResult CommandProcessor::validateDrawItem(const DrawItem& di) const {
  const PipelineSpec* spec = catalog_.find(di.pipeline);
  if (!spec) {
    return fail("UNKNOWN_PIPELINE",
                "drawItem pipeline not found",
                std::string(R"({"pipeline":")") + di.pipeline + R"("})");
  }

  const Geometry* g = scene_.getGeometry(di.geometryId);
  if (!g) {
    return fail("VALIDATION_BAD_GEOMETRY",
                "drawItem geometryId does not exist",
                std::string(R"({"geometryId":)") + idStr(di.geometryId) + "}");
  }

  if (!scene_.getBuffer(g->vertexBufferId)) {
    return fail("VALIDATION_MISSING_BUFFER",
                "geometry must reference an existing vertexBufferId",
                std::string(R"({"vertexBufferId":)") + idStr(g->vertexBufferId) + "}");
  }

  if (g->format != spec->requiredVertexFormat) {
    return fail("VALIDATION_VERTEX_FORMAT_MISMATCH",
                "geometry vertex format does not match pipeline requirement",
                std::string(R"({"pipeline":")") + di.pipeline +
                  R"(","required":")" + toString(spec->requiredVertexFormat) +
                  R"(","got":")" + toString(g->format) + R"("})");
  }

  return okResult();
}

// -------------------- style --------------------

CmdResult CommandProcessor::cmdSetDrawItemStyle(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "setDrawItemStyle: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + idStr(drawItemId) + "}");
  }

  // Every field is optional; absent fields keep their value.
  DrawItem next = *di;
  getFloat(obj, "r", next.color[0]);
  getFloat(obj, "g", next.color[1]);
  getFloat(obj, "b", next.color[2]);
  getFloat(obj, "a", next.color[3]);
  getFloat(obj, "lineWidth", next.lineWidth);
  getFloat(obj, "dashLength", next.dashLength);
  getFloat(obj, "gapLength", next.gapLength);

  for (float c : next.color) {
    if (!std::isfinite(c) || c < 0.0f || c > 1.0f) {
      return fail("BAD_STYLE", "setDrawItemStyle: color components must be in [0,1]");
    }
  }
  if (!std::isfinite(next.lineWidth) || next.lineWidth < 0.0f ||
      next.dashLength < 0.0f || next.gapLength < 0.0f) {
    return fail("BAD_STYLE", "setDrawItemStyle: lineWidth/dash must be non-negative");
  }

  *di = std::move(next);
  return okResult();
}

CmdResult CommandProcessor::cmdSetDrawItemVisible(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "setDrawItemVisible: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + idStr(drawItemId) + "}");
  }

  const auto* v = getMember(obj, "visible");
  if (!v || !v->IsBool()) {
    return fail("BAD_COMMAND", "setDrawItemVisible: missing bool visible");
  }

  di->visible = v->GetBool();
  return okResult();
}

// -------------------- Query --------------------

std::string CommandProcessor::listResourcesJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  auto writeIds = [&](const char* key, ResourceKind kind) {
    w.Key(key);
    w.StartArray();
    for (Id id : reg_.list(kind)) w.Uint64(id);
    w.EndArray();
  };

  w.StartObject();
  writeIds("panes", ResourceKind::Pane);
  writeIds("layers", ResourceKind::Layer);
  writeIds("drawItems", ResourceKind::DrawItem);
  writeIds("buffers", ResourceKind::Buffer);
  writeIds("geometries", ResourceKind::Geometry);

  w.Key("frame");
  w.Uint64(frameCounter_);

  w.Key("inFrame");
  w.Bool(inFrame_);

  w.EndObject();

  return sb.GetString();
}

} // namespace gc
