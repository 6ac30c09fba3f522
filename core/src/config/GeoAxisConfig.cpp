#include "gc/config/GeoAxisConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <string>
#include <utility>

namespace gc {

using JsonAlloc = rapidjson::Document::AllocatorType;

static rapidjson::Value writeLimits(const LimitRequest& req, JsonAlloc& alloc) {
  if (req.automatic) return rapidjson::Value("auto", alloc);
  rapidjson::Value arr(rapidjson::kArrayType);
  arr.PushBack(req.lo, alloc);
  arr.PushBack(req.hi, alloc);
  return arr;
}

static rapidjson::Value writeTickPolicy(const TickPolicy& p, JsonAlloc& alloc) {
  rapidjson::Value obj(rapidjson::kObjectType);
  obj.AddMember("targetCount", p.targetCount, alloc);
  obj.AddMember("ladder",
                rapidjson::Value(p.ladder == StepLadder::Decimal ? "decimal" : "geographic", alloc),
                alloc);
  if (!p.explicitValues.empty()) {
    rapidjson::Value vals(rapidjson::kArrayType);
    for (double v : p.explicitValues) vals.PushBack(v, alloc);
    obj.AddMember("values", vals, alloc);
  }
  return obj;
}

static rapidjson::Value writeLabelStyle(const LabelStyle& s, JsonAlloc& alloc) {
  rapidjson::Value obj(rapidjson::kObjectType);
  obj.AddMember("fontSize", s.fontSize, alloc);
  obj.AddMember("rotation", s.rotation, alloc);
  obj.AddMember("pad", s.pad, alloc);
  obj.AddMember("visible", s.visible, alloc);
  return obj;
}

std::string serializeGeoAxisConfig(const GeoAxisConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("source", rapidjson::Value(config.source.c_str(), alloc), alloc);
  doc.AddMember("dest", rapidjson::Value(config.dest.c_str(), alloc), alloc);
  doc.AddMember("lonLimits", writeLimits(config.lonLimits, alloc), alloc);
  doc.AddMember("latLimits", writeLimits(config.latLimits, alloc), alloc);

  doc.AddMember("coastlines", config.coastlines, alloc);
  doc.AddMember("coastlinePath",
                rapidjson::Value(config.coastlinePath.c_str(), alloc), alloc);

  doc.AddMember("lineDensity", config.lineDensity, alloc);
  doc.AddMember("removeOverlappingTicks", config.removeOverlappingTicks, alloc);
  doc.AddMember("keepDataAspect", config.keepDataAspect, alloc);

  doc.AddMember("xTicks", writeTickPolicy(config.xTickPolicy, alloc), alloc);
  doc.AddMember("yTicks", writeTickPolicy(config.yTickPolicy, alloc), alloc);
  doc.AddMember("xLabels", writeLabelStyle(config.xLabelStyle, alloc), alloc);
  doc.AddMember("yLabels", writeLabelStyle(config.yLabelStyle, alloc), alloc);

  doc.AddMember("style", rapidjson::Value(config.style.name.c_str(), alloc), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

// -------------------- Reading --------------------

static bool readString(const rapidjson::Value& obj, const char* key, std::string& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsString()) return false;
  out = it->value.GetString();
  return true;
}

static bool readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsBool()) return false;
  out = it->value.GetBool();
  return true;
}

static bool readInt(const rapidjson::Value& obj, const char* key, int& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsInt()) return false;
  out = it->value.GetInt();
  return true;
}

static bool readFloat(const rapidjson::Value& obj, const char* key, float& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsNumber()) return false;
  out = static_cast<float>(it->value.GetDouble());
  return true;
}

static bool readLimits(const rapidjson::Value& obj, const char* key, LimitRequest& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  const auto& v = it->value;
  if (v.IsString()) {
    if (std::string(v.GetString()) != "auto") return false;
    out = LimitRequest::fromTransform();
    return true;
  }
  if (!v.IsArray() || v.Size() != 2 || !v[0].IsNumber() || !v[1].IsNumber()) return false;
  out = LimitRequest::fixed(v[0].GetDouble(), v[1].GetDouble());
  return true;
}

static bool readTickPolicy(const rapidjson::Value& obj, const char* key, TickPolicy& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  const auto& v = it->value;
  if (!v.IsObject()) return false;

  if (!readInt(v, "targetCount", out.targetCount)) return false;

  std::string ladder;
  if (!readString(v, "ladder", ladder)) return false;
  if (ladder == "decimal") out.ladder = StepLadder::Decimal;
  else if (ladder == "geographic") out.ladder = StepLadder::Geographic;
  else if (!ladder.empty()) return false;

  auto vals = v.FindMember("values");
  if (vals != v.MemberEnd()) {
    if (!vals->value.IsArray()) return false;
    out.explicitValues.clear();
    for (const auto& x : vals->value.GetArray()) {
      if (!x.IsNumber()) return false;
      out.explicitValues.push_back(x.GetDouble());
    }
  }
  return true;
}

static bool readLabelStyle(const rapidjson::Value& obj, const char* key, LabelStyle& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  const auto& v = it->value;
  if (!v.IsObject()) return false;

  if (!readFloat(v, "fontSize", out.fontSize)) return false;
  if (!readFloat(v, "rotation", out.rotation)) return false;
  if (!readFloat(v, "pad", out.pad)) return false;
  return readBool(v, "visible", out.visible);
}

bool deserializeGeoAxisConfig(const std::string& json, GeoAxisConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  // Parse into a copy so a rejected document leaves `out` untouched.
  GeoAxisConfig next = out;

  if (!readString(doc, "source", next.source)) return false;
  if (!readString(doc, "dest", next.dest)) return false;
  if (!readLimits(doc, "lonLimits", next.lonLimits)) return false;
  if (!readLimits(doc, "latLimits", next.latLimits)) return false;

  if (!readBool(doc, "coastlines", next.coastlines)) return false;
  if (!readString(doc, "coastlinePath", next.coastlinePath)) return false;

  if (!readInt(doc, "lineDensity", next.lineDensity)) return false;
  if (!readBool(doc, "removeOverlappingTicks", next.removeOverlappingTicks)) return false;
  if (!readBool(doc, "keepDataAspect", next.keepDataAspect)) return false;

  if (!readTickPolicy(doc, "xTicks", next.xTickPolicy)) return false;
  if (!readTickPolicy(doc, "yTicks", next.yTickPolicy)) return false;
  if (!readLabelStyle(doc, "xLabels", next.xLabelStyle)) return false;
  if (!readLabelStyle(doc, "yLabels", next.yLabelStyle)) return false;

  std::string styleName;
  if (!readString(doc, "style", styleName)) return false;
  if (styleName == "Light") next.style = lightGeoStyle();
  else if (styleName == "Dark") next.style = darkGeoStyle();
  else if (!styleName.empty()) return false;

  out = std::move(next);
  return true;
}

} // namespace gc
