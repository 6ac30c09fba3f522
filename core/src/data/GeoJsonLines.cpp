#include "gc/data/GeoJsonLines.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace gc {

static bool readPosition(const rapidjson::Value& v, GeoPoint& p) {
  if (!v.IsArray() || v.Size() < 2 || !v[0].IsNumber() || !v[1].IsNumber()) return false;
  p.x = v[0].GetDouble();
  p.y = v[1].GetDouble();
  return true;
}

// One line: array of positions.
static bool readLine(const rapidjson::Value& coords, GeoLine& out) {
  if (!coords.IsArray()) return false;
  if (coords.Size() == 0) return true;
  if (!out.empty()) out.push_back(kBreakPoint);
  for (const auto& pos : coords.GetArray()) {
    GeoPoint p;
    if (!readPosition(pos, p)) return false;
    out.push_back(p);
  }
  return true;
}

// Array of lines (MultiLineString, Polygon rings).
static bool readLines(const rapidjson::Value& coords, GeoLine& out) {
  if (!coords.IsArray()) return false;
  for (const auto& line : coords.GetArray()) {
    if (!readLine(line, out)) return false;
  }
  return true;
}

static bool readGeometry(const rapidjson::Value& g, GeoLine& out) {
  if (g.IsNull()) return true;
  if (!g.IsObject()) return false;
  auto typeIt = g.FindMember("type");
  if (typeIt == g.MemberEnd() || !typeIt->value.IsString()) return false;
  const std::string type = typeIt->value.GetString();

  if (type == "GeometryCollection") {
    auto geoms = g.FindMember("geometries");
    if (geoms == g.MemberEnd() || !geoms->value.IsArray()) return false;
    for (const auto& child : geoms->value.GetArray()) {
      if (!readGeometry(child, out)) return false;
    }
    return true;
  }

  auto coordIt = g.FindMember("coordinates");
  if (coordIt == g.MemberEnd()) return type == "Point" || type == "MultiPoint";
  const auto& coords = coordIt->value;

  if (type == "LineString") return readLine(coords, out);
  if (type == "MultiLineString" || type == "Polygon") return readLines(coords, out);
  if (type == "MultiPolygon") {
    if (!coords.IsArray()) return false;
    for (const auto& poly : coords.GetArray()) {
      if (!readLines(poly, out)) return false;
    }
    return true;
  }
  return true;
}

static bool readObject(const rapidjson::Value& obj, GeoLine& out) {
  if (!obj.IsObject()) return false;
  auto typeIt = obj.FindMember("type");
  if (typeIt == obj.MemberEnd() || !typeIt->value.IsString()) return false;
  const std::string type = typeIt->value.GetString();

  if (type == "FeatureCollection") {
    auto features = obj.FindMember("features");
    if (features == obj.MemberEnd() || !features->value.IsArray()) return false;
    for (const auto& f : features->value.GetArray()) {
      if (!readObject(f, out)) return false;
    }
    return true;
  }
  if (type == "Feature") {
    auto geom = obj.FindMember("geometry");
    if (geom == obj.MemberEnd()) return false;
    return readGeometry(geom->value, out);
  }
  return readGeometry(obj, out);
}

bool loadGeoJsonLines(const std::string& json, GeoLine& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) return false;

  GeoLine lines;
  if (!readObject(doc, lines)) return false;

  if (!out.empty() && !lines.empty()) out.push_back(kBreakPoint);
  out.insert(out.end(), lines.begin(), lines.end());
  return true;
}

bool loadGeoJsonLinesFile(const std::string& path, GeoLine& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::fprintf(stderr, "GeoJsonLines: cannot open %s\n", path.c_str());
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (!loadGeoJsonLines(ss.str(), out)) {
    std::fprintf(stderr, "GeoJsonLines: malformed GeoJSON in %s\n", path.c_str());
    return false;
  }
  return true;
}

} // namespace gc
