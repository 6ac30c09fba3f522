// G1.9 — GeoAxisConfig JSON and GeoJSON line loading
// Tests:
//   1. defaults serialize and read back unchanged
//   2. every field survives a save/load cycle
//   3. partial documents keep the other fields
//   4. rejected documents leave the config untouched
//   5. GeoJSON geometries flatten into break-separated lines
//   6. malformed GeoJSON and missing files
//   7. a coastline file feeds the axis

#include "gc/commands/CommandProcessor.hpp"
#include "gc/config/GeoAxisConfig.hpp"
#include "gc/data/GeoJsonLines.hpp"
#include "gc/geo/GeoAxis.hpp"
#include "gc/ingest/IngestProcessor.hpp"
#include "gc/scene/ResourceRegistry.hpp"
#include "gc/scene/Scene.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static std::size_t countBreaks(const gc::GeoLine& line) {
  std::size_t n = 0;
  for (const auto& p : line) {
    if (gc::isBreak(p)) n++;
  }
  return n;
}

int main() {
  // --- Test 1: defaults ---
  {
    gc::GeoAxisConfig config;
    const std::string json = gc::serializeGeoAxisConfig(config);
    requireTrue(json.find("\"dest\":\"+proj=natearth\"") != std::string::npos, "dest written");
    requireTrue(json.find("\"style\":\"Light\"") != std::string::npos, "style by name");

    gc::GeoAxisConfig back;
    requireTrue(gc::deserializeGeoAxisConfig(json, back), "defaults load");
    requireTrue(back.source == config.source && back.dest == config.dest, "projection");
    requireTrue(!back.lonLimits.automatic && back.lonLimits.lo == -180.0 &&
                back.lonLimits.hi == 180.0, "lon limits");
    requireTrue(back.lineDensity == 1000, "density");
    requireTrue(back.removeOverlappingTicks && back.keepDataAspect, "flags");
    requireTrue(back.xTickPolicy.targetCount == 7, "tick count");
    requireTrue(back.xTickPolicy.ladder == gc::StepLadder::Geographic, "ladder");
    std::printf("  Test 1 (defaults): PASS\n");
  }

  // --- Test 2: full cycle ---
  {
    gc::GeoAxisConfig config;
    config.dest = "+proj=robin +lon_0=30";
    config.lonLimits = gc::LimitRequest::fromTransform();
    config.latLimits = gc::LimitRequest::fixed(-60.0, 75.0);
    config.coastlines = true;
    config.coastlinePath = "data/coast.geojson";
    config.lineDensity = 250;
    config.removeOverlappingTicks = false;
    config.keepDataAspect = false;
    config.xTickPolicy.targetCount = 5;
    config.yTickPolicy.ladder = gc::StepLadder::Decimal;
    config.yTickPolicy.explicitValues = {-45.0, 0.0, 45.0};
    config.xLabelStyle.fontSize = 14.0f;
    config.xLabelStyle.rotation = 0.5f;
    config.yLabelStyle.pad = 9.0f;
    config.yLabelStyle.visible = false;
    config.style = gc::darkGeoStyle();

    gc::GeoAxisConfig back;
    requireTrue(gc::deserializeGeoAxisConfig(gc::serializeGeoAxisConfig(config), back), "load");
    requireTrue(back.dest == config.dest, "dest");
    requireTrue(back.lonLimits.automatic, "auto lon");
    requireTrue(!back.latLimits.automatic && back.latLimits.lo == -60.0 &&
                back.latLimits.hi == 75.0, "lat limits");
    requireTrue(back.coastlines && back.coastlinePath == "data/coast.geojson", "coastlines");
    requireTrue(back.lineDensity == 250, "density");
    requireTrue(!back.removeOverlappingTicks && !back.keepDataAspect, "flags");
    requireTrue(back.xTickPolicy.targetCount == 5, "x tick count");
    requireTrue(back.yTickPolicy.ladder == gc::StepLadder::Decimal, "y ladder");
    requireTrue(back.yTickPolicy.explicitValues.size() == 3 &&
                back.yTickPolicy.explicitValues[2] == 45.0, "explicit ticks");
    requireTrue(back.xLabelStyle.fontSize == 14.0f && back.xLabelStyle.rotation == 0.5f,
                "x label style");
    requireTrue(back.yLabelStyle.pad == 9.0f && !back.yLabelStyle.visible, "y label style");
    requireTrue(back.style.name == "Dark", "style preset");
    std::printf("  Test 2 (full cycle): PASS\n");
  }

  // --- Test 3: partial documents ---
  {
    gc::GeoAxisConfig config;
    config.lineDensity = 321;
    requireTrue(gc::deserializeGeoAxisConfig(R"({"dest":"+proj=merc","latLimits":[-80,80]})",
                                             config), "partial load");
    requireTrue(config.dest == "+proj=merc", "dest replaced");
    requireTrue(config.latLimits.hi == 80.0, "lat replaced");
    requireTrue(config.lineDensity == 321, "density kept");
    requireTrue(config.source == "+proj=longlat +datum=WGS84", "source kept");
    requireTrue(gc::deserializeGeoAxisConfig("{}", config), "empty object");
    std::printf("  Test 3 (partial documents): PASS\n");
  }

  // --- Test 4: rejected documents ---
  {
    gc::GeoAxisConfig config;
    config.lineDensity = 77;
    const char* bad[] = {
      "not json",
      "[1,2,3]",
      R"({"lineDensity":"many"})",
      R"({"lonLimits":"sometimes"})",
      R"({"latLimits":[1,2,3]})",
      R"({"xTicks":{"ladder":"roman"}})",
      R"({"yLabels":{"visible":1}})",
      R"({"style":"Neon"})",
      R"({"dest":"+proj=robin","coastlines":"yes"})",
    };
    for (const char* doc : bad) {
      requireTrue(!gc::deserializeGeoAxisConfig(doc, config), doc);
    }
    requireTrue(config.lineDensity == 77, "density untouched");
    requireTrue(config.dest == "+proj=natearth", "dest untouched by rejected doc");
    std::printf("  Test 4 (rejected documents): PASS\n");
  }

  // --- Test 5: GeoJSON geometries ---
  {
    const std::string json = R"({
      "type": "FeatureCollection",
      "features": [
        {"type": "Feature", "properties": {},
         "geometry": {"type": "LineString", "coordinates": [[0,0],[10,5],[20,10]]}},
        {"type": "Feature", "properties": {},
         "geometry": {"type": "MultiLineString",
                      "coordinates": [[[1,1],[2,2]], [[3,3],[4,4]]]}},
        {"type": "Feature", "properties": {},
         "geometry": {"type": "Polygon",
                      "coordinates": [[[0,0],[5,0],[5,5],[0,0]]]}},
        {"type": "Feature", "properties": {},
         "geometry": {"type": "Point", "coordinates": [7,7]}},
        {"type": "Feature", "properties": {}, "geometry": null}
      ]
    })";
    gc::GeoLine out;
    requireTrue(gc::loadGeoJsonLines(json, out), "collection loads");
    requireTrue(out.size() - countBreaks(out) == 3 + 2 + 2 + 4, "all line vertices read");
    requireTrue(countBreaks(out) == 3, "four lines, three breaks");
    requireTrue(out[1].x == 10.0 && out[1].y == 5.0, "lon/lat order");

    gc::GeoLine more = out;
    requireTrue(gc::loadGeoJsonLines(
                  R"({"type":"MultiPolygon","coordinates":[[[[0,0],[1,0],[1,1],[0,0]]]]})", more),
                "multipolygon loads");
    requireTrue(more.size() == out.size() + 1 + 4, "appended after a break");
    std::printf("  Test 5 (GeoJSON geometries): PASS\n");
  }

  // --- Test 6: malformed input ---
  {
    gc::GeoLine out;
    requireTrue(!gc::loadGeoJsonLines("{", out), "parse error");
    requireTrue(!gc::loadGeoJsonLines(R"({"type":"LineString","coordinates":[[0]]})", out),
                "short position");
    requireTrue(!gc::loadGeoJsonLines(R"({"type":"LineString","coordinates":7})", out),
                "coordinates not an array");
    requireTrue(!gc::loadGeoJsonLinesFile("/nonexistent/coast.geojson", out), "missing file");
    std::printf("  Test 6 (malformed input): PASS\n");
  }

  // --- Test 7: coastline file ---
  {
    const char* path = "g1_9_coast.geojson";
    {
      std::ofstream f(path);
      f << R"({"type":"LineString","coordinates":[[-10,50],[0,52],[10,54]]})";
    }

    gc::Scene scene;
    gc::ResourceRegistry reg;
    gc::CommandProcessor cp(scene, reg);
    gc::IngestProcessor ingest;
    requireTrue(cp.applyJsonText(R"({"cmd":"createPane","id":1})").ok, "pane");

    gc::GeoAxisConfig config;
    requireTrue(gc::deserializeGeoAxisConfig(
                  std::string(R"({"lineDensity":20,"coastlines":true,"coastlinePath":")") +
                  path + "\"}", config), "config loads");
    gc::GeoAxisPlacement placement;
    placement.paneId = 1;
    gc::GeoAxis axis(scene, cp, ingest, placement, config);

    const gc::Id coast = axis.recipe().geometryId(gc::GeoDecoration::Coastlines);
    requireTrue(axis.coastlines().size() == 3, "coastline points loaded");
    requireTrue(scene.getGeometry(coast)->vertexCount == 3, "coastlines uploaded");
    requireTrue(scene.getDrawItem(axis.recipe().drawItemId(gc::GeoDecoration::Coastlines))->visible,
                "coastlines shown");
    std::remove(path);
    std::printf("  Test 7 (coastline file): PASS\n");
  }

  std::printf("G1.9 config PASS\n");
  return 0;
}
