// G1.8 — GeoAxis scene integration
// Tests:
//   1. construction: layers, decoration draw items, vertex counts, visibility
//   2. plotted data is projected and re-projected on a transform change
//   3. data limits skip decorations and hidden items
//   4. decoration visibility and restyling
//   5. zoom and pan keep the view inside the world
//   6. one x tick, zero y ticks, density 1000
//   7. automatic longitude limits
//   8. two axes side by side, dispose
//   9. construction errors
//  10. zoom and pan off the prime meridian and across the antimeridian
//  11. data series stay inside the axis' id block

#include "gc/commands/CommandProcessor.hpp"
#include "gc/geo/GeoAxis.hpp"
#include "gc/ingest/IngestProcessor.hpp"
#include "gc/proj/Transform.hpp"
#include "gc/scene/ResourceRegistry.hpp"
#include "gc/scene/Scene.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (!(std::fabs(a - b) <= eps)) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.9f, expected %.9f)\n", msg, a, b);
    std::exit(1);
  }
}

static const char* kWgs84 = "+proj=longlat +datum=WGS84";

struct Harness {
  gc::Scene scene;
  gc::ResourceRegistry reg;
  gc::CommandProcessor cp{scene, reg};
  gc::IngestProcessor ingest;
  gc::Id paneId{0};

  Harness() {
    const gc::CmdResult r = cp.applyJsonText(R"({"cmd":"createPane","name":"map"})");
    requireTrue(r.ok, "createPane");
    paneId = r.createdId;
  }

  gc::GeoAxisPlacement placement(gc::Id idBase = 1000) const {
    gc::GeoAxisPlacement p;
    p.paneId = paneId;
    p.pixelArea = gc::PixelRect{0, 0, 800, 400};
    p.idBase = idBase;
    return p;
  }

  std::uint32_t vertexCount(gc::Id geometryId) const {
    const gc::Geometry* g = scene.getGeometry(geometryId);
    requireTrue(g != nullptr, "geometry exists");
    return g->vertexCount;
  }
};

int main() {
  using gc::GeoDecoration;

  // --- Test 1: construction ---
  {
    Harness h;
    gc::GeoAxisConfig config;
    config.lineDensity = 100;
    gc::GeoAxis axis(h.scene, h.cp, h.ingest, h.placement(), config);
    const gc::GeoAxisRecipe& recipe = axis.recipe();

    requireTrue(h.scene.drawItemsOfLayer(recipe.decorationLayerId()).size() == 8,
                "grids, spines and anchors on the decoration layer");
    requireTrue(h.scene.drawItemsOfLayer(recipe.labelLayerId()).size() == 2, "two label items");
    requireTrue(h.scene.drawItemsOfLayer(recipe.coastlineLayerId()).size() == 1, "coastline item");
    requireTrue(h.scene.drawItemsOfLayer(recipe.dataLayerId()).empty(), "no data yet");
    requireTrue(h.scene.getLayer(recipe.labelLayerId())->paneId == h.paneId, "layers in the pane");

    requireTrue(h.vertexCount(recipe.geometryId(GeoDecoration::XGrid)) == 7 * 101 - 1, "x grid");
    requireTrue(h.vertexCount(recipe.geometryId(GeoDecoration::YGrid)) == 7 * 101 - 1, "y grid");
    requireTrue(h.vertexCount(recipe.geometryId(GeoDecoration::TopSpine)) == 100, "top spine");
    requireTrue(h.vertexCount(recipe.geometryId(GeoDecoration::LeftSpine)) == 100, "left spine");
    requireTrue(h.vertexCount(recipe.geometryId(GeoDecoration::XTickAnchors)) == 7, "x anchors");
    requireTrue(h.vertexCount(recipe.geometryId(GeoDecoration::XTickLabels)) == 0,
                "no glyphs without an atlas");
    requireTrue(h.vertexCount(recipe.geometryId(GeoDecoration::Coastlines)) == 0, "no coastlines");

    const gc::Buffer* grid = h.scene.getBuffer(recipe.bufferId(GeoDecoration::XGrid));
    requireTrue(grid->byteLength == (7 * 101 - 1) * 8, "buffer length synced");
    requireTrue(h.ingest.getBufferSize(grid->id) == grid->byteLength, "ingest holds the bytes");

    const gc::DrawItem* spine = h.scene.getDrawItem(recipe.drawItemId(GeoDecoration::TopSpine));
    requireTrue(spine->visible && !spine->autoLimits, "spine visible, no limits");
    requireTrue(spine->pipeline == "lineStrip@1", "spine pipeline");
    requireTrue(!h.scene.getDrawItem(recipe.drawItemId(GeoDecoration::XTickAnchors))->visible,
                "anchors hidden by default");
    requireTrue(!h.scene.getDrawItem(recipe.drawItemId(GeoDecoration::Coastlines))->visible,
                "coastlines hidden by default");
    requireTrue(h.scene.getDrawItem(recipe.drawItemId(GeoDecoration::YTickLabels))->pipeline ==
                "textSDF@1", "label pipeline");

    requireTrue(h.cp.committedFrames() == 1, "one frame committed");
    requireTrue(axis.sceneSyncCount() == 1, "one scene sync");

    gc::ViewLimits l;
    l.xmin = -40; l.xmax = 40; l.ymin = -20; l.ymax = 60;
    axis.batch([&] {
      axis.setLimits(l);
      axis.setLineDensity(50);
    });
    requireTrue(axis.sceneSyncCount() == 2, "batch -> one scene sync");
    requireTrue(h.cp.committedFrames() == 2, "batch -> one frame");
    requireTrue(h.vertexCount(recipe.geometryId(GeoDecoration::BottomSpine)) == 50,
                "spines follow the density");
    requireTrue(axis.frame()->limits == l, "frame limits");
    std::printf("  Test 1 (construction): PASS\n");
  }

  // --- Test 2: plotted data ---
  {
    Harness h;
    gc::GeoAxisConfig config;
    config.lineDensity = 20;
    gc::GeoAxis axis(h.scene, h.cp, h.ingest, h.placement(), config);

    const std::vector<gc::GeoPoint> pts{{0.0, 0.0}, {90.0, 45.0}, {-120.0, -30.0}};
    const gc::Id di = axis.plot("cities", "points@1", pts);
    requireTrue(di == 1000 + gc::GeoAxisRecipe::ID_SLOTS + 2, "deterministic data id");
    const gc::DrawItem* item = h.scene.getDrawItem(di);
    requireTrue(item != nullptr && item->layerId == axis.recipe().dataLayerId(), "on data layer");
    requireTrue(item->autoLimits, "data takes part in limits");

    const gc::Id bufferId = di - 2;
    std::vector<float> v = h.ingest.getBufferFloats(bufferId);
    requireTrue(v.size() == 6, "three projected vertices");
    gc::GeoPoint expect;
    requireTrue(axis.transform()->forward(pts[1], expect), "project sample");
    requireNear(v[2], expect.x, 1e-3, "x projected");
    requireNear(v[3], expect.y, 1e-3, "y projected");
    requireTrue(h.vertexCount(di - 1) == 3, "vertex count");

    axis.setTransform(kWgs84, "+proj=robin");
    v = h.ingest.getBufferFloats(bufferId);
    requireTrue(axis.transform()->forward(pts[1], expect), "project with robin");
    requireNear(v[2], expect.x, 1e-3, "re-projected x");
    requireNear(v[3], expect.y, 1e-3, "re-projected y");
    requireTrue(axis.frame()->transform == axis.transform(), "frame follows transform");

    requireTrue(axis.setPlotData(di, {{10.0, 10.0}}), "replace data");
    requireTrue(h.vertexCount(di - 1) == 1, "vertex count updated");
    requireTrue(axis.plotData(di)->size() == 1, "lon/lat kept");
    requireTrue(!axis.setPlotData(4242, {}), "unknown item");
    requireTrue(axis.plotData(4242) == nullptr, "no data for unknown item");

    bool threw = false;
    try {
      axis.plot("labels", "textSDF@1", pts);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "glyph pipeline rejected");
    threw = false;
    try {
      axis.plot("nope", "nope@1", pts);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "unknown pipeline rejected");

    const gc::Id second = axis.plot("track", "lineStrip@1", pts);
    requireTrue(second == di + 3, "next data slot");
    std::printf("  Test 2 (plotted data): PASS\n");
  }

  // --- Test 3: data limits ---
  {
    Harness h;
    gc::GeoAxisConfig config;
    config.lineDensity = 20;
    gc::GeoAxis axis(h.scene, h.cp, h.ingest, h.placement(), config);

    gc::ViewLimits out;
    requireTrue(!axis.dataLimits(out), "no data, no limits");

    axis.plot("a", "points@1", {{-10.0, 5.0}, {20.0, 40.0}});
    const gc::Id b = axis.plot("b", "points@1", {{100.0, -60.0}});
    requireTrue(axis.dataLimits(out), "limits from data");
    requireNear(out.xmin, -10.0, 1e-12, "xmin");
    requireNear(out.xmax, 100.0, 1e-12, "xmax");
    requireNear(out.ymin, -60.0, 1e-12, "ymin");
    requireNear(out.ymax, 40.0, 1e-12, "ymax");

    requireTrue(h.cp.applyJsonText(R"({"cmd":"setDrawItemVisible","drawItemId":)" +
                                   gc::idStr(b) + R"(,"visible":false})").ok,
                "hide b");
    requireTrue(axis.applyDataLimits(out), "apply limits");
    requireNear(out.xmax, 20.0, 1e-12, "hidden item skipped");
    requireTrue(axis.limits() == out, "limits applied");
    requireTrue(axis.frame()->limits == out, "frame follows");
    std::printf("  Test 3 (data limits): PASS\n");
  }

  // --- Test 4: decoration visibility and style ---
  {
    Harness h;
    gc::GeoAxisConfig config;
    config.lineDensity = 20;
    gc::GeoAxis axis(h.scene, h.cp, h.ingest, h.placement(), config);
    const gc::GeoAxisRecipe& recipe = axis.recipe();

    axis.setDecorationVisible(GeoDecoration::XGrid, false);
    requireTrue(!h.scene.getDrawItem(recipe.drawItemId(GeoDecoration::XGrid))->visible, "grid hidden");
    requireTrue(!axis.decorationVisible(GeoDecoration::XGrid), "state follows");

    axis.setCoastlinesVisible(true);
    requireTrue(h.scene.getDrawItem(recipe.drawItemId(GeoDecoration::Coastlines))->visible,
                "coastlines shown");

    axis.setDecorationVisible(GeoDecoration::YTickLabels, false);
    requireTrue(!h.scene.getDrawItem(recipe.drawItemId(GeoDecoration::YTickLabels))->visible,
                "y labels hidden");
    requireTrue(!axis.engine().settings().yLabelStyle.visible, "label style follows");
    const auto& flags = axis.frame()->overlap.yVisible;
    for (std::size_t i = 0; i < flags.size(); ++i) {
      requireTrue(!flags[i], "hidden labels take no space");
    }

    gc::LabelStyle xs;
    xs.visible = false;
    axis.setLabelStyle(gc::TickAxis::X, xs);
    requireTrue(!axis.decorationVisible(GeoDecoration::XTickLabels), "x labels hidden via style");

    axis.setStyle(gc::darkGeoStyle());
    const gc::DrawItem* spine = h.scene.getDrawItem(recipe.drawItemId(GeoDecoration::LeftSpine));
    requireNear(spine->color[0], 0.7, 1e-6, "dark spine colour");
    requireTrue(axis.style().name == "Dark", "style kept");
    requireTrue(!h.scene.getDrawItem(recipe.drawItemId(GeoDecoration::XGrid))->visible,
                "restyle keeps visibility");
    std::printf("  Test 4 (decorations): PASS\n");
  }

  // --- Test 5: zoom and pan ---
  {
    Harness h;
    gc::GeoAxisConfig config;
    config.lineDensity = 50;
    gc::GeoAxis axis(h.scene, h.cp, h.ingest, h.placement(), config);

    requireTrue(axis.zoom(1.0, 400.0, 200.0), "zoom in about the centre");
    requireNear(axis.limits().xmin, -90.0, 1e-6, "zoomed xmin");
    requireNear(axis.limits().xmax, 90.0, 1e-6, "zoomed xmax");
    requireNear(axis.limits().ymin, -45.0, 1e-6, "zoomed ymin");
    requireNear(axis.limits().ymax, 45.0, 1e-6, "zoomed ymax");

    const gc::ViewLimits before = axis.limits();
    requireTrue(axis.pan(100.0, 0.0), "pan");
    const gc::ViewLimits after = axis.limits();
    requireTrue(after.xmin < before.xmin, "content follows the pointer");
    requireNear(after.width(), before.width(), 1e-9, "pan keeps the span");
    requireNear(after.ymin, before.ymin, 1e-6, "horizontal pan keeps latitude");

    for (int i = 0; i < 5; ++i) {
      requireTrue(axis.pan(-300.0, 0.0), "pan east");
    }
    requireNear(axis.limits().xmax, 180.0, 1e-9, "clamped to the east edge");
    requireNear(axis.limits().width(), before.width(), 1e-9, "span kept while clamping");

    requireTrue(axis.zoom(-0.9, 400.0, 200.0), "zoom out");
    requireTrue(axis.limits() == gc::ViewLimits{}, "zoom out stops at the world");

    bool threw = false;
    try {
      axis.zoom(-1.0, 400.0, 200.0);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "factor -1 rejected");
    requireTrue(axis.limits() == gc::ViewLimits{}, "limits unchanged");
    std::printf("  Test 5 (zoom and pan): PASS\n");
  }

  // --- Test 6: one x tick, zero y ticks ---
  {
    Harness h;
    gc::GeoAxisConfig config;
    config.lineDensity = 1000;
    config.xTickPolicy.explicitValues = {0.0};
    config.yTickPolicy.explicitValues = {500.0};
    gc::GeoAxis axis(h.scene, h.cp, h.ingest, h.placement(), config);
    const gc::GeoAxisRecipe& recipe = axis.recipe();

    requireTrue(h.vertexCount(recipe.geometryId(GeoDecoration::XGrid)) == 1000, "x grid");
    requireTrue(h.vertexCount(recipe.geometryId(GeoDecoration::YGrid)) == 0, "y grid empty");
    requireTrue(h.vertexCount(recipe.geometryId(GeoDecoration::XTickAnchors)) == 1, "one anchor");
    requireTrue(h.vertexCount(recipe.geometryId(GeoDecoration::YTickAnchors)) == 0, "no y anchors");
    requireTrue(h.scene.getBuffer(recipe.bufferId(GeoDecoration::YGrid))->byteLength == 0,
                "empty buffer");
    std::printf("  Test 6 (one x tick, zero y ticks): PASS\n");
  }

  // --- Test 7: automatic longitude limits ---
  {
    Harness h;
    gc::GeoAxisConfig config;
    config.lineDensity = 20;
    config.dest = "+proj=natearth +lon_0=90";
    config.lonLimits = gc::LimitRequest::fromTransform();
    gc::GeoAxis axis(h.scene, h.cp, h.ingest, h.placement(), config);
    requireNear(axis.limits().xmin, -90.0, 1e-6, "auto xmin follows lon_0");
    requireNear(axis.limits().xmax, 270.0, 1e-6, "auto xmax follows lon_0");
    requireNear(axis.limits().ymin, -90.0, 1e-12, "literal ymin");
    requireNear(axis.limits().ymax, 90.0, 1e-12, "literal ymax");
    std::printf("  Test 7 (automatic limits): PASS\n");
  }

  // --- Test 8: two axes, dispose ---
  {
    Harness h;
    gc::GeoAxisConfig config;
    config.lineDensity = 20;
    gc::GeoAxis left(h.scene, h.cp, h.ingest, h.placement(1000), config);
    config.dest = "+proj=robin";
    gc::GeoAxis right(h.scene, h.cp, h.ingest, h.placement(2000), config);

    const std::size_t perAxis = static_cast<std::size_t>(GeoDecoration::Count);
    requireTrue(h.scene.drawItemIds().size() == 2 * perAxis, "both axes built");
    const gc::Id di = right.plot("pts", "points@1", {{1.0, 2.0}});
    requireTrue(di == 2000 + gc::GeoAxisRecipe::ID_SLOTS + 2, "right data id");

    left.setLimits(gc::ViewLimits{-30, 30, -30, 30});
    requireTrue(right.limits() == gc::ViewLimits{}, "axes are independent");

    right.dispose();
    requireTrue(h.scene.drawItemIds().size() == perAxis, "right items deleted");
    requireTrue(!h.scene.hasLayer(right.recipe().dataLayerId()), "right layers deleted");
    requireTrue(!h.scene.hasBuffer(di - 2), "data buffer deleted");
    requireTrue(h.ingest.getBufferSize(di - 2) == 0, "data bytes released");
    requireTrue(h.scene.hasLayer(left.recipe().dataLayerId()), "left untouched");

    right.dispose();
    right.setLimits(gc::ViewLimits{-10, 10, -10, 10});
    requireTrue(!h.scene.hasBuffer(right.recipe().bufferId(GeoDecoration::XGrid)),
                "disposed axis writes nothing");
    std::printf("  Test 8 (two axes, dispose): PASS\n");
  }

  // --- Test 9: construction errors ---
  {
    Harness h;
    gc::GeoAxisConfig config;
    config.dest = "+proj=nosuchprojection";
    bool threw = false;
    try {
      gc::GeoAxis axis(h.scene, h.cp, h.ingest, h.placement(), config);
    } catch (const gc::InvalidProjectionError&) {
      threw = true;
    }
    requireTrue(threw, "invalid projection rejected");
    requireTrue(h.scene.layerIds().empty(), "nothing created");

    gc::GeoAxisConfig missing;
    missing.coastlinePath = "/nonexistent/coastlines.geojson";
    threw = false;
    try {
      gc::GeoAxis axis(h.scene, h.cp, h.ingest, h.placement(), missing);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    requireTrue(threw, "missing coastline file rejected");

    gc::GeoAxisPlacement noPane = h.placement();
    noPane.paneId = 999;
    gc::GeoAxisConfig ok;
    ok.lineDensity = 10;
    threw = false;
    try {
      gc::GeoAxis axis(h.scene, h.cp, h.ingest, noPane, ok);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    requireTrue(threw, "unknown pane rejected");
    std::printf("  Test 9 (construction errors): PASS\n");
  }

  // --- Test 10: lon_0 = 90, antimeridian ---
  {
    Harness h;
    gc::GeoAxisConfig config;
    config.lineDensity = 21;
    config.keepDataAspect = false;
    config.dest = "+proj=natearth +lon_0=90";
    config.lonLimits = gc::LimitRequest::fromTransform();
    gc::GeoAxis axis(h.scene, h.cp, h.ingest, h.placement(), config);
    const gc::ViewLimits world = axis.limits();
    requireNear(world.xmin, -90.0, 1e-6, "domain xmin");
    requireNear(world.xmax, 270.0, 1e-6, "domain xmax");

    requireTrue(axis.zoom(1.0, 400.0, 200.0), "zoom in about lon 90");
    requireNear(axis.limits().xmin, 0.0, 1e-6, "zoomed xmin");
    requireNear(axis.limits().xmax, 180.0, 1e-6, "zoomed xmax");

    // Each step moves the centre across lon 180.
    double prev = axis.limits().xmin;
    for (int i = 0; i < 4; ++i) {
      requireTrue(axis.pan(-300.0, 0.0), "pan east");
      requireTrue(axis.limits().xmin >= prev - 1e-9, "pan east never jumps west");
      prev = axis.limits().xmin;
    }
    requireNear(axis.limits().xmax, 270.0, 1e-6, "clamped to the domain's east edge");
    requireNear(axis.limits().xmin, 90.0, 1e-6, "span kept");
    requireNear(axis.limits().ymin, -45.0, 1e-6, "latitude untouched");

    // Pivot at lon 225, which the inverse reports as -135.
    requireTrue(axis.zoom(1.0, 600.0, 200.0), "zoom in east of 180");
    requireNear(axis.limits().xmin, 157.5, 0.5, "zoom keeps the pivot: xmin");
    requireNear(axis.limits().xmax, 247.5, 0.5, "zoom keeps the pivot: xmax");

    requireTrue(axis.zoom(-0.75, 400.0, 200.0), "zoom out");
    requireNear(axis.limits().xmin, -90.0, 1e-6, "zoom out stops at domain xmin");
    requireNear(axis.limits().xmax, 270.0, 1e-6, "zoom out stops at domain xmax");
    requireNear(axis.limits().ymin, -90.0, 1e-6, "zoom out stops at domain ymin");
    requireNear(axis.limits().ymax, 90.0, 1e-6, "zoom out stops at domain ymax");

    gc::GeoAxisConfig plain;
    plain.lineDensity = 21;
    plain.keepDataAspect = false;
    gc::GeoAxis west(h.scene, h.cp, h.ingest, h.placement(2000), plain);
    west.setLimits(gc::ViewLimits{90.0, 180.0, -45.0, 45.0});
    requireTrue(west.pan(-100.0, 0.0), "pan against the east edge");
    requireNear(west.limits().xmax, 180.0, 1e-6, "stays at the east edge");
    requireNear(west.limits().xmin, 90.0, 1e-6, "does not wrap to the west");
    std::printf("  Test 10 (antimeridian): PASS\n");
  }

  // --- Test 11: data id block ---
  {
    Harness h;
    gc::GeoAxisConfig config;
    config.lineDensity = 10;
    gc::GeoAxis axis(h.scene, h.cp, h.ingest, h.placement(1000), config);
    gc::Id last = 0;
    for (std::uint32_t i = 0; i < gc::GeoAxisRecipe::MAX_DATA_SERIES; ++i) {
      last = axis.plot("s", "points@1", {{1.0, 2.0}});
    }
    requireTrue(last == 1000 + gc::GeoAxisRecipe::ID_BLOCK - 1, "last series ends the block");

    bool threw = false;
    try {
      axis.plot("overflow", "points@1", {{1.0, 2.0}});
    } catch (const std::runtime_error&) {
      threw = true;
    }
    requireTrue(threw, "series past the block rejected");
    requireTrue(!h.scene.hasBuffer(1000 + gc::GeoAxisRecipe::ID_BLOCK), "nothing created past the block");

    const gc::Id nextBase = 1000 + gc::GeoAxisRecipe::ID_BLOCK;
    gc::GeoAxis next(h.scene, h.cp, h.ingest, h.placement(nextBase), config);
    requireTrue(next.plot("n", "points@1", {{0.0, 0.0}}) == nextBase + gc::GeoAxisRecipe::ID_SLOTS + 2,
                "adjacent block usable");
    std::printf("  Test 11 (data id block): PASS\n");
  }

  std::printf("G1.8 geoaxis PASS\n");
  return 0;
}
