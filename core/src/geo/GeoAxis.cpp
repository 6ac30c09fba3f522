#include "gc/geo/GeoAxis.hpp"
#include "gc/commands/CommandProcessor.hpp"
#include "gc/data/GeoJsonLines.hpp"
#include "gc/geo/BatchProjector.hpp"
#include "gc/geo/LimitsResolver.hpp"
#include "gc/ingest/IngestProcessor.hpp"
#include "gc/pipelines/PipelineCatalog.hpp"
#include "gc/proj/Transform.hpp"
#include "gc/scene/Scene.hpp"
#include "gc/text/TextMeasurer.hpp"
#include "gc/viewport/DataLimits.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace gc {

namespace {

std::unique_ptr<TextMeasurer> fallbackMeasurer(const TextMeasurer* given) {
  if (given) return nullptr;
  return std::make_unique<ApproxTextMeasurer>();
}

std::shared_ptr<const Transform> transformFor(const GeoAxisConfig& config) {
  if (config.transformation) return config.transformation;
  return Transform::create(config.source, config.dest);
}

GeoAxisEngineSettings engineSettings(const GeoAxisConfig& config, const PixelRect& area) {
  GeoAxisEngineSettings s;
  s.lineDensity = config.lineDensity;
  s.removeOverlappingTicks = config.removeOverlappingTicks;
  s.keepDataAspect = config.keepDataAspect;
  s.pixelArea = area;
  s.xTickPolicy = config.xTickPolicy;
  s.yTickPolicy = config.yTickPolicy;
  s.xTickFormat = config.xTickFormat;
  s.yTickFormat = config.yTickFormat;
  s.xLabelStyle = config.xLabelStyle;
  s.yLabelStyle = config.yLabelStyle;
  return s;
}

GeoAxisStyle labelAwareStyle(const GeoAxisConfig& config) {
  GeoAxisStyle s = config.style;
  s[GeoDecoration::XTickLabels].visible &= config.xLabelStyle.visible;
  s[GeoDecoration::YTickLabels].visible &= config.yLabelStyle.visible;
  return s;
}

GeoAxisRecipeConfig recipeConfig(const GeoAxisPlacement& placement, const GeoAxisConfig& config) {
  GeoAxisRecipeConfig rc;
  rc.paneId = placement.paneId;
  rc.style = labelAwareStyle(config);
  rc.coastlines = config.coastlines;
  return rc;
}

// Keep a span inside [wlo, whi], shifting first and shrinking only when it
// does not fit.
void clampSpan(double& lo, double& hi, double wlo, double whi) {
  const double span = hi - lo;
  if (span >= whi - wlo) {
    lo = wlo;
    hi = whi;
  } else if (lo < wlo) {
    lo = wlo;
    hi = wlo + span;
  } else if (hi > whi) {
    hi = whi;
    lo = whi - span;
  }
}

void clampToDomain(ViewLimits& l, const GeoDomain& dom) {
  clampSpan(l.xmin, l.xmax, dom.lonMin, dom.lonMax);
  clampSpan(l.ymin, l.ymax, dom.latMin, dom.latMax);
}

// Inverse projection wraps longitudes into [-180, 180]; move `lon` by whole
// turns to the copy nearest `ref`.
double unwrapNear(double lon, double ref) {
  return ref + std::remainder(lon - ref, 360.0);
}

TickAxis labelAxis(GeoDecoration d) {
  return d == GeoDecoration::XTickLabels ? TickAxis::X : TickAxis::Y;
}

bool isLabelDecoration(GeoDecoration d) {
  return d == GeoDecoration::XTickLabels || d == GeoDecoration::YTickLabels;
}

const char* kBeginFrame = R"({"cmd":"beginFrame"})";
const char* kCommitFrame = R"({"cmd":"commitFrame"})";

} // namespace

GeoAxis::GeoAxis(Scene& scene, CommandProcessor& cp, IngestProcessor& ingest,
                 const GeoAxisPlacement& placement, const GeoAxisConfig& config,
                 const TextMeasurer* measurer)
  : scene_(scene), cp_(cp), ingest_(ingest), placement_(placement),
    style_(labelAwareStyle(config)),
    ownedMeasurer_(fallbackMeasurer(measurer)),
    holder_(transformFor(config)),
    recipe_(placement.idBase, recipeConfig(placement, config)) {
  if (!config.coastlinePath.empty() &&
      !loadGeoJsonLinesFile(config.coastlinePath, coastlines_)) {
    throw std::runtime_error("GeoAxis: cannot load coastlines from " + config.coastlinePath);
  }

  const ViewLimits limits = resolveLimits(config.lonLimits, config.latLimits,
                                          *holder_.get(), ViewLimits{});
  engine_ = std::make_unique<GeoAxisEngine>(
      holder_, limits, engineSettings(config, placement.pixelArea),
      measurer ? *measurer : *ownedMeasurer_);

  for (int i = 0; i < static_cast<int>(GeoDecoration::Count); i++) {
    visible_[i] = recipe_.initiallyVisible(static_cast<GeoDecoration>(i));
  }

  build_ = recipe_.build();
  for (const auto& cmd : build_.createCommands) apply(cmd);

  sceneNode_ = engine_->graph().addDerived(
      "sceneSync", {engine_->frameNode(), engine_->transformNode()},
      [this] { syncScene(); });
  dataDirty_ = true;
  requestSync();
}

GeoAxis::~GeoAxis() = default;

void GeoAxis::apply(const std::string& cmd) {
  const CmdResult r = cp_.applyJsonText(cmd);
  if (!r.ok) {
    throw std::runtime_error("GeoAxis: " + r.err.code + ": " + r.err.message);
  }
}

void GeoAxis::requestSync() {
  engine_->graph().invalidate(sceneNode_);
}

// -------------------- data --------------------

Id GeoAxis::plot(const std::string& name, const std::string& pipeline,
                 const std::vector<GeoPoint>& lonlat) {
  const PipelineSpec* spec = cp_.catalog().find(pipeline);
  if (!spec || spec->requiredVertexFormat != VertexFormat::Pos2_Plane) {
    throw std::invalid_argument("GeoAxis: pipeline '" + pipeline +
                                "' does not take pos2_plane vertices");
  }

  if (series_.size() >= GeoAxisRecipe::MAX_DATA_SERIES) {
    throw std::runtime_error("GeoAxis: data series limit (" +
                             std::to_string(GeoAxisRecipe::MAX_DATA_SERIES) + ") reached");
  }
  const Id base = placement_.idBase + GeoAxisRecipe::ID_SLOTS +
                  3 * static_cast<Id>(series_.size());
  DataSeries s;
  s.ids = DrawChain{base, base + 1, base + 2};
  s.lonlat = lonlat;
  for (const auto& cmd : createChainCommands(s.ids, recipe_.dataLayerId(), name,
                                             VertexFormat::Pos2_Plane, pipeline, true)) {
    apply(cmd);
  }

  series_.push_back(std::move(s));
  dataDirty_ = true;
  requestSync();
  return series_.back().ids.drawItemId;
}

GeoAxis::DataSeries* GeoAxis::findSeries(Id drawItemId) {
  for (auto& s : series_) {
    if (s.ids.drawItemId == drawItemId) return &s;
  }
  return nullptr;
}

const GeoAxis::DataSeries* GeoAxis::findSeries(Id drawItemId) const {
  for (const auto& s : series_) {
    if (s.ids.drawItemId == drawItemId) return &s;
  }
  return nullptr;
}

bool GeoAxis::setPlotData(Id drawItemId, const std::vector<GeoPoint>& lonlat) {
  DataSeries* s = findSeries(drawItemId);
  if (!s) return false;
  s->lonlat = lonlat;
  dataDirty_ = true;
  requestSync();
  return true;
}

const std::vector<GeoPoint>* GeoAxis::plotData(Id drawItemId) const {
  const DataSeries* s = findSeries(drawItemId);
  return s ? &s->lonlat : nullptr;
}

void GeoAxis::setCoastlines(const GeoLine& lonlat) {
  coastlines_ = lonlat;
  dataDirty_ = true;
  requestSync();
}

bool GeoAxis::dataLimits(ViewLimits& out) const {
  std::vector<LonLatSeries> series;
  series.reserve(series_.size());
  for (const auto& s : series_) {
    series.push_back(LonLatSeries{s.ids.drawItemId, &s.lonlat});
  }
  return DataLimits().compute(series, cp_.scene(), out);
}

bool GeoAxis::applyDataLimits(ViewLimits& out) {
  if (!dataLimits(out)) return false;
  setLimits(out);
  return true;
}

// -------------------- inputs --------------------

void GeoAxis::setLimits(const ViewLimits& limits) { engine_->setLimits(limits); }

void GeoAxis::setTransform(const std::string& source, const std::string& dest) {
  holder_.set(source, dest);
}

void GeoAxis::setTransform(std::shared_ptr<const Transform> transform) {
  holder_.set(std::move(transform));
}

void GeoAxis::setPixelArea(const PixelRect& area) { engine_->setPixelArea(area); }

void GeoAxis::setTickPolicy(TickAxis axis, TickPolicy policy) {
  engine_->setTickPolicy(axis, std::move(policy));
}

void GeoAxis::setTickFormatter(TickAxis axis, TickFormatter format) {
  engine_->setTickFormatter(axis, std::move(format));
}

void GeoAxis::setLineDensity(int density) { engine_->setLineDensity(density); }

void GeoAxis::setRemoveOverlappingTicks(bool enable) {
  engine_->setRemoveOverlappingTicks(enable);
}

// Label visibility lives in both the label style (overlap resolution) and
// the label draw item; keep them in step.
void GeoAxis::setLabelStyle(TickAxis axis, const LabelStyle& style) {
  const GeoDecoration d = axis == TickAxis::X ? GeoDecoration::XTickLabels
                                              : GeoDecoration::YTickLabels;
  const int i = static_cast<int>(d);
  if (visible_[i] != style.visible) {
    visible_[i] = style.visible;
    apply(makeVisibleCmd(recipe_.drawItemId(d), style.visible));
  }
  engine_->setLabelStyle(axis, style);
}

// -------------------- interaction --------------------

bool GeoAxis::pan(double dxPx, double dyPx) {
  const auto frame = engine_->frame();
  if (!frame || !std::isfinite(dxPx) || !std::isfinite(dyPx)) return false;

  const Viewport& vp = engine_->viewport();
  const PixelRect& area = vp.pixelArea();
  const double cx = area.x + 0.5 * area.width;
  const double cy = area.y + 0.5 * area.height;

  GeoPoint from, to;
  if (!pixelToLonLat(*frame->transform, vp, cx, cy, from) ||
      !pixelToLonLat(*frame->transform, vp, cx - dxPx, cy - dyPx, to)) {
    return false;
  }

  ViewLimits l = engine_->limits();
  const double dLon = std::remainder(to.x - from.x, 360.0);
  const double dLat = to.y - from.y;
  l.xmin += dLon;
  l.xmax += dLon;
  l.ymin += dLat;
  l.ymax += dLat;
  clampToDomain(l, frame->transform->domain());
  setLimits(l);
  return true;
}

bool GeoAxis::zoom(double factor, double pivotPx, double pivotPy) {
  if (!std::isfinite(factor) || factor <= -1.0) {
    throw std::invalid_argument("GeoAxis: zoom factor must be > -1");
  }
  const auto frame = engine_->frame();
  if (!frame) return false;

  GeoPoint pivot;
  if (!pixelToLonLat(*frame->transform, engine_->viewport(), pivotPx, pivotPy, pivot)) {
    return false;
  }

  const double s = 1.0 / (1.0 + factor);
  ViewLimits l = engine_->limits();
  pivot.x = unwrapNear(pivot.x, 0.5 * (l.xmin + l.xmax));
  l.xmin = pivot.x + (l.xmin - pivot.x) * s;
  l.xmax = pivot.x + (l.xmax - pivot.x) * s;
  l.ymin = pivot.y + (l.ymin - pivot.y) * s;
  l.ymax = pivot.y + (l.ymax - pivot.y) * s;
  clampToDomain(l, frame->transform->domain());
  setLimits(l);
  return true;
}

// -------------------- decorations --------------------

void GeoAxis::setDecorationVisible(GeoDecoration d, bool visible) {
  if (isLabelDecoration(d)) {
    const TickAxis axis = labelAxis(d);
    LabelStyle s = axis == TickAxis::X ? engine_->settings().xLabelStyle
                                       : engine_->settings().yLabelStyle;
    s.visible = visible;
    setLabelStyle(axis, s);
    return;
  }
  visible_[static_cast<int>(d)] = visible;
  apply(makeVisibleCmd(recipe_.drawItemId(d), visible));
}

bool GeoAxis::decorationVisible(GeoDecoration d) const {
  return visible_[static_cast<int>(d)];
}

void GeoAxis::setStyle(const GeoAxisStyle& style) {
  style_ = style;
  for (const auto& cmd : recipe_.styleCommands(style)) apply(cmd);
}

void GeoAxis::attachGlyphAtlas(const GlyphAtlas* atlas) {
  atlas_ = atlas;
  uploadedGeneration_ = 0;
  requestSync();
}

void GeoAxis::dispose() {
  if (disposed_) return;
  for (auto it = series_.rbegin(); it != series_.rend(); ++it) {
    for (const auto& cmd : disposeChainCommands(it->ids)) apply(cmd);
    ingest_.releaseBuffer(it->ids.bufferId);
  }
  for (const auto& cmd : build_.disposeCommands) apply(cmd);
  for (int i = 0; i < static_cast<int>(GeoDecoration::Count); i++) {
    ingest_.releaseBuffer(recipe_.bufferId(static_cast<GeoDecoration>(i)));
  }
  series_.clear();
  disposed_ = true;
}

// -------------------- scene upload --------------------

void GeoAxis::syncScene() {
  if (disposed_) return;
  syncCount_++;

  const auto frame = engine_->frame();
  const std::shared_ptr<const Transform> transform = frame ? frame->transform : holder_.get();

  const bool decorations = frame && frame->generation != uploadedGeneration_;
  const bool data = dataDirty_ || transform.get() != projectedWith_;
  if (!decorations && !data) return;

  const bool ownFrame = !cp_.inFrame();
  if (ownFrame) apply(kBeginFrame);

  if (decorations) {
    uploadDecorations(*frame);
    uploadedGeneration_ = frame->generation;
  }
  if (data) {
    reprojectData(*transform);
    projectedWith_ = transform.get();
    dataDirty_ = false;
  }
  ingest_.syncBufferLengths(scene_);

  if (ownFrame) apply(kCommitFrame);
}

void GeoAxis::uploadLine(Id bufferId, Id geometryId, const GeoLine& points) {
  std::vector<float> verts;
  appendVertices(points, verts);
  ingest_.setBufferFloats(bufferId, verts);
  apply(R"({"cmd":"setGeometryVertexCount","geometryId":)" + idStr(geometryId) +
        R"(,"vertexCount":)" + std::to_string(points.size()) + "}");
}

void GeoAxis::uploadGlyphs(GeoDecoration d, const GeoLine& positions,
                           const std::vector<std::string>& labels,
                           const std::vector<bool>& visible, float fontSize) {
  std::vector<float> glyphs;
  int count = 0;
  if (atlas_) {
    count = GeoAxisRecipe::computeLabelGlyphs(*atlas_, positions, labels, visible,
                                              fontSize, glyphs);
  }
  ingest_.setBufferFloats(recipe_.bufferId(d), glyphs);
  apply(R"({"cmd":"setGeometryVertexCount","geometryId":)" + idStr(recipe_.geometryId(d)) +
        R"(,"vertexCount":)" + std::to_string(count) + "}");
}

void GeoAxis::uploadDecorations(const GeoAxisFrame& frame) {
  const ProjectedGeometry& g = frame.geometry;
  const auto line = [this](GeoDecoration d, const GeoLine& pts) {
    uploadLine(recipe_.bufferId(d), recipe_.geometryId(d), pts);
  };

  line(GeoDecoration::XGrid, g.xGrid);
  line(GeoDecoration::YGrid, g.yGrid);
  line(GeoDecoration::TopSpine, g.spines[static_cast<int>(Spine::Top)]);
  line(GeoDecoration::BottomSpine, g.spines[static_cast<int>(Spine::Bottom)]);
  line(GeoDecoration::LeftSpine, g.spines[static_cast<int>(Spine::Left)]);
  line(GeoDecoration::RightSpine, g.spines[static_cast<int>(Spine::Right)]);
  line(GeoDecoration::XTickAnchors, g.xTickAnchors);
  line(GeoDecoration::YTickAnchors, g.yTickAnchors);

  const GeoAxisEngineSettings& s = engine_->settings();
  uploadGlyphs(GeoDecoration::XTickLabels, g.xLabelPositions, g.xTickLabels,
               frame.overlap.xVisible, s.xLabelStyle.fontSize);
  uploadGlyphs(GeoDecoration::YTickLabels, g.yLabelPositions, g.yTickLabels,
               frame.overlap.yVisible, s.yLabelStyle.fontSize);
}

void GeoAxis::reprojectData(const Transform& transform) {
  for (const auto& s : series_) {
    uploadLine(s.ids.bufferId, s.ids.geometryId, projectPoints(transform, s.lonlat));
  }
  uploadLine(recipe_.bufferId(GeoDecoration::Coastlines),
             recipe_.geometryId(GeoDecoration::Coastlines),
             projectPoints(transform, coastlines_));
}

} // namespace gc
