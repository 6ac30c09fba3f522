#include "gc/geo/GeoAxisEngine.hpp"
#include "gc/geo/BatchProjector.hpp"
#include "gc/proj/TransformHolder.hpp"
#include "gc/text/TextMeasurer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace gc {

namespace {

struct Bounds {
  double xMin{std::numeric_limits<double>::infinity()};
  double xMax{-std::numeric_limits<double>::infinity()};
  double yMin{std::numeric_limits<double>::infinity()};
  double yMax{-std::numeric_limits<double>::infinity()};
  bool any{false};

  void add(const GeoLine& line) {
    for (const GeoPoint& p : line) {
      if (!isFinitePoint(p)) continue;
      xMin = std::min(xMin, p.x);
      xMax = std::max(xMax, p.x);
      yMin = std::min(yMin, p.y);
      yMax = std::max(yMax, p.y);
      any = true;
    }
  }
};

// Zero-width plane ranges (a point or a line) get one unit around the centre.
void widen(double& lo, double& hi) {
  if (hi - lo > 1e-12 * std::max(1.0, std::fabs(lo))) return;
  const double c = 0.5 * (lo + hi);
  const double half = std::max(0.5, std::fabs(c) * 1e-6);
  lo = c - half;
  hi = c + half;
}

void requireFinite(const ViewLimits& l) {
  if (!l.isFinite()) throw std::invalid_argument("GeoAxisEngine: limits must be finite");
}

} // namespace

GeoAxisEngine::GeoAxisEngine(TransformHolder& transform, const ViewLimits& limits,
                             GeoAxisEngineSettings settings, const TextMeasurer& measurer)
  : holder_(transform), measurer_(measurer), settings_(std::move(settings)) {
  requireFinite(limits);
  limits_.xmin = std::min(limits.xmin, limits.xmax);
  limits_.xmax = std::max(limits.xmin, limits.xmax);
  limits_.ymin = std::min(limits.ymin, limits.ymax);
  limits_.ymax = std::max(limits.ymin, limits.ymax);

  limitsNode_     = graph_.addSource("limits");
  transformNode_  = graph_.addSource("transform");
  xTicksNode_     = graph_.addSource("xTicks");
  yTicksNode_     = graph_.addSource("yTicks");
  pixelAreaNode_  = graph_.addSource("pixelArea");
  densityNode_    = graph_.addSource("lineDensity");
  overlapNode_    = graph_.addSource("removeOverlappingTicks");
  labelStyleNode_ = graph_.addSource("labelStyle");
  frameNode_ = graph_.addDerived("geoAxisFrame",
                                 {limitsNode_, transformNode_, xTicksNode_, yTicksNode_,
                                  pixelAreaNode_, densityNode_, overlapNode_, labelStyleNode_},
                                 [this] { recompute(); });

  transformToken_ = holder_.subscribe(
      [this](const std::shared_ptr<const Transform>&) { graph_.invalidate(transformNode_); });

  graph_.invalidate(frameNode_);
}

GeoAxisEngine::~GeoAxisEngine() {
  holder_.unsubscribe(transformToken_);
}

// -------------------- inputs --------------------

void GeoAxisEngine::setLimits(const ViewLimits& limits) {
  requireFinite(limits);
  limits_.xmin = std::min(limits.xmin, limits.xmax);
  limits_.xmax = std::max(limits.xmin, limits.xmax);
  limits_.ymin = std::min(limits.ymin, limits.ymax);
  limits_.ymax = std::max(limits.ymin, limits.ymax);
  graph_.invalidate(limitsNode_);
}

void GeoAxisEngine::setPixelArea(const PixelRect& area) {
  if (!(area.width > 0.0) || !(area.height > 0.0) ||
      !std::isfinite(area.x) || !std::isfinite(area.y)) {
    throw std::invalid_argument("GeoAxisEngine: pixel area must be non-empty");
  }
  settings_.pixelArea = area;
  graph_.invalidate(pixelAreaNode_);
}

void GeoAxisEngine::setTickPolicy(TickAxis axis, TickPolicy policy) {
  if (axis == TickAxis::X) {
    settings_.xTickPolicy = std::move(policy);
    graph_.invalidate(xTicksNode_);
  } else {
    settings_.yTickPolicy = std::move(policy);
    graph_.invalidate(yTicksNode_);
  }
}

void GeoAxisEngine::setTickFormatter(TickAxis axis, TickFormatter format) {
  if (axis == TickAxis::X) {
    settings_.xTickFormat = std::move(format);
    graph_.invalidate(xTicksNode_);
  } else {
    settings_.yTickFormat = std::move(format);
    graph_.invalidate(yTicksNode_);
  }
}

void GeoAxisEngine::setLabelStyle(TickAxis axis, const LabelStyle& style) {
  (axis == TickAxis::X ? settings_.xLabelStyle : settings_.yLabelStyle) = style;
  graph_.invalidate(labelStyleNode_);
}

void GeoAxisEngine::setLineDensity(int density) {
  settings_.lineDensity = density;
  graph_.invalidate(densityNode_);
}

void GeoAxisEngine::setRemoveOverlappingTicks(bool enable) {
  settings_.removeOverlappingTicks = enable;
  graph_.invalidate(overlapNode_);
}

std::uint32_t GeoAxisEngine::addFrameListener(FrameListener fn) {
  const std::uint32_t token = nextListenerToken_++;
  listeners_.push_back(Listener{token, std::move(fn)});
  return token;
}

void GeoAxisEngine::removeFrameListener(std::uint32_t token) {
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [token](const Listener& l) { return l.token == token; }),
                   listeners_.end());
}

// -------------------- recompute --------------------

void GeoAxisEngine::recompute() {
  recomputeCount_++;

  auto next = std::make_shared<GeoAxisFrame>();
  Viewport vp;
  try {
    buildFrame(*next, vp);
  } catch (const std::exception& e) {
    lastError_ = e.what();
    std::fprintf(stderr, "GeoAxisEngine: recompute failed: %s\n", e.what());
    return;
  }

  next->generation = ++generation_;
  frame_ = next;
  viewport_ = vp;
  lastError_.clear();

  const auto snapshot = listeners_;
  for (const auto& l : snapshot) l.fn(*frame_);
}

void GeoAxisEngine::buildFrame(GeoAxisFrame& out, Viewport& viewport) const {
  const std::shared_ptr<const Transform> transform = holder_.get();
  const ViewLimits limits = limits_;

  out.limits = limits;
  out.transform = transform;
  out.pixelArea = settings_.pixelArea;

  // 1. ticks
  out.xTicks = generateTicks(limits.xmin, limits.xmax, settings_.xTickPolicy, settings_.xTickFormat);
  out.yTicks = generateTicks(limits.ymin, limits.ymax, settings_.yTickPolicy, settings_.yTickFormat);

  // 2. input-space sampling
  const SampledGrid grid = sampleGrid(limits, out.xTicks.values, out.yTicks.values,
                                      settings_.lineDensity);
  out.lineDensity = grid.density;

  // 3. projection to the plane
  ProjectedGeometry& geo = out.geometry;
  geo.xGrid = projectPoints(*transform, grid.xGrid);
  geo.yGrid = projectPoints(*transform, grid.yGrid);
  Bounds bounds;
  for (std::size_t i = 0; i < grid.spines.size(); ++i) {
    geo.spines[i] = projectPoints(*transform, grid.spines[i]);
    bounds.add(geo.spines[i]);
  }
  bounds.add(geo.xGrid);
  bounds.add(geo.yGrid);
  if (!bounds.any) {
    throw std::runtime_error("view limits do not project to any finite point");
  }
  widen(bounds.xMin, bounds.xMax);
  widen(bounds.yMin, bounds.yMax);

  viewport.setPixelArea(settings_.pixelArea);
  viewport.setPlaneRange(bounds.xMin, bounds.xMax, bounds.yMin, bounds.yMax);
  if (settings_.keepDataAspect) viewport.fitDataAspect();
  out.planeRange = viewport.planeRange();

  // 4. anchors, padding and overlap
  placeLabels(*transform, viewport, limits, TickAxis::X, out.xTicks, out);
  placeLabels(*transform, viewport, limits, TickAxis::Y, out.yTicks, out);

  out.overlap = resolveOverlaps(geo.xLabelBoxes, settings_.xLabelStyle.visible,
                                geo.yLabelBoxes, settings_.yLabelStyle.visible,
                                settings_.removeOverlappingTicks);
}

void GeoAxisEngine::placeLabels(const Transform& transform, const Viewport& viewport,
                                const ViewLimits& limits, TickAxis axis,
                                const TickLabels& ticks, GeoAxisFrame& out) const {
  const bool isX = (axis == TickAxis::X);
  const LabelStyle& style = isX ? settings_.xLabelStyle : settings_.yLabelStyle;
  ProjectedGeometry& geo = out.geometry;

  GeoLine& anchors = isX ? geo.xTickAnchors : geo.yTickAnchors;
  GeoLine& positions = isX ? geo.xLabelPositions : geo.yLabelPositions;
  std::vector<PixelBox>& boxes = isX ? geo.xLabelBoxes : geo.yLabelBoxes;
  (isX ? geo.xTickLabels : geo.yTickLabels) = ticks.labels;

  const GeoLine inputs = isX ? xTickAnchors(limits, ticks.values)
                             : yTickAnchors(limits, ticks.values);
  anchors.reserve(inputs.size());
  positions.reserve(inputs.size());
  boxes.reserve(inputs.size());

  for (std::size_t i = 0; i < inputs.size(); ++i) {
    const GeoPoint a = projectToPixel(transform, viewport, inputs[i]);
    GeoPoint pos = kBreakPoint;
    if (isFinitePoint(a)) {
      const GeoPoint off = directionalPad(transform, viewport, limits, inputs[i], axis,
                                          ticks.labels[i], style, measurer_);
      pos = GeoPoint{a.x + off.x, a.y + off.y};
    }
    anchors.push_back(a);
    positions.push_back(pos);
    boxes.push_back(labelBox(pos, ticks.labels[i], style, measurer_));
  }
}

} // namespace gc
