#pragma once
#include "gc/geo/GeoTypes.hpp"
#include "gc/geo/GridSampler.hpp"
#include "gc/geo/LabelPlacement.hpp"
#include "gc/geo/TickGenerator.hpp"
#include "gc/reactive/ReactiveGraph.hpp"
#include "gc/viewport/Viewport.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gc {

class TextMeasurer;
class Transform;
class TransformHolder;

struct ProjectedGeometry {
  GeoLine xGrid;                      // plane units, kBreakPoint between lines
  GeoLine yGrid;
  std::array<GeoLine, 4> spines;      // plane units, indexed by Spine
  GeoLine xTickAnchors;               // pixels, on the bottom spine
  GeoLine yTickAnchors;               // pixels, on the left spine
  GeoLine xLabelPositions;            // pixels, anchor + directional pad
  GeoLine yLabelPositions;
  std::vector<std::string> xTickLabels;
  std::vector<std::string> yTickLabels;
  std::vector<PixelBox> xLabelBoxes;
  std::vector<PixelBox> yLabelBoxes;
};

// Everything one recompute produced. Published as a whole.
struct GeoAxisFrame {
  std::uint64_t generation{0};
  ViewLimits limits;
  PlaneRange planeRange;    // viewport range after aspect fitting
  PixelRect pixelArea;
  std::shared_ptr<const Transform> transform;
  TickLabels xTicks;
  TickLabels yTicks;
  ProjectedGeometry geometry;
  OverlapState overlap;
  int lineDensity{0};
};

struct GeoAxisEngineSettings {
  int lineDensity{1000};
  bool removeOverlappingTicks{true};
  bool keepDataAspect{true};
  PixelRect pixelArea{};
  TickPolicy xTickPolicy{};
  TickPolicy yTickPolicy{};
  TickFormatter xTickFormat{longitudeFormatter()};
  TickFormatter yTickFormat{latitudeFormatter()};
  LabelStyle xLabelStyle{};
  LabelStyle yLabelStyle{};
};

// Owns the axis inputs as source nodes of a ReactiveGraph and one derived
// node that runs ticks -> sampling -> projection -> label placement and
// publishes a GeoAxisFrame. Setters trigger recomputation synchronously;
// use batch() to fold several changes into one recompute.
//
// A recompute that throws publishes nothing: the previous frame stays
// current and the message is kept in lastError().
class GeoAxisEngine {
public:
  using FrameListener = std::function<void(const GeoAxisFrame&)>;

  // Throws std::invalid_argument for non-finite limits. Runs the first
  // recompute before returning.
  GeoAxisEngine(TransformHolder& transform, const ViewLimits& limits,
                GeoAxisEngineSettings settings, const TextMeasurer& measurer);
  ~GeoAxisEngine();

  GeoAxisEngine(const GeoAxisEngine&) = delete;
  GeoAxisEngine& operator=(const GeoAxisEngine&) = delete;

  // ---- inputs ----
  void setLimits(const ViewLimits& limits);      // throws std::invalid_argument if non-finite
  void setPixelArea(const PixelRect& area);      // throws std::invalid_argument if empty
  void setTickPolicy(TickAxis axis, TickPolicy policy);
  void setTickFormatter(TickAxis axis, TickFormatter format);
  void setLabelStyle(TickAxis axis, const LabelStyle& style);
  void setLineDensity(int density);
  void setRemoveOverlappingTicks(bool enable);

  template <typename Fn>
  void batch(Fn&& fn) { graph_.batch(std::forward<Fn>(fn)); }

  // ---- state ----
  const ViewLimits& limits() const { return limits_; }
  const GeoAxisEngineSettings& settings() const { return settings_; }
  TransformHolder& transformHolder() { return holder_; }

  // Last published frame; null only if no recompute ever succeeded.
  std::shared_ptr<const GeoAxisFrame> frame() const { return frame_; }
  // Viewport of the last published frame.
  const Viewport& viewport() const { return viewport_; }

  std::uint64_t recomputeCount() const { return recomputeCount_; }
  std::uint64_t generation() const { return generation_; }
  const std::string& lastError() const { return lastError_; }

  std::uint32_t addFrameListener(FrameListener fn);
  void removeFrameListener(std::uint32_t token);

  // Lets owners hang their own derived nodes off the engine inputs.
  ReactiveGraph& graph() { return graph_; }
  NodeId transformNode() const { return transformNode_; }
  NodeId frameNode() const { return frameNode_; }

private:
  void recompute();
  void buildFrame(GeoAxisFrame& out, Viewport& viewport) const;
  void placeLabels(const Transform& transform, const Viewport& viewport,
                   const ViewLimits& limits, TickAxis axis,
                   const TickLabels& ticks, GeoAxisFrame& out) const;

  TransformHolder& holder_;
  const TextMeasurer& measurer_;
  ViewLimits limits_;
  GeoAxisEngineSettings settings_;

  ReactiveGraph graph_;
  NodeId limitsNode_{0};
  NodeId transformNode_{0};
  NodeId xTicksNode_{0};
  NodeId yTicksNode_{0};
  NodeId pixelAreaNode_{0};
  NodeId densityNode_{0};
  NodeId overlapNode_{0};
  NodeId labelStyleNode_{0};
  NodeId frameNode_{0};

  std::uint32_t transformToken_{0};

  std::shared_ptr<const GeoAxisFrame> frame_;
  Viewport viewport_;
  std::uint64_t recomputeCount_{0};
  std::uint64_t generation_{0};
  std::string lastError_;

  struct Listener {
    std::uint32_t token;
    FrameListener fn;
  };
  std::vector<Listener> listeners_;
  std::uint32_t nextListenerToken_{1};
};

} // namespace gc
