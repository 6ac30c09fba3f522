#pragma once
#include "gc/config/GeoAxisConfig.hpp"
#include "gc/geo/GeoAxisEngine.hpp"
#include "gc/geo/GeoTypes.hpp"
#include "gc/ids/Id.hpp"
#include "gc/proj/TransformHolder.hpp"
#include "gc/recipe/GeoAxisRecipe.hpp"
#include "gc/style/GeoStyle.hpp"
#include "gc/viewport/Viewport.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gc {

class CommandProcessor;
class GlyphAtlas;
class IngestProcessor;
class Scene;
class TextMeasurer;

// Where an axis lives in the scene.
struct GeoAxisPlacement {
  Id paneId{0};
  PixelRect pixelArea{};
  Id idBase{1000};   // start of the axis' GeoAxisRecipe::ID_BLOCK ids
};

// Geo axis bound to a scene: owns the decoration draw items of a
// GeoAxisRecipe, runs a GeoAxisEngine and writes every published frame
// into scene buffers. Data plotted through the axis is kept in lon/lat and
// re-projected when the transform changes.
//
// Every scene command the axis issues must succeed; a failure throws
// std::runtime_error carrying the command error code.
class GeoAxis {
public:
  // Throws InvalidProjectionError for bad projection definitions and
  // std::runtime_error if the coastline file cannot be read. `measurer` may
  // be null, in which case an ApproxTextMeasurer is used.
  GeoAxis(Scene& scene, CommandProcessor& cp, IngestProcessor& ingest,
          const GeoAxisPlacement& placement, const GeoAxisConfig& config,
          const TextMeasurer* measurer = nullptr);
  ~GeoAxis();

  GeoAxis(const GeoAxis&) = delete;
  GeoAxis& operator=(const GeoAxis&) = delete;

  // ---- data ----
  // Adds a data draw item on the data layer. `pipeline` must take
  // pos2_plane vertices (std::invalid_argument otherwise). Returns its id.
  Id plot(const std::string& name, const std::string& pipeline,
          const std::vector<GeoPoint>& lonlat);
  // Replaces the lon/lat points of a plotted item; false if unknown.
  bool setPlotData(Id drawItemId, const std::vector<GeoPoint>& lonlat);
  const std::vector<GeoPoint>* plotData(Id drawItemId) const;

  void setCoastlines(const GeoLine& lonlat);
  const GeoLine& coastlines() const { return coastlines_; }

  // Lon/lat bounds of visible data draw items (decorations, coastlines and
  // hidden items excluded). False when there is no such data.
  bool dataLimits(ViewLimits& out) const;
  // dataLimits() then setLimits(); leaves the limits alone on false.
  bool applyDataLimits(ViewLimits& out);

  // ---- inputs ----
  void setLimits(const ViewLimits& limits);
  void setTransform(const std::string& source, const std::string& dest);
  void setTransform(std::shared_ptr<const Transform> transform);
  void setPixelArea(const PixelRect& area);
  void setTickPolicy(TickAxis axis, TickPolicy policy);
  void setTickFormatter(TickAxis axis, TickFormatter format);
  void setLineDensity(int density);
  void setRemoveOverlappingTicks(bool enable);
  void setLabelStyle(TickAxis axis, const LabelStyle& style);

  template <typename Fn>
  void batch(Fn&& fn) { engine_->batch(std::forward<Fn>(fn)); }

  // ---- interaction ----
  // Move the view by a pixel delta (content follows the pointer). False if
  // the viewport centre cannot be mapped back to lon/lat.
  bool pan(double dxPx, double dyPx);
  // factor > 0 zooms in about the pivot pixel, -1 < factor < 0 zooms out.
  bool zoom(double factor, double pivotPx, double pivotPy);

  // ---- decorations ----
  void setDecorationVisible(GeoDecoration d, bool visible);
  bool decorationVisible(GeoDecoration d) const;
  void setCoastlinesVisible(bool visible) { setDecorationVisible(GeoDecoration::Coastlines, visible); }
  void setStyle(const GeoAxisStyle& style);
  const GeoAxisStyle& style() const { return style_; }

  // Label glyphs are only emitted while an atlas is attached.
  void attachGlyphAtlas(const GlyphAtlas* atlas);

  // Deletes every scene resource of the axis. Further calls are no-ops.
  void dispose();

  // ---- state ----
  const ViewLimits& limits() const { return engine_->limits(); }
  const std::shared_ptr<const Transform>& transform() const { return holder_.get(); }
  std::shared_ptr<const GeoAxisFrame> frame() const { return engine_->frame(); }
  const Viewport& viewport() const { return engine_->viewport(); }
  const std::string& lastError() const { return engine_->lastError(); }
  GeoAxisEngine& engine() { return *engine_; }
  const GeoAxisRecipe& recipe() const { return recipe_; }
  std::uint64_t sceneSyncCount() const { return syncCount_; }

private:
  struct DataSeries {
    DrawChain ids;
    std::vector<GeoPoint> lonlat;
  };

  void apply(const std::string& cmd);
  void syncScene();
  void uploadDecorations(const GeoAxisFrame& frame);
  void uploadLine(Id bufferId, Id geometryId, const GeoLine& points);
  void uploadGlyphs(GeoDecoration d, const GeoLine& positions,
                    const std::vector<std::string>& labels,
                    const std::vector<bool>& visible, float fontSize);
  void reprojectData(const Transform& transform);
  void requestSync();
  DataSeries* findSeries(Id drawItemId);
  const DataSeries* findSeries(Id drawItemId) const;

  Scene& scene_;
  CommandProcessor& cp_;
  IngestProcessor& ingest_;
  GeoAxisPlacement placement_;
  GeoAxisStyle style_;

  std::unique_ptr<TextMeasurer> ownedMeasurer_;
  TransformHolder holder_;
  std::unique_ptr<GeoAxisEngine> engine_;
  GeoAxisRecipe recipe_;
  RecipeBuildResult build_;
  bool disposed_{false};

  NodeId sceneNode_{0};
  const GlyphAtlas* atlas_{nullptr};
  bool visible_[static_cast<int>(GeoDecoration::Count)];

  std::vector<DataSeries> series_;
  GeoLine coastlines_;

  std::uint64_t uploadedGeneration_{0};
  const Transform* projectedWith_{nullptr};
  bool dataDirty_{false};
  std::uint64_t syncCount_{0};
};

} // namespace gc
