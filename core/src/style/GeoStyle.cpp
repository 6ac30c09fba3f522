#include "gc/style/GeoStyle.hpp"

#include <cstdio>
#include <string>

namespace gc {

const char* toString(GeoDecoration d) {
  switch (d) {
    case GeoDecoration::XGrid: return "xGrid";
    case GeoDecoration::YGrid: return "yGrid";
    case GeoDecoration::TopSpine: return "topSpine";
    case GeoDecoration::BottomSpine: return "bottomSpine";
    case GeoDecoration::LeftSpine: return "leftSpine";
    case GeoDecoration::RightSpine: return "rightSpine";
    case GeoDecoration::XTickLabels: return "xTickLabels";
    case GeoDecoration::YTickLabels: return "yTickLabels";
    case GeoDecoration::XTickAnchors: return "xTickAnchors";
    case GeoDecoration::YTickAnchors: return "yTickAnchors";
    case GeoDecoration::Coastlines: return "coastlines";
    default: return "unknown";
  }
}

static void setColor(float dst[4], float r, float g, float b, float a) {
  dst[0] = r; dst[1] = g; dst[2] = b; dst[3] = a;
}

// -------------------- Built-in presets --------------------

GeoAxisStyle lightGeoStyle() {
  GeoAxisStyle s;
  s.name = "Light";
  setColor(s.backgroundColor, 1.0f, 1.0f, 1.0f, 1.0f);

  for (GeoDecoration d : {GeoDecoration::XGrid, GeoDecoration::YGrid}) {
    setColor(s[d].color, 0.0f, 0.0f, 0.0f, 0.12f);
    s[d].lineWidth = 1.0f;
  }
  for (GeoDecoration d : {GeoDecoration::TopSpine, GeoDecoration::BottomSpine,
                          GeoDecoration::LeftSpine, GeoDecoration::RightSpine}) {
    setColor(s[d].color, 0.0f, 0.0f, 0.0f, 1.0f);
    s[d].lineWidth = 1.0f;
  }
  setColor(s[GeoDecoration::XTickLabels].color, 0.0f, 0.0f, 0.0f, 1.0f);
  setColor(s[GeoDecoration::YTickLabels].color, 0.0f, 0.0f, 0.0f, 1.0f);
  for (GeoDecoration d : {GeoDecoration::XTickAnchors, GeoDecoration::YTickAnchors}) {
    setColor(s[d].color, 0.0f, 0.0f, 0.0f, 1.0f);
    s[d].lineWidth = 3.0f;
    s[d].visible = false;
  }

  setColor(s[GeoDecoration::Coastlines].color, 0.0f, 0.0f, 0.0f, 1.0f);
  s[GeoDecoration::Coastlines].lineWidth = 1.0f;
  s[GeoDecoration::Coastlines].visible = false;
  return s;
}

GeoAxisStyle darkGeoStyle() {
  GeoAxisStyle s = lightGeoStyle();
  s.name = "Dark";
  setColor(s.backgroundColor, 0.08f, 0.09f, 0.11f, 1.0f);

  for (GeoDecoration d : {GeoDecoration::XGrid, GeoDecoration::YGrid}) {
    setColor(s[d].color, 1.0f, 1.0f, 1.0f, 0.15f);
  }
  for (GeoDecoration d : {GeoDecoration::TopSpine, GeoDecoration::BottomSpine,
                          GeoDecoration::LeftSpine, GeoDecoration::RightSpine}) {
    setColor(s[d].color, 0.7f, 0.7f, 0.72f, 1.0f);
  }
  setColor(s[GeoDecoration::XTickLabels].color, 0.85f, 0.85f, 0.87f, 1.0f);
  setColor(s[GeoDecoration::YTickLabels].color, 0.85f, 0.85f, 0.87f, 1.0f);
  setColor(s[GeoDecoration::XTickAnchors].color, 0.85f, 0.85f, 0.87f, 1.0f);
  setColor(s[GeoDecoration::YTickAnchors].color, 0.85f, 0.85f, 0.87f, 1.0f);
  setColor(s[GeoDecoration::Coastlines].color, 0.75f, 0.8f, 0.85f, 1.0f);
  return s;
}

// -------------------- Command generation helpers --------------------

std::string makeLineStyleCmd(Id drawItemId, const LineStyle& style) {
  char buf[512];
  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setDrawItemStyle","drawItemId":%llu,)"
    R"("r":%.9g,"g":%.9g,"b":%.9g,"a":%.9g,"lineWidth":%.9g,)"
    R"("dashLength":%.9g,"gapLength":%.9g})",
    static_cast<unsigned long long>(drawItemId),
    style.color[0], style.color[1], style.color[2], style.color[3],
    style.lineWidth, style.dashLength, style.gapLength);
  return buf;
}

std::string makeVisibleCmd(Id drawItemId, bool visible) {
  return R"({"cmd":"setDrawItemVisible","drawItemId":)" + idStr(drawItemId) +
         R"(,"visible":)" + (visible ? "true" : "false") + "}";
}

} // namespace gc
