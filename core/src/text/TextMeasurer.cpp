#include "gc/text/TextMeasurer.hpp"
#include "gc/text/GlyphAtlas.hpp"
#include "gc/text/Utf8.hpp"

#include <cmath>

namespace gc {

TextExtent TextMeasurer::measure(const std::string& text, float fontSize, float rotation) const {
  const TextExtent e = measureUnrotated(text, fontSize);
  if (rotation == 0.0f) return e;

  const double c = std::fabs(std::cos(static_cast<double>(rotation)));
  const double s = std::fabs(std::sin(static_cast<double>(rotation)));
  TextExtent r;
  r.width = e.width * c + e.height * s;
  r.height = e.width * s + e.height * c;
  return r;
}

TextExtent ApproxTextMeasurer::measureUnrotated(const std::string& text, float fontSize) const {
  TextExtent e;
  if (text.empty()) return e;
  e.width = static_cast<double>(utf8Decode(text).size()) * advanceEm_ * fontSize;
  e.height = heightEm_ * fontSize;
  return e;
}

TextExtent GlyphTextMeasurer::measureUnrotated(const std::string& text, float fontSize) const {
  TextExtent e;
  if (text.empty()) return e;

  const double scale = static_cast<double>(fontSize) / static_cast<double>(atlas_.glyphPx());
  for (std::uint32_t cp : utf8Decode(text)) {
    // Missing glyphs take no space, as in layoutText.
    if (const GlyphInfo* g = atlas_.getGlyph(cp)) e.width += g->advance * scale;
  }

  const double fontHeight = static_cast<double>(atlas_.ascent() - atlas_.descent()) * scale;
  e.height = fontHeight > 0.0 ? fontHeight : static_cast<double>(fontSize);
  return e;
}

} // namespace gc
