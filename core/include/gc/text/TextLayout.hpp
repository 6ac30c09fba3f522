#pragma once
#include "gc/text/GlyphAtlas.hpp"
#include "gc/text/Utf8.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace gc {

struct TextLayoutResult {
  std::vector<float> glyphInstances; // glyph8: x0,y0,x1,y1,u0,v0,u1,v1
  int glyphCount{0};
  float advanceWidth{0};
};

// Horizontal advance of a UTF-8 string at fontSize. Glyphs that are not in
// the atlas contribute nothing.
inline float measureTextWidth(const GlyphAtlas& atlas, const std::string& text,
                              float fontSize) {
  const float scale = fontSize / static_cast<float>(atlas.glyphPx());
  float width = 0;
  for (std::uint32_t cp : utf8Decode(text)) {
    if (const GlyphInfo* g = atlas.getGlyph(cp)) width += g->advance * scale;
  }
  return width;
}

// Lay out a UTF-8 string starting at (startX, baselineY), y up.
inline TextLayoutResult layoutText(const GlyphAtlas& atlas, const std::string& text,
                                   float startX, float baselineY, float fontSize) {
  TextLayoutResult r;
  const float scale = fontSize / static_cast<float>(atlas.glyphPx());
  float cursorX = startX;

  for (std::uint32_t cp : utf8Decode(text)) {
    const GlyphInfo* g = atlas.getGlyph(cp);
    if (!g) continue;
    if (g->w > 0 && g->h > 0) {
      const float x0 = cursorX + g->bearingX * scale;
      const float y1 = baselineY + g->bearingY * scale;
      const float y0 = y1 - g->h * scale;
      const float x1 = x0 + g->w * scale;
      r.glyphInstances.insert(r.glyphInstances.end(),
                              {x0, y0, x1, y1, g->u0, g->v0, g->u1, g->v1});
      r.glyphCount++;
    }
    cursorX += g->advance * scale;
  }
  r.advanceWidth = cursorX - startX;
  return r;
}

// Centre the text box (advance width x ascent-descent) on (cx, cy).
inline TextLayoutResult layoutTextCentered(const GlyphAtlas& atlas, const std::string& text,
                                           float cx, float cy, float fontSize) {
  const float scale = fontSize / static_cast<float>(atlas.glyphPx());
  const float width = measureTextWidth(atlas, text, fontSize);
  const float asc = atlas.ascent() * scale;
  const float desc = atlas.descent() * scale;
  const float baseline = cy - 0.5f * (asc + desc);
  return layoutText(atlas, text, cx - 0.5f * width, baseline, fontSize);
}

} // namespace gc
