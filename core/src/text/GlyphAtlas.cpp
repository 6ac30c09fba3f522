#include "gc/text/GlyphAtlas.hpp"
#include "gc/text/Utf8.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace gc {

GlyphAtlas::GlyphAtlas() {
  resetAtlas();
}

void GlyphAtlas::resetAtlas() {
  atlas_.assign(static_cast<std::size_t>(atlasSize_) * atlasSize_, 0);
  shelves_.clear();
  shelves_.push_back({1, 1, 0});
  glyphs_.clear();
  dirty_ = true;
}

void GlyphAtlas::setAtlasSize(std::uint32_t s) {
  atlasSize_ = s;
  resetAtlas();
}

void GlyphAtlas::setGlyphPx(std::uint32_t px) {
  if (px == glyphPx_) return;
  glyphPx_ = px;
  resetAtlas();
  if (fontLoaded_) updateMetrics();
}

bool GlyphAtlas::updateMetrics() {
  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(),
                      stbtt_GetFontOffsetForIndex(fontData_.data(), 0))) {
    std::fprintf(stderr, "GlyphAtlas: stbtt_InitFont failed\n");
    return false;
  }
  const float scale = stbtt_ScaleForPixelHeight(&font, static_cast<float>(glyphPx_));
  int asc = 0, desc = 0, gap = 0;
  stbtt_GetFontVMetrics(&font, &asc, &desc, &gap);
  ascent_ = static_cast<float>(asc) * scale;
  descent_ = static_cast<float>(desc) * scale;
  lineGap_ = static_cast<float>(gap) * scale;
  return true;
}

bool GlyphAtlas::loadFont(const std::uint8_t* data, std::uint32_t len) {
  if (!data || len == 0) return false;
  fontData_.assign(data, data + len);
  if (!updateMetrics()) {
    fontData_.clear();
    fontLoaded_ = false;
    return false;
  }
  fontLoaded_ = true;
  resetAtlas();
  return true;
}

bool GlyphAtlas::loadFontFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "GlyphAtlas: cannot open %s\n", path.c_str());
    return false;
  }
  auto sz = f.tellg();
  if (sz <= 0) return false;
  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(bytes.data()), sz);
  if (!f) return false;
  return loadFont(bytes.data(), static_cast<std::uint32_t>(bytes.size()));
}

bool GlyphAtlas::ensureText(const std::string& utf8) {
  const auto cps = utf8Decode(utf8);
  return ensureGlyphs(cps.data(), static_cast<std::uint32_t>(cps.size()));
}

bool GlyphAtlas::ensureGeoLabelGlyphs() {
  std::vector<std::uint32_t> cp;
  for (std::uint32_t c = 32; c <= 126; c++) cp.push_back(c);
  cp.push_back(0x00B0); // degree sign
  cp.push_back(0x2212); // minus sign
  return ensureGlyphs(cp.data(), static_cast<std::uint32_t>(cp.size()));
}

bool GlyphAtlas::ensureGlyphs(const std::uint32_t* codepoints, std::uint32_t count) {
  if (!fontLoaded_) return false;

  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(),
                      stbtt_GetFontOffsetForIndex(fontData_.data(), 0))) {
    std::fprintf(stderr, "GlyphAtlas: stbtt_InitFont failed\n");
    return false;
  }

  const float scale = stbtt_ScaleForPixelHeight(&font, static_cast<float>(glyphPx_));
  const std::uint32_t spread = useSdf_ ? sdfRange_ : 0;
  const float invAtlas = 1.0f / static_cast<float>(atlasSize_);
  bool modified = false;

  for (std::uint32_t i = 0; i < count; i++) {
    const std::uint32_t cp = codepoints[i];
    if (glyphs_.count(cp) != 0) continue;

    const int glyphIdx = stbtt_FindGlyphIndex(&font, static_cast<int>(cp));
    int advW = 0, lsb = 0;
    stbtt_GetGlyphHMetrics(&font, glyphIdx, &advW, &lsb);

    int ix0 = 0, iy0 = 0, ix1 = 0, iy1 = 0;
    stbtt_GetGlyphBitmapBox(&font, glyphIdx, scale, scale, &ix0, &iy0, &ix1, &iy1);

    GlyphInfo info;
    info.codepoint = cp;
    info.advance = static_cast<float>(advW) * scale;

    const int gw = ix1 - ix0;
    const int gh = iy1 - iy0;
    if (gw <= 0 || gh <= 0) {
      // whitespace: metrics only
      glyphs_[cp] = info;
      continue;
    }

    // Rasterize into a cell padded by the distance spread.
    const std::uint32_t cellW = static_cast<std::uint32_t>(gw) + 2 * spread;
    const std::uint32_t cellH = static_cast<std::uint32_t>(gh) + 2 * spread;
    std::vector<std::uint8_t> coverage(static_cast<std::size_t>(cellW) * cellH, 0);
    stbtt_MakeGlyphBitmap(&font, &coverage[spread * cellW + spread], gw, gh,
                          static_cast<int>(cellW), scale, scale, glyphIdx);

    std::vector<std::uint8_t> pixels(coverage.size());
    if (useSdf_) {
      buildSdfR8(coverage.data(), cellW, cellH, sdfRange_, pixels.data());
    } else {
      pixels = coverage;
    }

    std::uint32_t ax = 0, ay = 0;
    if (!packGlyph(cellW + pad_ * 2, cellH + pad_ * 2, ax, ay)) {
      std::fprintf(stderr, "GlyphAtlas: atlas full (cp=%u)\n", cp);
      continue;
    }

    for (std::uint32_t row = 0; row < cellH; row++) {
      std::memcpy(&atlas_[static_cast<std::size_t>(ay + pad_ + row) * atlasSize_ + ax + pad_],
                  &pixels[static_cast<std::size_t>(row) * cellW], cellW);
    }

    // Atlas row 0 is the top; v0 is the bottom edge of the glyph.
    info.u0 = static_cast<float>(ax + pad_) * invAtlas;
    info.u1 = static_cast<float>(ax + pad_ + cellW) * invAtlas;
    info.v0 = static_cast<float>(ay + pad_ + cellH) * invAtlas;
    info.v1 = static_cast<float>(ay + pad_) * invAtlas;
    info.bearingX = static_cast<float>(ix0) - static_cast<float>(spread);
    info.bearingY = static_cast<float>(-iy0) + static_cast<float>(spread);
    info.w = static_cast<float>(cellW);
    info.h = static_cast<float>(cellH);
    glyphs_[cp] = info;
    modified = true;
  }

  if (modified) dirty_ = true;
  return modified;
}

const GlyphInfo* GlyphAtlas::getGlyph(std::uint32_t codepoint) const {
  auto it = glyphs_.find(codepoint);
  return it == glyphs_.end() ? nullptr : &it->second;
}

bool GlyphAtlas::packGlyph(std::uint32_t w, std::uint32_t h,
                           std::uint32_t& outX, std::uint32_t& outY) {
  for (auto& shelf : shelves_) {
    if (shelf.h == 0) shelf.h = h;
    if (h <= shelf.h && shelf.x + w <= atlasSize_ - 1 && shelf.y + shelf.h <= atlasSize_ - 1) {
      outX = shelf.x;
      outY = shelf.y;
      shelf.x += w;
      return true;
    }
  }

  const Shelf& last = shelves_.back();
  const std::uint32_t ny = last.y + last.h;
  if (ny + h > atlasSize_ - 1 || w > atlasSize_ - 2) return false;

  outX = 1;
  outY = ny;
  shelves_.push_back({1 + w, ny, h});
  return true;
}

// Exact nearest-opposite search inside the spread window. 128 is the edge,
// values above are inside the glyph.
void GlyphAtlas::buildSdfR8(const std::uint8_t* alpha, std::uint32_t w, std::uint32_t h,
                            std::uint32_t sdfRange, std::uint8_t* out) {
  const int r = static_cast<int>(std::max<std::uint32_t>(sdfRange, 1));
  const int iw = static_cast<int>(w);
  const int ih = static_cast<int>(h);

  for (int y = 0; y < ih; y++) {
    for (int x = 0; x < iw; x++) {
      const bool inside = alpha[y * iw + x] > 127;
      float best = static_cast<float>(r);

      for (int dy = -r; dy <= r; dy++) {
        const int sy = y + dy;
        if (sy < 0 || sy >= ih) continue;
        for (int dx = -r; dx <= r; dx++) {
          const int sx = x + dx;
          if (sx < 0 || sx >= iw) continue;
          if ((alpha[sy * iw + sx] > 127) == inside) continue;
          const float d = std::sqrt(static_cast<float>(dx * dx + dy * dy));
          if (d < best) best = d;
        }
      }

      const float signedDist = inside ? best : -best;
      const float v = 128.0f + signedDist / static_cast<float>(r) * 127.0f;
      out[y * iw + x] = static_cast<std::uint8_t>(std::max(0.0f, std::min(255.0f, v)));
    }
  }
}

} // namespace gc
