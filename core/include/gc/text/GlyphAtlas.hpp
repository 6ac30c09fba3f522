#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace gc {

struct GlyphInfo {
  std::uint32_t codepoint{0};
  // UV in atlas [0..1]
  float u0{0}, v0{0}, u1{0}, v1{0};
  // Metrics in pixels at glyphPx
  float advance{0};
  float bearingX{0}, bearingY{0};
  float w{0}, h{0};
};

// R8 glyph atlas rasterized with stb_truetype. Stores signed distance
// fields by default, raw coverage when setUseSdf(false).
class GlyphAtlas {
public:
  GlyphAtlas();

  // Load a TTF/OTF from memory. Fails if stb_truetype rejects the font.
  bool loadFont(const std::uint8_t* data, std::uint32_t len);
  bool loadFontFile(const std::string& path);
  bool hasFont() const { return fontLoaded_; }

  // Ensure glyphs are rasterized and packed.
  // Returns true if atlas was modified (needs re-upload).
  bool ensureGlyphs(const std::uint32_t* codepoints, std::uint32_t count);
  bool ensureText(const std::string& utf8);

  // ASCII printable plus the degree sign used by coordinate labels.
  bool ensureGeoLabelGlyphs();

  // Returns nullptr if not rasterized.
  const GlyphInfo* getGlyph(std::uint32_t codepoint) const;

  // Vertical font metrics in pixels at glyphPx (descent is negative).
  float ascent() const { return ascent_; }
  float descent() const { return descent_; }
  float lineGap() const { return lineGap_; }

  const std::uint8_t* atlasData() const { return atlas_.data(); }
  std::uint32_t atlasSize() const { return atlasSize_; }

  bool isDirty() const { return dirty_; }
  void clearDirty() { dirty_ = false; }

  // Parameters. Changing glyphPx or the atlas size drops rasterized glyphs.
  void setGlyphPx(std::uint32_t px);
  std::uint32_t glyphPx() const { return glyphPx_; }
  void setSdfRange(std::uint32_t r) { sdfRange_ = r; }
  void setAtlasSize(std::uint32_t s);
  void setUseSdf(bool v) { useSdf_ = v; }
  bool useSdf() const { return useSdf_; }

private:
  std::uint32_t atlasSize_{1024};
  std::uint32_t glyphPx_{48};
  std::uint32_t sdfRange_{8};
  std::uint32_t pad_{2};
  bool useSdf_{true};

  std::vector<std::uint8_t> atlas_;    // R8 atlas (atlasSize_ x atlasSize_)
  std::vector<std::uint8_t> fontData_; // retained font file bytes
  bool fontLoaded_{false};
  bool dirty_{false};

  float ascent_{0}, descent_{0}, lineGap_{0};

  std::unordered_map<std::uint32_t, GlyphInfo> glyphs_;

  // Shelf packer state
  struct Shelf {
    std::uint32_t x, y, h;
  };
  std::vector<Shelf> shelves_;

  void resetAtlas();
  bool updateMetrics();
  bool packGlyph(std::uint32_t w, std::uint32_t h,
                 std::uint32_t& outX, std::uint32_t& outY);

  static void buildSdfR8(const std::uint8_t* alpha, std::uint32_t w, std::uint32_t h,
                         std::uint32_t sdfRange, std::uint8_t* out);
};

} // namespace gc
