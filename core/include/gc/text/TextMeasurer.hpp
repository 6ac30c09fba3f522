#pragma once
#include <string>

namespace gc {

class GlyphAtlas;

struct TextExtent {
  double width{0};
  double height{0};
};

// Pixel extents of label text. measure() returns the axis-aligned bounding
// box of the text rotated by `rotation` radians about its centre.
class TextMeasurer {
public:
  virtual ~TextMeasurer() = default;

  TextExtent measure(const std::string& text, float fontSize, float rotation) const;

protected:
  virtual TextExtent measureUnrotated(const std::string& text, float fontSize) const = 0;
};

// Fixed em fractions; used when no font is loaded.
class ApproxTextMeasurer : public TextMeasurer {
public:
  explicit ApproxTextMeasurer(double advanceEm = 0.6, double heightEm = 1.0)
    : advanceEm_(advanceEm), heightEm_(heightEm) {}

protected:
  TextExtent measureUnrotated(const std::string& text, float fontSize) const override;

private:
  double advanceEm_;
  double heightEm_;
};

// Measures with glyph advances and font ascent/descent from a GlyphAtlas.
// Glyphs missing from the atlas fall back to 0.6 em.
class GlyphTextMeasurer : public TextMeasurer {
public:
  explicit GlyphTextMeasurer(const GlyphAtlas& atlas) : atlas_(atlas) {}

protected:
  TextExtent measureUnrotated(const std::string& text, float fontSize) const override;

private:
  const GlyphAtlas& atlas_;
};

} // namespace gc
