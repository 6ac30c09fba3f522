#pragma once
#include "gc/ids/Id.hpp"
#include <cstdint>
#include <string>

namespace gc {

enum class VertexFormat : std::uint8_t {
  Pos2_Plane = 1, // vec2 position in projected plane units
  Pos2_Pixel = 2, // vec2 position in pixels (y up, pane origin added)
  Glyph8     = 3  // x0,y0,x1,y1,u0,v0,u1,v1 per glyph instance
};

inline const char* toString(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2_Plane: return "pos2_plane";
    case VertexFormat::Pos2_Pixel: return "pos2_pixel";
    case VertexFormat::Glyph8: return "glyph8";
    default: return "unknown";
  }
}

inline bool parseVertexFormat(const std::string& s, VertexFormat& out) {
  if (s == "pos2_plane") { out = VertexFormat::Pos2_Plane; return true; }
  if (s == "pos2_pixel") { out = VertexFormat::Pos2_Pixel; return true; }
  if (s == "glyph8")     { out = VertexFormat::Glyph8;     return true; }
  return false;
}

// Bytes per vertex (float components).
inline std::uint32_t strideOf(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2_Plane: return 8;
    case VertexFormat::Pos2_Pixel: return 8;
    case VertexFormat::Glyph8: return 32;
    default: return 0;
  }
}

struct Buffer {
  Id id{0};
  std::uint32_t byteLength{0};
};

struct Geometry {
  Id id{0};
  Id vertexBufferId{0};
  VertexFormat format{VertexFormat::Pos2_Plane};
  std::uint32_t vertexCount{0}; // number of vertices
};

} // namespace gc
