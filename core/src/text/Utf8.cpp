#include "gc/text/Utf8.hpp"

namespace gc {

static bool isContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

std::uint32_t utf8DecodeOne(const char*& it, const char* end) {
  if (it >= end) return kReplacementChar;

  const auto c0 = static_cast<unsigned char>(*it++);
  if ((c0 & 0x80) == 0) return c0;

  int len = 0;
  std::uint32_t cp = 0;
  if ((c0 & 0xE0) == 0xC0)      { len = 2; cp = c0 & 0x1Fu; }
  else if ((c0 & 0xF0) == 0xE0) { len = 3; cp = c0 & 0x0Fu; }
  else if ((c0 & 0xF8) == 0xF0) { len = 4; cp = c0 & 0x07u; }
  else return kReplacementChar;

  for (int i = 1; i < len; ++i) {
    if (it >= end) return kReplacementChar;
    const auto c = static_cast<unsigned char>(*it);
    if (!isContinuation(c)) return kReplacementChar;
    cp = (cp << 6) | (c & 0x3Fu);
    ++it;
  }

  // Overlong forms, surrogates and out-of-range values.
  static const std::uint32_t minForLen[5] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < minForLen[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return kReplacementChar;
  }
  return cp;
}

std::vector<std::uint32_t> utf8Decode(const std::string& text) {
  std::vector<std::uint32_t> out;
  out.reserve(text.size());
  const char* it = text.data();
  const char* end = it + text.size();
  while (it < end) out.push_back(utf8DecodeOne(it, end));
  return out;
}

} // namespace gc
