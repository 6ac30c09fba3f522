#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace gc {

inline constexpr std::uint32_t kReplacementChar = 0xFFFD;

// Decode one code point and advance `it`. Malformed input yields U+FFFD.
std::uint32_t utf8DecodeOne(const char*& it, const char* end);

std::vector<std::uint32_t> utf8Decode(const std::string& text);

} // namespace gc
