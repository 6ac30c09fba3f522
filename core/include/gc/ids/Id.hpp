#pragma once
#include <cstdint>
#include <limits>
#include <string>
#include <stdexcept>

namespace gc {

using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Accept either JSON numeric IDs (preferred) or string decimal.
inline Id parseIdString(const std::string& s) {
  if (s.empty()) return kInvalidId;
  std::uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') throw std::runtime_error("Id must be decimal digits");
    const auto digit = static_cast<std::uint64_t>(c - '0');
    if (v > (std::numeric_limits<std::uint64_t>::max() - digit) / 10u) {
      throw std::runtime_error("Id out of range");
    }
    v = v * 10 + digit;
  }
  return static_cast<Id>(v);
}

inline std::string idStr(Id id) { return std::to_string(id); }

} // namespace gc
