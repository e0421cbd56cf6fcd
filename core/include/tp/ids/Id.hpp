#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace tp {

// Entity id, unique within one store collection. 0 is never assigned.
using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Decimal id sent as a JSON string ("12"). Empty => kInvalidId.
// Throws std::runtime_error on non-digits or a value past the Id range.
inline Id parseIdString(const std::string& s) {
  if (s.empty()) return kInvalidId;

  constexpr Id kMax = std::numeric_limits<Id>::max();
  Id v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') throw std::runtime_error("id must be decimal digits: " + s);
    const auto digit = static_cast<Id>(c - '0');
    if (v > (kMax - digit) / 10) throw std::runtime_error("id out of range: " + s);
    v = v * 10 + digit;
  }
  return v;
}

} // namespace tp
