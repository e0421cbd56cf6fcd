#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace tp {

// Derived from the history entries on every request; never kept as running
// counters.
struct HistoryStats {
  std::size_t totalCommands = 0;
  std::size_t executed = 0;
  std::size_t undone = 0;
  std::size_t failed = 0;

  std::map<std::string, std::size_t> byKind;

  // Position
  std::ptrdiff_t cursor = -1;
  std::size_t maxSize = 0;
  std::size_t evicted = 0;   // entries dropped by the size bound since the last clear
};

} // namespace tp
