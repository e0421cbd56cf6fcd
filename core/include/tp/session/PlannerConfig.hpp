#pragma once
#include "tp/commands/Invoker.hpp"
#include "tp/store/TripStore.hpp"

#include <string>

namespace tp {

struct PlannerConfig {
  InvokerConfig invoker;
  TripStoreConfig store;
  std::string snapshotPath;   // empty => no load/save
};

// Reads
//   {"invoker":{"maxHistory":N,"verbose":b},
//    "store":{"shareCodeLength":N,"shareCodeSeed":N},
//    "snapshotPath":"..."}
// Missing or mistyped fields keep the values already in `out`;
// shareCodeLength is clamped to TripStoreConfig's bounds. Returns false
// on invalid JSON, leaving `out` untouched.
bool parsePlannerConfig(const std::string& json, PlannerConfig& out);

std::string serializePlannerConfig(const PlannerConfig& config);

} // namespace tp
