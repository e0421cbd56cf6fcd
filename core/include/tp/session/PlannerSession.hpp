#pragma once
#include "tp/commands/CommandFactory.hpp"
#include "tp/commands/Invoker.hpp"
#include "tp/session/PlannerConfig.hpp"
#include "tp/store/TripStore.hpp"

#include <string>

#include <rapidjson/document.h>

namespace tp {

// One store, one invoker, one JSON command surface.
//
// Mutation commands ("createTrip", "addFlight", ...) are built by the
// CommandFactory and run through the Invoker. Session commands:
//   {"cmd":"undo"} {"cmd":"redo"} {"cmd":"clearHistory"}
//   {"cmd":"history","start":0,"end":10} {"cmd":"stats"} {"cmd":"snapshot"}
// Every result carries a JSON string in CmdResult::json on success.
class PlannerSession {
public:
  PlannerSession();
  explicit PlannerSession(const PlannerConfig& config);

  CmdResult applyJson(const rapidjson::Value& obj);
  CmdResult applyJsonText(const std::string& jsonText);

  // Store snapshot file I/O. An empty path falls back to config().snapshotPath.
  bool loadSnapshot(const std::string& path = {});
  bool saveSnapshot(const std::string& path = {}) const;

  TripStore& store() { return store_; }
  const TripStore& store() const { return store_; }
  Invoker& invoker() { return invoker_; }
  const Invoker& invoker() const { return invoker_; }
  const PlannerConfig& config() const { return config_; }

private:
  PlannerConfig config_;
  TripStore store_;
  Invoker invoker_;
  CommandFactory factory_;

  // ---- handlers ----
  CmdResult cmdUndo();
  CmdResult cmdRedo();
  CmdResult cmdHistory(const rapidjson::Value& obj);
  CmdResult cmdStats();
  CmdResult cmdSnapshot();
  CmdResult cmdClearHistory();

  CmdResult historyMoveResult(const char* key, const std::string& label);
};

} // namespace tp
