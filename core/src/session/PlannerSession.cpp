#include "tp/session/PlannerSession.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

namespace tp {

PlannerSession::PlannerSession() : PlannerSession(PlannerConfig{}) {}

PlannerSession::PlannerSession(const PlannerConfig& config)
  : config_(config),
    store_(config.store),
    invoker_(config.invoker),
    factory_(store_) {}

CmdResult PlannerSession::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return cmdFail(kBadCommand, "PlannerSession: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult PlannerSession::applyJson(const rapidjson::Value& obj) {
  if (!obj.IsObject()) {
    return cmdFail(kBadCommand, "Command must be a JSON object");
  }

  auto it = obj.FindMember("cmd");
  if (it == obj.MemberEnd() || !it->value.IsString()) {
    return cmdFail(kBadCommand, "Missing string field: cmd");
  }

  const std::string cmd = it->value.GetString();

  if (cmd == "undo") return cmdUndo();
  if (cmd == "redo") return cmdRedo();
  if (cmd == "history") return cmdHistory(obj);
  if (cmd == "stats") return cmdStats();
  if (cmd == "snapshot") return cmdSnapshot();
  if (cmd == "clearHistory") return cmdClearHistory();

  CmdError err;
  auto command = factory_.fromJson(obj, err);
  if (!command) {
    CmdResult r;
    r.ok = false;
    r.err = err;
    return r;
  }
  return invoker_.execute(std::move(command));
}

CmdResult PlannerSession::historyMoveResult(const char* key, const std::string& label) {
  CmdResult r;
  r.json = std::string("{\"") + key + "\":\"" + label + "\"}";
  return r;
}

CmdResult PlannerSession::cmdUndo() {
  std::string label;
  if (!invoker_.undo(&label)) {
    CmdResult r;
    r.ok = false;
    r.err = invoker_.lastError();
    return r;
  }
  return historyMoveResult("undone", label);
}

CmdResult PlannerSession::cmdRedo() {
  std::string label;
  if (!invoker_.redo(&label)) {
    CmdResult r;
    r.ok = false;
    r.err = invoker_.lastError();
    return r;
  }
  return historyMoveResult("redone", label);
}

CmdResult PlannerSession::cmdHistory(const rapidjson::Value& obj) {
  std::size_t start = 0;
  std::size_t end = Invoker::kHistoryEnd;

  auto s = obj.FindMember("start");
  if (s != obj.MemberEnd()) {
    if (!s->value.IsUint64()) return cmdFail(kBadCommand, "history: start must be a non-negative integer");
    start = static_cast<std::size_t>(s->value.GetUint64());
  }
  auto e = obj.FindMember("end");
  if (e != obj.MemberEnd()) {
    if (!e->value.IsUint64()) return cmdFail(kBadCommand, "history: end must be a non-negative integer");
    end = static_cast<std::size_t>(e->value.GetUint64());
  }

  CmdResult r;
  r.json = invoker_.historyJson(start, end);
  return r;
}

CmdResult PlannerSession::cmdStats() {
  CmdResult r;
  r.json = invoker_.statisticsJson();
  return r;
}

CmdResult PlannerSession::cmdSnapshot() {
  CmdResult r;
  r.json = store_.toJSON();
  return r;
}

CmdResult PlannerSession::cmdClearHistory() {
  invoker_.clear();
  CmdResult r;
  r.json = "{\"cleared\":true}";
  return r;
}

bool PlannerSession::loadSnapshot(const std::string& path) {
  const std::string& p = path.empty() ? config_.snapshotPath : path;
  if (p.empty()) return false;

  std::ifstream f(p);
  if (!f) return false;
  std::stringstream ss;
  ss << f.rdbuf();

  if (!store_.loadJSON(ss.str())) {
    std::fprintf(stderr, "PlannerSession::loadSnapshot: invalid snapshot in %s\n", p.c_str());
    return false;
  }
  // History entries hold captured state for the previous store contents.
  invoker_.clear();
  return true;
}

bool PlannerSession::saveSnapshot(const std::string& path) const {
  const std::string& p = path.empty() ? config_.snapshotPath : path;
  if (p.empty()) return false;

  FILE* f = std::fopen(p.c_str(), "wb");
  if (!f) return false;

  const std::string json = store_.toJSON();
  const std::size_t written = std::fwrite(json.data(), 1, json.size(), f);
  std::fclose(f);
  return written == json.size();
}

} // namespace tp
