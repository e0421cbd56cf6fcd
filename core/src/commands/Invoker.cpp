#include "tp/commands/Invoker.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace tp {

Invoker::Invoker() : Invoker(InvokerConfig{}) {}

Invoker::Invoker(const InvokerConfig& config)
  : config_(config), history_(config.maxHistory) {}

void Invoker::recordFailureLocked(const char* op, const CmdError& err) {
  lastError_ = err;
  if (config_.verbose) {
    std::fprintf(stderr, "Invoker::%s: %s: %s\n", op, err.code.c_str(), err.message.c_str());
  }
}

CmdResult Invoker::execute(std::unique_ptr<Command> cmd) {
  std::lock_guard<std::mutex> lock(mtx_);

  if (!cmd) {
    CmdResult r = cmdFail(kBadCommand, "execute: null command");
    recordFailureLocked("execute", r.err);
    return r;
  }

  // Commands run once through here; redo goes through redo().
  if (cmd->status() != CommandStatus::Pending) {
    CmdResult r = cmdFail(kInvalidState,
      std::string("execute: ") + toString(cmd->kind()) + " is " + toString(cmd->status()));
    recordFailureLocked("execute", r.err);
    return r;
  }

  history_.pruneRedoBranch();

  CmdResult r = cmd->execute();
  if (!r.ok) {
    recordFailureLocked("execute", r.err);
    return r;
  }

  history_.push(std::move(cmd));
  lastError_ = CmdError{};
  return r;
}

bool Invoker::undo(std::string* label) {
  std::lock_guard<std::mutex> lock(mtx_);

  Command* c = history_.undoTarget();
  if (!c) {
    recordFailureLocked("undo", cmdFail(kHistoryExhausted, "undo: nothing to undo").err);
    return false;
  }
  if (c->status() != CommandStatus::Executed) {
    recordFailureLocked("undo", cmdFail(kInvalidState,
      std::string("undo: ") + toString(c->kind()) + " is " + toString(c->status())).err);
    return false;
  }
  if (!c->undo()) {
    recordFailureLocked("undo", c->error());
    return false;
  }

  history_.stepBack();
  if (label) *label = toString(c->kind());
  lastError_ = CmdError{};
  return true;
}

bool Invoker::redo(std::string* label) {
  std::lock_guard<std::mutex> lock(mtx_);

  Command* c = history_.redoTarget();
  if (!c) {
    recordFailureLocked("redo", cmdFail(kHistoryExhausted, "redo: nothing to redo").err);
    return false;
  }
  // A failed redo stays in place and blocks the rest of the branch.
  if (c->status() != CommandStatus::Undone) {
    recordFailureLocked("redo", cmdFail(kInvalidState,
      std::string("redo: ") + toString(c->kind()) + " is " + toString(c->status())).err);
    return false;
  }

  CmdResult r = c->execute();
  if (!r.ok) {
    recordFailureLocked("redo", r.err);
    return false;
  }

  history_.stepForward();
  if (label) *label = toString(c->kind());
  lastError_ = CmdError{};
  return true;
}

bool Invoker::canUndo() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return history_.canUndo();
}

bool Invoker::canRedo() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return history_.canRedo();
}

std::vector<CommandInfo> Invoker::history(std::size_t start, std::size_t end) const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<CommandInfo> out;
  end = std::min(end, history_.size());
  for (std::size_t i = start; i < end; ++i) {
    out.push_back(history_.at(i).describe());
  }
  return out;
}

std::string Invoker::historyJson(std::size_t start, std::size_t end) const {
  const std::vector<CommandInfo> entries = history(start, end);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartArray();
  for (const auto& e : entries) {
    w.StartObject();
    w.Key("kind");   w.String(toString(e.kind));
    w.Key("status"); w.String(toString(e.status));
    w.Key("executedAt");
    if (e.executedAt.empty()) w.Null(); else w.String(e.executedAt.c_str());
    w.Key("undoneAt");
    if (e.undoneAt.empty()) w.Null(); else w.String(e.undoneAt.c_str());
    w.Key("payload");
    w.RawValue(e.payloadJson.c_str(), e.payloadJson.size(), rapidjson::kObjectType);
    w.Key("error");
    if (e.error.empty()) w.Null(); else w.String(e.error.c_str());
    w.EndObject();
  }
  w.EndArray();

  return sb.GetString();
}

HistoryStats Invoker::statistics() const {
  std::lock_guard<std::mutex> lock(mtx_);

  HistoryStats s;
  s.totalCommands = history_.size();
  s.cursor = history_.cursor();
  s.maxSize = history_.maxSize();
  s.evicted = history_.evicted();

  for (std::size_t i = 0; i < history_.size(); ++i) {
    const Command& c = history_.at(i);
    switch (c.status()) {
      case CommandStatus::Executed: s.executed++; break;
      case CommandStatus::Undone: s.undone++; break;
      case CommandStatus::Failed: s.failed++; break;
      default: break;
    }
    s.byKind[toString(c.kind())]++;
  }
  return s;
}

std::string Invoker::statisticsJson() const {
  const HistoryStats s = statistics();

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("totalCommands"); w.Uint64(s.totalCommands);
  w.Key("executed");      w.Uint64(s.executed);
  w.Key("undone");        w.Uint64(s.undone);
  w.Key("failed");        w.Uint64(s.failed);
  w.Key("byKind");
  w.StartObject();
  for (const auto& kv : s.byKind) {
    w.Key(kv.first.c_str());
    w.Uint64(kv.second);
  }
  w.EndObject();
  w.Key("cursor");  w.Int64(s.cursor);
  w.Key("maxSize"); w.Uint64(s.maxSize);
  w.Key("evicted"); w.Uint64(s.evicted);
  w.EndObject();

  return sb.GetString();
}

std::string Invoker::undoDescription() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!history_.canUndo()) return {};
  return toString(history_.at(static_cast<std::size_t>(history_.cursor())).kind());
}

std::string Invoker::redoDescription() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!history_.canRedo()) return {};
  return toString(history_.at(static_cast<std::size_t>(history_.cursor() + 1)).kind());
}

CmdError Invoker::lastError() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return lastError_;
}

std::size_t Invoker::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return history_.size();
}

std::ptrdiff_t Invoker::cursor() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return history_.cursor();
}

void Invoker::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  history_.clear();
  lastError_ = CmdError{};
}

} // namespace tp
