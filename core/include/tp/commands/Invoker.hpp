#pragma once
#include "tp/commands/Command.hpp"
#include "tp/commands/CommandHistory.hpp"
#include "tp/debug/Stats.hpp"

#include <cstddef>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tp {

struct InvokerConfig {
  std::size_t maxHistory{CommandHistory::kDefaultMaxSize};
  bool verbose{false};   // log failed execute/undo/redo to stderr
};

// Runs commands against their Receiver and records them in a bounded
// linear history. Every public method holds the invoker mutex, so one
// Invoker may be driven from several threads. The mutex only orders this
// invoker's history; store-level isolation is the Receiver's job.
class Invoker {
public:
  static constexpr std::size_t kHistoryEnd = std::numeric_limits<std::size_t>::max();

  Invoker();
  explicit Invoker(const InvokerConfig& config);

  // Discards the redo branch, executes `cmd`, and records it when it
  // reaches Executed. A failed command is dropped and its error returned.
  // Only Pending commands are accepted (INVALID_STATE otherwise, history
  // untouched).
  CmdResult execute(std::unique_ptr<Command> cmd);

  // Undo the command at the cursor. Returns true if it was undone; `label`
  // then receives that command's kind.
  bool undo(std::string* label = nullptr);

  // Re-apply the command after the cursor. Returns true if it was redone.
  bool redo(std::string* label = nullptr);

  bool canUndo() const;
  bool canRedo() const;

  // Descriptions of entries [start, end), clamped to the history size.
  std::vector<CommandInfo> history(std::size_t start = 0, std::size_t end = kHistoryEnd) const;
  std::string historyJson(std::size_t start = 0, std::size_t end = kHistoryEnd) const;

  HistoryStats statistics() const;
  std::string statisticsJson() const;

  // Label of the command undo()/redo() would act on; empty if none.
  std::string undoDescription() const;
  std::string redoDescription() const;

  // Error of the last failed execute/undo/redo (code empty if the last call
  // succeeded).
  CmdError lastError() const;

  std::size_t size() const;
  std::ptrdiff_t cursor() const;
  void clear();

private:
  void recordFailureLocked(const char* op, const CmdError& err);

  InvokerConfig config_;
  mutable std::mutex mtx_;
  CommandHistory history_;
  CmdError lastError_{};
};

} // namespace tp
