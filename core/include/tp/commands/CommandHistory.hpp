#pragma once
#include "tp/commands/Command.hpp"

#include <cstddef>
#include <deque>
#include <memory>

namespace tp {

// Bounded linear undo/redo history.
//
// entries_[0..cursor_] are applied; entries_[cursor_+1..] are the redo
// branch. cursor_ == -1 means nothing is applied. Not thread-safe; Invoker
// serializes access.
class CommandHistory {
public:
  static constexpr std::size_t kDefaultMaxSize = 100;

  explicit CommandHistory(std::size_t maxSize = kDefaultMaxSize);

  // Discard the redo branch (everything after the cursor).
  void pruneRedoBranch();

  // Append an executed command and move the cursor onto it. Evicts the
  // oldest entry once size exceeds maxSize, keeping the cursor on the same
  // command.
  void push(std::unique_ptr<Command> cmd);

  // Command at the cursor / just after it, or nullptr at either end.
  Command* undoTarget();
  Command* redoTarget();

  // Cursor moves; callers only step after the command transition succeeded.
  void stepBack();
  void stepForward();

  bool canUndo() const;
  bool canRedo() const;

  std::size_t size() const { return entries_.size(); }
  std::ptrdiff_t cursor() const { return cursor_; }
  std::size_t maxSize() const { return maxSize_; }
  std::size_t evicted() const { return evicted_; }

  const Command& at(std::size_t index) const { return *entries_[index]; }

  void clear();

private:
  std::deque<std::unique_ptr<Command>> entries_;
  std::ptrdiff_t cursor_{-1};
  std::size_t maxSize_;
  std::size_t evicted_{0};
};

} // namespace tp
