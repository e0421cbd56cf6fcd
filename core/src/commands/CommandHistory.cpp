#include "tp/commands/CommandHistory.hpp"

namespace tp {

CommandHistory::CommandHistory(std::size_t maxSize)
  : maxSize_(maxSize == 0 ? 1 : maxSize) {}

void CommandHistory::pruneRedoBranch() {
  const auto keep = static_cast<std::size_t>(cursor_ + 1);
  while (entries_.size() > keep) entries_.pop_back();
}

void CommandHistory::push(std::unique_ptr<Command> cmd) {
  if (!cmd) return;
  pruneRedoBranch();
  entries_.push_back(std::move(cmd));
  cursor_ = static_cast<std::ptrdiff_t>(entries_.size()) - 1;

  while (entries_.size() > maxSize_) {
    entries_.pop_front();
    --cursor_;
    ++evicted_;
  }
}

Command* CommandHistory::undoTarget() {
  if (cursor_ < 0) return nullptr;
  return entries_[static_cast<std::size_t>(cursor_)].get();
}

Command* CommandHistory::redoTarget() {
  const auto next = static_cast<std::size_t>(cursor_ + 1);
  if (next >= entries_.size()) return nullptr;
  return entries_[next].get();
}

void CommandHistory::stepBack() {
  if (cursor_ >= 0) --cursor_;
}

void CommandHistory::stepForward() {
  if (static_cast<std::size_t>(cursor_ + 1) < entries_.size()) ++cursor_;
}

bool CommandHistory::canUndo() const {
  if (cursor_ < 0) return false;
  return entries_[static_cast<std::size_t>(cursor_)]->canUndo();
}

bool CommandHistory::canRedo() const {
  const auto next = static_cast<std::size_t>(cursor_ + 1);
  if (next >= entries_.size()) return false;
  return entries_[next]->canRedo();
}

void CommandHistory::clear() {
  entries_.clear();
  cursor_ = -1;
  evicted_ = 0;
}

} // namespace tp
