#include "tp/commands/Command.hpp"
#include "tp/store/Receiver.hpp"
#include "tp/time/TimeFormat.hpp"

namespace tp {

CmdResult cmdFail(const std::string& code,
                  const std::string& message,
                  const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  r.createdId = 0;
  return r;
}

Command::Command(CommandKind kind, Receiver& receiver)
  : receiver_(receiver), kind_(kind) {}

CmdResult Command::execute() {
  if (status_ == CommandStatus::Executed) {
    return cmdFail(kInvalidState, std::string(toString(kind_)) + ": already executed");
  }
  if (status_ == CommandStatus::Failed) {
    return cmdFail(kInvalidState, std::string(toString(kind_)) + ": command has failed");
  }

  const bool redo = status_ == CommandStatus::Undone;
  CmdResult r = applyForward(redo);

  if (!r.ok) {
    status_ = CommandStatus::Failed;
    error_ = r.err;
    return r;
  }

  status_ = CommandStatus::Executed;
  inverseCaptured_ = true;
  error_ = CmdError{};
  result_ = r;
  executedOnce_ = true;
  executedAt_ = Clock::now();
  return r;
}

bool Command::undo() {
  if (status_ != CommandStatus::Executed) return false;

  CmdResult r = applyInverse();
  if (!r.ok) {
    error_ = r.err;
    return false;
  }

  status_ = CommandStatus::Undone;
  error_ = CmdError{};
  undoneOnce_ = true;
  undoneAt_ = Clock::now();
  return true;
}

CommandInfo Command::describe() const {
  CommandInfo info;
  info.kind = kind_;
  info.status = status_;
  if (executedOnce_) info.executedAt = formatTimestamp(executedAt_);
  if (undoneOnce_) info.undoneAt = formatTimestamp(undoneAt_);
  info.payloadJson = payloadJson();
  if (hasError()) info.error = error_.code + ": " + error_.message;
  return info;
}

} // namespace tp
