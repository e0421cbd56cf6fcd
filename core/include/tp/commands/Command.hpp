#pragma once
#include "tp/ids/Id.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace tp {

class Receiver;

enum class CommandKind : std::uint8_t {
  CreateTrip,
  UpdateBudget,
  AddCollaborator,
  AddFlight,
  AddHotel,
  AddActivity,
  AddExpense,
  UpdateItemStatus
};

inline const char* toString(CommandKind k) {
  switch (k) {
    case CommandKind::CreateTrip: return "CreateTrip";
    case CommandKind::UpdateBudget: return "UpdateBudget";
    case CommandKind::AddCollaborator: return "AddCollaborator";
    case CommandKind::AddFlight: return "AddFlight";
    case CommandKind::AddHotel: return "AddHotel";
    case CommandKind::AddActivity: return "AddActivity";
    case CommandKind::AddExpense: return "AddExpense";
    case CommandKind::UpdateItemStatus: return "UpdateItemStatus";
    default: return "Unknown";
  }
}

enum class CommandStatus : std::uint8_t {
  Pending,
  Executed,
  Undone,
  Failed
};

inline const char* toString(CommandStatus s) {
  switch (s) {
    case CommandStatus::Pending: return "pending";
    case CommandStatus::Executed: return "executed";
    case CommandStatus::Undone: return "undone";
    case CommandStatus::Failed: return "failed";
    default: return "unknown";
  }
}

// Error codes carried in CmdError::code.
inline constexpr const char* kValidationFailure = "VALIDATION_FAILURE";
inline constexpr const char* kNotFound = "NOT_FOUND";
inline constexpr const char* kInverseUnavailable = "INVERSE_UNAVAILABLE";
inline constexpr const char* kHistoryExhausted = "HISTORY_EXHAUSTED";
inline constexpr const char* kInvalidState = "INVALID_STATE";
inline constexpr const char* kBadCommand = "BAD_COMMAND";
inline constexpr const char* kUnknownCommand = "UNKNOWN_COMMAND";

struct CmdError {
  std::string code;     // e.g. "VALIDATION_FAILURE"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Id createdId{0};
  std::string json;     // JSON form of the entity the command produced/changed
};

CmdResult cmdFail(const std::string& code,
                  const std::string& message,
                  const std::string& detailsJson = "{}");

// Read-only view of a command for history listings.
struct CommandInfo {
  CommandKind kind{CommandKind::CreateTrip};
  CommandStatus status{CommandStatus::Pending};
  std::string executedAt;   // empty until first execute
  std::string undoneAt;     // empty until first undo
  std::string payloadJson;
  std::string error;        // empty when no error is recorded
};

// A reversible unit of work bound to a Receiver and an immutable payload.
//
// State machine:
//   Pending  -> Executed | Failed
//   Executed -> Undone   (undo ok)   | Executed (undo failed, error set)
//   Undone   -> Executed (redo ok)   | Failed   (redo failed, terminal)
//
// Subclasses implement the forward/inverse effect; each must change the
// Receiver through a single atomic call per attempt so a failure leaves
// nothing behind.
class Command {
public:
  Command(CommandKind kind, Receiver& receiver);
  virtual ~Command() = default;

  Command(const Command&) = delete;
  Command& operator=(const Command&) = delete;

  // First execution (from Pending) or redo (from Undone).
  CmdResult execute();

  // Valid only while Executed. On failure the status stays Executed and
  // error() describes why.
  bool undo();

  CommandInfo describe() const;

  CommandKind kind() const { return kind_; }
  CommandStatus status() const { return status_; }
  bool canUndo() const { return status_ == CommandStatus::Executed; }
  bool canRedo() const { return status_ == CommandStatus::Undone; }

  // True once the command has reached Executed at least once; never reset.
  bool hasCapturedInverse() const { return inverseCaptured_; }

  bool hasError() const { return !error_.code.empty(); }
  const CmdError& error() const { return error_; }

  const CmdResult& lastResult() const { return result_; }

  // Payload as a JSON object (never changes after construction).
  virtual std::string payloadJson() const = 0;

protected:
  // Apply the forward mutation. `redo` is true when re-applying after an
  // undo; implementations restore the captured entity instead of creating
  // a new one.
  virtual CmdResult applyForward(bool redo) = 0;

  // Apply the captured inverse.
  virtual CmdResult applyInverse() = 0;

  Receiver& receiver_;

private:
  using Clock = std::chrono::system_clock;

  CommandKind kind_;
  CommandStatus status_{CommandStatus::Pending};
  bool inverseCaptured_{false};
  CmdError error_{};
  CmdResult result_{};

  bool executedOnce_{false};
  bool undoneOnce_{false};
  Clock::time_point executedAt_{};
  Clock::time_point undoneAt_{};
};

} // namespace tp
