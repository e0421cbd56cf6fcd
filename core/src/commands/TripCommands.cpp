#include "tp/commands/TripCommands.hpp"
#include "tp/store/EntityJson.hpp"
#include "tp/store/Receiver.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace tp {

namespace {

std::string idDetails(const char* field, Id id) {
  return std::string(R"({")") + field + R"(":)" + std::to_string(id) + "}";
}

std::string shareCodeDetails(Id tripId, const std::string& code) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  if (tripId != kInvalidId) {
    w.Key("tripId"); w.Uint64(tripId);
  }
  w.Key("shareCode"); w.String(code.c_str(), static_cast<rapidjson::SizeType>(code.size()));
  w.EndObject();
  return sb.GetString();
}

CmdResult validateBudget(const char* cmd, double budget) {
  if (!std::isfinite(budget) || budget < 0.0) {
    return cmdFail(kValidationFailure,
                   std::string(cmd) + ": budget must be a non-negative number",
                   R"({"field":"budget"})");
  }
  return CmdResult{};
}

} // namespace

// -------------------- CreateTrip --------------------

CreateTripCommand::CreateTripCommand(Receiver& receiver, CreateTripPayload payload)
  : Command(CommandKind::CreateTrip, receiver), payload_(std::move(payload)) {}

std::string CreateTripCommand::payloadJson() const {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("userId");       w.Uint64(payload_.ownerId);
  w.Key("destination");  w.String(payload_.destination.c_str());
  w.Key("name");         w.String(payload_.name.c_str());
  w.Key("startDate");    w.String(payload_.startDate.c_str());
  w.Key("endDate");      w.String(payload_.endDate.c_str());
  w.Key("shareCode");    w.String(payload_.shareCode.c_str());
  w.Key("budget");       w.Double(payload_.budget);
  w.Key("isSuggestion"); w.Bool(payload_.isSuggestion);
  w.EndObject();
  return sb.GetString();
}

CmdResult CreateTripCommand::applyForward(bool redo) {
  Trip t;

  if (redo) {
    t = captured_;
    const StoreStatus st = receiver_.insertTrip(t);
    if (st != StoreStatus::Ok) {
      return cmdFail(kInverseUnavailable,
                     "createTrip: trip cannot be restored (id or share code taken)",
                     shareCodeDetails(captured_.id, captured_.shareCode));
    }
  } else {
    if (payload_.ownerId == kInvalidId) {
      return cmdFail(kValidationFailure, "createTrip: userId is required", R"({"field":"userId"})");
    }
    const std::pair<const char*, const std::string*> required[] = {
      {"destination", &payload_.destination},
      {"name", &payload_.name},
      {"startDate", &payload_.startDate},
      {"endDate", &payload_.endDate},
    };
    for (const auto& f : required) {
      if (f.second->empty()) {
        return cmdFail(kValidationFailure,
                       std::string("createTrip: missing ") + f.first,
                       std::string(R"({"field":")") + f.first + R"("})");
      }
    }
    // ISO dates compare correctly as strings
    if (payload_.startDate > payload_.endDate) {
      return cmdFail(kValidationFailure, "createTrip: startDate is after endDate",
                     R"({"field":"startDate"})");
    }
    CmdResult budgetCheck = validateBudget("createTrip", payload_.budget);
    if (!budgetCheck.ok) return budgetCheck;

    t.ownerId = payload_.ownerId;
    t.destination = payload_.destination;
    t.name = payload_.name;
    t.startDate = payload_.startDate;
    t.endDate = payload_.endDate;
    t.shareCode = payload_.shareCode;
    t.budget = payload_.budget;
    t.isSuggestion = payload_.isSuggestion;

    const StoreStatus st = receiver_.insertTrip(t);
    if (st != StoreStatus::Ok) {
      return cmdFail(kValidationFailure,
                     payload_.shareCode.empty() ? "createTrip: no free share code"
                                                : "createTrip: share code already in use",
                     shareCodeDetails(kInvalidId, payload_.shareCode));
    }
    captured_ = t;
  }

  CmdResult r;
  r.ok = true;
  r.createdId = t.id;
  r.json = tripToJSON(t);
  return r;
}

CmdResult CreateTripCommand::applyInverse() {
  if (!receiver_.removeTrip(captured_.id)) {
    return cmdFail(kInverseUnavailable, "createTrip: trip no longer exists",
                   idDetails("tripId", captured_.id));
  }
  return CmdResult{};
}

// -------------------- UpdateBudget --------------------

UpdateBudgetCommand::UpdateBudgetCommand(Receiver& receiver, Id tripId, double budget)
  : Command(CommandKind::UpdateBudget, receiver), tripId_(tripId), budget_(budget) {}

std::string UpdateBudgetCommand::payloadJson() const {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("tripId"); w.Uint64(tripId_);
  w.Key("budget"); w.Double(budget_);
  w.EndObject();
  return sb.GetString();
}

CmdResult UpdateBudgetCommand::applyForward(bool redo) {
  CmdResult budgetCheck = validateBudget("updateBudget", budget_);
  if (!budgetCheck.ok) return budgetCheck;

  double previous = 0.0;
  Trip updated;
  const StoreStatus st = receiver_.updateBudget(tripId_, budget_, &previous, &updated);
  if (st != StoreStatus::Ok) {
    return cmdFail(redo ? kInverseUnavailable : kNotFound,
                   "updateBudget: trip does not exist", idDetails("tripId", tripId_));
  }

  previous_ = previous;

  CmdResult r;
  r.ok = true;
  r.json = tripToJSON(updated);
  return r;
}

CmdResult UpdateBudgetCommand::applyInverse() {
  const double applied = budget_;
  const double restore = previous_;
  const StoreStatus st = receiver_.updateTrip(tripId_, [applied, restore](Trip& t) {
    if (t.budget != applied) return false;
    t.budget = restore;
    return true;
  });

  if (st == StoreStatus::NotFound) {
    return cmdFail(kInverseUnavailable, "updateBudget: trip no longer exists",
                   idDetails("tripId", tripId_));
  }
  if (st != StoreStatus::Ok) {
    return cmdFail(kInverseUnavailable, "updateBudget: budget changed since execute",
                   idDetails("tripId", tripId_));
  }
  return CmdResult{};
}

// -------------------- AddCollaborator --------------------

AddCollaboratorCommand::AddCollaboratorCommand(Receiver& receiver, Id tripId, Id userId)
  : Command(CommandKind::AddCollaborator, receiver), tripId_(tripId), userId_(userId) {}

std::string AddCollaboratorCommand::payloadJson() const {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("tripId"); w.Uint64(tripId_);
  w.Key("userId"); w.Uint64(userId_);
  w.EndObject();
  return sb.GetString();
}

CmdResult AddCollaboratorCommand::applyForward(bool redo) {
  if (userId_ == kInvalidId) {
    return cmdFail(kValidationFailure, "addCollaborator: userId is required",
                   R"({"field":"userId"})");
  }

  Trip updated;
  const StoreStatus st = receiver_.addCollaborator(tripId_, userId_, &updated);
  const std::string details = std::string(R"({"tripId":)") + std::to_string(tripId_) +
                              R"(,"userId":)" + std::to_string(userId_) + "}";
  switch (st) {
    case StoreStatus::Ok:
      break;
    case StoreStatus::NotFound:
      return cmdFail(redo ? kInverseUnavailable : kNotFound,
                     "addCollaborator: trip does not exist", details);
    case StoreStatus::Conflict:
      return cmdFail(redo ? kInverseUnavailable : kValidationFailure,
                     "addCollaborator: user is already a collaborator", details);
    case StoreStatus::Rejected:
    default:
      return cmdFail(redo ? kInverseUnavailable : kValidationFailure,
                     "addCollaborator: user owns the trip", details);
  }

  added_ = true;

  CmdResult r;
  r.ok = true;
  r.json = tripToJSON(updated);
  return r;
}

CmdResult AddCollaboratorCommand::applyInverse() {
  if (!added_) {
    return cmdFail(kInverseUnavailable, "addCollaborator: nothing was added");
  }
  const StoreStatus st = receiver_.removeCollaborator(tripId_, userId_);
  if (st != StoreStatus::Ok) {
    return cmdFail(kInverseUnavailable, "addCollaborator: collaborator no longer present",
                   std::string(R"({"tripId":)") + std::to_string(tripId_) +
                     R"(,"userId":)" + std::to_string(userId_) + "}");
  }
  return CmdResult{};
}

} // namespace tp
