#pragma once
#include "tp/commands/Command.hpp"
#include "tp/store/Types.hpp"

#include <string>

namespace tp {

struct CreateTripPayload {
  Id ownerId{0};
  std::string destination;
  std::string name;
  std::string startDate;
  std::string endDate;
  std::string shareCode;   // empty => store generates one
  double budget{0.0};
  bool isSuggestion{false};
};

// Inserts a trip. Captures the stored trip (id + share code) so undo can
// delete it and redo can put the very same trip back.
class CreateTripCommand : public Command {
public:
  CreateTripCommand(Receiver& receiver, CreateTripPayload payload);

  std::string payloadJson() const override;

  const CreateTripPayload& payload() const { return payload_; }
  Id tripId() const { return captured_.id; }

protected:
  CmdResult applyForward(bool redo) override;
  CmdResult applyInverse() override;

private:
  const CreateTripPayload payload_;
  Trip captured_;
};

class UpdateBudgetCommand : public Command {
public:
  UpdateBudgetCommand(Receiver& receiver, Id tripId, double budget);

  std::string payloadJson() const override;

  Id tripId() const { return tripId_; }
  double budget() const { return budget_; }
  double previousBudget() const { return previous_; }

protected:
  CmdResult applyForward(bool redo) override;
  CmdResult applyInverse() override;

private:
  const Id tripId_;
  const double budget_;
  double previous_{0.0};
};

// Fails (rather than no-op) when the user already collaborates on or owns
// the trip, so a successful execute always has something to undo.
class AddCollaboratorCommand : public Command {
public:
  AddCollaboratorCommand(Receiver& receiver, Id tripId, Id userId);

  std::string payloadJson() const override;

  Id tripId() const { return tripId_; }
  Id userId() const { return userId_; }
  bool wasAdded() const { return added_; }

protected:
  CmdResult applyForward(bool redo) override;
  CmdResult applyInverse() override;

private:
  const Id tripId_;
  const Id userId_;
  bool added_{false};
};

} // namespace tp
