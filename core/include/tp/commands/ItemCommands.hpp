#pragma once
#include "tp/commands/Command.hpp"
#include "tp/store/Types.hpp"

#include <string>

namespace tp {

// AddFlight / AddHotel / AddActivity / AddExpense. The kind follows the
// item type; the payload's id is ignored (the store assigns one).
class AddItemCommand : public Command {
public:
  AddItemCommand(Receiver& receiver, ItineraryItem item);

  std::string payloadJson() const override;

  const ItineraryItem& payload() const { return payload_; }
  ItemType itemType() const { return payload_.type; }
  Id itemId() const { return captured_.id; }

protected:
  CmdResult applyForward(bool redo) override;
  CmdResult applyInverse() override;

private:
  const ItineraryItem payload_;
  ItineraryItem captured_;
};

// Required fields and ordering rules per item type.
CmdResult validateItem(const ItineraryItem& item);

// Convenience constructors for the common item kinds.
ItineraryItem makeFlight(Id tripId, std::string company, std::string code,
                         std::string departure, std::string arrival);
ItineraryItem makeHotel(Id tripId, std::string name,
                        std::string checkin, std::string checkout);
ItineraryItem makeActivity(Id tripId, std::string description, std::string date);
ItineraryItem makeExpense(Id tripId, std::string description, double amount,
                          std::string currency, std::string date, std::string category);

class UpdateItemStatusCommand : public Command {
public:
  UpdateItemStatusCommand(Receiver& receiver, ItemType type, Id itemId, bool isDone);

  std::string payloadJson() const override;

  ItemType itemType() const { return type_; }
  Id itemId() const { return itemId_; }
  bool isDone() const { return isDone_; }
  bool previousIsDone() const { return previous_; }

protected:
  CmdResult applyForward(bool redo) override;
  CmdResult applyInverse() override;

private:
  const ItemType type_;
  const Id itemId_;
  const bool isDone_;
  bool previous_{false};
};

} // namespace tp
