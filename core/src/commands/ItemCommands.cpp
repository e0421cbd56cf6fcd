#include "tp/commands/ItemCommands.hpp"
#include "tp/store/EntityJson.hpp"
#include "tp/store/Receiver.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace tp {

namespace {

CommandKind kindFor(ItemType t) {
  switch (t) {
    case ItemType::Flight: return CommandKind::AddFlight;
    case ItemType::Hotel: return CommandKind::AddHotel;
    case ItemType::Activity: return CommandKind::AddActivity;
    case ItemType::Expense: return CommandKind::AddExpense;
  }
  return CommandKind::AddFlight;
}

std::string cmdName(ItemType t) {
  switch (t) {
    case ItemType::Flight: return "addFlight";
    case ItemType::Hotel: return "addHotel";
    case ItemType::Activity: return "addActivity";
    case ItemType::Expense: return "addExpense";
  }
  return "addItem";
}

CmdResult missingField(ItemType t, const char* field) {
  return cmdFail(kValidationFailure,
                 cmdName(t) + ": missing " + field,
                 std::string(R"({"field":")") + field + R"("})");
}

std::string itemDetails(ItemType t, Id id) {
  return std::string(R"({"type":")") + toString(t) + R"(","itemId":)" + std::to_string(id) + "}";
}

} // namespace

CmdResult validateItem(const ItineraryItem& item) {
  const ItemType t = item.type;
  if (item.tripId == kInvalidId) return missingField(t, "tripId");

  switch (t) {
    case ItemType::Flight:
      if (item.company.empty()) return missingField(t, "company");
      if (item.code.empty()) return missingField(t, "code");
      if (item.start.empty()) return missingField(t, "departure");
      if (item.end.empty()) return missingField(t, "arrival");
      if (item.start > item.end) {
        return cmdFail(kValidationFailure, "addFlight: departure is after arrival",
                       R"({"field":"departure"})");
      }
      break;
    case ItemType::Hotel:
      if (item.name.empty()) return missingField(t, "name");
      if (item.start.empty()) return missingField(t, "checkin");
      if (item.end.empty()) return missingField(t, "checkout");
      if (item.start >= item.end) {
        return cmdFail(kValidationFailure, "addHotel: checkin must be before checkout",
                       R"({"field":"checkin"})");
      }
      break;
    case ItemType::Activity:
      if (item.description.empty()) return missingField(t, "description");
      if (item.start.empty()) return missingField(t, "date");
      break;
    case ItemType::Expense:
      if (item.description.empty()) return missingField(t, "description");
      if (item.currency.empty()) return missingField(t, "currency");
      if (item.start.empty()) return missingField(t, "date");
      if (item.category.empty()) return missingField(t, "category");
      if (!std::isfinite(item.amount) || item.amount <= 0.0) {
        return cmdFail(kValidationFailure, "addExpense: amount must be positive",
                       R"({"field":"amount"})");
      }
      break;
  }
  return CmdResult{};
}

ItineraryItem makeFlight(Id tripId, std::string company, std::string code,
                         std::string departure, std::string arrival) {
  ItineraryItem it;
  it.tripId = tripId;
  it.type = ItemType::Flight;
  it.company = std::move(company);
  it.code = std::move(code);
  it.start = std::move(departure);
  it.end = std::move(arrival);
  return it;
}

ItineraryItem makeHotel(Id tripId, std::string name,
                        std::string checkin, std::string checkout) {
  ItineraryItem it;
  it.tripId = tripId;
  it.type = ItemType::Hotel;
  it.name = std::move(name);
  it.start = std::move(checkin);
  it.end = std::move(checkout);
  return it;
}

ItineraryItem makeActivity(Id tripId, std::string description, std::string date) {
  ItineraryItem it;
  it.tripId = tripId;
  it.type = ItemType::Activity;
  it.description = std::move(description);
  it.start = std::move(date);
  return it;
}

ItineraryItem makeExpense(Id tripId, std::string description, double amount,
                          std::string currency, std::string date, std::string category) {
  ItineraryItem it;
  it.tripId = tripId;
  it.type = ItemType::Expense;
  it.description = std::move(description);
  it.amount = amount;
  it.currency = std::move(currency);
  it.start = std::move(date);
  it.category = std::move(category);
  return it;
}

// -------------------- AddItem --------------------

AddItemCommand::AddItemCommand(Receiver& receiver, ItineraryItem item)
  : Command(kindFor(item.type), receiver), payload_(std::move(item)) {}

std::string AddItemCommand::payloadJson() const {
  ItineraryItem shown = payload_;
  shown.id = 0;
  return itemToJSON(shown);
}

CmdResult AddItemCommand::applyForward(bool redo) {
  ItineraryItem item;

  if (redo) {
    item = captured_;
    const StoreStatus st = receiver_.insertItem(item);
    if (st != StoreStatus::Ok) {
      return cmdFail(kInverseUnavailable,
                     cmdName(payload_.type) + ": item cannot be restored (" + toString(st) + ")",
                     itemDetails(captured_.type, captured_.id));
    }
  } else {
    CmdResult check = validateItem(payload_);
    if (!check.ok) return check;

    item = payload_;
    item.id = kInvalidId;
    const StoreStatus st = receiver_.insertItem(item);
    if (st != StoreStatus::Ok) {
      return cmdFail(kNotFound,
                     cmdName(payload_.type) + ": trip does not exist",
                     std::string(R"({"tripId":)") + std::to_string(payload_.tripId) + "}");
    }
    captured_ = item;
  }

  CmdResult r;
  r.ok = true;
  r.createdId = item.id;
  r.json = itemToJSON(item);
  return r;
}

CmdResult AddItemCommand::applyInverse() {
  if (!receiver_.removeItem(collectionOf(captured_.type), captured_.id)) {
    return cmdFail(kInverseUnavailable,
                   cmdName(payload_.type) + ": item no longer exists",
                   itemDetails(captured_.type, captured_.id));
  }
  return CmdResult{};
}

// -------------------- UpdateItemStatus --------------------

UpdateItemStatusCommand::UpdateItemStatusCommand(Receiver& receiver, ItemType type,
                                                 Id itemId, bool isDone)
  : Command(CommandKind::UpdateItemStatus, receiver),
    type_(type), itemId_(itemId), isDone_(isDone) {}

std::string UpdateItemStatusCommand::payloadJson() const {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("itemType"); w.String(toString(type_));
  w.Key("itemId");   w.Uint64(itemId_);
  w.Key("isDone");   w.Bool(isDone_);
  w.EndObject();
  return sb.GetString();
}

CmdResult UpdateItemStatusCommand::applyForward(bool redo) {
  bool previous = false;
  const bool target = isDone_;
  ItineraryItem updated;
  const StoreStatus st = receiver_.updateItem(collectionOf(type_), itemId_,
    [&previous, target](ItineraryItem& item) {
      previous = item.isDone;
      item.isDone = target;
      return true;
    }, &updated);

  if (st != StoreStatus::Ok) {
    return cmdFail(redo ? kInverseUnavailable : kNotFound,
                   std::string("updateItemStatus: ") + toString(type_) + " does not exist",
                   itemDetails(type_, itemId_));
  }

  previous_ = previous;

  CmdResult r;
  r.ok = true;
  r.json = itemToJSON(updated);
  return r;
}

CmdResult UpdateItemStatusCommand::applyInverse() {
  const bool applied = isDone_;
  const bool restore = previous_;
  const StoreStatus st = receiver_.updateItem(collectionOf(type_), itemId_,
    [applied, restore](ItineraryItem& item) {
      if (item.isDone != applied) return false;
      item.isDone = restore;
      return true;
    });

  if (st == StoreStatus::NotFound) {
    return cmdFail(kInverseUnavailable,
                   std::string("updateItemStatus: ") + toString(type_) + " no longer exists",
                   itemDetails(type_, itemId_));
  }
  if (st != StoreStatus::Ok) {
    return cmdFail(kInverseUnavailable, "updateItemStatus: status changed since execute",
                   itemDetails(type_, itemId_));
  }
  return CmdResult{};
}

} // namespace tp
