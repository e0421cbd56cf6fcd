#include "tp/commands/CommandFactory.hpp"
#include "tp/commands/ItemCommands.hpp"
#include "tp/commands/TripCommands.hpp"
#include "tp/store/Receiver.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <stdexcept>
#include <string>

namespace tp {

CommandFactory::CommandFactory(Receiver& receiver) : receiver_(receiver) {}

std::unique_ptr<Command> CommandFactory::reject(CmdError& err, const std::string& code,
                                                const std::string& message,
                                                const std::string& detailsJson) {
  err.code = code;
  err.message = message;
  err.details = detailsJson.empty() ? "{}" : detailsJson;
  return nullptr;
}

const rapidjson::Value* CommandFactory::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string CommandFactory::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (v->IsString()) return v->GetString();
  return {};
}

Id CommandFactory::getIdOrZero(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return 0;

  if (v->IsUint64()) return static_cast<Id>(v->GetUint64());
  if (v->IsInt64() && v->GetInt64() > 0) return static_cast<Id>(v->GetInt64());
  if (v->IsString()) return parseIdString(v->GetString());
  return 0;
}

bool CommandFactory::isMutation(const std::string& cmd) {
  return cmd == "createTrip" || cmd == "updateBudget" || cmd == "addCollaborator" ||
         cmd == "addFlight" || cmd == "addHotel" || cmd == "addActivity" ||
         cmd == "addExpense" || cmd == "updateItemStatus";
}

std::unique_ptr<Command> CommandFactory::fromJsonText(const std::string& jsonText,
                                                      CmdError& err) const {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return reject(err, kBadCommand, "CommandFactory: invalid JSON object");
  }

  return fromJson(d, err);
}

std::unique_ptr<Command> CommandFactory::fromJson(const rapidjson::Value& obj,
                                                  CmdError& err) const {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return reject(err, kBadCommand, "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  try {
    if (cmd == "createTrip") return buildCreateTrip(obj, err);
    if (cmd == "updateBudget") return buildUpdateBudget(obj, err);
    if (cmd == "addCollaborator") return buildAddCollaborator(obj, err);
    if (cmd == "addFlight" || cmd == "addHotel" || cmd == "addActivity" || cmd == "addExpense")
      return buildAddItem(cmd, obj, err);
    if (cmd == "updateItemStatus") return buildUpdateItemStatus(obj, err);
  } catch (const std::runtime_error& e) {
    // parseIdString on a malformed string id
    return reject(err, kBadCommand, cmd + ": " + e.what());
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("cmd"); w.String(cmd.c_str(), static_cast<rapidjson::SizeType>(cmd.size()));
  w.EndObject();
  return reject(err, kUnknownCommand, "Unknown cmd", sb.GetString());
}

std::unique_ptr<Command> CommandFactory::buildCreateTrip(const rapidjson::Value& obj,
                                                         CmdError&) const {
  CreateTripPayload p;
  p.ownerId = getIdOrZero(obj, "userId");
  p.destination = getStringOrEmpty(obj, "destination");
  p.name = getStringOrEmpty(obj, "name");
  p.startDate = getStringOrEmpty(obj, "startDate");
  p.endDate = getStringOrEmpty(obj, "endDate");
  p.shareCode = getStringOrEmpty(obj, "shareCode");
  const auto* budget = getMember(obj, "budget");
  if (budget && budget->IsNumber()) p.budget = budget->GetDouble();
  const auto* suggestion = getMember(obj, "isSuggestion");
  if (suggestion && suggestion->IsBool()) p.isSuggestion = suggestion->GetBool();

  // Field rules are the command's job; an incomplete payload fails on execute.
  return std::make_unique<CreateTripCommand>(receiver_, std::move(p));
}

std::unique_ptr<Command> CommandFactory::buildUpdateBudget(const rapidjson::Value& obj,
                                                           CmdError& err) const {
  const Id tripId = getIdOrZero(obj, "tripId");
  if (tripId == 0) {
    return reject(err, kBadCommand, "updateBudget: missing/invalid tripId");
  }
  const auto* b = getMember(obj, "budget");
  if (!b || !b->IsNumber()) {
    return reject(err, kBadCommand, "updateBudget: missing number budget");
  }
  return std::make_unique<UpdateBudgetCommand>(receiver_, tripId, b->GetDouble());
}

std::unique_ptr<Command> CommandFactory::buildAddCollaborator(const rapidjson::Value& obj,
                                                              CmdError& err) const {
  const Id tripId = getIdOrZero(obj, "tripId");
  if (tripId == 0) {
    return reject(err, kBadCommand, "addCollaborator: missing/invalid tripId");
  }
  const Id userId = getIdOrZero(obj, "userId");
  if (userId == 0) {
    return reject(err, kBadCommand, "addCollaborator: missing/invalid userId");
  }
  return std::make_unique<AddCollaboratorCommand>(receiver_, tripId, userId);
}

std::unique_ptr<Command> CommandFactory::buildAddItem(const std::string& cmd,
                                                      const rapidjson::Value& obj,
                                                      CmdError& err) const {
  const Id tripId = getIdOrZero(obj, "tripId");
  if (tripId == 0) {
    return reject(err, kBadCommand, cmd + ": missing/invalid tripId");
  }

  ItineraryItem item;
  if (cmd == "addFlight") {
    item = makeFlight(tripId,
                      getStringOrEmpty(obj, "company"),
                      getStringOrEmpty(obj, "code"),
                      getStringOrEmpty(obj, "departure"),
                      getStringOrEmpty(obj, "arrival"));
  } else if (cmd == "addHotel") {
    item = makeHotel(tripId,
                     getStringOrEmpty(obj, "name"),
                     getStringOrEmpty(obj, "checkin"),
                     getStringOrEmpty(obj, "checkout"));
  } else if (cmd == "addActivity") {
    item = makeActivity(tripId,
                        getStringOrEmpty(obj, "description"),
                        getStringOrEmpty(obj, "date"));
  } else {
    const auto* amount = getMember(obj, "amount");
    if (!amount || !amount->IsNumber()) {
      return reject(err, kBadCommand, "addExpense: missing number amount");
    }
    item = makeExpense(tripId,
                       getStringOrEmpty(obj, "description"),
                       amount->GetDouble(),
                       getStringOrEmpty(obj, "currency"),
                       getStringOrEmpty(obj, "date"),
                       getStringOrEmpty(obj, "category"));
  }

  const auto* done = getMember(obj, "isDone");
  if (done && done->IsBool()) item.isDone = done->GetBool();

  return std::make_unique<AddItemCommand>(receiver_, std::move(item));
}

std::unique_ptr<Command> CommandFactory::buildUpdateItemStatus(const rapidjson::Value& obj,
                                                               CmdError& err) const {
  ItemType type{};
  const std::string typeName = getStringOrEmpty(obj, "itemType");
  if (!parseItemType(typeName, type)) {
    return reject(err, kBadCommand, "updateItemStatus: unsupported itemType",
                  R"({"supported":["flight","hotel","activity","expense"]})");
  }
  const Id itemId = getIdOrZero(obj, "itemId");
  if (itemId == 0) {
    return reject(err, kBadCommand, "updateItemStatus: missing/invalid itemId");
  }
  const auto* done = getMember(obj, "isDone");
  if (!done || !done->IsBool()) {
    return reject(err, kBadCommand, "updateItemStatus: missing bool isDone");
  }
  return std::make_unique<UpdateItemStatusCommand>(receiver_, type, itemId, done->GetBool());
}

} // namespace tp
