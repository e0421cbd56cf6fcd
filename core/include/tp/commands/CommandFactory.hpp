#pragma once
#include "tp/commands/Command.hpp"
#include "tp/ids/Id.hpp"

#include <memory>
#include <string>

#include <rapidjson/document.h>

namespace tp {

class Receiver;

// Builds commands from JSON objects of the form {"cmd":"addFlight", ...}.
// Commands are bound to the factory's receiver.
class CommandFactory {
public:
  explicit CommandFactory(Receiver& receiver);

  // Returns nullptr and fills `err` (BAD_COMMAND / UNKNOWN_COMMAND) when the
  // object is not a well-formed mutation command.
  std::unique_ptr<Command> fromJson(const rapidjson::Value& obj, CmdError& err) const;

  // Convenience: parse string then build.
  std::unique_ptr<Command> fromJsonText(const std::string& jsonText, CmdError& err) const;

  // True for the cmd names fromJson() understands.
  static bool isMutation(const std::string& cmd);

private:
  Receiver& receiver_;

  std::unique_ptr<Command> buildCreateTrip(const rapidjson::Value& obj, CmdError& err) const;
  std::unique_ptr<Command> buildUpdateBudget(const rapidjson::Value& obj, CmdError& err) const;
  std::unique_ptr<Command> buildAddCollaborator(const rapidjson::Value& obj, CmdError& err) const;
  std::unique_ptr<Command> buildAddItem(const std::string& cmd, const rapidjson::Value& obj,
                                        CmdError& err) const;
  std::unique_ptr<Command> buildUpdateItemStatus(const rapidjson::Value& obj, CmdError& err) const;

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static Id getIdOrZero(const rapidjson::Value& obj, const char* key);
  static std::unique_ptr<Command> reject(CmdError& err, const std::string& code,
                                         const std::string& message,
                                         const std::string& detailsJson = "{}");
};

} // namespace tp
