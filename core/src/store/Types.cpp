#include "tp/store/Types.hpp"
#include <algorithm>

namespace tp {

bool parseItemType(const std::string& s, ItemType& out) {
  if (s == "flight")   { out = ItemType::Flight;   return true; }
  if (s == "hotel")    { out = ItemType::Hotel;    return true; }
  if (s == "activity") { out = ItemType::Activity; return true; }
  if (s == "expense")  { out = ItemType::Expense;  return true; }
  return false;
}

bool Trip::hasCollaborator(Id userId) const {
  return std::find(collaborators.begin(), collaborators.end(), userId) != collaborators.end();
}

} // namespace tp
