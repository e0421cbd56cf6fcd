#include "tp/store/EntityJson.hpp"

namespace tp {

namespace {

std::string getString(const rapidjson::Value& v, const char* key) {
  auto it = v.FindMember(key);
  if (it == v.MemberEnd() || !it->value.IsString()) return {};
  return it->value.GetString();
}

} // namespace

void writeTrip(JsonWriter& w, const Trip& t) {
  w.StartObject();
  w.Key("id");           w.Uint64(t.id);
  w.Key("userId");       w.Uint64(t.ownerId);
  w.Key("destination");  w.String(t.destination.c_str());
  w.Key("name");         w.String(t.name.c_str());
  w.Key("startDate");    w.String(t.startDate.c_str());
  w.Key("endDate");      w.String(t.endDate.c_str());
  w.Key("isSuggestion"); w.Bool(t.isSuggestion);
  w.Key("budget");       w.Double(t.budget);
  w.Key("shareCode");    w.String(t.shareCode.c_str());
  w.Key("collaborators");
  w.StartArray();
  for (Id c : t.collaborators) w.Uint64(c);
  w.EndArray();
  w.EndObject();
}

void writeItem(JsonWriter& w, const ItineraryItem& item) {
  w.StartObject();
  w.Key("id");     w.Uint64(item.id);
  w.Key("tripId"); w.Uint64(item.tripId);
  w.Key("type");   w.String(toString(item.type));
  w.Key("isDone"); w.Bool(item.isDone);

  switch (item.type) {
    case ItemType::Flight:
      w.Key("company");   w.String(item.company.c_str());
      w.Key("code");      w.String(item.code.c_str());
      w.Key("departure"); w.String(item.start.c_str());
      w.Key("arrival");   w.String(item.end.c_str());
      break;
    case ItemType::Hotel:
      w.Key("name");     w.String(item.name.c_str());
      w.Key("checkin");  w.String(item.start.c_str());
      w.Key("checkout"); w.String(item.end.c_str());
      break;
    case ItemType::Activity:
      w.Key("description"); w.String(item.description.c_str());
      w.Key("date");        w.String(item.start.c_str());
      break;
    case ItemType::Expense:
      w.Key("description"); w.String(item.description.c_str());
      w.Key("amount");      w.Double(item.amount);
      w.Key("currency");    w.String(item.currency.c_str());
      w.Key("date");        w.String(item.start.c_str());
      w.Key("category");    w.String(item.category.c_str());
      break;
  }
  w.EndObject();
}

bool readTrip(const rapidjson::Value& v, Trip& out) {
  if (!v.IsObject()) return false;
  if (!v.HasMember("id") || !v["id"].IsUint64()) return false;

  Trip t;
  t.id = v["id"].GetUint64();
  if (v.HasMember("userId") && v["userId"].IsUint64()) t.ownerId = v["userId"].GetUint64();
  t.destination = getString(v, "destination");
  t.name = getString(v, "name");
  t.startDate = getString(v, "startDate");
  t.endDate = getString(v, "endDate");
  if (v.HasMember("isSuggestion") && v["isSuggestion"].IsBool())
    t.isSuggestion = v["isSuggestion"].GetBool();
  if (v.HasMember("budget") && v["budget"].IsNumber())
    t.budget = v["budget"].GetDouble();
  t.shareCode = getString(v, "shareCode");

  if (v.HasMember("collaborators") && v["collaborators"].IsArray()) {
    for (const auto& c : v["collaborators"].GetArray()) {
      if (c.IsUint64()) t.collaborators.push_back(c.GetUint64());
    }
  }

  out = std::move(t);
  return true;
}

bool readItem(const rapidjson::Value& v, ItemType type, ItineraryItem& out) {
  if (!v.IsObject()) return false;
  if (!v.HasMember("id") || !v["id"].IsUint64()) return false;

  ItineraryItem item;
  item.id = v["id"].GetUint64();
  item.type = type;
  if (v.HasMember("tripId") && v["tripId"].IsUint64()) item.tripId = v["tripId"].GetUint64();
  if (v.HasMember("isDone") && v["isDone"].IsBool()) item.isDone = v["isDone"].GetBool();

  switch (type) {
    case ItemType::Flight:
      item.company = getString(v, "company");
      item.code = getString(v, "code");
      item.start = getString(v, "departure");
      item.end = getString(v, "arrival");
      break;
    case ItemType::Hotel:
      item.name = getString(v, "name");
      item.start = getString(v, "checkin");
      item.end = getString(v, "checkout");
      break;
    case ItemType::Activity:
      item.description = getString(v, "description");
      item.start = getString(v, "date");
      break;
    case ItemType::Expense:
      item.description = getString(v, "description");
      if (v.HasMember("amount") && v["amount"].IsNumber()) item.amount = v["amount"].GetDouble();
      item.currency = getString(v, "currency");
      item.start = getString(v, "date");
      item.category = getString(v, "category");
      break;
  }

  out = std::move(item);
  return true;
}

std::string tripToJSON(const Trip& t) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  writeTrip(w, t);
  return sb.GetString();
}

std::string itemToJSON(const ItineraryItem& item) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  writeItem(w, item);
  return sb.GetString();
}

} // namespace tp
