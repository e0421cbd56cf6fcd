#include "tp/store/TripStore.hpp"
#include "tp/store/EntityJson.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace tp {

namespace {

constexpr const char* kShareCodeAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr std::uint32_t kShareCodeAlphabetSize = 36;

constexpr ItemType kItemTypes[kItemTypeCount] = {
  ItemType::Flight, ItemType::Hotel, ItemType::Activity, ItemType::Expense
};

std::size_t slotOf(ItemType t) { return static_cast<std::size_t>(t); }
std::size_t counterOf(Collection c) { return static_cast<std::size_t>(c); }

} // namespace

TripStore::TripStore() : TripStore(TripStoreConfig{}) {}

TripStore::TripStore(const TripStoreConfig& config)
  : config_(config), seed_(config.shareCodeSeed) {
  config_.shareCodeLength = std::clamp(config_.shareCodeLength,
                                       TripStoreConfig::kMinShareCodeLength,
                                       TripStoreConfig::kMaxShareCodeLength);
  nextIds_.fill(1);
}

bool TripStore::itemSlot(Collection c, std::size_t& slot) {
  switch (c) {
    case Collection::Flights:    slot = slotOf(ItemType::Flight);   return true;
    case Collection::Hotels:     slot = slotOf(ItemType::Hotel);    return true;
    case Collection::Activities: slot = slotOf(ItemType::Activity); return true;
    case Collection::Expenses:   slot = slotOf(ItemType::Expense);  return true;
    default: return false;
  }
}

Id TripStore::nextId(Collection c) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return nextIds_[counterOf(c)];
}

// -------------------- trips --------------------

bool TripStore::generateShareCodeLocked(std::string& out) {
  const std::size_t len = config_.shareCodeLength;
  std::string code(len, kShareCodeAlphabet[0]);

  int attempts = 0;
  for (; attempts < kShareCodeAttempts / 2; ++attempts) {
    for (std::size_t i = 0; i < len; ++i) {
      seed_ = seed_ * 1664525u + 1013904223u;
      code[i] = kShareCodeAlphabet[(seed_ >> 16) % kShareCodeAlphabetSize];
    }
    if (!shareCodeTakenLocked(code, kInvalidId)) {
      out = code;
      return true;
    }
  }

  // Dense code space: walk the codes after the last candidate in order.
  for (; attempts < kShareCodeAttempts; ++attempts) {
    for (std::size_t i = len; i-- > 0;) {
      const char* pos = std::strchr(kShareCodeAlphabet, code[i]);
      const auto digit = static_cast<std::uint32_t>(pos - kShareCodeAlphabet);
      if (digit + 1 < kShareCodeAlphabetSize) {
        code[i] = kShareCodeAlphabet[digit + 1];
        break;
      }
      code[i] = kShareCodeAlphabet[0];
    }
    if (!shareCodeTakenLocked(code, kInvalidId)) {
      out = code;
      return true;
    }
  }
  return false;
}

bool TripStore::shareCodeTakenLocked(const std::string& code, Id exceptId) const {
  for (const auto& kv : trips_) {
    if (kv.first != exceptId && kv.second.shareCode == code) return true;
  }
  return false;
}

StoreStatus TripStore::insertTrip(Trip& trip) {
  std::lock_guard<std::mutex> lock(mtx_);
  Id& next = nextIds_[counterOf(Collection::Trips)];

  if (trip.id != kInvalidId && trips_.count(trip.id)) return StoreStatus::Conflict;
  if (!trip.shareCode.empty() && shareCodeTakenLocked(trip.shareCode, kInvalidId))
    return StoreStatus::Conflict;

  if (trip.shareCode.empty()) {
    std::string code;
    if (!generateShareCodeLocked(code)) {
      std::fprintf(stderr, "TripStore::insertTrip: no free share code of length %zu\n",
                   config_.shareCodeLength);
      return StoreStatus::Conflict;
    }
    trip.shareCode = code;
  }

  if (trip.id == kInvalidId) {
    trip.id = next++;
  } else if (trip.id >= next) {
    next = trip.id + 1;
  }

  trips_[trip.id] = trip;
  return StoreStatus::Ok;
}

bool TripStore::findTrip(Id id, Trip& out) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = trips_.find(id);
  if (it == trips_.end()) return false;
  out = it->second;
  return true;
}

bool TripStore::findTripByShareCode(const std::string& code, Trip& out) const {
  if (code.empty()) return false;
  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto& kv : trips_) {
    if (kv.second.shareCode == code) {
      out = kv.second;
      return true;
    }
  }
  return false;
}

StoreStatus TripStore::updateTrip(Id id, const TripMutator& fn, Trip* out) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = trips_.find(id);
  if (it == trips_.end()) return StoreStatus::NotFound;

  // Mutate a copy so a refused update leaves nothing behind.
  Trip copy = it->second;
  if (!fn(copy)) return StoreStatus::Rejected;
  copy.id = id;
  if (copy.shareCode != it->second.shareCode &&
      (copy.shareCode.empty() || shareCodeTakenLocked(copy.shareCode, id)))
    return StoreStatus::Rejected;

  it->second = std::move(copy);
  if (out) *out = it->second;
  return StoreStatus::Ok;
}

bool TripStore::removeTrip(Id id) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (trips_.erase(id) == 0) return false;

  for (auto& table : items_) {
    for (auto it = table.begin(); it != table.end();) {
      if (it->second.tripId == id) it = table.erase(it);
      else ++it;
    }
  }
  return true;
}

StoreStatus TripStore::updateBudget(Id tripId, double budget, double* previous, Trip* out) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = trips_.find(tripId);
  if (it == trips_.end()) return StoreStatus::NotFound;

  if (previous) *previous = it->second.budget;
  it->second.budget = budget;
  if (out) *out = it->second;
  return StoreStatus::Ok;
}

StoreStatus TripStore::addCollaborator(Id tripId, Id userId, Trip* out) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = trips_.find(tripId);
  if (it == trips_.end()) return StoreStatus::NotFound;

  Trip& t = it->second;
  if (t.ownerId == userId) return StoreStatus::Rejected;
  if (t.hasCollaborator(userId)) return StoreStatus::Conflict;

  t.collaborators.push_back(userId);
  if (out) *out = t;
  return StoreStatus::Ok;
}

StoreStatus TripStore::removeCollaborator(Id tripId, Id userId, Trip* out) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = trips_.find(tripId);
  if (it == trips_.end()) return StoreStatus::NotFound;

  auto& collabs = it->second.collaborators;
  auto pos = std::find(collabs.begin(), collabs.end(), userId);
  if (pos == collabs.end()) return StoreStatus::NotFound;

  collabs.erase(pos);
  if (out) *out = it->second;
  return StoreStatus::Ok;
}

// -------------------- itinerary items --------------------

StoreStatus TripStore::insertItem(ItineraryItem& item) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!trips_.count(item.tripId)) return StoreStatus::NotFound;

  ItemTable& table = items_[slotOf(item.type)];
  Id& next = nextIds_[counterOf(collectionOf(item.type))];

  if (item.id == kInvalidId) {
    item.id = next++;
  } else {
    if (table.count(item.id)) return StoreStatus::Conflict;
    if (item.id >= next) next = item.id + 1;
  }

  table[item.id] = item;
  return StoreStatus::Ok;
}

bool TripStore::findItem(Collection c, Id id, ItineraryItem& out) const {
  std::size_t slot = 0;
  if (!itemSlot(c, slot)) return false;

  std::lock_guard<std::mutex> lock(mtx_);
  const ItemTable& table = items_[slot];
  auto it = table.find(id);
  if (it == table.end()) return false;
  out = it->second;
  return true;
}

StoreStatus TripStore::updateItem(Collection c, Id id, const ItemMutator& fn,
                                  ItineraryItem* out) {
  std::size_t slot = 0;
  if (!itemSlot(c, slot)) return StoreStatus::NotFound;

  std::lock_guard<std::mutex> lock(mtx_);
  ItemTable& table = items_[slot];
  auto it = table.find(id);
  if (it == table.end()) return StoreStatus::NotFound;

  ItineraryItem copy = it->second;
  if (!fn(copy)) return StoreStatus::Rejected;
  // identity and placement are not editable through a mutator
  copy.id = id;
  copy.type = it->second.type;
  copy.tripId = it->second.tripId;

  it->second = std::move(copy);
  if (out) *out = it->second;
  return StoreStatus::Ok;
}

bool TripStore::removeItem(Collection c, Id id) {
  std::size_t slot = 0;
  if (!itemSlot(c, slot)) return false;

  std::lock_guard<std::mutex> lock(mtx_);
  return items_[slot].erase(id) > 0;
}

// -------------------- enumeration --------------------

std::vector<Trip> TripStore::trips() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<Trip> out;
  out.reserve(trips_.size());
  for (const auto& kv : trips_) out.push_back(kv.second);
  return out;
}

std::vector<ItineraryItem> TripStore::items(Collection c) const {
  std::vector<ItineraryItem> out;
  std::size_t slot = 0;
  if (!itemSlot(c, slot)) return out;

  std::lock_guard<std::mutex> lock(mtx_);
  out.reserve(items_[slot].size());
  for (const auto& kv : items_[slot]) out.push_back(kv.second);
  return out;
}

std::vector<ItineraryItem> TripStore::itemsForTrip(Id tripId) const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<ItineraryItem> out;
  for (const auto& table : items_) {
    for (const auto& kv : table) {
      if (kv.second.tripId == tripId) out.push_back(kv.second);
    }
  }
  return out;
}

std::size_t TripStore::count(Collection c) const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (c == Collection::Trips) return trips_.size();
  std::size_t slot = 0;
  if (!itemSlot(c, slot)) return 0;
  return items_[slot].size();
}

void TripStore::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  trips_.clear();
  for (auto& table : items_) table.clear();
}

// -------------------- snapshot --------------------

std::string TripStore::toJSON() const {
  std::lock_guard<std::mutex> lock(mtx_);

  rapidjson::StringBuffer sb;
  JsonWriter w(sb);

  w.StartObject();

  w.Key("nextIds");
  w.StartObject();
  for (std::size_t i = 0; i < kCollectionCount; ++i) {
    w.Key(toString(static_cast<Collection>(i)));
    w.Uint64(nextIds_[i]);
  }
  w.EndObject();

  w.Key(toString(Collection::Trips));
  w.StartArray();
  for (const auto& kv : trips_) writeTrip(w, kv.second);
  w.EndArray();

  for (ItemType t : kItemTypes) {
    w.Key(toString(collectionOf(t)));
    w.StartArray();
    for (const auto& kv : items_[slotOf(t)]) writeItem(w, kv.second);
    w.EndArray();
  }

  w.EndObject();
  return sb.GetString();
}

bool TripStore::loadJSON(const std::string& json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) return false;
  if (!doc.IsObject()) return false;

  std::map<Id, Trip> loadedTrips;
  std::array<ItemTable, kItemTypeCount> loadedItems;
  std::array<Id, kCollectionCount> loadedNext;
  loadedNext.fill(1);

  const char* tripsKey = toString(Collection::Trips);
  if (doc.HasMember(tripsKey)) {
    if (!doc[tripsKey].IsArray()) return false;
    for (const auto& v : doc[tripsKey].GetArray()) {
      Trip t;
      if (!readTrip(v, t) || t.id == kInvalidId) return false;
      if (loadedTrips.count(t.id)) return false;
      if (!t.shareCode.empty()) {
        for (const auto& kv : loadedTrips) {
          if (kv.second.shareCode == t.shareCode) return false;
        }
      }
      Id& next = loadedNext[counterOf(Collection::Trips)];
      if (t.id >= next) next = t.id + 1;
      loadedTrips[t.id] = std::move(t);
    }
  }

  for (ItemType type : kItemTypes) {
    const Collection c = collectionOf(type);
    const char* key = toString(c);
    if (!doc.HasMember(key)) continue;
    if (!doc[key].IsArray()) return false;
    for (const auto& v : doc[key].GetArray()) {
      ItineraryItem item;
      if (!readItem(v, type, item) || item.id == kInvalidId) return false;
      if (!loadedTrips.count(item.tripId)) return false;
      if (loadedItems[slotOf(type)].count(item.id)) return false;
      Id& next = loadedNext[counterOf(c)];
      if (item.id >= next) next = item.id + 1;
      loadedItems[slotOf(type)][item.id] = std::move(item);
    }
  }

  // Saved counters win when they are ahead of the highest stored id, so ids
  // freed by deletions before the save stay retired.
  if (doc.HasMember("nextIds") && doc["nextIds"].IsObject()) {
    const auto& ids = doc["nextIds"];
    for (std::size_t i = 0; i < kCollectionCount; ++i) {
      const char* key = toString(static_cast<Collection>(i));
      if (ids.HasMember(key) && ids[key].IsUint64()) {
        loadedNext[i] = std::max<Id>(loadedNext[i], ids[key].GetUint64());
      }
    }
  }

  std::lock_guard<std::mutex> lock(mtx_);
  std::swap(trips_, loadedTrips);

  // Codes are generated against the loaded trips; on failure the previous
  // contents come back untouched.
  for (auto& kv : trips_) {
    if (!kv.second.shareCode.empty()) continue;
    std::string code;
    if (!generateShareCodeLocked(code)) {
      std::swap(trips_, loadedTrips);
      return false;
    }
    kv.second.shareCode = code;
  }

  items_ = std::move(loadedItems);
  nextIds_ = loadedNext;
  return true;
}

} // namespace tp
