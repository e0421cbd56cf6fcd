#pragma once
#include "tp/ids/Id.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace tp {

enum class Collection : std::uint8_t {
  Trips,
  Flights,
  Hotels,
  Activities,
  Expenses
};

inline constexpr std::size_t kCollectionCount = 5;

inline const char* toString(Collection c) {
  switch (c) {
    case Collection::Trips: return "trips";
    case Collection::Flights: return "flights";
    case Collection::Hotels: return "hotels";
    case Collection::Activities: return "activities";
    case Collection::Expenses: return "expenses";
    default: return "unknown";
  }
}

enum class ItemType : std::uint8_t {
  Flight,
  Hotel,
  Activity,
  Expense
};

inline constexpr std::size_t kItemTypeCount = 4;

inline const char* toString(ItemType t) {
  switch (t) {
    case ItemType::Flight: return "flight";
    case ItemType::Hotel: return "hotel";
    case ItemType::Activity: return "activity";
    case ItemType::Expense: return "expense";
    default: return "unknown";
  }
}

inline Collection collectionOf(ItemType t) {
  switch (t) {
    case ItemType::Flight: return Collection::Flights;
    case ItemType::Hotel: return Collection::Hotels;
    case ItemType::Activity: return Collection::Activities;
    case ItemType::Expense: return Collection::Expenses;
  }
  return Collection::Flights;
}

// Accepts "flight", "hotel", "activity", "expense". Returns false otherwise.
bool parseItemType(const std::string& s, ItemType& out);

// Result of a single store mutation.
enum class StoreStatus : std::uint8_t {
  Ok,
  NotFound,   // target (or parent trip) absent
  Conflict,   // id or share code already taken, collaborator already present
  Rejected    // mutator or business rule refused the change
};

inline const char* toString(StoreStatus s) {
  switch (s) {
    case StoreStatus::Ok: return "ok";
    case StoreStatus::NotFound: return "notFound";
    case StoreStatus::Conflict: return "conflict";
    case StoreStatus::Rejected: return "rejected";
    default: return "unknown";
  }
}

struct Trip {
  Id id{0};
  Id ownerId{0};
  std::string destination;
  std::string name;
  std::string startDate;   // ISO yyyy-mm-dd
  std::string endDate;
  bool isSuggestion{false};
  double budget{0.0};
  std::string shareCode;
  std::vector<Id> collaborators;

  bool hasCollaborator(Id userId) const;
};

// One row of a trip itinerary. Field meaning depends on type, mirroring the
// per-type columns of the planner database:
//   Flight:   company, code, start = departure, end = arrival
//   Hotel:    name, start = checkin, end = checkout
//   Activity: description, start = date
//   Expense:  description, amount, currency, category, start = date
struct ItineraryItem {
  Id id{0};
  Id tripId{0};
  ItemType type{ItemType::Flight};
  bool isDone{false};

  std::string company;
  std::string code;
  std::string name;
  std::string description;
  std::string start;
  std::string end;

  double amount{0.0};
  std::string currency;
  std::string category;
};

} // namespace tp
