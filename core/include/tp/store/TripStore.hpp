#pragma once
#include "tp/store/Receiver.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tp {

struct TripStoreConfig {
  static constexpr std::size_t kMinShareCodeLength = 1;
  static constexpr std::size_t kMaxShareCodeLength = 32;

  std::size_t shareCodeLength{6};   // clamped to [kMin, kMax]
  std::uint32_t shareCodeSeed{42};
};

// In-memory planner database. All public methods take the store mutex, so a
// single TripStore can back several invokers/threads at once.
class TripStore : public Receiver {
public:
  TripStore();
  explicit TripStore(const TripStoreConfig& config);

  Id nextId(Collection c) const override;

  StoreStatus insertTrip(Trip& trip) override;
  bool findTrip(Id id, Trip& out) const override;
  bool findTripByShareCode(const std::string& code, Trip& out) const override;
  StoreStatus updateTrip(Id id, const TripMutator& fn, Trip* out = nullptr) override;
  bool removeTrip(Id id) override;

  StoreStatus updateBudget(Id tripId, double budget,
                           double* previous = nullptr, Trip* out = nullptr) override;
  StoreStatus addCollaborator(Id tripId, Id userId, Trip* out = nullptr) override;
  StoreStatus removeCollaborator(Id tripId, Id userId, Trip* out = nullptr) override;

  StoreStatus insertItem(ItineraryItem& item) override;
  bool findItem(Collection c, Id id, ItineraryItem& out) const override;
  StoreStatus updateItem(Collection c, Id id, const ItemMutator& fn,
                         ItineraryItem* out = nullptr) override;
  bool removeItem(Collection c, Id id) override;

  // Enumeration (ordered by id)
  std::vector<Trip> trips() const;
  std::vector<ItineraryItem> items(Collection c) const;
  std::vector<ItineraryItem> itemsForTrip(Id tripId) const;
  std::size_t count(Collection c) const;

  // Drops every entity. Id counters keep their values.
  void clear();

  // Snapshot: all collections plus id counters.
  std::string toJSON() const;
  // All-or-nothing. Rejects duplicate share codes and items whose trip is
  // not in the snapshot; trips saved without a share code get a fresh one.
  bool loadJSON(const std::string& json);

private:
  using ItemTable = std::map<Id, ItineraryItem>;

  static constexpr int kShareCodeAttempts = 4096;

  static bool itemSlot(Collection c, std::size_t& slot);

  // False once kShareCodeAttempts candidates were all taken.
  bool generateShareCodeLocked(std::string& out);
  bool shareCodeTakenLocked(const std::string& code, Id exceptId) const;

  TripStoreConfig config_;
  mutable std::mutex mtx_;

  std::map<Id, Trip> trips_;
  std::array<ItemTable, kItemTypeCount> items_;
  std::array<Id, kCollectionCount> nextIds_;
  std::uint32_t seed_;
};

} // namespace tp
