#pragma once
#include "tp/store/Types.hpp"
#include <functional>
#include <string>

namespace tp {

// Mutator run under the store lock. Returning false aborts the update and
// leaves the entity untouched (reported as StoreStatus::Rejected).
using TripMutator = std::function<bool(Trip&)>;
using ItemMutator = std::function<bool(ItineraryItem&)>;

// The mutable store commands operate against. Every method is one atomic
// operation on the store; implementations shared between threads must
// serialize them internally.
class Receiver {
public:
  virtual ~Receiver() = default;

  // Id the next auto-assigned insert into `c` will receive. Ids are never
  // reused, even after deletion.
  virtual Id nextId(Collection c) const = 0;

  // ---- trips ----

  // id == 0 => auto-assign (written back into `trip`). id != 0 => explicit
  // id, Conflict if present. Empty shareCode => a fresh unique code is
  // generated. Conflict if the share code is taken.
  virtual StoreStatus insertTrip(Trip& trip) = 0;
  virtual bool findTrip(Id id, Trip& out) const = 0;
  virtual bool findTripByShareCode(const std::string& code, Trip& out) const = 0;
  virtual StoreStatus updateTrip(Id id, const TripMutator& fn, Trip* out = nullptr) = 0;
  // Removes the trip and every itinerary item that references it.
  virtual bool removeTrip(Id id) = 0;

  // Sets the budget; the value it replaced is written to `previous`.
  virtual StoreStatus updateBudget(Id tripId, double budget,
                                   double* previous = nullptr, Trip* out = nullptr) = 0;
  // Conflict if already a collaborator, Rejected if userId owns the trip.
  virtual StoreStatus addCollaborator(Id tripId, Id userId, Trip* out = nullptr) = 0;
  // NotFound if the trip is gone or the user is not a collaborator.
  virtual StoreStatus removeCollaborator(Id tripId, Id userId, Trip* out = nullptr) = 0;

  // ---- itinerary items ----

  // Collection follows item.type. NotFound if item.tripId does not exist.
  // Same id rules as insertTrip.
  virtual StoreStatus insertItem(ItineraryItem& item) = 0;
  virtual bool findItem(Collection c, Id id, ItineraryItem& out) const = 0;
  virtual StoreStatus updateItem(Collection c, Id id, const ItemMutator& fn,
                                 ItineraryItem* out = nullptr) = 0;
  virtual bool removeItem(Collection c, Id id) = 0;
};

} // namespace tp
