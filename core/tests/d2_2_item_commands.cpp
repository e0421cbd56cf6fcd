// D2.2 - Itinerary commands: AddFlight/Hotel/Activity/Expense, UpdateItemStatus

#include "tp/commands/ItemCommands.hpp"
#include "tp/commands/TripCommands.hpp"
#include "tp/store/TripStore.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static tp::Id seedTrip(tp::TripStore& store) {
  tp::Trip t;
  t.ownerId = 1;
  t.destination = "Kyoto";
  t.name = "Spring";
  t.startDate = "2025-04-01";
  t.endDate = "2025-04-12";
  store.insertTrip(t);
  return t.id;
}

int main() {
  // ---- Test 1: each item kind maps to its command kind and collection ----
  {
    tp::TripStore store;
    const tp::Id trip = seedTrip(store);

    tp::AddItemCommand flight(store, tp::makeFlight(trip, "JAL", "JL44", "2025-04-01 10:00", "2025-04-02 08:00"));
    tp::AddItemCommand hotel(store, tp::makeHotel(trip, "Ryokan", "2025-04-02", "2025-04-06"));
    tp::AddItemCommand activity(store, tp::makeActivity(trip, "Fushimi Inari", "2025-04-03"));
    tp::AddItemCommand expense(store, tp::makeExpense(trip, "Rail pass", 280.0, "USD", "2025-04-01", "transport"));

    requireTrue(flight.kind() == tp::CommandKind::AddFlight, "flight kind");
    requireTrue(hotel.kind() == tp::CommandKind::AddHotel, "hotel kind");
    requireTrue(activity.kind() == tp::CommandKind::AddActivity, "activity kind");
    requireTrue(expense.kind() == tp::CommandKind::AddExpense, "expense kind");

    requireTrue(flight.execute().ok, "flight ok");
    requireTrue(hotel.execute().ok, "hotel ok");
    requireTrue(activity.execute().ok, "activity ok");
    requireTrue(expense.execute().ok, "expense ok");

    requireTrue(store.count(tp::Collection::Flights) == 1, "1 flight");
    requireTrue(store.count(tp::Collection::Hotels) == 1, "1 hotel");
    requireTrue(store.count(tp::Collection::Activities) == 1, "1 activity");
    requireTrue(store.count(tp::Collection::Expenses) == 1, "1 expense");
    requireTrue(store.itemsForTrip(trip).size() == 4, "4 items on trip");

    tp::ItineraryItem got;
    requireTrue(store.findItem(tp::Collection::Flights, flight.itemId(), got), "flight stored");
    requireTrue(got.code == "JL44" && !got.isDone, "flight fields");
    requireTrue(flight.lastResult().json.find("\"departure\":\"2025-04-01 10:00\"") != std::string::npos,
                "flight result json uses departure");
    std::printf("  Test 1 (add items): PASS\n");
  }

  // ---- Test 2: undo deletes, redo restores the same id ----
  {
    tp::TripStore store;
    const tp::Id trip = seedTrip(store);

    tp::AddItemCommand act(store, tp::makeActivity(trip, "Museum", "2025-04-04"));
    act.execute();
    const tp::Id id = act.itemId();

    requireTrue(act.undo(), "undo activity");
    tp::ItineraryItem got;
    requireTrue(!store.findItem(tp::Collection::Activities, id, got), "activity removed");

    requireTrue(act.execute().ok, "redo activity");
    requireTrue(store.findItem(tp::Collection::Activities, id, got), "same id restored");
    requireTrue(store.count(tp::Collection::Activities) == 1, "no duplicate");
    requireTrue(store.nextId(tp::Collection::Activities) == id + 1, "no id allocated by redo");
    std::printf("  Test 2 (item undo redo): PASS\n");
  }

  // ---- Test 3: validation and missing trip ----
  {
    tp::TripStore store;
    const tp::Id trip = seedTrip(store);

    tp::AddItemCommand noCode(store, tp::makeFlight(trip, "JAL", "", "2025-04-01", "2025-04-02"));
    requireTrue(noCode.execute().err.code == tp::kValidationFailure, "flight code required");

    tp::AddItemCommand backwards(store, tp::makeHotel(trip, "Inn", "2025-04-06", "2025-04-02"));
    requireTrue(backwards.execute().err.code == tp::kValidationFailure, "checkin before checkout");

    tp::AddItemCommand zero(store, tp::makeExpense(trip, "Nothing", 0.0, "USD", "2025-04-01", "misc"));
    requireTrue(zero.execute().err.code == tp::kValidationFailure, "amount must be positive");

    tp::AddItemCommand orphan(store, tp::makeActivity(999, "Ghost", "2025-04-01"));
    tp::CmdResult r = orphan.execute();
    requireTrue(r.err.code == tp::kNotFound, "trip must exist");
    requireTrue(orphan.status() == tp::CommandStatus::Failed, "orphan failed");

    requireTrue(store.itemsForTrip(trip).empty(), "nothing inserted");

    requireTrue(tp::validateItem(tp::makeActivity(trip, "ok", "2025-04-01")).ok, "valid activity");
    std::printf("  Test 3 (item validation): PASS\n");
  }

  // ---- Test 4: item redo fails once its trip is gone ----
  {
    tp::TripStore store;
    const tp::Id trip = seedTrip(store);

    tp::AddItemCommand hotel(store, tp::makeHotel(trip, "Inn", "2025-04-02", "2025-04-03"));
    hotel.execute();
    hotel.undo();
    store.removeTrip(trip);

    tp::CmdResult r = hotel.execute();
    requireTrue(r.err.code == tp::kInverseUnavailable, "redo without trip");
    requireTrue(hotel.status() == tp::CommandStatus::Failed, "terminal after failed redo");
    std::printf("  Test 4 (item redo blocked): PASS\n");
  }

  // ---- Test 5: item undo after trip cascade ----
  {
    tp::TripStore store;
    const tp::Id trip = seedTrip(store);

    tp::AddItemCommand exp(store, tp::makeExpense(trip, "Taxi", 30.0, "JPY", "2025-04-01", "transport"));
    exp.execute();
    store.removeTrip(trip);

    requireTrue(!exp.undo(), "nothing left to delete");
    requireTrue(exp.error().code == tp::kInverseUnavailable, "INVERSE_UNAVAILABLE");
    requireTrue(exp.status() == tp::CommandStatus::Executed, "stays executed");
    std::printf("  Test 5 (item undo after cascade): PASS\n");
  }

  // ---- Test 6: UpdateItemStatus ----
  {
    tp::TripStore store;
    const tp::Id trip = seedTrip(store);
    tp::AddItemCommand act(store, tp::makeActivity(trip, "Tea ceremony", "2025-04-05"));
    act.execute();
    const tp::Id id = act.itemId();

    tp::UpdateItemStatusCommand done(store, tp::ItemType::Activity, id, true);
    requireTrue(done.execute().ok, "mark done");
    requireTrue(!done.previousIsDone(), "previous was not done");
    tp::ItineraryItem got;
    store.findItem(tp::Collection::Activities, id, got);
    requireTrue(got.isDone, "is done");

    requireTrue(done.undo(), "undo status");
    store.findItem(tp::Collection::Activities, id, got);
    requireTrue(!got.isDone, "not done again");

    requireTrue(done.execute().ok, "redo status");
    store.findItem(tp::Collection::Activities, id, got);
    requireTrue(got.isDone, "done again");

    // external flip back, then undo must refuse
    store.updateItem(tp::Collection::Activities, id, [](tp::ItineraryItem& it) {
      it.isDone = false;
      return true;
    });
    requireTrue(!done.undo(), "undo refused after external change");
    requireTrue(done.error().code == tp::kInverseUnavailable, "INVERSE_UNAVAILABLE");

    tp::UpdateItemStatusCommand wrongType(store, tp::ItemType::Flight, id, true);
    requireTrue(wrongType.execute().err.code == tp::kNotFound, "no flight with that id");
    std::printf("  Test 6 (update item status): PASS\n");
  }

  std::printf("D2.2 item_commands: ALL PASS\n");
  return 0;
}
