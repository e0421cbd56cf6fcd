// D2.1 - Trip commands: CreateTrip, UpdateBudget, AddCollaborator

#include "tp/commands/TripCommands.hpp"
#include "tp/store/TripStore.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static tp::CreateTripPayload lisbon(tp::Id owner = 1) {
  tp::CreateTripPayload p;
  p.ownerId = owner;
  p.destination = "Lisbon";
  p.name = "Summer";
  p.startDate = "2025-07-01";
  p.endDate = "2025-07-14";
  p.budget = 2000.0;
  return p;
}

int main() {
  // ---- Test 1: CreateTrip execute / undo / redo keeps id and code ----
  {
    tp::TripStore store;
    tp::CreateTripCommand cmd(store, lisbon());
    requireTrue(cmd.status() == tp::CommandStatus::Pending, "starts pending");
    requireTrue(!cmd.hasCapturedInverse(), "no inverse before execute");

    tp::CmdResult r = cmd.execute();
    requireTrue(r.ok, "create ok");
    requireTrue(r.createdId == 1, "createdId is 1");
    requireTrue(cmd.tripId() == 1, "tripId captured");
    requireTrue(cmd.status() == tp::CommandStatus::Executed, "executed");
    requireTrue(cmd.hasCapturedInverse(), "inverse captured");
    requireTrue(r.json.find("\"destination\":\"Lisbon\"") != std::string::npos, "result json");

    tp::Trip t;
    store.findTrip(1, t);
    const std::string code = t.shareCode;
    requireTrue(!code.empty(), "share code generated");

    requireTrue(cmd.undo(), "undo ok");
    requireTrue(cmd.status() == tp::CommandStatus::Undone, "undone");
    requireTrue(!store.findTrip(1, t), "trip gone after undo");
    requireTrue(cmd.hasCapturedInverse(), "inverse never cleared");

    r = cmd.execute();
    requireTrue(r.ok, "redo ok");
    requireTrue(store.findTrip(1, t), "trip back with same id");
    requireTrue(t.shareCode == code, "same share code after redo");
    requireTrue(store.count(tp::Collection::Trips) == 1, "exactly one trip");
    requireTrue(store.nextId(tp::Collection::Trips) == 2, "redo allocates nothing");
    std::printf("  Test 1 (create undo redo): PASS\n");
  }

  // ---- Test 2: CreateTrip validation ----
  {
    tp::TripStore store;

    tp::CreateTripPayload p = lisbon();
    p.destination.clear();
    tp::CreateTripCommand missing(store, p);
    tp::CmdResult r = missing.execute();
    requireTrue(!r.ok && r.err.code == tp::kValidationFailure, "missing destination");
    requireTrue(missing.status() == tp::CommandStatus::Failed, "failed status");
    requireTrue(missing.hasError(), "error recorded");
    requireTrue(!missing.hasCapturedInverse(), "failed command captured nothing");

    p = lisbon();
    p.startDate = "2025-08-01";
    tp::CreateTripCommand reversed(store, p);
    requireTrue(reversed.execute().err.code == tp::kValidationFailure, "start after end");

    p = lisbon();
    p.budget = -5.0;
    tp::CreateTripCommand negative(store, p);
    requireTrue(negative.execute().err.code == tp::kValidationFailure, "negative budget");

    tp::CreateTripCommand noOwner(store, lisbon(0));
    requireTrue(noOwner.execute().err.code == tp::kValidationFailure, "owner required");

    requireTrue(store.count(tp::Collection::Trips) == 0, "nothing inserted");
    requireTrue(store.nextId(tp::Collection::Trips) == 1, "no id consumed");

    // Failed is terminal
    r = missing.execute();
    requireTrue(r.err.code == tp::kInvalidState, "failed command cannot run again");
    requireTrue(!missing.undo(), "failed command cannot undo");
    std::printf("  Test 2 (create validation): PASS\n");
  }

  // ---- Test 3: explicit share code conflicts ----
  {
    tp::TripStore store;
    tp::CreateTripPayload p = lisbon();
    p.shareCode = "ABC123";
    tp::CreateTripCommand first(store, p);
    requireTrue(first.execute().ok, "first with code");

    tp::CreateTripCommand second(store, p);
    tp::CmdResult r = second.execute();
    requireTrue(!r.ok && r.err.code == tp::kValidationFailure, "code conflict");
    requireTrue(store.count(tp::Collection::Trips) == 1, "one trip");
    std::printf("  Test 3 (share code conflict): PASS\n");
  }

  // ---- Test 4: CreateTrip redo blocked by a reused share code ----
  {
    tp::TripStore store;
    tp::CreateTripPayload p = lisbon();
    p.shareCode = "XYZ789";
    tp::CreateTripCommand cmd(store, p);
    cmd.execute();
    cmd.undo();

    tp::CreateTripCommand squatter(store, p);
    requireTrue(squatter.execute().ok, "another trip takes the code");

    tp::CmdResult r = cmd.execute();
    requireTrue(!r.ok && r.err.code == tp::kInverseUnavailable, "redo cannot restore");
    requireTrue(cmd.status() == tp::CommandStatus::Failed, "failed redo is terminal");
    requireTrue(store.count(tp::Collection::Trips) == 1, "store unchanged by failed redo");
    std::printf("  Test 4 (create redo conflict): PASS\n");
  }

  // ---- Test 5: UpdateBudget ----
  {
    tp::TripStore store;
    tp::CreateTripCommand create(store, lisbon());
    create.execute();
    const tp::Id id = create.tripId();

    tp::UpdateBudgetCommand upd(store, id, 3500.0);
    requireTrue(upd.execute().ok, "update ok");
    requireTrue(upd.previousBudget() == 2000.0, "previous captured");
    tp::Trip t;
    store.findTrip(id, t);
    requireTrue(t.budget == 3500.0, "budget applied");

    requireTrue(upd.undo(), "undo budget");
    store.findTrip(id, t);
    requireTrue(t.budget == 2000.0, "budget restored");

    requireTrue(upd.execute().ok, "redo budget");
    store.findTrip(id, t);
    requireTrue(t.budget == 3500.0, "budget re-applied");

    tp::UpdateBudgetCommand missing(store, 999, 10.0);
    requireTrue(missing.execute().err.code == tp::kNotFound, "missing trip");

    tp::UpdateBudgetCommand bad(store, id, std::nan(""));
    requireTrue(bad.execute().err.code == tp::kValidationFailure, "NaN budget");
    std::printf("  Test 5 (update budget): PASS\n");
  }

  // ---- Test 6: UpdateBudget undo refuses to clobber an external change ----
  {
    tp::TripStore store;
    tp::CreateTripCommand create(store, lisbon());
    create.execute();
    const tp::Id id = create.tripId();

    tp::UpdateBudgetCommand upd(store, id, 100.0);
    upd.execute();
    store.updateBudget(id, 555.0);

    requireTrue(!upd.undo(), "undo refused");
    requireTrue(upd.status() == tp::CommandStatus::Executed, "stays executed");
    requireTrue(upd.error().code == tp::kInverseUnavailable, "INVERSE_UNAVAILABLE");
    tp::Trip t;
    store.findTrip(id, t);
    requireTrue(t.budget == 555.0, "external value kept");

    store.removeTrip(id);
    requireTrue(!upd.undo(), "undo after delete refused");
    requireTrue(upd.error().code == tp::kInverseUnavailable, "still INVERSE_UNAVAILABLE");
    std::printf("  Test 6 (budget compare-and-set): PASS\n");
  }

  // ---- Test 7: AddCollaborator ----
  {
    tp::TripStore store;
    tp::CreateTripCommand create(store, lisbon(1));
    create.execute();
    const tp::Id id = create.tripId();

    tp::AddCollaboratorCommand add(store, id, 8);
    requireTrue(add.execute().ok, "add collaborator");
    requireTrue(add.wasAdded(), "added flag");
    tp::Trip t;
    store.findTrip(id, t);
    requireTrue(t.hasCollaborator(8), "8 collaborates");

    tp::AddCollaboratorCommand again(store, id, 8);
    tp::CmdResult r = again.execute();
    requireTrue(r.err.code == tp::kValidationFailure, "duplicate collaborator");

    tp::AddCollaboratorCommand owner(store, id, 1);
    requireTrue(owner.execute().err.code == tp::kValidationFailure, "owner cannot collaborate");

    tp::AddCollaboratorCommand noTrip(store, 404, 8);
    requireTrue(noTrip.execute().err.code == tp::kNotFound, "missing trip");

    requireTrue(add.undo(), "undo collaborator");
    store.findTrip(id, t);
    requireTrue(!t.hasCollaborator(8), "8 removed");

    requireTrue(add.execute().ok, "redo collaborator");
    store.findTrip(id, t);
    requireTrue(t.collaborators.size() == 1, "exactly one collaborator after redo");
    std::printf("  Test 7 (add collaborator): PASS\n");
  }

  // ---- Test 8: describe ----
  {
    tp::TripStore store;
    tp::UpdateBudgetCommand upd(store, 3, 12.5);
    tp::CommandInfo info = upd.describe();
    requireTrue(info.kind == tp::CommandKind::UpdateBudget, "kind");
    requireTrue(info.status == tp::CommandStatus::Pending, "pending");
    requireTrue(info.executedAt.empty() && info.undoneAt.empty(), "no timestamps yet");
    requireTrue(info.payloadJson == R"({"tripId":3,"budget":12.5})", "payload json");

    upd.execute();
    info = upd.describe();
    requireTrue(info.status == tp::CommandStatus::Failed, "failed on missing trip");
    requireTrue(info.error.find(tp::kNotFound) == 0, "error text carries code");
    requireTrue(info.executedAt.empty(), "failed execute sets no timestamp");
    std::printf("  Test 8 (describe): PASS\n");
  }

  std::printf("D2.1 trip_commands: ALL PASS\n");
  return 0;
}
