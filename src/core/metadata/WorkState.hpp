#pragma once
#include <optional>
#include <string>
#include <vector>

namespace mmig {

// Pipeline states of a work item. FETCHING, DELIVERING and FINALIZING are
// transient: a row only sits in them while a worker holds its lease.
enum class WorkState {
  Discovered,
  Fetching,
  Fetched,
  FetchFailed,
  Delivering,
  Delivered,
  DeliverFailed,
  Finalizing,
  Done,
};

// How a row moved from one state to another.
enum class TransitionKind {
  Register,  // (none) -> DISCOVERED
  Claim,     // stable -> transient, lease taken
  Commit,    // transient -> next stage, lease released
  Fail,      // transient -> *_FAILED (or back to origin for FINALIZING)
  Reclaim,   // transient -> origin, expired lease dropped by the sweep
  Requeue,   // *_FAILED -> state it is retried from
};

struct Transition {
  TransitionKind kind;
  WorkState from;
  WorkState to;
};

const std::vector<WorkState>& allWorkStates();
std::string toString(WorkState s);
std::string toString(TransitionKind k);
// Throws std::invalid_argument on an unknown name.
WorkState parseWorkState(const std::string& name);

bool isTransient(WorkState s);
bool isFailure(WorkState s);

// State a transient row reverts to when its lease expires.
std::optional<WorkState> originOf(WorkState transient);
// State a failed row is retried from.
std::optional<WorkState> retryStateOf(WorkState failed);

// Row-shape rules enforced by the store.
bool hasContent(WorkState s);
bool hasDestination(WorkState s);

bool isAllowed(TransitionKind kind, WorkState from, WorkState to);
const std::vector<Transition>& transitionTable();

} // namespace mmig
