#include "WorkState.hpp"

#include <algorithm>
#include <stdexcept>

namespace mmig {

namespace {

using S = WorkState;
using K = TransitionKind;

const std::vector<Transition> kTransitions = {
  {K::Claim,   S::Discovered,    S::Fetching},
  {K::Commit,  S::Fetching,      S::Fetched},
  {K::Fail,    S::Fetching,      S::FetchFailed},
  {K::Reclaim, S::Fetching,      S::Discovered},
  {K::Requeue, S::FetchFailed,   S::Discovered},

  {K::Claim,   S::Fetched,       S::Delivering},
  {K::Commit,  S::Delivering,    S::Delivered},
  {K::Fail,    S::Delivering,    S::DeliverFailed},
  {K::Reclaim, S::Delivering,    S::Fetched},
  {K::Requeue, S::DeliverFailed, S::Fetched},

  {K::Claim,   S::Delivered,     S::Finalizing},
  {K::Commit,  S::Finalizing,    S::Done},
  // staging release failed; counted, retried from DELIVERED
  {K::Fail,    S::Finalizing,    S::Delivered},
  {K::Reclaim, S::Finalizing,    S::Delivered},
};

} // namespace

const std::vector<WorkState>& allWorkStates() {
  static const std::vector<WorkState> all = {
    S::Discovered, S::Fetching, S::Fetched, S::FetchFailed, S::Delivering,
    S::Delivered, S::DeliverFailed, S::Finalizing, S::Done,
  };
  return all;
}

std::string toString(WorkState s) {
  switch (s) {
    case S::Discovered:    return "DISCOVERED";
    case S::Fetching:      return "FETCHING";
    case S::Fetched:       return "FETCHED";
    case S::FetchFailed:   return "FETCH_FAILED";
    case S::Delivering:    return "DELIVERING";
    case S::Delivered:     return "DELIVERED";
    case S::DeliverFailed: return "DELIVER_FAILED";
    case S::Finalizing:    return "FINALIZING";
    case S::Done:          return "DONE";
  }
  return "UNKNOWN";
}

std::string toString(TransitionKind k) {
  switch (k) {
    case K::Register: return "register";
    case K::Claim:    return "claim";
    case K::Commit:   return "commit";
    case K::Fail:     return "fail";
    case K::Reclaim:  return "reclaim";
    case K::Requeue:  return "requeue";
  }
  return "unknown";
}

WorkState parseWorkState(const std::string& name) {
  for (WorkState s : allWorkStates()) {
    if (toString(s) == name) return s;
  }
  throw std::invalid_argument("unknown work state: " + name);
}

bool isTransient(WorkState s) {
  return s == S::Fetching || s == S::Delivering || s == S::Finalizing;
}

bool isFailure(WorkState s) {
  return s == S::FetchFailed || s == S::DeliverFailed;
}

std::optional<WorkState> originOf(WorkState transient) {
  for (const auto& t : kTransitions) {
    if (t.kind == K::Reclaim && t.from == transient) return t.to;
  }
  return std::nullopt;
}

std::optional<WorkState> retryStateOf(WorkState failed) {
  for (const auto& t : kTransitions) {
    if (t.kind == K::Requeue && t.from == failed) return t.to;
  }
  return std::nullopt;
}

bool hasContent(WorkState s) {
  switch (s) {
    case S::Fetched:
    case S::Delivering:
    case S::Delivered:
    case S::DeliverFailed:
    case S::Finalizing:
    case S::Done:
      return true;
    default:
      return false;
  }
}

bool hasDestination(WorkState s) {
  return s == S::Delivered || s == S::Finalizing || s == S::Done;
}

bool isAllowed(TransitionKind kind, WorkState from, WorkState to) {
  return std::any_of(kTransitions.begin(), kTransitions.end(), [&](const Transition& t) {
    return t.kind == kind && t.from == from && t.to == to;
  });
}

const std::vector<Transition>& transitionTable() { return kTransitions; }

} // namespace mmig
