#include "RecoverySweep.hpp"

#include <spdlog/spdlog.h>

namespace mmig {

RecoverySweep::RecoverySweep(const StoreOptions& storeOptions,
                             RunState& runState,
                             RetryPolicy policy,
                             std::chrono::seconds interval)
  : Worker("recovery", storeOptions, runState), policy_(policy), interval_(interval) {}

int64_t RecoverySweep::sweep() {
  const int64_t reclaimed = store_.reclaimExpired(store_.now());
  if (reclaimed > 0) spdlog::info("recovery: reclaimed {} expired leases", reclaimed);
  return reclaimed;
}

int64_t RecoverySweep::scheduleRetries() {
  const int64_t now = store_.now();
  const int64_t fetches =
    store_.requeueFailed(WorkState::FetchFailed, policy_.fetchMaxAttempts, policy_.backoff, now);
  const int64_t deliveries =
    store_.requeueFailed(WorkState::DeliverFailed, policy_.deliverMaxAttempts, policy_.backoff, now);
  if (fetches + deliveries > 0)
    spdlog::info("recovery: requeued {} fetches and {} deliveries", fetches, deliveries);
  return fetches + deliveries;
}

bool RecoverySweep::work() {
  const int64_t reclaimed = sweep();
  return reclaimed + scheduleRetries() > 0;
}

} // namespace mmig
