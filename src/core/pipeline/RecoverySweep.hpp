#pragma once

#include "Worker.hpp"

namespace mmig {

struct RetryPolicy {
  int fetchMaxAttempts = 5;
  int deliverMaxAttempts = 5;
  RetryBackoff backoff;
};

// Maintenance loop run every `interval`:
//  - reclaims rows whose lease expired (crashed or stalled workers),
//  - requeues failed rows that are still below their stage's attempt limit.
// Migration runs one sweep synchronously before any pool starts claiming.
class RecoverySweep : public Worker {
public:
  RecoverySweep(const StoreOptions& storeOptions,
                RunState& runState,
                RetryPolicy policy,
                std::chrono::seconds interval);

  // Returns rows reverted to their pre-claim state.
  int64_t sweep();
  // Returns rows moved back into a claimable state.
  int64_t scheduleRetries();

protected:
  bool work() override;
  std::chrono::milliseconds nextDelay(bool) override { return interval_; }

private:
  RetryPolicy policy_;
  std::chrono::milliseconds interval_;
};

} // namespace mmig
