#pragma once
#include <atomic>

#include "Worker.hpp"
#include "core/adapters/SourceAdapter.hpp"

namespace mmig {

// Lists the source library every `interval` and registers what it finds.
// Never touches rows that already exist.
class DiscoveryWorker : public Worker {
public:
  DiscoveryWorker(const StoreOptions& storeOptions,
                  RunState& runState,
                  SourceAdapter& source,
                  std::chrono::seconds interval);

  // Full listings completed since construction.
  int64_t passesCompleted() const { return passes_.load(); }

protected:
  // Progress means at least one new item was registered.
  bool work() override;
  std::chrono::milliseconds nextDelay(bool worked) override;

private:
  SourceAdapter& source_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds retryDelay_;
  bool lastPassFailed_ = false;
  std::atomic<int64_t> passes_{0};
};

} // namespace mmig
