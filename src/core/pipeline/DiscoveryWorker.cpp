#include "DiscoveryWorker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "core/Errors.hpp"

namespace mmig {

namespace {

// a listing aborted by stop(); not a failure
struct ListingInterrupted {};

constexpr std::chrono::milliseconds kFirstRetry{1000};

} // namespace

DiscoveryWorker::DiscoveryWorker(const StoreOptions& storeOptions,
                                 RunState& runState,
                                 SourceAdapter& source,
                                 std::chrono::seconds interval)
  : Worker("discovery", storeOptions, runState),
    source_(source),
    interval_(interval),
    retryDelay_(kFirstRetry) {}

bool DiscoveryWorker::work() {
  int64_t listed = 0;
  int64_t inserted = 0;
  try {
    source_.listItems([&](const SourceItem& item) {
      if (stopping()) throw ListingInterrupted{};
      ++listed;
      if (store_.registerItem(item) == RegisterResult::Inserted) {
        ++inserted;
        spdlog::debug("discovered {}", item.source_id);
      }
    });
  } catch (const ListingInterrupted&) {
    spdlog::info("discovery interrupted after {} items", listed);
    return inserted > 0;
  } catch (const AdapterError& e) {
    spdlog::warn("failed to list source library after {} items: {}", listed, e.what());
    lastPassFailed_ = true;
    return inserted > 0;
  }

  lastPassFailed_ = false;
  ++passes_;
  spdlog::info("discovery pass {} complete: {} listed, {} new", passes_.load(), listed, inserted);
  return inserted > 0;
}

std::chrono::milliseconds DiscoveryWorker::nextDelay(bool) {
  if (!lastPassFailed_) {
    retryDelay_ = kFirstRetry;
    return interval_;
  }
  auto d = std::min(retryDelay_, interval_);
  retryDelay_ = std::min(retryDelay_ * 2, interval_);
  return d;
}

} // namespace mmig
