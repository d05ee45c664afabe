#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "DeliveryWorker.hpp"
#include "DiscoveryWorker.hpp"
#include "FetchWorker.hpp"
#include "Finalizer.hpp"
#include "RecoverySweep.hpp"
#include "Worker.hpp"
#include "core/config/Config.hpp"
#include "core/storage/LocalFSBackend.hpp"

namespace mmig {

enum class RunOutcome { Interrupted, Completed, Failed };

// Owns every loop of one run and the threads they run on.
// Adapters are shared by all workers of a pool and must be thread-safe.
class Migration {
public:
  Migration(const Config& config,
            SourceAdapter& source,
            DestinationAdapter& destination,
            WorkItemStore::Clock clock = {});
  ~Migration();

  Migration(const Migration&) = delete;
  Migration& operator=(const Migration&) = delete;

  // Runs one recovery sweep, then starts every loop.
  void start();
  // Stops and joins every loop. Leases in flight are left to expire.
  void stop();

  // Blocks until `interrupted` becomes true, a loop fails fatally, or the
  // migration is complete and every loop has been idle for maxIdle.
  RunOutcome run(const std::atomic<bool>& interrupted);

  // At least one discovery pass finished and every row is final.
  bool complete();
  void logProgress();

  const std::string& runId() const { return runId_; }
  const RunState& runState() const { return runState_; }

private:
  bool idleLongEnough() const;

  Config config_;
  std::string runId_;
  StoreOptions storeOptions_;
  RunState runState_;
  WorkItemStore store_;
  LocalFSBackend staging_;

  std::unique_ptr<RecoverySweep> recovery_;
  std::unique_ptr<DiscoveryWorker> discovery_;
  std::vector<std::unique_ptr<Worker>> workers_;
  bool started_ = false;
};

} // namespace mmig
