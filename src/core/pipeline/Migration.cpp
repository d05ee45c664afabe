#include "Migration.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

#include "core/util/Ids.hpp"

namespace mmig {

Migration::Migration(const Config& config,
                     SourceAdapter& source,
                     DestinationAdapter& destination,
                     WorkItemStore::Clock clock)
  : config_(config),
    runId_(uuid4()),
    storeOptions_{config.dbPath, std::move(clock)},
    store_(storeOptions_.dbPath, storeOptions_.clock),
    staging_(config.stagingRoot) {
  const ClaimOptions claim{config_.batchSize, config_.lease};

  RetryPolicy retry;
  retry.fetchMaxAttempts = config_.fetchMaxAttempts;
  retry.deliverMaxAttempts = config_.deliverMaxAttempts;
  retry.backoff = config_.retryBackoff;

  recovery_ = std::make_unique<RecoverySweep>(storeOptions_, runState_, retry, config_.sweepInterval);
  discovery_ = std::make_unique<DiscoveryWorker>(storeOptions_, runState_, source, config_.discoveryInterval);

  for (int i = 0; i < config_.fetchWorkers; ++i) {
    workers_.push_back(std::make_unique<FetchWorker>(
      "fetch-" + std::to_string(i), runId_, storeOptions_, runState_, source, staging_, claim));
  }
  for (int i = 0; i < config_.deliverWorkers; ++i) {
    workers_.push_back(std::make_unique<DeliveryWorker>(
      "deliver-" + std::to_string(i), runId_, storeOptions_, runState_, destination, staging_,
      config_.collection, claim));
  }
  workers_.push_back(std::make_unique<Finalizer>(
    runId_, storeOptions_, runState_, staging_, config_.finalizeMaxAttempts, claim,
    config_.retryBackoff));
}

Migration::~Migration() { stop(); }

void Migration::start() {
  if (started_) return;
  spdlog::info("migration run {} starting", runId_);

  // Nothing may claim before abandoned leases of a previous process are back.
  recovery_->sweep();

  recovery_->start();
  discovery_->start();
  for (auto& w : workers_) w->start();
  started_ = true;
}

void Migration::stop() {
  if (!started_) return;
  recovery_->stop();
  discovery_->stop();
  for (auto& w : workers_) w->stop();

  recovery_->join();
  discovery_->join();
  for (auto& w : workers_) w->join();
  started_ = false;
  spdlog::info("migration run {} stopped", runId_);
}

bool Migration::complete() {
  return discovery_->passesCompleted() > 0 && store_.isComplete(config_.failureLimits());
}

bool Migration::idleLongEnough() const {
  const int64_t limit = config_.maxIdle.count();
  if (discovery_->idleSeconds() < limit) return false;
  for (const auto& w : workers_) {
    if (w->idleSeconds() < limit) return false;
  }
  return true;
}

void Migration::logProgress() {
  const auto counts = store_.countByState();
  int64_t total = 0;
  for (const auto& kv : counts) total += kv.second;
  spdlog::info("progress: total={} discovered={} fetched={} delivered={} done={} "
               "fetch_failed={} deliver_failed={} in_flight={}",
               total,
               counts.at(WorkState::Discovered),
               counts.at(WorkState::Fetched),
               counts.at(WorkState::Delivered),
               counts.at(WorkState::Done),
               counts.at(WorkState::FetchFailed),
               counts.at(WorkState::DeliverFailed),
               counts.at(WorkState::Fetching) + counts.at(WorkState::Delivering) +
                 counts.at(WorkState::Finalizing));
}

RunOutcome Migration::run(const std::atomic<bool>& interrupted) {
  start();

  auto nextProgress = std::chrono::steady_clock::now() + config_.progressInterval;
  RunOutcome outcome = RunOutcome::Interrupted;
  while (!interrupted.load()) {
    if (runState_.failed()) {
      outcome = RunOutcome::Failed;
      break;
    }
    if (std::chrono::steady_clock::now() >= nextProgress) {
      logProgress();
      nextProgress += config_.progressInterval;
    }
    if (config_.maxIdle.count() > 0 && idleLongEnough() && complete()) {
      spdlog::info("all rows are final and every worker has been idle for {}s, migration complete",
                   config_.maxIdle.count());
      outcome = RunOutcome::Completed;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  stop();
  if (outcome != RunOutcome::Failed && runState_.failed()) outcome = RunOutcome::Failed;
  logProgress();
  return outcome;
}

} // namespace mmig
