#include "Finalizer.hpp"

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace mmig {

Finalizer::Finalizer(const std::string& runId,
                     const StoreOptions& storeOptions,
                     RunState& runState,
                     LocalFSBackend& staging,
                     int maxAttempts,
                     ClaimOptions claim,
                     RetryBackoff backoff)
  : Worker("finalizer", storeOptions, runState),
    owner_("finalizer/" + runId),
    staging_(staging),
    maxAttempts_(maxAttempts),
    claim_(claim),
    backoff_(backoff) {}

bool Finalizer::work() {
  const auto items = store_.claimBatch(owner_, WorkState::Delivered, WorkState::Finalizing,
                                       claim_.lease, claim_.batchSize, backoff_);
  if (items.empty()) return false;

  for (const auto& item : items) {
    if (stopping()) break;
    finalizeOne(item);
  }
  return true;
}

void Finalizer::finalizeOne(const WorkItem& item) {
  const std::string& ref = *item.content_ref;
  CommitResult result = CommitResult::Committed;
  try {
    if (!staging_.remove(ref)) spdlog::debug("finalizer: {} was already removed", ref);
    result = store_.commit(item.source_id, owner_, WorkState::Finalizing, WorkState::Done);
    if (result == CommitResult::Committed) spdlog::debug("finalizer: {} done", item.source_id);
  } catch (const StoreError&) {
    throw;
  } catch (const std::exception& e) {
    if (item.attempt_count + 1 >= maxAttempts_) {
      spdlog::warn("finalizer: giving up on removing {} for {}, leaving it for manual cleanup: {}",
                   ref, item.source_id, e.what());
      ItemUpdate fields;
      fields.last_error = "staging artifact left at " + ref + ": " + e.what();
      result = store_.commit(item.source_id, owner_, WorkState::Finalizing, WorkState::Done, fields);
    } else {
      spdlog::warn("finalizer: cannot remove {} for {} (attempt {}): {}", ref, item.source_id,
                   item.attempt_count + 1, e.what());
      result = store_.fail(item.source_id, owner_, WorkState::Finalizing, WorkState::Delivered,
                           describe(e));
    }
  }

  if (result == CommitResult::StaleLease)
    spdlog::info("finalizer: lease on {} lost", item.source_id);
}

} // namespace mmig
