#include "FetchWorker.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "core/Errors.hpp"
#include "core/storage/Digest.hpp"

namespace mmig {

FetchWorker::FetchWorker(std::string name,
                         const std::string& runId,
                         const StoreOptions& storeOptions,
                         RunState& runState,
                         SourceAdapter& source,
                         LocalFSBackend& staging,
                         ClaimOptions claim)
  : Worker(name, storeOptions, runState),
    owner_(name + "/" + runId),
    source_(source),
    staging_(staging),
    claim_(claim) {}

bool FetchWorker::work() {
  const auto items = store_.claimBatch(owner_, WorkState::Discovered, WorkState::Fetching,
                                       claim_.lease, claim_.batchSize);
  if (items.empty()) return false;

  spdlog::debug("{} claimed {} items", name(), items.size());
  for (const auto& item : items) {
    // unprocessed claims expire and are reclaimed by the next sweep
    if (stopping()) break;
    fetchOne(item);
  }
  return true;
}

void FetchWorker::fetchOne(const WorkItem& item) {
  std::string ref;
  try {
    const std::string bytes = source_.fetch(item.source_id);
    const std::string hash = sha256_hex(bytes);
    ref = staging_.put(item.source_id, bytes);
    if (sha256_hex(staging_.read(ref)) != hash)
      throw IntegrityError("staged copy of " + item.source_id + " does not match its digest");

    ItemUpdate fields;
    fields.content_ref = ref;
    fields.content_hash = hash;
    if (store_.commit(item.source_id, owner_, WorkState::Fetching, WorkState::Fetched, fields) ==
        CommitResult::StaleLease) {
      spdlog::info("{}: lease on {} lost, discarding fetched content", name(), item.source_id);
      discardStaged(ref);
      return;
    }
    spdlog::debug("{}: fetched {} ({} bytes, sha256 {})", name(), item.source_id, bytes.size(), hash);
  } catch (const StoreError&) {
    throw;
  } catch (const PermanentAdapterError& e) {
    discardStaged(ref);
    recordFailure(item, describe(e), true);
  } catch (const std::exception& e) {
    discardStaged(ref);
    recordFailure(item, describe(e), false);
  }
}

void FetchWorker::recordFailure(const WorkItem& item, const std::string& error, bool permanent) {
  spdlog::warn("{}: fetch of {} failed (attempt {}): {}", name(), item.source_id,
               item.attempt_count + 1, error);
  if (store_.fail(item.source_id, owner_, WorkState::Fetching, WorkState::FetchFailed, error,
                  permanent) == CommitResult::StaleLease) {
    spdlog::info("{}: lease on {} lost before recording failure", name(), item.source_id);
  }
}

void FetchWorker::discardStaged(const std::string& ref) {
  if (ref.empty()) return;
  try {
    staging_.remove(ref);
  } catch (const std::exception& e) {
    spdlog::warn("{}: could not remove staged file {}: {}", name(), ref, e.what());
  }
}

} // namespace mmig
