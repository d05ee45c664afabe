#include "DeliveryWorker.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "core/Errors.hpp"
#include "core/storage/Digest.hpp"

namespace mmig {

DeliveryWorker::DeliveryWorker(std::string name,
                               const std::string& runId,
                               const StoreOptions& storeOptions,
                               RunState& runState,
                               DestinationAdapter& destination,
                               LocalFSBackend& staging,
                               std::string collectionName,
                               ClaimOptions claim)
  : Worker(name, storeOptions, runState),
    owner_(name + "/" + runId),
    destination_(destination),
    staging_(staging),
    collectionName_(std::move(collectionName)),
    claim_(claim) {}

bool DeliveryWorker::work() {
  const auto items = store_.claimBatch(owner_, WorkState::Fetched, WorkState::Delivering,
                                       claim_.lease, claim_.batchSize);
  if (items.empty()) return false;

  spdlog::debug("{} claimed {} items", name(), items.size());
  for (const auto& item : items) {
    if (stopping()) break;
    deliverOne(item);
  }
  return true;
}

std::string DeliveryWorker::readVerified(const WorkItem& item) {
  std::string bytes;
  try {
    bytes = staging_.read(*item.content_ref);
  } catch (const std::runtime_error& e) {
    throw IntegrityError(e.what());
  }
  if (sha256_hex(bytes) != *item.content_hash)
    throw IntegrityError("staged content of " + item.source_id + " no longer matches " +
                         *item.content_hash);
  return bytes;
}

void DeliveryWorker::deliverOne(const WorkItem& item) {
  try {
    const std::string bytes = readVerified(item);

    if (!collection_) {
      collection_ = destination_.ensureCollection(collectionName_);
      spdlog::info("{}: using collection '{}' ({})", name(), collection_->name, collection_->id);
    }

    UploadMetadata meta;
    meta.source_id = item.source_id;
    meta.file_name = item.name.empty() ? item.source_id : item.name;
    meta.created_at = item.source_created_at;
    meta.collection = collection_;
    const std::string destinationId = destination_.upload(bytes, meta);

    ItemUpdate fields;
    fields.destination_id = destinationId;
    if (store_.commit(item.source_id, owner_, WorkState::Delivering, WorkState::Delivered, fields) ==
        CommitResult::StaleLease) {
      spdlog::info("{}: lease on {} lost, discarding delivery result {}", name(), item.source_id,
                   destinationId);
      return;
    }
    spdlog::debug("{}: delivered {} as {}", name(), item.source_id, destinationId);
  } catch (const StoreError&) {
    throw;
  } catch (const std::exception& e) {
    const bool permanent = dynamic_cast<const PermanentAdapterError*>(&e) != nullptr;
    const std::string error = describe(e);
    spdlog::warn("{}: delivery of {} failed (attempt {}): {}", name(), item.source_id,
                 item.attempt_count + 1, error);
    if (store_.fail(item.source_id, owner_, WorkState::Delivering, WorkState::DeliverFailed, error,
                    permanent) == CommitResult::StaleLease) {
      spdlog::info("{}: lease on {} lost before recording failure", name(), item.source_id);
    }
  }
}

} // namespace mmig
