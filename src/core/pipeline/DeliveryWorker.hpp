#pragma once
#include <optional>
#include <string>

#include "Worker.hpp"
#include "core/adapters/DestinationAdapter.hpp"
#include "core/storage/LocalFSBackend.hpp"

namespace mmig {

// FETCHED -> DELIVERING -> DELIVERED | DELIVER_FAILED.
// The staged copy is re-hashed before upload; a mismatch fails the item
// without contacting the destination.
class DeliveryWorker : public Worker {
public:
  DeliveryWorker(std::string name,
                 const std::string& runId,
                 const StoreOptions& storeOptions,
                 RunState& runState,
                 DestinationAdapter& destination,
                 LocalFSBackend& staging,
                 std::string collectionName,
                 ClaimOptions claim);

  const std::string& owner() const { return owner_; }

protected:
  bool work() override;

private:
  void deliverOne(const WorkItem& item);
  std::string readVerified(const WorkItem& item);

  std::string owner_;
  DestinationAdapter& destination_;
  LocalFSBackend& staging_;
  std::string collectionName_;
  std::optional<CollectionHandle> collection_;
  ClaimOptions claim_;
};

} // namespace mmig
