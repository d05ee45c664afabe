#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mmig {

struct CollectionHandle {
  std::string id;
  std::string name;
};

struct UploadMetadata {
  std::string source_id;
  std::string file_name;
  int64_t     created_at = 0;
  // When set, the new asset is placed in this collection by the same call.
  // Either both happen or the call throws and no asset is left behind.
  std::optional<CollectionHandle> collection;
};

// Where assets go. Same error contract as SourceAdapter.
class DestinationAdapter {
public:
  virtual ~DestinationAdapter() = default;

  // Returns the destination's identifier for the new asset.
  virtual std::string upload(std::string_view bytes, const UploadMetadata& meta) = 0;

  // Finds the collection by name or creates it.
  virtual CollectionHandle ensureCollection(const std::string& name) = 0;

  // Adds an asset that already exists at the destination.
  virtual void addToCollection(const std::string& destinationId, const CollectionHandle& collection) = 0;
};

} // namespace mmig
