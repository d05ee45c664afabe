#pragma once
#include <string>

#include "DestinationAdapter.hpp"

namespace mmig {

// A destination that is a directory: <root>/media/<id> plus one directory per
// collection holding copies named after the original files.
class LocalDirDestination : public DestinationAdapter {
public:
  explicit LocalDirDestination(std::string root);

  std::string upload(std::string_view bytes, const UploadMetadata& meta) override;
  CollectionHandle ensureCollection(const std::string& name) override;
  void addToCollection(const std::string& destinationId, const CollectionHandle& collection) override;

private:
  std::string root_;
};

} // namespace mmig
