#pragma once
#include <string>

#include "core/adapters/CredentialProvider.hpp"
#include "core/adapters/DestinationAdapter.hpp"

namespace httplib { class Result; }

namespace mmig {

// Photo-library style REST destination:
//   POST /v1/uploads                          raw bytes -> upload token
//   POST /v1/mediaItems:batchCreate           token (+ albumId) -> media item id
//   GET  /v1/albums, POST /v1/albums          find or create a collection
//   POST /v1/albums/{id}:batchAddMediaItems   add an item to it
// A client is created per call, so one instance may serve a whole pool.
class HttpDestination : public DestinationAdapter {
public:
  HttpDestination(std::string baseUrl, CredentialProvider& credentials);

  std::string upload(std::string_view bytes, const UploadMetadata& meta) override;
  CollectionHandle ensureCollection(const std::string& name) override;
  void addToCollection(const std::string& destinationId, const CollectionHandle& collection) override;

private:
  // Maps transport errors and HTTP status to the adapter error taxonomy.
  // Returns the body of a 2xx response.
  std::string checked(const httplib::Result& res, const std::string& what);

  std::string baseUrl_;
  CredentialProvider& credentials_;
};

} // namespace mmig
