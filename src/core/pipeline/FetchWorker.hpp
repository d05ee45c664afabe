#pragma once
#include <string>

#include "Worker.hpp"
#include "core/adapters/SourceAdapter.hpp"
#include "core/storage/LocalFSBackend.hpp"

namespace mmig {

// DISCOVERED -> FETCHING -> FETCHED | FETCH_FAILED.
// Downloads into staging, hashes, re-reads the staged copy to verify it.
class FetchWorker : public Worker {
public:
  FetchWorker(std::string name,
              const std::string& runId,
              const StoreOptions& storeOptions,
              RunState& runState,
              SourceAdapter& source,
              LocalFSBackend& staging,
              ClaimOptions claim);

  const std::string& owner() const { return owner_; }

protected:
  bool work() override;

private:
  void fetchOne(const WorkItem& item);
  void recordFailure(const WorkItem& item, const std::string& error, bool permanent);
  void discardStaged(const std::string& ref);

  std::string owner_;
  SourceAdapter& source_;
  LocalFSBackend& staging_;
  ClaimOptions claim_;
};

} // namespace mmig
