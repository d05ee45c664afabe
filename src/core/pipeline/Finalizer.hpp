#pragma once
#include <string>

#include "Worker.hpp"
#include "core/storage/LocalFSBackend.hpp"

namespace mmig {

// DELIVERED -> FINALIZING -> DONE. Removes the staged file first. After
// `maxAttempts` failed removals the row is finished anyway and the leftover
// file is recorded in last_error for manual cleanup. A row that failed a
// removal is not claimed again until `backoff` has passed.
class Finalizer : public Worker {
public:
  Finalizer(const std::string& runId,
            const StoreOptions& storeOptions,
            RunState& runState,
            LocalFSBackend& staging,
            int maxAttempts,
            ClaimOptions claim,
            RetryBackoff backoff);

protected:
  bool work() override;

private:
  void finalizeOne(const WorkItem& item);

  std::string owner_;
  LocalFSBackend& staging_;
  int maxAttempts_;
  ClaimOptions claim_;
  RetryBackoff backoff_;
};

} // namespace mmig
