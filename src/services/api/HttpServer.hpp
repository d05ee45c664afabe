#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "core/metadata/WorkItemStore.hpp"

namespace httplib { class Server; }

namespace mmig {

// Read-only operator endpoints over the store:
//   GET /health, /progress, /failures, /leftovers
// apiKey: if empty, auth is disabled.
class OperatorServer {
public:
  OperatorServer(const std::string& dbPath, FailureLimits limits, std::string apiKey);
  ~OperatorServer();

  // Binds synchronously and serves on a background thread. Port 0 picks a
  // free port. Returns the bound port; throws std::runtime_error if binding
  // fails.
  int start(const std::string& host, int port);

  // Idempotent. Safe to call at any point after start(), including before
  // the listener thread is accepting.
  void stop();

private:
  WorkItemStore store_;
  FailureLimits limits_;
  std::string apiKey_;
  std::unique_ptr<httplib::Server> svr_;
  std::thread thread_;
  std::atomic<bool> done_{false};
};

// JSON bodies served by OperatorServer, shared with the command line.
std::string progress_json(WorkItemStore& store, const FailureLimits& limits);
std::string failures_json(WorkItemStore& store, const FailureLimits& limits);
std::string leftovers_json(WorkItemStore& store);

} // namespace mmig
