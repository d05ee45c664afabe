#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "core/metadata/WorkItemStore.hpp"

namespace mmig {

struct Config {
  std::string dbPath = "data/migration.db";
  std::string stagingRoot = "data/staging";
  std::string sourceRoot;
  std::string destUrl;
  std::string destRoot;
  std::string authFile = "auth/destination.json";
  std::string collection = "From ICloud";

  int fetchWorkers = 2;
  int deliverWorkers = 2;
  int batchSize = 8;
  std::chrono::seconds lease{300};

  int fetchMaxAttempts = 5;
  int deliverMaxAttempts = 5;
  int finalizeMaxAttempts = 3;
  RetryBackoff retryBackoff;

  std::chrono::seconds discoveryInterval{600};
  std::chrono::seconds sweepInterval{30};
  std::chrono::seconds progressInterval{10};
  std::chrono::seconds maxIdle{300};

  int port = 0;
  std::string apiKey;
  std::string logLevel = "info";

  FailureLimits failureLimits() const { return {fetchMaxAttempts, deliverMaxAttempts}; }
};

// Looks up one variable; std::nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup processEnv();

// Builds a Config from MMIG_* variables on top of the defaults.
// Throws std::invalid_argument naming the variable for a malformed value.
Config loadConfig(const EnvLookup& env = processEnv());

} // namespace mmig
