#include "Config.hpp"

#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <stdexcept>

namespace mmig {

namespace {

std::string get_env_or(const EnvLookup& env, const char* key, const std::string& defval) {
  if (auto v = env(key)) return *v;
  return defval;
}

int64_t get_int_or(const EnvLookup& env, const char* key, int64_t defval, int64_t min) {
  auto v = env(key);
  if (!v) return defval;
  size_t used = 0;
  int64_t n = 0;
  try {
    n = std::stoll(*v, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string(key) + " must be an integer, got '" + *v + "'");
  }
  if (used != v->size())
    throw std::invalid_argument(std::string(key) + " must be an integer, got '" + *v + "'");
  if (n < min)
    throw std::invalid_argument(std::string(key) + " must be at least " + std::to_string(min));
  return n;
}

} // namespace

EnvLookup processEnv() {
  return [](const std::string& key) -> std::optional<std::string> {
    if (const char* v = std::getenv(key.c_str())) return std::string(v);
    return std::nullopt;
  };
}

Config loadConfig(const EnvLookup& env) {
  Config c;
  c.dbPath      = get_env_or(env, "MMIG_DB_PATH", c.dbPath);
  c.stagingRoot = get_env_or(env, "MMIG_STAGING_ROOT", c.stagingRoot);
  c.sourceRoot  = get_env_or(env, "MMIG_SOURCE_ROOT", c.sourceRoot);
  c.destUrl     = get_env_or(env, "MMIG_DEST_URL", c.destUrl);
  c.destRoot    = get_env_or(env, "MMIG_DEST_ROOT", c.destRoot);
  c.authFile    = get_env_or(env, "MMIG_AUTH_FILE", c.authFile);
  c.collection  = get_env_or(env, "MMIG_COLLECTION", c.collection);
  c.apiKey      = get_env_or(env, "MMIG_API_KEY", c.apiKey);
  c.logLevel    = get_env_or(env, "MMIG_LOG_LEVEL", c.logLevel);

  c.fetchWorkers        = static_cast<int>(get_int_or(env, "MMIG_FETCH_WORKERS", c.fetchWorkers, 1));
  c.deliverWorkers      = static_cast<int>(get_int_or(env, "MMIG_DELIVER_WORKERS", c.deliverWorkers, 1));
  c.batchSize           = static_cast<int>(get_int_or(env, "MMIG_BATCH_SIZE", c.batchSize, 1));
  c.lease               = std::chrono::seconds(get_int_or(env, "MMIG_LEASE_SECONDS", c.lease.count(), 1));
  c.fetchMaxAttempts    = static_cast<int>(get_int_or(env, "MMIG_FETCH_MAX_ATTEMPTS", c.fetchMaxAttempts, 1));
  c.deliverMaxAttempts  = static_cast<int>(get_int_or(env, "MMIG_DELIVER_MAX_ATTEMPTS", c.deliverMaxAttempts, 1));
  c.finalizeMaxAttempts = static_cast<int>(get_int_or(env, "MMIG_FINALIZE_MAX_ATTEMPTS", c.finalizeMaxAttempts, 1));

  c.retryBackoff.base = std::chrono::milliseconds(
    get_int_or(env, "MMIG_RETRY_BASE_MS", c.retryBackoff.base.count(), 0));
  c.retryBackoff.max = std::chrono::milliseconds(
    get_int_or(env, "MMIG_RETRY_MAX_MS", c.retryBackoff.max.count(), 0));
  if (c.retryBackoff.max < c.retryBackoff.base)
    throw std::invalid_argument("MMIG_RETRY_MAX_MS must not be below MMIG_RETRY_BASE_MS");

  c.discoveryInterval = std::chrono::seconds(get_int_or(env, "MMIG_DISCOVERY_SECONDS", c.discoveryInterval.count(), 1));
  c.sweepInterval     = std::chrono::seconds(get_int_or(env, "MMIG_SWEEP_SECONDS", c.sweepInterval.count(), 1));
  c.progressInterval  = std::chrono::seconds(get_int_or(env, "MMIG_PROGRESS_SECONDS", c.progressInterval.count(), 1));
  c.maxIdle           = std::chrono::seconds(get_int_or(env, "MMIG_MAX_IDLE_SECONDS", c.maxIdle.count(), 0));
  c.port              = static_cast<int>(get_int_or(env, "MMIG_PORT", c.port, 0));
  if (c.port > 65535) throw std::invalid_argument("MMIG_PORT must be at most 65535");

  if (c.collection.empty()) throw std::invalid_argument("MMIG_COLLECTION must not be empty");

  // names spdlog::level::from_str understands; anything else it maps to off
  static const char* const kLevels[] = {"trace", "debug", "info", "warn", "warning",
                                        "error", "err", "critical", "off"};
  if (std::find(std::begin(kLevels), std::end(kLevels), c.logLevel) == std::end(kLevels))
    throw std::invalid_argument("MMIG_LOG_LEVEL must be one of trace, debug, info, warn, error, critical, off; got '" +
                                c.logLevel + "'");
  return c;
}

} // namespace mmig
