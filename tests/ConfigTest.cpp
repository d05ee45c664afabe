#define BOOST_TEST_MODULE Config
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <map>
#include <stdexcept>
#include "core/config/Config.hpp"

using namespace mmig;

namespace {

EnvLookup envOf(std::map<std::string, std::string> vars) {
  return [vars](const std::string& key) -> std::optional<std::string> {
    auto it = vars.find(key);
    if (it == vars.end()) return std::nullopt;
    return it->second;
  };
}

} // namespace

BOOST_AUTO_TEST_CASE(defaults) {
  const Config c = loadConfig(envOf({}));
  BOOST_CHECK_EQUAL(c.dbPath, "data/migration.db");
  BOOST_CHECK_EQUAL(c.collection, "From ICloud");
  BOOST_CHECK_EQUAL(c.fetchWorkers, 2);
  BOOST_CHECK_EQUAL(c.lease.count(), 300);
  BOOST_CHECK_EQUAL(c.fetchMaxAttempts, 5);
  BOOST_CHECK_EQUAL(c.port, 0);
  BOOST_CHECK(c.sourceRoot.empty());
}

BOOST_AUTO_TEST_CASE(overrides) {
  const Config c = loadConfig(envOf({
    {"MMIG_DB_PATH", "/data/artifacts.sqlite"},
    {"MMIG_SOURCE_ROOT", "/library"},
    {"MMIG_FETCH_WORKERS", "8"},
    {"MMIG_LEASE_SECONDS", "60"},
    {"MMIG_DELIVER_MAX_ATTEMPTS", "3"},
    {"MMIG_RETRY_BASE_MS", "100"},
    {"MMIG_RETRY_MAX_MS", "30000"},
    {"MMIG_MAX_IDLE_SECONDS", "0"},
    {"MMIG_PORT", "8080"},
  }));
  BOOST_CHECK_EQUAL(c.dbPath, "/data/artifacts.sqlite");
  BOOST_CHECK_EQUAL(c.sourceRoot, "/library");
  BOOST_CHECK_EQUAL(c.fetchWorkers, 8);
  BOOST_CHECK_EQUAL(c.lease.count(), 60);
  BOOST_CHECK_EQUAL(c.failureLimits().deliverMaxAttempts, 3);
  BOOST_CHECK_EQUAL(c.retryBackoff.base.count(), 100);
  BOOST_CHECK_EQUAL(c.maxIdle.count(), 0);
  BOOST_CHECK_EQUAL(c.port, 8080);
}

BOOST_AUTO_TEST_CASE(rejects_malformed_values) {
  BOOST_CHECK_THROW(loadConfig(envOf({{"MMIG_LEASE_SECONDS", "soon"}})), std::invalid_argument);
  BOOST_CHECK_THROW(loadConfig(envOf({{"MMIG_LEASE_SECONDS", "0"}})), std::invalid_argument);
  BOOST_CHECK_THROW(loadConfig(envOf({{"MMIG_BATCH_SIZE", "12x"}})), std::invalid_argument);
  BOOST_CHECK_THROW(loadConfig(envOf({{"MMIG_FETCH_MAX_ATTEMPTS", "-1"}})), std::invalid_argument);
  BOOST_CHECK_THROW(loadConfig(envOf({{"MMIG_PORT", "70000"}})), std::invalid_argument);
  BOOST_CHECK_THROW(loadConfig(envOf({{"MMIG_RETRY_BASE_MS", "5000"}, {"MMIG_RETRY_MAX_MS", "10"}})),
                    std::invalid_argument);
  BOOST_CHECK_THROW(loadConfig(envOf({{"MMIG_COLLECTION", ""}})), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(log_level_must_be_known) {
  BOOST_CHECK_EQUAL(loadConfig(envOf({{"MMIG_LOG_LEVEL", "debug"}})).logLevel, "debug");
  BOOST_CHECK_EQUAL(loadConfig(envOf({{"MMIG_LOG_LEVEL", "off"}})).logLevel, "off");
  try {
    loadConfig(envOf({{"MMIG_LOG_LEVEL", "verbose"}}));
    BOOST_FAIL("expected std::invalid_argument");
  } catch (const std::invalid_argument& e) {
    BOOST_CHECK(std::string(e.what()).find("MMIG_LOG_LEVEL") != std::string::npos);
  }
}

BOOST_AUTO_TEST_CASE(error_names_the_variable) {
  try {
    loadConfig(envOf({{"MMIG_SWEEP_SECONDS", "often"}}));
    BOOST_FAIL("expected std::invalid_argument");
  } catch (const std::invalid_argument& e) {
    BOOST_CHECK(std::string(e.what()).find("MMIG_SWEEP_SECONDS") != std::string::npos);
  }
}
