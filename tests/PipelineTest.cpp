#define BOOST_TEST_MODULE Pipeline
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "core/config/Config.hpp"
#include "core/pipeline/DeliveryWorker.hpp"
#include "core/pipeline/DiscoveryWorker.hpp"
#include "core/pipeline/FetchWorker.hpp"
#include "core/pipeline/Finalizer.hpp"
#include "core/pipeline/Migration.hpp"
#include "core/pipeline/RecoverySweep.hpp"

using namespace mmig;
using namespace mmig::test;
using std::chrono::milliseconds;
using std::chrono::seconds;
namespace fs = std::filesystem;

namespace {

RetryPolicy testRetryPolicy() {
  RetryPolicy p;
  p.fetchMaxAttempts = 5;
  p.deliverMaxAttempts = 5;
  p.backoff.base = milliseconds(1000);
  p.backoff.max = milliseconds(60000);
  return p;
}

int stagedFiles(const std::string& root) {
  int n = 0;
  for (const auto& e : fs::recursive_directory_iterator(root)) {
    if (e.is_regular_file()) ++n;
  }
  return n;
}

void overwrite(const std::string& path, const std::string& bytes) {
  std::ofstream os(path, std::ios::binary | std::ios::trunc);
  os << bytes;
}

struct PipelineFixture {
  TempDir dir;
  FakeClock clock;
  std::string dbPath = freshStore(dir);
  StoreOptions opts{dbPath, clock.fn()};
  RunState runState;
  FakeSource source;
  FakeDestination destination;
  LocalFSBackend staging{dir.sub("staging")};
  ClaimOptions claim{8, seconds(60)};

  WorkItemStore store{dbPath, clock.fn()};
  DiscoveryWorker discovery{opts, runState, source, seconds(600)};
  FetchWorker fetcher{"fetch-0", "run-1", opts, runState, source, staging, claim};
  DeliveryWorker deliverer{"deliver-0", "run-1", opts, runState, destination, staging, "From ICloud", claim};
  Finalizer finalizer{"run-1", opts, runState, staging, 3, claim, testRetryPolicy().backoff};
  RecoverySweep recovery{opts, runState, testRetryPolicy(), seconds(30)};

  // Runs the stage workers until none of them makes progress.
  void pump() {
    for (int round = 0; round < 20; ++round) {
      bool worked = fetcher.runOnce();
      worked = deliverer.runOnce() || worked;
      worked = finalizer.runOnce() || worked;
      if (!worked) return;
    }
    BOOST_FAIL("pipeline did not settle");
  }

  WorkItem row(const std::string& id) {
    auto w = store.get(id);
    BOOST_REQUIRE(w);
    return *w;
  }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(pipeline_suite, PipelineFixture)

BOOST_AUTO_TEST_CASE(items_travel_to_done) {
  source.add("p1", "alpha");
  source.add("p2", "bravo");
  source.add("p3", "charlie");

  BOOST_CHECK(discovery.runOnce());
  BOOST_CHECK_EQUAL(discovery.passesCompleted(), 1);
  pump();

  for (const std::string id : {"p1", "p2", "p3"}) {
    const WorkItem w = row(id);
    BOOST_CHECK(w.state == WorkState::Done);
    BOOST_CHECK(!w.lease_owner);
    BOOST_CHECK(!w.last_error);
    BOOST_REQUIRE(w.destination_id);
    BOOST_CHECK_EQUAL(destination.uploadCount(id), 1);
    BOOST_CHECK_EQUAL(destination.content(*w.destination_id), source.fetch(id));
    BOOST_CHECK(!staging.exists(*w.content_ref));

    std::string why;
    BOOST_CHECK_MESSAGE(isValidHistory(store.history(id), &why), why);
  }
  BOOST_CHECK_EQUAL(destination.members("album-From ICloud").size(), 3u);
  BOOST_CHECK_EQUAL(stagedFiles(staging.root()), 0);
  BOOST_CHECK(store.isComplete(FailureLimits{}));

  // a second discovery pass finds nothing new and leaves DONE rows alone
  BOOST_CHECK(!discovery.runOnce());
  BOOST_CHECK(row("p1").state == WorkState::Done);
}

BOOST_AUTO_TEST_CASE(corrupted_staging_never_reaches_destination) {
  source.add("p1", "original bytes");
  discovery.runOnce();
  BOOST_CHECK(fetcher.runOnce());

  const WorkItem fetched = row("p1");
  BOOST_REQUIRE(fetched.state == WorkState::Fetched);
  overwrite(*fetched.content_ref, "tampered bytes");

  BOOST_CHECK(deliverer.runOnce());
  const WorkItem w = row("p1");
  BOOST_CHECK(w.state == WorkState::DeliverFailed);
  BOOST_CHECK_EQUAL(w.attempt_count, 1);
  BOOST_REQUIRE(w.last_error);
  BOOST_CHECK(w.last_error->find("IntegrityError") != std::string::npos);
  BOOST_CHECK_EQUAL(destination.totalUploads(), 0);
  BOOST_CHECK(!w.destination_id);
}

BOOST_AUTO_TEST_CASE(transient_fetch_failure_is_retried) {
  source.add("p1", "alpha");
  source.failFetch("p1", [] { throw TransientAdapterError("connection reset"); });
  discovery.runOnce();

  fetcher.runOnce();
  WorkItem w = row("p1");
  BOOST_CHECK(w.state == WorkState::FetchFailed);
  BOOST_CHECK(!w.terminal);
  BOOST_CHECK_EQUAL(w.attempt_count, 1);
  BOOST_CHECK(stagedFiles(staging.root()) == 0);

  // still inside the backoff window
  BOOST_CHECK_EQUAL(recovery.scheduleRetries(), 0);
  clock.advance(2);
  source.clearFailure("p1");
  BOOST_CHECK_EQUAL(recovery.scheduleRetries(), 1);

  pump();
  w = row("p1");
  BOOST_CHECK(w.state == WorkState::Done);
  BOOST_CHECK_EQUAL(w.attempt_count, 0);
  BOOST_CHECK_EQUAL(source.fetchCount("p1"), 2);
  BOOST_CHECK_EQUAL(destination.uploadCount("p1"), 1);
}

BOOST_AUTO_TEST_CASE(permanent_fetch_failure_is_terminal) {
  source.add("p1", "alpha");
  source.failFetch("p1", [] { throw PermanentAdapterError("asset deleted upstream"); });
  discovery.runOnce();
  fetcher.runOnce();

  const WorkItem w = row("p1");
  BOOST_CHECK(w.state == WorkState::FetchFailed);
  BOOST_CHECK(w.terminal);
  BOOST_REQUIRE(w.last_error);
  BOOST_CHECK(w.last_error->find("asset deleted upstream") != std::string::npos);

  clock.advance(3600);
  BOOST_CHECK_EQUAL(recovery.scheduleRetries(), 0);
  BOOST_CHECK_EQUAL(store.listPermanentFailures(FailureLimits{}).size(), 1u);
  BOOST_CHECK(store.isComplete(FailureLimits{}));
  BOOST_CHECK_EQUAL(source.fetchCount("p1"), 1);
}

BOOST_AUTO_TEST_CASE(delivery_gives_up_after_attempt_limit) {
  source.add("p1", "alpha");
  destination.failUploads = true;
  discovery.runOnce();
  fetcher.runOnce();

  for (int attempt = 1; attempt <= 5; ++attempt) {
    BOOST_REQUIRE(deliverer.runOnce());
    BOOST_CHECK(row("p1").state == WorkState::DeliverFailed);
    BOOST_CHECK_EQUAL(row("p1").attempt_count, attempt);
    clock.advance(120);
    BOOST_CHECK_EQUAL(recovery.scheduleRetries(), attempt < 5 ? 1 : 0);
  }

  const WorkItem w = row("p1");
  BOOST_CHECK(w.state == WorkState::DeliverFailed);
  BOOST_CHECK(staging.exists(*w.content_ref));
  BOOST_CHECK(!deliverer.runOnce());
  const auto failed = store.listPermanentFailures(FailureLimits{5, 5});
  BOOST_REQUIRE_EQUAL(failed.size(), 1u);
  BOOST_CHECK_EQUAL(failed[0].source_id, "p1");
  BOOST_CHECK(store.isComplete(FailureLimits{5, 5}));
}

BOOST_AUTO_TEST_CASE(rejected_upload_is_not_retried) {
  source.add("p1", "alpha");
  destination.rejectUploads = true;
  discovery.runOnce();
  fetcher.runOnce();
  deliverer.runOnce();

  BOOST_CHECK(row("p1").terminal);
  clock.advance(3600);
  BOOST_CHECK_EQUAL(recovery.scheduleRetries(), 0);
}

BOOST_AUTO_TEST_CASE(failed_album_placement_does_not_upload_twice) {
  source.add("p1", "alpha");
  destination.failCollectionAdds = 1;
  discovery.runOnce();
  fetcher.runOnce();

  BOOST_REQUIRE(deliverer.runOnce());
  BOOST_CHECK(row("p1").state == WorkState::DeliverFailed);
  BOOST_CHECK_EQUAL(destination.totalUploads(), 0);

  clock.advance(2);
  BOOST_CHECK_EQUAL(recovery.scheduleRetries(), 1);
  BOOST_REQUIRE(deliverer.runOnce());

  const WorkItem w = row("p1");
  BOOST_CHECK(w.state == WorkState::Delivered);
  BOOST_CHECK_EQUAL(destination.uploadCount("p1"), 1);
  BOOST_REQUIRE(w.destination_id);
  const auto album = destination.members("album-From ICloud");
  BOOST_REQUIRE_EQUAL(album.size(), 1u);
  BOOST_CHECK_EQUAL(album[0], *w.destination_id);
}

BOOST_AUTO_TEST_CASE(lost_lease_discards_staged_copy) {
  source.add("p1", "alpha");
  discovery.runOnce();

  bool reclaimed = false;
  source.onFetch = [&](const std::string&) {
    if (reclaimed) return;
    reclaimed = true;
    // the worker stalls past its lease and a sweep takes the row back
    clock.advance(120);
    BOOST_CHECK_EQUAL(recovery.sweep(), 1);
  };

  BOOST_CHECK(fetcher.runOnce());
  WorkItem w = row("p1");
  BOOST_CHECK(w.state == WorkState::Discovered);
  BOOST_CHECK(!w.content_ref);
  BOOST_CHECK_EQUAL(stagedFiles(staging.root()), 0);

  const auto h = store.history("p1");
  BOOST_REQUIRE_EQUAL(h.size(), 3u);
  BOOST_CHECK(h[2].kind == TransitionKind::Reclaim);

  BOOST_CHECK(fetcher.runOnce());
  BOOST_CHECK(row("p1").state == WorkState::Fetched);
  BOOST_CHECK_EQUAL(stagedFiles(staging.root()), 1);
}

BOOST_AUTO_TEST_CASE(unremovable_staging_file_is_left_for_cleanup) {
  Finalizer stubborn("run-1", opts, runState, staging, 3, claim, testRetryPolicy().backoff);

  source.add("p1", "alpha");
  discovery.runOnce();
  fetcher.runOnce();
  deliverer.runOnce();

  // a non-empty directory where the staged file was cannot be removed
  const std::string ref = *row("p1").content_ref;
  fs::remove(ref);
  fs::create_directories(fs::path(ref) / "locked");
  overwrite((fs::path(ref) / "locked" / "f").string(), "x");

  BOOST_CHECK(stubborn.runOnce());
  WorkItem w = row("p1");
  BOOST_CHECK(w.state == WorkState::Delivered);
  BOOST_CHECK_EQUAL(w.attempt_count, 1);
  BOOST_CHECK(w.last_error);

  // retries are spaced 1s, then 2s apart
  BOOST_CHECK(!stubborn.runOnce());
  clock.advance(1);
  BOOST_CHECK(stubborn.runOnce());
  BOOST_CHECK_EQUAL(row("p1").attempt_count, 2);
  clock.advance(1);
  BOOST_CHECK(!stubborn.runOnce());
  BOOST_CHECK(row("p1").state == WorkState::Delivered);
  clock.advance(1);
  BOOST_CHECK(stubborn.runOnce());
  w = row("p1");
  BOOST_CHECK(w.state == WorkState::Done);
  BOOST_REQUIRE(w.last_error);
  BOOST_CHECK(w.last_error->find("staging artifact left at " + ref) == 0);

  const auto leftovers = store.listLeftoverArtifacts();
  BOOST_REQUIRE_EQUAL(leftovers.size(), 1u);
  BOOST_CHECK_EQUAL(leftovers[0].source_id, "p1");

  std::string why;
  BOOST_CHECK_MESSAGE(isValidHistory(store.history("p1"), &why), why);
}

BOOST_AUTO_TEST_SUITE_END()

namespace {

Config migrationConfig(const TempDir& dir, const std::string& dbPath) {
  Config c;
  c.dbPath = dbPath;
  c.stagingRoot = dir.sub("staging");
  c.fetchWorkers = 2;
  c.deliverWorkers = 2;
  c.batchSize = 4;
  c.maxIdle = seconds(1);
  c.progressInterval = seconds(1);
  return c;
}

// Runs `m` and interrupts it if it has not returned within `limit`.
RunOutcome runWithWatchdog(Migration& m, seconds limit) {
  std::atomic<bool> interrupted{false};
  std::atomic<bool> finished{false};
  std::thread watchdog([&] {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!finished.load() && std::chrono::steady_clock::now() < deadline)
      std::this_thread::sleep_for(milliseconds(50));
    interrupted = true;
  });
  const RunOutcome outcome = m.run(interrupted);
  finished = true;
  watchdog.join();
  return outcome;
}

} // namespace

BOOST_AUTO_TEST_CASE(migration_completes_and_stops) {
  TempDir dir;
  const std::string dbPath = freshStore(dir);
  FakeSource source;
  FakeDestination destination;
  for (int i = 0; i < 20; ++i) source.add("item-" + std::to_string(i), "bytes of " + std::to_string(i));

  Migration migration(migrationConfig(dir, dbPath), source, destination);
  BOOST_CHECK(runWithWatchdog(migration, seconds(60)) == RunOutcome::Completed);
  BOOST_CHECK(!migration.runState().failed());

  WorkItemStore store(dbPath);
  BOOST_CHECK_EQUAL(store.countByState().at(WorkState::Done), 20);
  for (int i = 0; i < 20; ++i) BOOST_CHECK_EQUAL(destination.uploadCount("item-" + std::to_string(i)), 1);
  BOOST_CHECK_EQUAL(destination.members("album-From ICloud").size(), 20u);
  BOOST_CHECK_EQUAL(stagedFiles(dir.sub("staging")), 0);
}

BOOST_AUTO_TEST_CASE(restart_recovers_abandoned_leases) {
  TempDir dir;
  const std::string dbPath = freshStore(dir);
  FakeClock clock;
  FakeSource source;
  FakeDestination destination;
  for (int i = 0; i < 6; ++i) source.add("item-" + std::to_string(i), "bytes of " + std::to_string(i));

  // a previous process fetched everything and died holding delivery leases
  {
    RunState runState;
    StoreOptions opts{dbPath, clock.fn()};
    LocalFSBackend staging(dir.sub("staging"));
    DiscoveryWorker discovery(opts, runState, source, seconds(600));
    FetchWorker fetcher("fetch-0", "crashed", opts, runState, source, staging, ClaimOptions{});
    discovery.runOnce();
    while (fetcher.runOnce()) {}

    WorkItemStore store(dbPath, clock.fn());
    BOOST_REQUIRE_EQUAL(
      store.claimBatch("deliver-0/crashed", WorkState::Fetched, WorkState::Delivering, seconds(300), 3).size(),
      3u);
  }
  clock.advance(301);

  Migration migration(migrationConfig(dir, dbPath), source, destination, clock.fn());
  BOOST_CHECK(runWithWatchdog(migration, seconds(60)) == RunOutcome::Completed);

  WorkItemStore store(dbPath, clock.fn());
  BOOST_CHECK_EQUAL(store.countByState().at(WorkState::Done), 6);
  for (int i = 0; i < 6; ++i) {
    const std::string id = "item-" + std::to_string(i);
    BOOST_CHECK_EQUAL(destination.uploadCount(id), 1);
    BOOST_CHECK_EQUAL(source.fetchCount(id), 1);
    std::string why;
    BOOST_CHECK_MESSAGE(isValidHistory(store.history(id), &why), why);
  }
}
