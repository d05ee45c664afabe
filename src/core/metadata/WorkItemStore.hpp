#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "WorkItem.hpp"
#include "WorkState.hpp"

struct sqlite3;

namespace mmig {

enum class RegisterResult { Inserted, AlreadyPresent };

// StaleLease: the row is no longer in the expected transient state or its
// lease belongs to someone else. The caller discards its result.
enum class CommitResult { Committed, StaleLease };

// Delay before a failed row may be requeued: min(base * 2^(attempts-1), max).
struct RetryBackoff {
  std::chrono::milliseconds base{1000};
  std::chrono::milliseconds max{60000};

  std::chrono::milliseconds delayFor(int64_t attempts) const;
};

// Retry ceilings used to decide which failed rows are permanent.
struct FailureLimits {
  int fetchMaxAttempts = 5;
  int deliverMaxAttempts = 5;
};

// The durable store. Every mutation is one IMMEDIATE transaction over one row
// (or one bounded claim batch) and appends its transition to item_history in
// the same transaction.
//
// One instance owns one SQLite connection. Instances on the same file may be
// used from different threads and processes at once; a single instance
// serializes its own callers.
class WorkItemStore {
public:
  // Seconds since the epoch.
  using Clock = std::function<int64_t()>;

  // Opens an existing store initialized with initDatabase().
  // Throws StoreError if it cannot be opened.
  explicit WorkItemStore(const std::string& dbPath, Clock clock = {});
  ~WorkItemStore();

  WorkItemStore(const WorkItemStore&) = delete;
  WorkItemStore& operator=(const WorkItemStore&) = delete;

  // Idempotent insert in DISCOVERED. Relies on the primary key, so concurrent
  // calls with the same source_id produce exactly one row.
  RegisterResult registerItem(const SourceItem& item, const std::string& actor = "discovery");
  RegisterResult registerItem(const std::string& sourceId);

  // Atomically moves up to maxN rows in `from` without a live lease into the
  // transient state `to`, leased to `owner` until now + lease. Concurrent
  // callers always receive disjoint sets.
  // With `backoff`, a row with attempt_count > 0 is only eligible once
  // backoff.delayFor(attempt_count) has passed since its last update.
  std::vector<WorkItem> claimBatch(const std::string& owner,
                                   WorkState from,
                                   WorkState to,
                                   std::chrono::seconds lease,
                                   int maxN,
                                   const std::optional<RetryBackoff>& backoff = std::nullopt);

  // Moves a row leased by `owner` from `expected` to `to`, clears the lease and
  // applies `fields`. Resets attempt_count when the row enters a new stage.
  CommitResult commit(const std::string& sourceId,
                      const std::string& owner,
                      WorkState expected,
                      WorkState to,
                      const ItemUpdate& fields = {});

  // Same guard as commit. Moves to `failureState`, increments attempt_count
  // and records `error`. A permanent failure is never requeued.
  CommitResult fail(const std::string& sourceId,
                    const std::string& owner,
                    WorkState expected,
                    WorkState failureState,
                    const std::string& error,
                    bool permanent = false);

  // Reverts every transient row whose lease expired before `now` to its
  // origin state and drops the lease. Returns the number of rows reverted.
  int64_t reclaimExpired(int64_t now);

  // Moves rows in the failure state back to the state they are retried from,
  // for rows that are not terminal, are below maxAttempts and have waited out
  // their backoff. Returns the number of rows requeued.
  int64_t requeueFailed(WorkState failureState,
                        int maxAttempts,
                        const RetryBackoff& backoff,
                        int64_t now);

  std::optional<WorkItem> get(const std::string& sourceId);
  std::map<WorkState, int64_t> countByState();
  std::vector<WorkItem> listPermanentFailures(const FailureLimits& limits);
  // DONE rows whose staging artifact could not be removed.
  std::vector<WorkItem> listLeftoverArtifacts();
  std::vector<HistoryEntry> history(const std::string& sourceId);
  // Every row is DONE or permanently failed.
  bool isComplete(const FailureLimits& limits);

  int64_t now() const;

private:
  sqlite3* db_;
  Clock clock_;
  std::mutex mutex_;
};

} // namespace mmig
