#include "WorkItemStore.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <ctime>
#include <stdexcept>
#include <utility>

#include "core/Errors.hpp"

namespace mmig {

namespace {

constexpr int kBusyTimeoutMs = 30000;

const char* kItemColumns =
  "source_id, name, size, source_created_at, state, lease_owner, lease_expires_at, "
  "attempt_count, terminal, content_ref, content_hash, destination_id, last_error, "
  "created_at, updated_at";

// Prepared statement bound to one call; finalized on scope exit.
class Stmt {
public:
  Stmt(sqlite3* db, const std::string& sql) : db_(db), st_(nullptr) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      std::string err = sqlite3_errmsg(db_);
      sqlite3_finalize(st_);
      throw StoreError("prepare failed: " + err);
    }
  }
  ~Stmt() { sqlite3_finalize(st_); }

  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  Stmt& bind(int i, const std::string& v) {
    check(sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT));
    return *this;
  }
  Stmt& bind(int i, int64_t v) {
    check(sqlite3_bind_int64(st_, i, v));
    return *this;
  }
  Stmt& bind(int i, const std::optional<std::string>& v) {
    check(v ? sqlite3_bind_text(st_, i, v->c_str(), -1, SQLITE_TRANSIENT)
            : sqlite3_bind_null(st_, i));
    return *this;
  }

  // true while rows remain
  bool step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
  }

  std::string text(int col) const {
    auto p = reinterpret_cast<const char*>(sqlite3_column_text(st_, col));
    return p ? p : "";
  }
  std::optional<std::string> optText(int col) const {
    if (sqlite3_column_type(st_, col) == SQLITE_NULL) return std::nullopt;
    return text(col);
  }
  int64_t int64(int col) const { return sqlite3_column_int64(st_, col); }
  std::optional<int64_t> optInt64(int col) const {
    if (sqlite3_column_type(st_, col) == SQLITE_NULL) return std::nullopt;
    return int64(col);
  }

private:
  void check(int rc) {
    if (rc != SQLITE_OK) throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
  }

  sqlite3* db_;
  sqlite3_stmt* st_;
};

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw StoreError(std::string(sql) + " failed: " + msg);
  }
}

// BEGIN IMMEDIATE takes the write lock up front, so the select and the update
// inside one transaction cannot interleave with another connection's.
class Transaction {
public:
  explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE;"); }
  ~Transaction() {
    if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
  }
  void commit() {
    exec(db_, "COMMIT;");
    done_ = true;
  }

private:
  sqlite3* db_;
  bool done_ = false;
};

WorkItem readItem(const Stmt& st) {
  WorkItem w;
  w.source_id         = st.text(0);
  w.name              = st.text(1);
  w.size              = st.int64(2);
  w.source_created_at = st.int64(3);
  w.state             = parseWorkState(st.text(4));
  w.lease_owner       = st.optText(5);
  w.lease_expires_at  = st.optInt64(6);
  w.attempt_count     = st.int64(7);
  w.terminal          = st.int64(8) != 0;
  w.content_ref       = st.optText(9);
  w.content_hash      = st.optText(10);
  w.destination_id    = st.optText(11);
  w.last_error        = st.optText(12);
  w.created_at        = st.int64(13);
  w.updated_at        = st.int64(14);
  return w;
}

void appendHistory(sqlite3* db,
                   const std::string& sourceId,
                   TransitionKind kind,
                   std::optional<WorkState> from,
                   WorkState to,
                   int64_t at,
                   const std::string& actor,
                   const std::string& details) {
  Stmt st(db, R"SQL(
    INSERT INTO item_history (source_id, kind, from_state, to_state, at, actor, details)
    VALUES (?,?,?,?,?,?,?)
  )SQL");
  st.bind(1, sourceId)
    .bind(2, toString(kind))
    .bind(3, from ? std::optional<std::string>(toString(*from)) : std::nullopt)
    .bind(4, toString(to))
    .bind(5, at)
    .bind(6, actor)
    .bind(7, details);
  st.step();
}

// Reads state and owner of a row inside an open transaction.
bool leaseHeld(sqlite3* db, const std::string& sourceId, const std::string& owner, WorkState expected) {
  Stmt st(db, "SELECT state, lease_owner FROM work_items WHERE source_id = ?");
  st.bind(1, sourceId);
  if (!st.step()) return false;
  return st.text(0) == toString(expected) && st.optText(1) == owner;
}

std::string permanentFailureClause() {
  return "((state = 'FETCH_FAILED' AND (terminal = 1 OR attempt_count >= ?1)) OR "
         " (state = 'DELIVER_FAILED' AND (terminal = 1 OR attempt_count >= ?2)))";
}

} // namespace

std::chrono::milliseconds RetryBackoff::delayFor(int64_t attempts) const {
  if (attempts <= 0) return std::chrono::milliseconds(0);
  auto d = base;
  for (int64_t i = 1; i < attempts && d < max; ++i) d *= 2;
  return std::min(d, max);
}

WorkItemStore::WorkItemStore(const std::string& dbPath, Clock clock)
  : db_(nullptr), clock_(std::move(clock)) {
  if (!clock_) clock_ = [] { return static_cast<int64_t>(std::time(nullptr)); };

  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StoreError("failed to open store " + dbPath + ": " + msg);
  }
  db_ = db;
  try {
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    exec(db_, "PRAGMA foreign_keys=ON;");
    exec(db_, "PRAGMA synchronous=FULL;");
  } catch (...) {
    sqlite3_close(db_);
    throw;
  }
}

WorkItemStore::~WorkItemStore() { sqlite3_close(db_); }

int64_t WorkItemStore::now() const { return clock_(); }

RegisterResult WorkItemStore::registerItem(const std::string& sourceId) {
  SourceItem item;
  item.source_id = sourceId;
  return registerItem(item);
}

RegisterResult WorkItemStore::registerItem(const SourceItem& item, const std::string& actor) {
  if (item.source_id.empty()) throw std::invalid_argument("source_id must not be empty");

  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t at = now();
  Transaction tx(db_);

  Stmt st(db_, R"SQL(
    INSERT INTO work_items (source_id, name, size, source_created_at, state, created_at, updated_at)
    VALUES (?,?,?,?,'DISCOVERED',?,?)
    ON CONFLICT (source_id) DO NOTHING
  )SQL");
  st.bind(1, item.source_id)
    .bind(2, item.name)
    .bind(3, item.size)
    .bind(4, item.created_at)
    .bind(5, at)
    .bind(6, at);
  st.step();

  if (sqlite3_changes(db_) == 0) return RegisterResult::AlreadyPresent;

  appendHistory(db_, item.source_id, TransitionKind::Register, std::nullopt,
                WorkState::Discovered, at, actor, item.name);
  tx.commit();
  return RegisterResult::Inserted;
}

std::vector<WorkItem> WorkItemStore::claimBatch(const std::string& owner,
                                                WorkState from,
                                                WorkState to,
                                                std::chrono::seconds lease,
                                                int maxN,
                                                const std::optional<RetryBackoff>& backoff) {
  if (!isAllowed(TransitionKind::Claim, from, to))
    throw std::invalid_argument("illegal claim " + toString(from) + " -> " + toString(to));
  if (owner.empty()) throw std::invalid_argument("lease owner must not be empty");
  if (maxN <= 0 || lease.count() <= 0) return {};

  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t at = now();
  const int64_t expires = at + lease.count();
  Transaction tx(db_);

  std::vector<WorkItem> claimed;
  {
    // same curve as RetryBackoff::delayFor, in milliseconds
    Stmt sel(db_, std::string("SELECT ") + kItemColumns + R"SQL(
      FROM work_items
      WHERE state = ?1 AND (lease_expires_at IS NULL OR lease_expires_at < ?2)
        AND (?4 IS NULL OR attempt_count = 0 OR
             (?2 - updated_at) * 1000 >= min(?4 * (1 << min(attempt_count - 1, 30)), ?5))
      ORDER BY updated_at, source_id
      LIMIT ?3
    )SQL");
    sel.bind(1, toString(from)).bind(2, at).bind(3, static_cast<int64_t>(maxN));
    if (backoff) {
      sel.bind(4, static_cast<int64_t>(backoff->base.count()))
         .bind(5, static_cast<int64_t>(backoff->max.count()));
    }
    while (sel.step()) claimed.push_back(readItem(sel));
  }

  for (auto& w : claimed) {
    Stmt upd(db_, R"SQL(
      UPDATE work_items
      SET state = ?, lease_owner = ?, lease_expires_at = ?, updated_at = ?
      WHERE source_id = ? AND state = ?
    )SQL");
    upd.bind(1, toString(to))
       .bind(2, owner)
       .bind(3, expires)
       .bind(4, at)
       .bind(5, w.source_id)
       .bind(6, toString(from));
    upd.step();

    appendHistory(db_, w.source_id, TransitionKind::Claim, from, to, at, owner, "");
    w.state = to;
    w.lease_owner = owner;
    w.lease_expires_at = expires;
    w.updated_at = at;
  }

  tx.commit();
  return claimed;
}

CommitResult WorkItemStore::commit(const std::string& sourceId,
                                   const std::string& owner,
                                   WorkState expected,
                                   WorkState to,
                                   const ItemUpdate& fields) {
  if (!isAllowed(TransitionKind::Commit, expected, to))
    throw std::invalid_argument("illegal commit " + toString(expected) + " -> " + toString(to));
  if (to == WorkState::Fetched && (!fields.content_ref || !fields.content_hash))
    throw std::invalid_argument("commit to FETCHED requires content_ref and content_hash");
  if (to == WorkState::Delivered && !fields.destination_id)
    throw std::invalid_argument("commit to DELIVERED requires destination_id");

  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t at = now();
  Transaction tx(db_);

  if (!leaseHeld(db_, sourceId, owner, expected)) return CommitResult::StaleLease;

  // Entering a new stage starts a fresh attempt budget.
  const bool newStage = to == WorkState::Fetched || to == WorkState::Delivered;

  Stmt upd(db_, R"SQL(
    UPDATE work_items
    SET state = ?, lease_owner = NULL, lease_expires_at = NULL,
        content_ref = COALESCE(?, content_ref),
        content_hash = COALESCE(?, content_hash),
        destination_id = COALESCE(?, destination_id),
        last_error = ?,
        attempt_count = CASE WHEN ? THEN 0 ELSE attempt_count END,
        updated_at = ?
    WHERE source_id = ?
  )SQL");
  upd.bind(1, toString(to))
     .bind(2, fields.content_ref)
     .bind(3, fields.content_hash)
     .bind(4, fields.destination_id)
     .bind(5, fields.last_error)
     .bind(6, static_cast<int64_t>(newStage))
     .bind(7, at)
     .bind(8, sourceId);
  upd.step();

  appendHistory(db_, sourceId, TransitionKind::Commit, expected, to, at, owner,
                fields.last_error.value_or(""));
  tx.commit();
  return CommitResult::Committed;
}

CommitResult WorkItemStore::fail(const std::string& sourceId,
                                 const std::string& owner,
                                 WorkState expected,
                                 WorkState failureState,
                                 const std::string& error,
                                 bool permanent) {
  if (!isAllowed(TransitionKind::Fail, expected, failureState))
    throw std::invalid_argument("illegal fail " + toString(expected) + " -> " + toString(failureState));

  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t at = now();
  Transaction tx(db_);

  if (!leaseHeld(db_, sourceId, owner, expected)) return CommitResult::StaleLease;

  Stmt upd(db_, R"SQL(
    UPDATE work_items
    SET state = ?, lease_owner = NULL, lease_expires_at = NULL,
        attempt_count = attempt_count + 1,
        terminal = ?,
        last_error = ?,
        updated_at = ?
    WHERE source_id = ?
  )SQL");
  upd.bind(1, toString(failureState))
     .bind(2, static_cast<int64_t>(permanent && isFailure(failureState)))
     .bind(3, error)
     .bind(4, at)
     .bind(5, sourceId);
  upd.step();

  appendHistory(db_, sourceId, TransitionKind::Fail, expected, failureState, at, owner, error);
  tx.commit();
  return CommitResult::Committed;
}

int64_t WorkItemStore::reclaimExpired(int64_t now) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);

  int64_t reclaimed = 0;
  for (const auto& t : transitionTable()) {
    if (t.kind != TransitionKind::Reclaim) continue;

    Stmt hist(db_, R"SQL(
      INSERT INTO item_history (source_id, kind, from_state, to_state, at, actor, details)
      SELECT source_id, 'reclaim', ?1, ?2, ?3, 'recovery', 'lease of ' || lease_owner || ' expired'
      FROM work_items
      WHERE state = ?1 AND lease_expires_at < ?3
    )SQL");
    hist.bind(1, toString(t.from)).bind(2, toString(t.to)).bind(3, now);
    hist.step();

    Stmt upd(db_, R"SQL(
      UPDATE work_items
      SET state = ?2, lease_owner = NULL, lease_expires_at = NULL, updated_at = ?3
      WHERE state = ?1 AND lease_expires_at < ?3
    )SQL");
    upd.bind(1, toString(t.from)).bind(2, toString(t.to)).bind(3, now);
    upd.step();
    reclaimed += sqlite3_changes(db_);
  }

  tx.commit();
  return reclaimed;
}

int64_t WorkItemStore::requeueFailed(WorkState failureState,
                                     int maxAttempts,
                                     const RetryBackoff& backoff,
                                     int64_t now) {
  auto retryState = retryStateOf(failureState);
  if (!retryState) throw std::invalid_argument("no retry edge from " + toString(failureState));

  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);

  std::vector<std::string> due;
  {
    Stmt sel(db_, R"SQL(
      SELECT source_id, attempt_count, updated_at FROM work_items
      WHERE state = ? AND terminal = 0 AND attempt_count < ?
      ORDER BY updated_at, source_id
    )SQL");
    sel.bind(1, toString(failureState)).bind(2, static_cast<int64_t>(maxAttempts));
    while (sel.step()) {
      const int64_t waitedMs = (now - sel.int64(2)) * 1000;
      if (waitedMs >= backoff.delayFor(sel.int64(1)).count()) due.push_back(sel.text(0));
    }
  }

  for (const auto& id : due) {
    Stmt upd(db_, "UPDATE work_items SET state = ?, updated_at = ? WHERE source_id = ? AND state = ?");
    upd.bind(1, toString(*retryState)).bind(2, now).bind(3, id).bind(4, toString(failureState));
    upd.step();
    appendHistory(db_, id, TransitionKind::Requeue, failureState, *retryState, now, "scheduler", "");
  }

  tx.commit();
  return static_cast<int64_t>(due.size());
}

std::optional<WorkItem> WorkItemStore::get(const std::string& sourceId) {
  std::lock_guard<std::mutex> lock(mutex_);
  Stmt st(db_, std::string("SELECT ") + kItemColumns + " FROM work_items WHERE source_id = ?");
  st.bind(1, sourceId);
  if (!st.step()) return std::nullopt;
  return readItem(st);
}

std::map<WorkState, int64_t> WorkItemStore::countByState() {
  std::map<WorkState, int64_t> counts;
  for (WorkState s : allWorkStates()) counts[s] = 0;

  std::lock_guard<std::mutex> lock(mutex_);
  Stmt st(db_, "SELECT state, COUNT(*) FROM work_items GROUP BY state");
  while (st.step()) counts[parseWorkState(st.text(0))] = st.int64(1);
  return counts;
}

std::vector<WorkItem> WorkItemStore::listPermanentFailures(const FailureLimits& limits) {
  std::lock_guard<std::mutex> lock(mutex_);
  Stmt st(db_, std::string("SELECT ") + kItemColumns + " FROM work_items WHERE " +
               permanentFailureClause() + " ORDER BY source_id");
  st.bind(1, static_cast<int64_t>(limits.fetchMaxAttempts))
    .bind(2, static_cast<int64_t>(limits.deliverMaxAttempts));
  std::vector<WorkItem> out;
  while (st.step()) out.push_back(readItem(st));
  return out;
}

std::vector<WorkItem> WorkItemStore::listLeftoverArtifacts() {
  std::lock_guard<std::mutex> lock(mutex_);
  Stmt st(db_, std::string("SELECT ") + kItemColumns +
               " FROM work_items WHERE state = 'DONE' AND last_error IS NOT NULL ORDER BY source_id");
  std::vector<WorkItem> out;
  while (st.step()) out.push_back(readItem(st));
  return out;
}

std::vector<HistoryEntry> WorkItemStore::history(const std::string& sourceId) {
  std::lock_guard<std::mutex> lock(mutex_);
  Stmt st(db_, R"SQL(
    SELECT id, source_id, kind, from_state, to_state, at, actor, details
    FROM item_history WHERE source_id = ? ORDER BY id
  )SQL");
  st.bind(1, sourceId);

  std::vector<HistoryEntry> out;
  while (st.step()) {
    HistoryEntry h;
    h.id = st.int64(0);
    h.source_id = st.text(1);
    const std::string kind = st.text(2);
    for (auto k : {TransitionKind::Register, TransitionKind::Claim, TransitionKind::Commit,
                   TransitionKind::Fail, TransitionKind::Reclaim, TransitionKind::Requeue}) {
      if (toString(k) == kind) h.kind = k;
    }
    if (auto from = st.optText(3)) h.from = parseWorkState(*from);
    h.to = parseWorkState(st.text(4));
    h.at = st.int64(5);
    h.actor = st.text(6);
    h.details = st.text(7);
    out.push_back(std::move(h));
  }
  return out;
}

bool WorkItemStore::isComplete(const FailureLimits& limits) {
  std::lock_guard<std::mutex> lock(mutex_);
  Stmt st(db_, "SELECT COUNT(*) FROM work_items WHERE state <> 'DONE' AND NOT " +
               permanentFailureClause());
  st.bind(1, static_cast<int64_t>(limits.fetchMaxAttempts))
    .bind(2, static_cast<int64_t>(limits.deliverMaxAttempts));
  st.step();
  return st.int64(0) == 0;
}

} // namespace mmig
