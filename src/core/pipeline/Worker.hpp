#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <string>
#include <thread>

#include "core/metadata/WorkItemStore.hpp"

namespace mmig {

// Shared by all loops of one run. A fatal store failure in any of them
// marks the run failed and makes every loop exit.
class RunState {
public:
  void fail(const std::string& why);
  bool failed() const { return failed_.load(); }
  std::string failure() const;

private:
  std::atomic<bool> failed_{false};
  mutable std::mutex mutex_;
  std::string failure_;
};

// How to open this loop's own store connection.
struct StoreOptions {
  std::string dbPath;
  WorkItemStore::Clock clock;
};

// Exponential idle backoff between empty rounds.
struct Pace {
  std::chrono::milliseconds idleMin{100};
  std::chrono::milliseconds idleMax{30000};
};

// Arguments of claimBatch for one pool.
struct ClaimOptions {
  int batchSize = 8;
  std::chrono::seconds lease{300};
};

// A named loop on its own thread with its own store connection. work() is
// called repeatedly; after a round without progress the loop sleeps with
// exponential backoff until stop() wakes it.
//
// Owners must stop() and join() before destroying a started worker.
class Worker {
public:
  Worker(std::string name, const StoreOptions& storeOptions, RunState& runState, Pace pace = {});
  virtual ~Worker();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  void start();
  void stop();
  void join();

  // One round on the caller's thread. StoreError propagates.
  bool runOnce() { return work(); }

  const std::string& name() const { return name_; }
  // Seconds since the last round that made progress (or since start).
  int64_t idleSeconds() const;

protected:
  // Returns true if the round made progress.
  virtual bool work() = 0;
  virtual std::chrono::milliseconds nextDelay(bool worked);

  bool stopping() const { return exit_.load() || runState_.failed(); }

  // "<ExceptionType>: <what>" for last_error and logs.
  static std::string describe(const std::exception& e);

  WorkItemStore store_;
  RunState& runState_;

private:
  void run();

  std::string name_;
  Pace pace_;
  std::chrono::milliseconds backoff_;
  std::atomic<bool> exit_{false};
  std::atomic<int64_t> lastWorked_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
};

} // namespace mmig
