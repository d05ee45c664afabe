#include "Worker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

#include "core/Errors.hpp"

namespace mmig {

namespace {

int64_t steadySeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace

void RunState::fail(const std::string& why) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (failed_.load()) return;
  failure_ = why;
  failed_.store(true);
}

std::string RunState::failure() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_;
}

Worker::Worker(std::string name, const StoreOptions& storeOptions, RunState& runState, Pace pace)
  : store_(storeOptions.dbPath, storeOptions.clock),
    runState_(runState),
    name_(std::move(name)),
    pace_(pace),
    backoff_(pace.idleMin),
    lastWorked_(steadySeconds()) {}

Worker::~Worker() {
  if (thread_.joinable()) {
    stop();
    thread_.join();
  }
}

void Worker::start() {
  if (thread_.joinable()) return;
  exit_.store(false);
  lastWorked_.store(steadySeconds());
  thread_ = std::thread([this] { run(); });
}

void Worker::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    exit_.store(true);
  }
  cv_.notify_all();
}

void Worker::join() {
  if (thread_.joinable()) thread_.join();
}

int64_t Worker::idleSeconds() const { return steadySeconds() - lastWorked_.load(); }

std::chrono::milliseconds Worker::nextDelay(bool worked) {
  if (worked) {
    backoff_ = pace_.idleMin;
    return std::chrono::milliseconds(0);
  }
  auto d = backoff_;
  backoff_ = std::min(backoff_ * 2, pace_.idleMax);
  return d;
}

std::string Worker::describe(const std::exception& e) {
  const char* kind = "Error";
  if (dynamic_cast<const PermanentAdapterError*>(&e)) kind = "PermanentAdapterError";
  else if (dynamic_cast<const IntegrityError*>(&e)) kind = "IntegrityError";
  else if (dynamic_cast<const TransientAdapterError*>(&e)) kind = "TransientAdapterError";
  return std::string(kind) + ": " + e.what();
}

void Worker::run() {
  spdlog::info("{} started", name_);
  while (!stopping()) {
    bool worked = false;
    try {
      worked = work();
    } catch (const StoreError& e) {
      spdlog::critical("{}: store failure, stopping run: {}", name_, e.what());
      runState_.fail(name_ + ": " + e.what());
      break;
    } catch (const std::exception& e) {
      spdlog::warn("{} round failed: {}", name_, e.what());
    }

    if (worked) lastWorked_.store(steadySeconds());

    const auto delay = nextDelay(worked);
    if (delay.count() > 0) {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait_for(lock, delay, [this] { return exit_.load(); });
    }
  }
  spdlog::info("{} stopped", name_);
}

} // namespace mmig
