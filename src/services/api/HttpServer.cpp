#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/Errors.hpp"

using nlohmann::json;

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static json item_json(const mmig::WorkItem& w) {
  json j = {
    {"source_id", w.source_id},
    {"name", w.name},
    {"state", mmig::toString(w.state)},
    {"attempt_count", w.attempt_count},
    {"terminal", w.terminal},
    {"updated_at", w.updated_at},
  };
  j["last_error"] = w.last_error ? json(*w.last_error) : json(nullptr);
  if (w.content_ref) j["content_ref"] = *w.content_ref;
  if (w.destination_id) j["destination_id"] = *w.destination_id;
  return j;
}

// -------- server --------

namespace mmig {

std::string progress_json(WorkItemStore& store, const FailureLimits& limits) {
  json counts = json::object();
  int64_t total = 0;
  for (const auto& kv : store.countByState()) {
    counts[toString(kv.first)] = kv.second;
    total += kv.second;
  }
  json out = {
    {"counts", counts},
    {"total", total},
    {"complete", store.isComplete(limits)},
  };
  return out.dump();
}

std::string failures_json(WorkItemStore& store, const FailureLimits& limits) {
  json out = json::array();
  for (const auto& w : store.listPermanentFailures(limits)) out.push_back(item_json(w));
  return out.dump();
}

std::string leftovers_json(WorkItemStore& store) {
  json out = json::array();
  for (const auto& w : store.listLeftoverArtifacts()) out.push_back(item_json(w));
  return out.dump();
}

OperatorServer::OperatorServer(const std::string& dbPath, FailureLimits limits, std::string apiKey)
  : store_(dbPath), limits_(limits), apiKey_(std::move(apiKey)), svr_(std::make_unique<httplib::Server>()) {
  auto& svr = *svr_;

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // Handlers run on the server's pool; the store serializes them.
  auto guarded = [this](std::string (*body)(OperatorServer&)) {
    return [this, body](const httplib::Request& req, httplib::Response& res) {
      if (!check_api_key(req, apiKey_, res)) return;
      try {
        res.set_content(body(*this), "application/json");
        res.status = 200;
      } catch (const std::exception& e) {
        spdlog::error("operator query {} failed: {}", req.path, e.what());
        res.status = 503;
        res.set_content("store unavailable", "text/plain");
      }
    };
  };

  svr.Get("/progress", guarded([](OperatorServer& s) { return progress_json(s.store_, s.limits_); }));
  svr.Get("/failures", guarded([](OperatorServer& s) { return failures_json(s.store_, s.limits_); }));
  svr.Get("/leftovers", guarded([](OperatorServer& s) { return leftovers_json(s.store_); }));

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404) res.set_content("not found", "text/plain");
  });
}

OperatorServer::~OperatorServer() { stop(); }

int OperatorServer::start(const std::string& host, int port) {
  if (thread_.joinable()) throw std::logic_error("operator API already started");

  int bound = port;
  if (port == 0) {
    bound = svr_->bind_to_any_port(host);
  } else if (!svr_->bind_to_port(host, port)) {
    bound = -1;
  }
  if (bound < 0) throw std::runtime_error("cannot bind operator API to " + host + ":" + std::to_string(port));

  done_ = false;
  thread_ = std::thread([this] {
    if (!svr_->listen_after_bind()) spdlog::error("operator API stopped listening unexpectedly");
    done_ = true;
  });
  spdlog::info("operator API listening on http://{}:{}", host, bound);
  return bound;
}

void OperatorServer::stop() {
  if (!thread_.joinable()) return;
  // stop() on a server that has not entered its accept loop is a no-op
  while (!svr_->is_running() && !done_) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  svr_->stop();
  thread_.join();
}

} // namespace mmig
