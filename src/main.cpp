// src/main.cpp
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <string>
#include <iostream>
#include <filesystem>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/adapters/FileCredentialProvider.hpp"
#include "core/adapters/LocalDirDestination.hpp"
#include "core/adapters/LocalDirSource.hpp"
#include "core/config/Config.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/WorkItemStore.hpp"
#include "core/pipeline/Migration.hpp"
#include "services/api/HttpServer.hpp"
#include "services/destination/HttpDestination.hpp"

// ---------- helpers ----------

static std::atomic<bool> g_interrupted{false};

static void on_signal(int) { g_interrupted.store(true); }

// Look for schema.sql in CWD first, then next to the binary's build tree.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in the current directory and src/core/metadata)");
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade the SQLite store\n"
            << "  " << argv0 << " --run         # run the migration until done or signalled\n"
            << "  " << argv0 << " --status      # print counts per state as JSON\n"
            << "  " << argv0 << " --report      # print permanent failures and leftover staging files\n";
}

static int run_migration(const mmig::Config& config) {
  if (config.sourceRoot.empty()) throw std::invalid_argument("MMIG_SOURCE_ROOT is required for --run");
  if (config.destUrl.empty() && config.destRoot.empty())
    throw std::invalid_argument("set MMIG_DEST_URL or MMIG_DEST_ROOT for --run");

  mmig::LocalDirSource source(config.sourceRoot);

  std::unique_ptr<mmig::CredentialProvider> credentials;
  std::unique_ptr<mmig::DestinationAdapter> destination;
  if (!config.destUrl.empty()) {
    credentials = std::make_unique<mmig::FileCredentialProvider>(config.authFile);
    destination = std::make_unique<mmig::HttpDestination>(config.destUrl, *credentials);
    spdlog::info("delivering to {} (collection '{}')", config.destUrl, config.collection);
  } else {
    destination = std::make_unique<mmig::LocalDirDestination>(config.destRoot);
    spdlog::info("delivering to {} (collection '{}')", config.destRoot, config.collection);
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  mmig::RunOutcome outcome;
  {
    mmig::Migration migration(config, source, *destination);

    // declared after the migration so it is stopped and joined first
    std::unique_ptr<mmig::OperatorServer> api;
    if (config.port > 0) {
      api = std::make_unique<mmig::OperatorServer>(config.dbPath, config.failureLimits(), config.apiKey);
      api->start("0.0.0.0", config.port);
    }

    outcome = migration.run(g_interrupted);
    if (outcome == mmig::RunOutcome::Failed)
      spdlog::critical("migration aborted: {}", migration.runState().failure());
  }

  switch (outcome) {
    case mmig::RunOutcome::Completed:   return 0;
    case mmig::RunOutcome::Interrupted: return 0;
    case mmig::RunOutcome::Failed:      return 2;
  }
  return 2;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const mmig::Config config = mmig::loadConfig();
    spdlog::set_level(spdlog::level::from_str(config.logLevel));

    if (argc > 1 && std::string(argv[1]) == "--init") {
      mmig::initDatabase(config.dbPath, findSchemaPath());
      std::cout << "DB initialized at: " << config.dbPath << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--run") {
      // Self-heal DB on startup (idempotent)
      mmig::initDatabase(config.dbPath, findSchemaPath());
      return run_migration(config);
    }

    if (argc > 1 && std::string(argv[1]) == "--status") {
      mmig::WorkItemStore store(config.dbPath);
      std::cout << mmig::progress_json(store, config.failureLimits()) << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--report") {
      mmig::WorkItemStore store(config.dbPath);
      const auto failed = store.listPermanentFailures(config.failureLimits());
      const auto leftovers = store.listLeftoverArtifacts();
      std::cout << "{\"failures\":" << mmig::failures_json(store, config.failureLimits())
                << ",\"leftovers\":" << mmig::leftovers_json(store) << "}\n";
      return failed.empty() && leftovers.empty() ? 0 : 3;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
