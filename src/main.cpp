// src/main.cpp
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/auth/CredentialProvider.hpp"
#include "core/auth/ManagedIdentityAuthenticator.hpp"
#include "core/db/ConnectionConfig.hpp"
#include "core/db/InitDb.hpp"
#include "core/db/SessionManager.hpp"
#include "core/jobs/BatchRunRecorder.hpp"
#include "core/jobs/ImagePath.hpp"
#include "core/jobs/JobStateStore.hpp"
#include "core/jobs/Orchestrator.hpp"
#include "core/util/Env.hpp"
#include "core/util/Time.hpp"
#include "services/manifest/Manifest.hpp"

using namespace pjt;

// ---------- helpers ----------

// PJT_DB_CONFIG points at a database.json; otherwise PJT_DB_* variables.
static ConnectionConfig loadConfig() {
  const std::string file = get_env_or("PJT_DB_CONFIG", "");
  if (!file.empty()) return load_connection_config_file(file);
  return load_connection_config_env();
}

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const std::string fromEnv = get_env_or("PJT_SCHEMA_PATH", "");
  if (!fromEnv.empty()) return fromEnv;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/db/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw ConfigurationError("schema.sql not found (looked in CWD and src/core/db)");
}

static std::unique_ptr<SessionManager> connect(const ConnectionConfig& cfg) {
  std::shared_ptr<CredentialProvider> credentials;
  if (cfg.mode == ConnectionMode::ManagedIdentity) {
    ManagedIdentityAuthenticator::Options opts;
    opts.timeoutSeconds = cfg.auth_timeout_seconds;
    credentials = std::make_shared<CredentialProvider>(
      std::make_shared<ManagedIdentityAuthenticator>(opts), cfg.client_id);
  }
  return SessionManager::create(cfg, std::move(credentials));
}

static int runManifest(const std::string& manifestPath) {
  const bool report = env_flag("PJT_REPORT", false);
  RunMetadata meta;
  meta.run_id             = get_env_or("PJT_RUN_ID", "");
  meta.start_time         = current_timestamp();
  meta.model              = model_name_from_weights(get_env_or("PJT_MODEL_PATH", ""));
  meta.reporting_required = report;

  ConnectionConfig cfg;
  try {
    cfg = loadConfig();
  } catch (const ConfigurationError& e) {
    if (report) throw ConfigurationError(std::string("Please provide database credentials: ") + e.what());
    throw;
  }

  std::unique_ptr<SessionManager> sessions = connect(cfg);
  const JobStateStore store(parse_claim_policy(get_env_or("PJT_CLAIM_POLICY", "")));

  BatchRunRecorder recorder(meta, report ? sessions.get() : nullptr, store);

  OrchestratorOptions opts;
  opts.customer   = get_env_or("PJT_CUSTOMER", "");
  opts.run_id     = meta.run_id;
  opts.model      = meta.model;
  opts.start_time = meta.start_time;
  opts.resumable  = env_flag("PJT_RESUME", true);
  opts.report_run = report;

  const RunSummary summary = run_manifest(manifestPath, recorder, *sessions, store, opts);

  std::cout << "processed " << summary.processed << " of " << summary.seen
            << " images (" << summary.skipped << " already done, "
            << summary.conflicts << " claimed elsewhere)\n";
  return 0;
}

static int listCompleted(const std::string& customer) {
  std::unique_ptr<SessionManager> sessions = connect(loadConfig());
  const JobStateStore store;
  const auto done = sessions->unitOfWork([&](Session& s) {
    return store.queryCompleted(s, customer, {ProcessingStatus::Processed});
  });
  for (const CompletedImage& c : done) std::cout << c.upload_date << "/" << c.filename << "\n";
  return 0;
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init                    # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --run <manifest.json>     # record a detection run (PJT_CUSTOMER, PJT_RUN_ID, ...)\n"
            << "  " << argv0 << " --completed <customer>    # list processed images\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    spdlog::set_level(spdlog::level::from_str(get_env_or("PJT_LOG_LEVEL", "info")));

    const std::string cmd = argc > 1 ? argv[1] : "";

    if (cmd == "--init") {
      const ConnectionConfig cfg = loadConfig();
      initDatabase(cfg.database, findSchemaPath());
      std::cout << "DB initialized at: " << cfg.database << "\n";
      return 0;
    }
    if (cmd == "--run" && argc > 2) return runManifest(argv[2]);
    if (cmd == "--completed" && argc > 2) return listCompleted(argv[2]);

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
