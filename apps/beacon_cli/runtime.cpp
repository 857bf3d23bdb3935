#include "runtime.h"

#include "beacon/domain/profile_json.h"
#include "beacon/storage/inmemory_connection_repository.h"
#include "beacon/storage/inmemory_profile_repository.h"
#include "beacon/storage/sqlite/sqlite_audit_log.h"
#include "beacon/storage/sqlite/sqlite_connection_repository.h"
#include "beacon/storage/sqlite/sqlite_profile_repository.h"

#include <iostream>

namespace beacon::cli {

namespace {

// Returns the number of dataset records skipped as invalid.
core::Result<std::size_t, std::string> import_files(const StoreSettings& settings,
                                                    storage::IProfileRepository& profiles) {
  using R = core::Result<std::size_t, std::string>;

  if (!settings.providers_path.has_value() && !settings.seekers_path.has_value()) {
    return R::ok(0);
  }
  if (!settings.providers_path.has_value() || !settings.seekers_path.has_value()) {
    return R::err("--providers and --seekers must be given together");
  }

  auto dataset = domain::load_dataset(*settings.providers_path, *settings.seekers_path);
  if (!dataset.has_value()) {
    return R::err(dataset.error());
  }
  for (const auto& rejected : dataset.value().rejected) {
    std::cerr << "WARNING: skipped " << domain::describe(rejected) << "\n";
  }
  for (const auto& provider : dataset.value().providers) {
    if (!profiles.upsert_provider(provider).has_value()) {
      return R::err("failed to store provider " + provider.provider_id.value);
    }
  }
  for (const auto& seeker : dataset.value().seekers) {
    if (!profiles.upsert_seeker(seeker).has_value()) {
      return R::err("failed to store seeker " + seeker.seeker_id.value);
    }
  }
  return R::ok(dataset.value().rejected.size());
}

}  // namespace

core::Result<std::shared_ptr<Workspace>, std::string> Workspace::open(
    const StoreSettings& settings) {
  using R = core::Result<std::shared_ptr<Workspace>, std::string>;

  std::shared_ptr<Workspace> ws(new Workspace());

  if (settings.db_path.has_value()) {
    auto db_result = storage::sqlite::SqliteDb::open(*settings.db_path);
    if (!db_result.has_value()) {
      return R::err(db_result.error());
    }
    ws->db_ = db_result.value();

    auto schema_result = ws->db_->ensure_schema_v2();
    if (!schema_result.has_value()) {
      return R::err("Failed to initialize schema: " + schema_result.error());
    }

    ws->profiles_ = std::make_unique<storage::sqlite::SqliteProfileRepository>(ws->db_);
    ws->connections_ = std::make_unique<storage::sqlite::SqliteConnectionRepository>(ws->db_);
    ws->audit_log_ = std::make_unique<storage::sqlite::SqliteAuditLog>(ws->db_);
  } else {
    ws->profiles_ = std::make_unique<storage::InMemoryProfileRepository>();
    ws->connections_ = std::make_unique<storage::InMemoryConnectionRepository>();
    ws->audit_log_ = std::make_unique<storage::InMemoryAuditLog>();
  }

  ws->services_ = std::make_unique<core::Services>(*ws->profiles_, *ws->connections_,
                                                   *ws->audit_log_);

  auto imported = import_files(settings, *ws->profiles_);
  if (!imported.has_value()) {
    return R::err(imported.error());
  }
  ws->rejected_records_ = imported.value();

  if (!ws->persistent()) {
    std::cerr << "WARNING: no --db given; connections and audit events last for this run only\n";
  }
  return R::ok(std::move(ws));
}

ScoringStack::ScoringStack(const std::optional<goals::ReasoningClientConfig>& client_config,
                           goals::RetryPolicy policy) {
  if (client_config.has_value()) {
    client_ = std::make_unique<goals::HttpReasoningClient>(*client_config);
    remote_ =
        std::make_unique<goals::RemoteGoalEstimator>(*client_, scorer_.tables(), policy);
  }
  fallback_ = std::make_unique<goals::FallbackGoalEstimator>(remote_.get());
}

core::Result<std::shared_ptr<ScoringStack>, std::string> build_scoring_stack(
    const ReasoningSettings& settings) {
  using R = core::Result<std::shared_ptr<ScoringStack>, std::string>;

  auto client_config = to_client_config(settings);
  if (!client_config.has_value()) {
    return R::err(client_config.error());
  }

  const auto& config = client_config.value();
  if (config.has_value()) {
    std::cerr << "Reasoning service: " << config->host << ":" << config->port << config->path
              << " (model " << config->model << ")\n";
  } else {
    std::cerr << "WARNING: no reasoning service configured; goal alignment uses the heuristic\n";
  }

  return R::ok(std::make_shared<ScoringStack>(config, to_retry_policy(settings)));
}

}  // namespace beacon::cli
