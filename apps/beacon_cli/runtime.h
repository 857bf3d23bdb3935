#pragma once

#include "config.h"

#include "beacon/app/app_service.h"
#include "beacon/core/result.h"
#include "beacon/core/services.h"
#include "beacon/goals/fallback_goal_estimator.h"
#include "beacon/goals/http_reasoning_client.h"
#include "beacon/goals/remote_goal_estimator.h"
#include "beacon/matching/bilateral_scorer.h"
#include "beacon/storage/audit_log.h"
#include "beacon/storage/repositories.h"
#include "beacon/storage/sqlite/sqlite_db.h"

#include <cstddef>
#include <memory>
#include <string>

namespace beacon::cli {

// Workspace owns the stores for one CLI invocation: SQLite when a database
// path is configured, in-memory otherwise. Dataset files are imported on open.
class Workspace {
 public:
  [[nodiscard]] static core::Result<std::shared_ptr<Workspace>, std::string> open(
      const StoreSettings& settings);

  ~Workspace() = default;

  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;
  Workspace(Workspace&&) = delete;
  Workspace& operator=(Workspace&&) = delete;

  [[nodiscard]] core::Services& services() { return *services_; }
  [[nodiscard]] bool persistent() const { return db_ != nullptr; }
  // Dataset records skipped on import because they failed validation.
  [[nodiscard]] std::size_t rejected_records() const { return rejected_records_; }

 private:
  Workspace() = default;

  std::shared_ptr<storage::sqlite::SqliteDb> db_;
  std::unique_ptr<storage::IProfileRepository> profiles_;
  std::unique_ptr<storage::IConnectionRepository> connections_;
  std::unique_ptr<storage::IAuditLog> audit_log_;
  std::unique_ptr<core::Services> services_;
  std::size_t rejected_records_{0};
};

// ScoringStack wires the scorer to the goal estimator chain. Without a
// reasoning client config the chain is the heuristic alone.
class ScoringStack {
 public:
  ScoringStack(const std::optional<goals::ReasoningClientConfig>& client_config,
               goals::RetryPolicy policy);

  ~ScoringStack() = default;

  ScoringStack(const ScoringStack&) = delete;
  ScoringStack& operator=(const ScoringStack&) = delete;
  ScoringStack(ScoringStack&&) = delete;
  ScoringStack& operator=(ScoringStack&&) = delete;

  [[nodiscard]] app::Engine engine() { return app::Engine{scorer_, *fallback_}; }

 private:
  matching::BilateralScorer scorer_;
  std::unique_ptr<goals::HttpReasoningClient> client_;
  std::unique_ptr<goals::RemoteGoalEstimator> remote_;
  std::unique_ptr<goals::FallbackGoalEstimator> fallback_;
};

// build_scoring_stack validates reasoning settings and reports the mode on
// stderr once validation has passed.
[[nodiscard]] core::Result<std::shared_ptr<ScoringStack>, std::string> build_scoring_stack(
    const ReasoningSettings& settings);

}  // namespace beacon::cli
