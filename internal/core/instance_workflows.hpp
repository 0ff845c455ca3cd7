#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fleet/orchestrator/v1/commands.pb.h"
#include "internal/config/settings.hpp"
#include "internal/core/action_recorder.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lifecycle/state_machine.hpp"
#include "internal/provider/provider_registry.hpp"
#include "internal/util/time.hpp"

namespace fleet::core {

enum class TerminationResult {
  kTerminated,
  // provider still deleting; retried on a later pass
  kPending,
  // a provider call failed; termination_attempts was bumped
  kFailed,
  // row is not terminating
  kSkipped,
};

struct ReconcileReport {
  std::size_t seen      = 0;
  std::size_t untracked = 0;
  std::size_t zombies   = 0;
};

/*
  InstanceWorkflows

  Provider-driven lifecycle steps shared by the command dispatcher and
  the reconciliation jobs.

  Every step is idempotent: an instance that already moved on is left
  alone, a resource that is already gone counts as deleted. Provider
  calls always run outside store transactions.
*/
class InstanceWorkflows {
 public:
  using Sleeper = std::function<void(std::int64_t ms)>;

  InstanceWorkflows(std::shared_ptr<db::Repository> repository, std::shared_ptr<lifecycle::InstanceStateMachine> state_machine,
                    std::shared_ptr<ActionRecorder> recorder, std::shared_ptr<provider::ProviderRegistry> providers,
                    config::LifecycleSettings settings, util::MillisClock clock, Sleeper sleeper = {});

  // Inserts the provisioning row for a new request and returns its id.
  // Generates an id when the command has none. Throws util::InvalidArgument
  // when provider, zone or instance type are missing.
  std::string CreateInstanceRow(const fleet::orchestrator::v1::ProvisionCommand& command);

  void Provision(const fleet::orchestrator::v1::ProvisionCommand& command);

  // Re-runs provisioning for a row the caller already claimed (requeue job).
  void ResumeProvisioning(const db::model::InstanceRecord& instance);

  void Terminate(const fleet::orchestrator::v1::TerminateCommand& command);

  // One termination pass over a terminating row.
  TerminationResult ProcessTermination(const std::string& instance_id);

  void Reinstall(const fleet::orchestrator::v1::ReinstallCommand& command);

  // Returns the number of catalog rows written.
  std::size_t SyncCatalog(const fleet::orchestrator::v1::SyncCatalogCommand& command);

  ReconcileReport Reconcile(const fleet::orchestrator::v1::ReconcileCommand& command);

  // Tracks provider volumes the store does not know yet, flagged
  // delete-on-terminate. Returns how many were added.
  std::size_t ImportVolumes(const db::model::InstanceRecord& instance, const std::vector<provider::AttachedVolume>& volumes);

 private:
  void RunProvisioning(db::model::InstanceRecord instance);

  // Records a provider failure on a provisioning row; permanent codes fail it.
  void HandleProvisioningFailure(const db::model::InstanceRecord& instance, const provider::ProviderResult& result,
                                 std::string_view stage);

  void FailProvisioning(const std::string& instance_id, std::string_view error_code, const std::string& message);

  using RowGuard = std::function<bool(const db::model::InstanceRecord&)>;

  // Applies `mutate` to the row if it is still in `expected` and `guard`,
  // when given, accepts the locked row. Returns false otherwise.
  bool Patch(const std::string& instance_id, fleet::model::InstanceStatus expected,
             const std::function<void(db::model::InstanceRecord&)>& mutate, const RowGuard& guard = {});

  // Re-stamps the reconciliation lease while provider calls run so the
  // requeue job leaves the row alone. False once the row left provisioning.
  bool RefreshProvisioningLease(const std::string& instance_id);

  void RecordTerminationFailure(const std::string& instance_id, const std::string& message);

  std::optional<db::model::InstanceRecord> Load(const std::string& instance_id);

  std::shared_ptr<db::Repository>                  repository_;
  std::shared_ptr<lifecycle::InstanceStateMachine> state_machine_;
  std::shared_ptr<ActionRecorder>                  recorder_;
  std::shared_ptr<provider::ProviderRegistry>      providers_;
  config::LifecycleSettings                        settings_;
  util::MillisClock                                clock_;
  Sleeper                                          sleeper_;
};

} // namespace fleet::core
