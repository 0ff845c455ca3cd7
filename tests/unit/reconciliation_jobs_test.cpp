#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/jobs/health_check_job.hpp"
#include "internal/jobs/provisioning_requeue_job.hpp"
#include "internal/jobs/recovery_job.hpp"
#include "internal/jobs/terminator_job.hpp"
#include "internal/jobs/watch_dog_job.hpp"
#include "internal/model/action_type.hpp"
#include "internal/model/error_codes.hpp"
#include "internal/worker/worker_auth.hpp"
#include "tests/support/fleet_test_env.hpp"

namespace {

using fleet::config::JobSettings;
using fleet::jobs::HealthCheckJob;
using fleet::jobs::ProvisioningRequeueJob;
using fleet::jobs::RecoveryJob;
using fleet::jobs::TerminatorJob;
using fleet::jobs::WatchDogJob;
using fleet::model::InstanceStatus;
using fleet::provider::ProviderCode;
using fleet::testing::TestEnv;

namespace action = fleet::model::action;
namespace error  = fleet::model::error_code;

constexpr std::int64_t kSecond = 1000;

bool Contains(const std::vector<std::string>& values, std::string_view value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

void MoveToReady(TestEnv& env, const std::string& id) {
  env.Move(id, InstanceStatus::kBooting, InstanceStatus::kInstalling);
  env.Move(id, InstanceStatus::kInstalling, InstanceStatus::kStarting);
  env.Move(id, InstanceStatus::kStarting, InstanceStatus::kReady);
}

// --- health check -------------------------------------------------------

void TestHealthCheckAdvancesOnProbes() {
  TestEnv        env;
  HealthCheckJob job(env.JobCtx(), JobSettings{});
  const auto     id = env.Provision();

  // nothing answers yet
  assert(job.RunOnce() == 1);
  auto row = env.Get(id);
  assert(row.status == InstanceStatus::kBooting);
  assert(row.health_check_failures == 1);

  // the lease keeps the row out of the next immediate tick
  env.probe->reachable = true;
  assert(job.RunOnce() == 0);

  env.Advance(11 * kSecond);
  assert(job.RunOnce() == 1);
  assert(env.Get(id).status == InstanceStatus::kInstalling);

  env.probe->readyz       = true;
  env.probe->model_listed = true;
  env.Advance(11 * kSecond);
  job.RunOnce();

  row = env.Get(id);
  assert(row.status == InstanceStatus::kReady);
  assert(row.ready_at_ms == env.Now());

  const auto done = env.recorder->CompletedActions(id);
  assert(Contains(done, action::kWorkerInstall));
  assert(Contains(done, action::kWorkerHttpReady));
  assert(Contains(done, action::kWorkerModelLoaded));
  assert(Contains(done, action::kHealthCheckPass));

  // ready rows are no longer claimed
  env.Advance(11 * kSecond);
  assert(job.RunOnce() == 0);
}

void TestHealthCheckTrustsFreshHeartbeat() {
  TestEnv        env;
  HealthCheckJob job(env.JobCtx(), JobSettings{});
  const auto     id = env.Provision("llama-3-8b");

  env.Heartbeat(id, "ready", "other-model");
  job.RunOnce();
  // the worker serves a different model, so it stops short of ready
  assert(env.Get(id).status == InstanceStatus::kStarting);

  env.Advance(11 * kSecond);
  env.Heartbeat(id, "ready", "llama-3-8b");
  job.RunOnce();
  assert(env.Get(id).status == InstanceStatus::kReady);
}

void TestHealthCheckIgnoresStaleHeartbeat() {
  TestEnv        env;
  HealthCheckJob job(env.JobCtx(), JobSettings{});
  const auto     id = env.Provision();

  env.Heartbeat(id, "ready", "llama-3-8b");
  env.Advance(31 * kSecond);
  job.RunOnce();
  assert(env.Get(id).status == InstanceStatus::kBooting);
}

void TestHealthCheckFetchesMissingIp() {
  TestEnv env;
  env.mock->SetIpDelayPolls(100);
  HealthCheckJob job(env.JobCtx(), JobSettings{});
  const auto     id = env.Provision();
  assert(env.Get(id).ip_address.empty());

  env.probe->reachable = true;
  job.RunOnce();
  assert(env.Get(id).status == InstanceStatus::kBooting);

  env.mock->SetIpDelayPolls(0);
  env.Advance(11 * kSecond);
  job.RunOnce();

  auto row = env.Get(id);
  assert(!row.ip_address.empty());
  assert(row.status == InstanceStatus::kInstalling);
  assert(Contains(env.recorder->CompletedActions(id), action::kProviderGetIp));
}

void TestHealthCheckTimesOutBootAndModelLoad() {
  TestEnv        env;
  HealthCheckJob job(env.JobCtx(), JobSettings{});

  const auto booting = env.Provision();
  const auto loading = env.Provision();
  env.Move(loading, InstanceStatus::kBooting, InstanceStatus::kInstalling);
  env.Move(loading, InstanceStatus::kInstalling, InstanceStatus::kStarting);

  env.Advance(env.lifecycle.model_load_timeout_seconds * kSecond + kSecond);
  job.RunOnce();
  assert(env.Get(booting).status == InstanceStatus::kBooting);
  auto row = env.Get(loading);
  assert(row.status == InstanceStatus::kStartupFailed);
  assert(row.error_code == error::kModelLoadTimeout);

  env.Advance(env.lifecycle.boot_timeout_seconds * kSecond);
  job.RunOnce();
  row = env.Get(booting);
  assert(row.status == InstanceStatus::kStartupFailed);
  assert(row.error_code == error::kStartupTimeout);
  assert(row.error_message.rfind("booting for ", 0) == 0);
}

void TestStartupFailedSelfHealsWithinBudget() {
  TestEnv env;
  env.lifecycle.startup_recovery_max_attempts = 1;
  HealthCheckJob job(env.JobCtx(), JobSettings{});

  const auto id = env.Provision();
  env.Move(id, InstanceStatus::kBooting, InstanceStatus::kStartupFailed);

  // no heartbeat, no recovery
  job.RunOnce();
  assert(env.Get(id).status == InstanceStatus::kStartupFailed);

  env.Advance(11 * kSecond);
  env.Heartbeat(id, "starting", "");
  job.RunOnce();
  auto row = env.Get(id);
  assert(row.status == InstanceStatus::kBooting);
  assert(row.startup_recoveries == 1);

  env.Move(id, InstanceStatus::kBooting, InstanceStatus::kStartupFailed);
  env.Advance(11 * kSecond);
  env.Heartbeat(id, "starting", "");
  job.RunOnce();
  assert(env.Get(id).status == InstanceStatus::kStartupFailed);
}

void TestHealthCheckFailsAfterConsecutiveFailures() {
  TestEnv env;
  env.lifecycle.health_check_max_failures = 3;
  HealthCheckJob job(env.JobCtx(), JobSettings{});
  const auto     id = env.Provision();

  assert(job.RunOnce() == 1);
  env.Advance(11 * kSecond);
  assert(job.RunOnce() == 1);
  assert(env.Get(id).health_check_failures == 2);

  // progress resets the streak
  env.probe->reachable = true;
  env.Advance(11 * kSecond);
  assert(job.RunOnce() == 1);
  auto row = env.Get(id);
  assert(row.status == InstanceStatus::kInstalling);
  assert(row.health_check_failures == 0);

  for (int i = 0; i < 3; ++i) {
    env.Advance(11 * kSecond);
    assert(job.RunOnce() == 1);
  }
  row = env.Get(id);
  assert(row.status == InstanceStatus::kStartupFailed);
  assert(row.error_code == error::kHealthCheckFailed);
  assert(row.error_message == "3 consecutive failed health checks");
}

// --- terminator ---------------------------------------------------------

void TestTerminatorFinishesTermination() {
  TestEnv       env;
  TerminatorJob job(env.JobCtx(), JobSettings{});

  const auto id = env.Provision("llama", 10);
  env.Move(id, InstanceStatus::kBooting, InstanceStatus::kTerminating);

  // the provisioning claim still holds the reconciliation lease
  assert(job.RunOnce() == 0);

  env.Advance(31 * kSecond);
  env.mock->FailNext("delete", ProviderCode::kNotFound);
  assert(job.RunOnce() == 1);
  assert(env.Get(id).status == InstanceStatus::kTerminating);

  // pending rows give their lease back right away
  assert(job.RunOnce() == 1);
  auto row = env.Get(id);
  assert(row.status == InstanceStatus::kTerminated);
  assert(!env.mock->ServerExists(row.provider_instance_id));
  for (const auto& volume : env.Volumes(id)) {
    assert(volume.status == fleet::model::VolumeStatus::kDeleted);
  }
}

void TestTerminatorSkipsRowsNeedingManualIntervention() {
  TestEnv env;
  env.lifecycle.terminate_max_attempts = 1;
  env.Rebuild();
  TerminatorJob job(env.JobCtx(), JobSettings{});

  const auto id = env.Provision();
  env.Move(id, InstanceStatus::kBooting, InstanceStatus::kTerminating);
  env.mock->FailNext("delete", ProviderCode::kTransient, 10);

  env.Advance(31 * kSecond);
  assert(job.RunOnce() == 1);
  auto row = env.Get(id);
  assert(row.termination_attempts == 1);
  assert(row.error_code == error::kTerminationManual);

  env.Advance(31 * kSecond);
  assert(job.RunOnce() == 0);
}

// --- watch-dog ----------------------------------------------------------

void TestWatchDogDetectsOutOfBandDeletion() {
  TestEnv     env;
  WatchDogJob job(env.JobCtx(), JobSettings{});

  const auto id = env.Provision();
  MoveToReady(env, id);
  fleet::worker::WorkerAuth auth(env.repository, env.clock);
  {
    auto tx = env.repository->Begin();
    auth.Issue(*tx, id);
    tx->Commit();
  }

  env.Advance(61 * kSecond);
  assert(job.RunOnce() == 1);
  assert(env.Get(id).status == InstanceStatus::kReady);

  env.mock->DeleteOutOfBand(env.Get(id).provider_instance_id);
  env.Advance(61 * kSecond);
  assert(job.RunOnce() == 1);

  auto row = env.Get(id);
  assert(row.status == InstanceStatus::kTerminated);
  assert(row.deleted_by_provider);
  assert(row.deletion_reason == "provider_deleted");
  assert(row.error_code == error::kProviderDeleted);

  auto tx = env.repository->Begin();
  assert(env.repository->GetWorkerToken(*tx, id)->revoked_at_ms == env.Now());
}

void TestWatchDogImportsUntrackedVolumes() {
  TestEnv     env;
  WatchDogJob job(env.JobCtx(), JobSettings{});

  env.mock->FailNext("list_volumes", ProviderCode::kTransient);
  const auto id = env.Provision("llama", 20);
  assert(env.Volumes(id).empty());
  MoveToReady(env, id);

  env.Advance(61 * kSecond);
  job.RunOnce();
  auto volumes = env.Volumes(id);
  assert(volumes.size() == 2);
  for (const auto& volume : volumes) {
    assert(volume.delete_on_terminate);
  }
}

void TestWatchDogReleasesLeaseOnProviderError() {
  TestEnv     env;
  WatchDogJob job(env.JobCtx(), JobSettings{});

  const auto id = env.Provision();
  MoveToReady(env, id);

  env.Advance(61 * kSecond);
  env.mock->FailNext("exists", ProviderCode::kTransient);
  assert(job.RunOnce() == 1);
  assert(job.RunOnce() == 1);
  assert(env.mock->CallCount("exists") == 2);
  assert(job.RunOnce() == 0);
  assert(env.Get(id).status == InstanceStatus::kReady);
}

void TestWatchDogReleasesLeaseWithoutProvider() {
  TestEnv     env;
  WatchDogJob job(env.JobCtx(), JobSettings{});

  fleet::db::model::InstanceRecord record;
  record.id                   = "orphan";
  record.provider_code        = "retired";
  record.zone                 = "retired-zone";
  record.instance_type        = "GPU";
  record.provider_instance_id = "srv-retired";
  record.status               = InstanceStatus::kReady;
  record.created_at_ms        = env.Now();
  {
    auto tx = env.repository->Begin();
    assert(env.repository->InsertInstance(*tx, record));
    tx->Commit();
  }

  assert(job.RunOnce() == 1);
  assert(env.Get("orphan").last_reconciliation_ms == 0);
  // released, so the next tick sees it again
  assert(job.RunOnce() == 1);
  assert(env.Get("orphan").status == InstanceStatus::kReady);
}

// --- provisioning requeue ----------------------------------------------

void TestRequeuePicksUpDroppedProvision() {
  TestEnv                env;
  ProvisioningRequeueJob job(env.JobCtx(), JobSettings{});

  fleet::orchestrator::v1::ProvisionCommand command;
  command.set_provider_code("mock");
  command.set_zone("mock-zone-1");
  command.set_instance_type("MOCK-GPU-S");
  const auto id = env.workflows->CreateInstanceRow(command);

  // too young to requeue
  assert(job.RunOnce() == 0);

  env.Advance(31 * kSecond);
  assert(job.RunOnce() == 1);
  auto row = env.Get(id);
  assert(row.status == InstanceStatus::kBooting);
  assert(row.retry_count == 1);
}

void TestRequeueRetriesTransientFailures() {
  TestEnv                env;
  ProvisioningRequeueJob job(env.JobCtx(), JobSettings{});

  env.mock->FailNext("create", ProviderCode::kTransient);
  const auto id = env.Provision();
  assert(env.Get(id).status == InstanceStatus::kProvisioning);

  env.Advance(31 * kSecond);
  job.RunOnce();
  assert(env.Get(id).status == InstanceStatus::kBooting);
  assert(env.mock->ServerCount() == 1);
}

void TestRequeueExhaustsRetries() {
  TestEnv env;
  env.lifecycle.provisioning_max_retries = 1;
  env.Rebuild();
  ProvisioningRequeueJob job(env.JobCtx(), JobSettings{});

  env.mock->FailNext("create", ProviderCode::kTransient, 10);
  const auto id = env.Provision();

  env.Advance(31 * kSecond);
  job.RunOnce();
  auto row = env.Get(id);
  assert(row.status == InstanceStatus::kProvisioningFailed);
  assert(row.error_code == error::kProvisioningRetriesExhausted);
  assert(row.retry_count == 1);
}

void TestRequeueFailsRowsAlreadyAtTheLimit() {
  TestEnv env;
  env.lifecycle.provisioning_max_retries = 2;
  ProvisioningRequeueJob job(env.JobCtx(), JobSettings{});

  fleet::orchestrator::v1::ProvisionCommand command;
  command.set_provider_code("mock");
  command.set_zone("mock-zone-1");
  command.set_instance_type("MOCK-GPU-S");
  const auto id = env.workflows->CreateInstanceRow(command);
  {
    auto tx  = env.repository->Begin();
    auto row = env.repository->GetInstance(*tx, id).value();
    row.retry_count = 2;
    assert(env.repository->UpdateInstance(*tx, row, InstanceStatus::kProvisioning));
    tx->Commit();
  }

  env.Advance(31 * kSecond);
  assert(job.RunOnce() == 0);
  auto row = env.Get(id);
  assert(row.status == InstanceStatus::kProvisioningFailed);
  assert(row.error_code == error::kProvisioningRetriesExhausted);
  assert(env.mock->CallCount("create") == 0);
}

// --- recovery -----------------------------------------------------------

void TestRecoveryFailsStuckRows() {
  TestEnv env;
  env.lifecycle.recovery.booting_seconds  = 60;
  env.lifecycle.recovery.draining_seconds = 60;
  RecoveryJob job(env.JobCtx(), JobSettings{});

  const auto booting  = env.Provision();
  const auto draining = env.Provision();
  const auto ready    = env.Provision();
  MoveToReady(env, draining);
  env.Move(draining, InstanceStatus::kReady, InstanceStatus::kDraining);
  MoveToReady(env, ready);

  assert(job.RunOnce() == 0);

  env.Advance(61 * kSecond);
  assert(job.RunOnce() == 2);

  auto row = env.Get(booting);
  assert(row.status == InstanceStatus::kStartupFailed);
  assert(row.error_code == error::kRecoveryTimeout);
  assert(row.error_message == "stuck in booting for 61s");

  row = env.Get(draining);
  assert(row.status == InstanceStatus::kFailed);
  assert(row.error_code == error::kRecoveryTimeout);

  assert(env.Get(ready).status == InstanceStatus::kReady);
  assert(!job.LimitMs(InstanceStatus::kReady));
  assert(*job.LimitMs(InstanceStatus::kBooting) == 60 * kSecond);
}

void TestRecoveryMeasuresFromStateEntry() {
  fleet::db::model::InstanceRecord record;
  record.status        = InstanceStatus::kStarting;
  record.created_at_ms = 100;
  assert(RecoveryJob::EnteredAtMs(record) == 100);
  record.starting_started_at_ms = 500;
  assert(RecoveryJob::EnteredAtMs(record) == 500);
  record.status = InstanceStatus::kProvisioning;
  assert(RecoveryJob::EnteredAtMs(record) == 100);
}

} // namespace

int main() {
  TestHealthCheckAdvancesOnProbes();
  TestHealthCheckTrustsFreshHeartbeat();
  TestHealthCheckIgnoresStaleHeartbeat();
  TestHealthCheckFetchesMissingIp();
  TestHealthCheckTimesOutBootAndModelLoad();
  TestStartupFailedSelfHealsWithinBudget();
  TestHealthCheckFailsAfterConsecutiveFailures();
  TestTerminatorFinishesTermination();
  TestTerminatorSkipsRowsNeedingManualIntervention();
  TestWatchDogDetectsOutOfBandDeletion();
  TestWatchDogImportsUntrackedVolumes();
  TestWatchDogReleasesLeaseOnProviderError();
  TestWatchDogReleasesLeaseWithoutProvider();
  TestRequeuePicksUpDroppedProvision();
  TestRequeueRetriesTransientFailures();
  TestRequeueExhaustsRetries();
  TestRequeueFailsRowsAlreadyAtTheLimit();
  TestRecoveryFailsStuckRows();
  TestRecoveryMeasuresFromStateEntry();

  std::cout << "fleet_unit_reconciliation_jobs: pass\n";
  return 0;
}
