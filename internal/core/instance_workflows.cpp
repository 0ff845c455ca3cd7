#include "instance_workflows.hpp"

#include <chrono>
#include <set>
#include <thread>

#include "internal/core/db_errors.hpp"
#include "internal/model/error_codes.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace fleet::core {

using fleet::model::InstanceStatus;
using fleet::model::VolumeStatus;
using lifecycle::TransitionOutcome;
using lifecycle::TransitionRequest;
using observability::IntField;
using observability::StringField;
using provider::ProviderCode;
using provider::ProviderResult;

namespace action = fleet::model::action;
namespace error  = fleet::model::error_code;

namespace {

void RealSleep(std::int64_t ms) {
  if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::string IpMetadata(const std::string& ip) {
  return "{\"ip_address\":\"" + ip + "\"}";
}

} // namespace

InstanceWorkflows::InstanceWorkflows(std::shared_ptr<db::Repository> repository,
                                     std::shared_ptr<lifecycle::InstanceStateMachine> state_machine,
                                     std::shared_ptr<ActionRecorder> recorder,
                                     std::shared_ptr<provider::ProviderRegistry> providers, config::LifecycleSettings settings,
                                     util::MillisClock clock, Sleeper sleeper)
    : repository_(std::move(repository)),
      state_machine_(std::move(state_machine)),
      recorder_(std::move(recorder)),
      providers_(std::move(providers)),
      settings_(settings),
      clock_(std::move(clock)),
      sleeper_(sleeper ? std::move(sleeper) : Sleeper(RealSleep)) {
}

std::optional<db::model::InstanceRecord> InstanceWorkflows::Load(const std::string& instance_id) {
  auto tx = repository_->Begin();
  return repository_->GetInstance(*tx, instance_id);
}

bool InstanceWorkflows::Patch(const std::string& instance_id, InstanceStatus expected,
                              const std::function<void(db::model::InstanceRecord&)>& mutate, const RowGuard& guard) {
  auto tx      = repository_->Begin();
  auto current = repository_->LockInstance(*tx, instance_id);
  if (!current || current->status != expected || current->is_archived) {
    return false;
  }
  if (guard && !guard(*current)) {
    return false;
  }

  auto record = *current;
  mutate(record);

  auto res = repository_->UpdateInstance(*tx, record, expected);
  if (res.code == db::ErrorCode::Conflict || res.code == db::ErrorCode::Immutable) {
    return false;
  }
  ThrowIfDbError(res, "update instance " + instance_id);
  tx->Commit();
  return true;
}

// ------------------------------------------------------------------
// Provision
// ------------------------------------------------------------------

std::string InstanceWorkflows::CreateInstanceRow(const fleet::orchestrator::v1::ProvisionCommand& command) {
  if (command.provider_code().empty() || command.zone().empty() || command.instance_type().empty()) {
    throw util::InvalidArgument("provision requires provider_code, zone and instance_type");
  }

  db::model::InstanceRecord record;
  record.id             = command.instance_id().empty() ? util::NewId() : command.instance_id();
  record.provider_code  = command.provider_code();
  record.zone           = command.zone();
  record.instance_type  = command.instance_type();
  record.model_id       = command.model_id();
  record.image_id       = command.image_id();
  record.data_volume_gb = command.data_volume_gb();
  record.status         = InstanceStatus::kProvisioning;
  record.created_at_ms  = clock_();

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertInstance(*tx, record), "create instance " + record.id);
  tx->Commit();

  FLEET_LOG_INFO("instance requested", {StringField("instance_id", record.id), StringField("provider", record.provider_code),
                                        StringField("zone", record.zone), StringField("type", record.instance_type),
                                        StringField("model", record.model_id)});
  return record.id;
}

void InstanceWorkflows::Provision(const fleet::orchestrator::v1::ProvisionCommand& command) {
  observability::SpanScope span("workflow.provision");

  std::string instance_id = command.instance_id();
  if (instance_id.empty() || !Load(instance_id)) {
    try {
      instance_id = CreateInstanceRow(command);
    } catch (const util::AlreadyExists&) {
      // a concurrent delivery of the same command created it first
    }
  }
  span.SetAttribute("instance_id", instance_id);

  // Claim with the reconciliation lease so a duplicate delivery or the
  // requeue job does not provision the same row concurrently.
  std::optional<db::model::InstanceRecord> claimed;
  {
    const auto now    = clock_();
    const auto cutoff = now - util::SecondsToMillis(settings_.reconciliation_lease_seconds);

    auto tx      = repository_->Begin();
    auto current = repository_->LockInstance(*tx, instance_id);
    if (!current || current->status != InstanceStatus::kProvisioning || current->is_archived) {
      FLEET_LOG_INFO("provision skipped, instance not provisioning", {StringField("instance_id", instance_id)});
      return;
    }
    if (current->last_reconciliation_ms != 0 && current->last_reconciliation_ms > cutoff) {
      FLEET_LOG_INFO("provision skipped, lease held elsewhere", {StringField("instance_id", instance_id)});
      return;
    }

    auto record                   = *current;
    record.last_reconciliation_ms = now;
    auto res                      = repository_->UpdateInstance(*tx, record, InstanceStatus::kProvisioning);
    if (res.code == db::ErrorCode::Conflict || res.code == db::ErrorCode::Immutable) {
      return;
    }
    ThrowIfDbError(res, "claim instance " + instance_id);
    tx->Commit();
    claimed = record;
  }

  RunProvisioning(std::move(*claimed));
}

bool InstanceWorkflows::RefreshProvisioningLease(const std::string& instance_id) {
  return Patch(instance_id, InstanceStatus::kProvisioning,
               [&](db::model::InstanceRecord& record) { record.last_reconciliation_ms = clock_(); });
}

void InstanceWorkflows::ResumeProvisioning(const db::model::InstanceRecord& instance) {
  observability::SpanScope span("workflow.provision.resume");
  span.SetAttribute("instance_id", instance.id);

  RunProvisioning(instance);
}

void InstanceWorkflows::FailProvisioning(const std::string& instance_id, std::string_view error_code, const std::string& message) {
  TransitionRequest request;
  request.instance_id   = instance_id;
  request.from          = InstanceStatus::kProvisioning;
  request.to            = InstanceStatus::kProvisioningFailed;
  request.reason        = std::string(error_code);
  request.error_code    = std::string(error_code);
  request.error_message = message;
  state_machine_->Transition(request);
}

void InstanceWorkflows::HandleProvisioningFailure(const db::model::InstanceRecord& instance, const ProviderResult& result,
                                                  std::string_view stage) {
  const auto message = std::string(stage) + ": " + result.message;

  if (provider::IsPermanent(result.code)) {
    FLEET_LOG_ERROR("provisioning failed permanently", {StringField("instance_id", instance.id), StringField("stage", stage),
                                                        StringField("code", provider::ToString(result.code)),
                                                        StringField("error", result.message)});
    FailProvisioning(instance.id, provider::ToString(result.code), message);
    return;
  }

  if (instance.retry_count >= settings_.provisioning_max_retries) {
    FailProvisioning(instance.id, error::kProvisioningRetriesExhausted, message);
    return;
  }

  // Transient: leave the row in provisioning for the requeue job.
  const bool server_gone = result.code == ProviderCode::kNotFound && stage != "create";
  Patch(instance.id, InstanceStatus::kProvisioning, [&](db::model::InstanceRecord& record) {
    record.error_code    = std::string(provider::ToString(result.code));
    record.error_message = message;
    if (server_gone) {
      // the server vanished before it came up; the next attempt creates a new one
      record.provider_instance_id.clear();
    }
  });

  FLEET_LOG_WARN("provisioning step failed, will retry", {StringField("instance_id", instance.id), StringField("stage", stage),
                                                          StringField("code", provider::ToString(result.code)),
                                                          IntField("retry_count", instance.retry_count)});
}

void InstanceWorkflows::RunProvisioning(db::model::InstanceRecord instance) {
  auto adapter = providers_->Find(instance.provider_code);
  if (!adapter) {
    FailProvisioning(instance.id, error::kProviderNotConfigured, "provider not configured: " + instance.provider_code);
    return;
  }

  // Boot image: provider choice, then the requested image, then the configured default.
  std::string image_id;
  if (auto res = adapter->ResolveBootImage(instance.zone, instance.instance_type, image_id); !res) {
    HandleProvisioningFailure(instance, res, "resolve_image");
    return;
  }
  if (image_id.empty()) image_id = instance.image_id;
  if (image_id.empty()) image_id = providers_->DefaultImage(instance.provider_code);
  if (image_id.empty()) {
    FailProvisioning(instance.id, error::kImageNotFound, "no boot image for " + instance.instance_type);
    return;
  }

  if (instance.provider_instance_id.empty()) {
    provider::CreateInstanceRequest request;
    request.instance_id    = instance.id;
    request.zone           = instance.zone;
    request.instance_type  = instance.instance_type;
    request.image_id       = image_id;
    request.data_volume_gb = instance.data_volume_gb;

    auto        handle = recorder_->Begin(instance.id, action::kProviderCreate);
    std::string server_id;
    auto        res = adapter->CreateInstance(request, server_id);
    if (!res) {
      recorder_->Fail(handle, std::string(provider::ToString(res.code)) + ": " + res.message);
      HandleProvisioningFailure(instance, res, "create");
      return;
    }
    recorder_->Succeed(handle, "{\"provider_instance_id\":\"" + server_id + "\"}");

    // Only the first server recorded on the row survives. A row that moved
    // on, or one another worker already bound to its own server, loses ours.
    const bool persisted = Patch(
        instance.id, InstanceStatus::kProvisioning,
        [&](db::model::InstanceRecord& record) {
          record.provider_instance_id   = server_id;
          record.image_id               = image_id;
          record.last_reconciliation_ms = clock_();
        },
        [](const db::model::InstanceRecord& current) { return current.provider_instance_id.empty(); });
    if (!persisted) {
      FLEET_LOG_WARN("instance no longer accepts this server, deleting it",
                     {StringField("instance_id", instance.id), StringField("server_id", server_id)});
      auto del = adapter->DeleteInstance(instance.zone, server_id);
      if (!del && del.code != ProviderCode::kNotFound) {
        FLEET_LOG_ERROR("compensating delete failed", {StringField("instance_id", instance.id), StringField("server_id", server_id),
                                                       StringField("error", del.message)});
      }
      return;
    }
    instance.provider_instance_id = server_id;
    instance.image_id             = image_id;

    std::vector<provider::AttachedVolume> volumes;
    if (auto list = adapter->ListAttachedVolumes(instance.zone, server_id, volumes); list) {
      ImportVolumes(instance, volumes);
    } else {
      FLEET_LOG_WARN("volume discovery failed after create",
                     {StringField("instance_id", instance.id), StringField("error", list.message)});
    }
  }

  {
    auto handle = recorder_->Begin(instance.id, action::kProviderStart);
    auto res    = adapter->StartInstance(instance.zone, instance.provider_instance_id);
    if (!res) {
      recorder_->Fail(handle, std::string(provider::ToString(res.code)) + ": " + res.message);
      HandleProvisioningFailure(instance, res, "start");
      return;
    }
    recorder_->Succeed(handle);
  }
  if (!RefreshProvisioningLease(instance.id)) {
    FLEET_LOG_INFO("instance left provisioning after start", {StringField("instance_id", instance.id)});
    return;
  }

  std::optional<std::string> ip;
  {
    auto handle = recorder_->Begin(instance.id, action::kProviderGetIp);
    for (std::int32_t attempt = 1; attempt <= settings_.provisioning_ip_attempts; ++attempt) {
      auto res = adapter->GetIp(instance.zone, instance.provider_instance_id, ip);
      if (!res) {
        recorder_->Fail(handle, std::string(provider::ToString(res.code)) + ": " + res.message);
        HandleProvisioningFailure(instance, res, "get_ip");
        return;
      }
      if (ip) break;
      if (attempt < settings_.provisioning_ip_attempts) {
        sleeper_(settings_.provisioning_ip_interval_ms);
        if (!RefreshProvisioningLease(instance.id)) {
          recorder_->Fail(handle, "instance left provisioning");
          return;
        }
      }
    }
    if (ip) {
      recorder_->Succeed(handle, IpMetadata(*ip));
    } else {
      // booting proceeds; the health check keeps asking for the address
      recorder_->Fail(handle, "no IP assigned yet");
    }
  }

  TransitionRequest request;
  request.instance_id = instance.id;
  request.from        = InstanceStatus::kProvisioning;
  request.to          = InstanceStatus::kBooting;
  request.reason      = "provider server started";
  request.mutate      = [&](db::model::InstanceRecord& record) {
    record.provider_instance_id = instance.provider_instance_id;
    record.image_id             = instance.image_id;
    if (ip) record.ip_address = *ip;
  };

  auto outcome = state_machine_->Transition(request);
  if (outcome != TransitionOutcome::kApplied) {
    FLEET_LOG_INFO("provisioned instance already moved on", {StringField("instance_id", instance.id)});
  }
}

std::size_t InstanceWorkflows::ImportVolumes(const db::model::InstanceRecord& instance,
                                             const std::vector<provider::AttachedVolume>& volumes) {
  if (volumes.empty()) {
    return 0;
  }

  const auto  now   = clock_();
  std::size_t added = 0;

  auto tx = repository_->Begin();

  std::set<std::string> known;
  for (const auto& tracked : repository_->ListVolumes(*tx, instance.id)) {
    known.insert(tracked.provider_volume_id);
  }

  for (const auto& volume : volumes) {
    if (known.contains(volume.provider_volume_id)) continue;

    db::model::VolumeRecord record;
    record.id                  = util::NewId();
    record.instance_id         = instance.id;
    record.provider_volume_id  = volume.provider_volume_id;
    record.volume_name         = volume.name;
    record.volume_type         = volume.volume_type;
    record.size_bytes          = volume.size_bytes;
    record.is_boot             = volume.is_boot;
    record.delete_on_terminate = true;
    record.status              = VolumeStatus::kAttached;
    record.created_at_ms       = now;
    record.attached_at_ms      = now;
    record.reconciled_at_ms    = now;

    auto res = repository_->InsertVolume(*tx, record);
    if (res.code == db::ErrorCode::AlreadyExists) continue;
    ThrowIfDbError(res, "track volume " + volume.provider_volume_id);
    known.insert(volume.provider_volume_id);
    ++added;
  }
  tx->Commit();

  if (added > 0) {
    FLEET_LOG_INFO("volumes tracked", {StringField("instance_id", instance.id), IntField("count", static_cast<std::int64_t>(added))});
  }
  return added;
}

// ------------------------------------------------------------------
// Terminate
// ------------------------------------------------------------------

void InstanceWorkflows::Terminate(const fleet::orchestrator::v1::TerminateCommand& command) {
  observability::SpanScope span("workflow.terminate");
  span.SetAttribute("instance_id", command.instance_id());

  auto instance = Load(command.instance_id());
  if (!instance) {
    FLEET_LOG_WARN("terminate for unknown instance", {StringField("instance_id", command.instance_id())});
    return;
  }

  const auto reason = command.reason().empty() ? std::string("terminate requested") : command.reason();
  auto       status = instance->status;

  if (fleet::model::IsTerminal(status)) {
    return;
  }

  if (status == InstanceStatus::kReady) {
    TransitionRequest drain;
    drain.instance_id = instance->id;
    drain.from        = InstanceStatus::kReady;
    drain.to          = InstanceStatus::kDraining;
    drain.reason      = reason;
    if (state_machine_->Transition(drain) == TransitionOutcome::kApplied) {
      status = InstanceStatus::kDraining;
    } else if (auto reloaded = Load(instance->id)) {
      status = reloaded->status;
    }
  }

  // The fast path runs only under the reconciliation lease, the same one
  // the terminator job claims, so one pass runs per row at a time.
  bool leased = false;
  if (status != InstanceStatus::kTerminating && fleet::model::CanTransition(status, InstanceStatus::kTerminating)) {
    TransitionRequest request;
    request.instance_id = instance->id;
    request.from        = status;
    request.to          = InstanceStatus::kTerminating;
    request.reason      = reason;
    request.mutate      = [&](db::model::InstanceRecord& record) {
      record.deletion_reason        = reason;
      record.termination_attempts   = 0;
      record.last_reconciliation_ms = clock_();
    };
    leased = state_machine_->Transition(request) == TransitionOutcome::kApplied;
    if (!leased) {
      FLEET_LOG_INFO("terminate raced with another transition", {StringField("instance_id", instance->id)});
    }
  } else if (status == InstanceStatus::kTerminating) {
    const auto now    = clock_();
    const auto cutoff = now - util::SecondsToMillis(settings_.reconciliation_lease_seconds);
    leased            = Patch(
        instance->id, InstanceStatus::kTerminating, [&](db::model::InstanceRecord& record) { record.last_reconciliation_ms = now; },
        [&](const db::model::InstanceRecord& current) { return current.last_reconciliation_ms <= cutoff; });
  }

  if (!leased) {
    return;
  }

  // fast path; the terminator job finishes whatever is left
  if (ProcessTermination(instance->id) == TerminationResult::kPending) {
    auto tx  = repository_->Begin();
    auto res = repository_->ReleaseLease(*tx, instance->id, db::LeaseColumn::kLastReconciliation);
    if (res) {
      tx->Commit();
    } else {
      FLEET_LOG_WARN("lease release failed", {StringField("instance_id", instance->id), StringField("error", res.message)});
    }
  }
}

void InstanceWorkflows::RecordTerminationFailure(const std::string& instance_id, const std::string& message) {
  const auto max_attempts = settings_.terminate_max_attempts;
  Patch(instance_id, InstanceStatus::kTerminating, [&](db::model::InstanceRecord& record) {
    ++record.termination_attempts;
    record.error_message = message;
    if (record.termination_attempts >= max_attempts) {
      record.error_code = std::string(error::kTerminationManual);
      FLEET_LOG_ERROR("termination needs manual intervention",
                      {StringField("instance_id", instance_id), IntField("attempts", record.termination_attempts),
                       StringField("error", message)});
    }
  });
}

TerminationResult InstanceWorkflows::ProcessTermination(const std::string& instance_id) {
  observability::SpanScope span("workflow.terminate.pass");
  span.SetAttribute("instance_id", instance_id);

  auto instance = Load(instance_id);
  if (!instance || instance->status != InstanceStatus::kTerminating) {
    return TerminationResult::kSkipped;
  }

  bool server_gone = instance->provider_instance_id.empty();
  auto adapter     = providers_->Find(instance->provider_code);

  if (!server_gone && !adapter) {
    RecordTerminationFailure(instance_id, "provider not configured: " + instance->provider_code);
    return TerminationResult::kFailed;
  }

  if (!server_gone) {
    // Discover volumes first; once the server is gone the listing is too.
    std::vector<provider::AttachedVolume> attached;
    auto list = adapter->ListAttachedVolumes(instance->zone, instance->provider_instance_id, attached);
    if (list) {
      ImportVolumes(*instance, attached);
    } else if (list.code == ProviderCode::kNotFound) {
      server_gone = true;
    } else {
      RecordTerminationFailure(instance_id, "list volumes: " + list.message);
      return TerminationResult::kFailed;
    }
  }

  if (!server_gone) {
    auto handle = recorder_->Begin(instance_id, action::kProviderDelete);
    auto res    = adapter->DeleteInstance(instance->zone, instance->provider_instance_id);
    if (!res && res.code != ProviderCode::kNotFound) {
      recorder_->Fail(handle, std::string(provider::ToString(res.code)) + ": " + res.message);
      RecordTerminationFailure(instance_id, "delete server: " + res.message);
      return TerminationResult::kFailed;
    }
    recorder_->Succeed(handle);
  }

  // Volumes still attached to a live server cannot be deleted yet.
  if (!server_gone) {
    bool exists = true;
    auto res    = adapter->InstanceExists(instance->zone, instance->provider_instance_id, exists);
    if (!res) {
      RecordTerminationFailure(instance_id, "confirm deletion: " + res.message);
      return TerminationResult::kFailed;
    }
    if (exists) {
      FLEET_LOG_INFO("server deletion in progress", {StringField("instance_id", instance_id),
                                                     StringField("server_id", instance->provider_instance_id)});
      return TerminationResult::kPending;
    }
  }

  // Flagged volumes: attached -> deleting -> deleted.
  std::vector<db::model::VolumeRecord> volumes;
  {
    auto tx = repository_->Begin();
    volumes = repository_->ListVolumes(*tx, instance_id);
  }

  bool volumes_left = false;
  for (const auto& volume : volumes) {
    if (!volume.delete_on_terminate || volume.status == VolumeStatus::kDeleted) continue;
    if (!adapter) {
      volumes_left = true;
      continue;
    }

    if (volume.status == VolumeStatus::kAttached) {
      auto tx  = repository_->Begin();
      auto res = repository_->UpdateVolumeStatus(*tx, volume.id, VolumeStatus::kAttached, VolumeStatus::kDeleting, clock_(), {});
      if (res) {
        tx->Commit();
      } else if (res.code != db::ErrorCode::Conflict) {
        ThrowIfDbError(res, "mark volume deleting " + volume.id);
      }
    }

    auto handle = recorder_->Begin(instance_id, action::kProviderVolumeDel, "{\"provider_volume_id\":\"" + volume.provider_volume_id + "\"}");
    auto res    = adapter->DeleteVolume(instance->zone, volume.provider_volume_id);
    if (!res && res.code != ProviderCode::kNotFound) {
      recorder_->Fail(handle, res.message);
      volumes_left = true;

      auto tx = repository_->Begin();
      // keep the failure visible on the row; status stays deleting
      auto upd = repository_->UpdateVolumeStatus(*tx, volume.id, VolumeStatus::kDeleting, VolumeStatus::kDeleting, clock_(), res.message);
      if (upd) tx->Commit();
      continue;
    }
    recorder_->Succeed(handle);

    auto tx  = repository_->Begin();
    auto upd = repository_->UpdateVolumeStatus(*tx, volume.id, VolumeStatus::kDeleting, VolumeStatus::kDeleted, clock_(), {});
    if (upd) {
      tx->Commit();
    } else if (upd.code != db::ErrorCode::Conflict) {
      ThrowIfDbError(upd, "mark volume deleted " + volume.id);
    }
  }

  if (volumes_left) {
    RecordTerminationFailure(instance_id, "volume deletion incomplete");
    return TerminationResult::kFailed;
  }

  // terminated + token revocation commit together
  auto tx = repository_->Begin();

  TransitionRequest request;
  request.instance_id = instance_id;
  request.from        = InstanceStatus::kTerminating;
  request.to          = InstanceStatus::kTerminated;
  request.reason      = "provider resources deleted";

  auto outcome = state_machine_->Transition(*tx, request);
  if (outcome != TransitionOutcome::kApplied) {
    return TerminationResult::kSkipped;
  }

  auto revoke = repository_->RevokeWorkerToken(*tx, instance_id, clock_());
  if (revoke.code != db::ErrorCode::NotFound) {
    ThrowIfDbError(revoke, "revoke worker token " + instance_id);
  }
  tx->Commit();
  return TerminationResult::kTerminated;
}

// ------------------------------------------------------------------
// Reinstall
// ------------------------------------------------------------------

void InstanceWorkflows::Reinstall(const fleet::orchestrator::v1::ReinstallCommand& command) {
  observability::SpanScope span("workflow.reinstall");
  span.SetAttribute("instance_id", command.instance_id());

  auto instance = Load(command.instance_id());
  if (!instance) {
    FLEET_LOG_WARN("reinstall for unknown instance", {StringField("instance_id", command.instance_id())});
    return;
  }

  const auto from = instance->status;
  if (from != InstanceStatus::kInstalling && from != InstanceStatus::kStarting && from != InstanceStatus::kReady &&
      from != InstanceStatus::kStartupFailed) {
    FLEET_LOG_INFO("reinstall ignored", {StringField("instance_id", instance->id), StringField("status", fleet::model::ToString(from))});
    return;
  }

  TransitionRequest request;
  request.instance_id = instance->id;
  request.from        = from;
  request.to          = InstanceStatus::kBooting;
  request.reason      = "reinstall requested";
  if (state_machine_->Transition(request) != TransitionOutcome::kApplied) {
    return;
  }
  recorder_->RecordSuccess(instance->id, action::kReinstallRequested);

  auto adapter = providers_->Find(instance->provider_code);
  if (!adapter || instance->provider_instance_id.empty()) {
    return;
  }

  auto handle = recorder_->Begin(instance->id, action::kProviderStart);
  auto res    = adapter->StartInstance(instance->zone, instance->provider_instance_id);
  if (res) {
    recorder_->Succeed(handle);
  } else {
    // the health check times the boot out if the server never answers
    recorder_->Fail(handle, std::string(provider::ToString(res.code)) + ": " + res.message);
  }
}

// ------------------------------------------------------------------
// Catalog and drift
// ------------------------------------------------------------------

std::size_t InstanceWorkflows::SyncCatalog(const fleet::orchestrator::v1::SyncCatalogCommand& command) {
  observability::SpanScope span("workflow.sync_catalog");

  std::vector<std::shared_ptr<provider::CloudProvider>> targets;
  if (command.provider_code().empty()) {
    targets = providers_->All();
  } else if (auto adapter = providers_->Find(command.provider_code())) {
    targets.push_back(adapter);
  } else {
    throw util::NotFound("provider not configured: " + command.provider_code());
  }

  std::size_t written = 0;
  for (const auto& adapter : targets) {
    for (const auto& zone : adapter->Zones()) {
      std::vector<provider::CatalogEntry> entries;
      auto                                res = adapter->FetchCatalog(zone, entries);
      if (!res) {
        FLEET_LOG_WARN("catalog fetch failed", {StringField("provider", adapter->Code()), StringField("zone", zone),
                                                StringField("code", provider::ToString(res.code)),
                                                StringField("error", res.message)});
        continue;
      }

      const auto now = clock_();
      auto       tx  = repository_->Begin();
      for (const auto& entry : entries) {
        db::model::CatalogInstanceTypeRecord record;
        record.provider_code   = adapter->Code();
        record.zone            = zone;
        record.code            = entry.code;
        record.name            = entry.name;
        record.cost_per_hour   = entry.cost_per_hour;
        record.cpu_count       = entry.cpu_count;
        record.ram_gb          = entry.ram_gb;
        record.gpu_count       = entry.gpu_count;
        record.vram_per_gpu_gb = entry.vram_per_gpu_gb;
        record.bandwidth_bps   = entry.bandwidth_bps;
        record.updated_at_ms   = now;
        ThrowIfDbError(repository_->UpsertCatalogInstanceType(*tx, record), "upsert catalog " + entry.code);
      }
      tx->Commit();
      written += entries.size();

      FLEET_LOG_INFO("catalog synced", {StringField("provider", adapter->Code()), StringField("zone", zone),
                                        IntField("types", static_cast<std::int64_t>(entries.size()))});
    }
  }
  return written;
}

ReconcileReport InstanceWorkflows::Reconcile(const fleet::orchestrator::v1::ReconcileCommand& command) {
  observability::SpanScope span("workflow.reconcile");

  std::vector<std::shared_ptr<provider::CloudProvider>> targets;
  if (command.provider_code().empty()) {
    targets = providers_->All();
  } else if (auto adapter = providers_->Find(command.provider_code())) {
    targets.push_back(adapter);
  } else {
    throw util::NotFound("provider not configured: " + command.provider_code());
  }

  ReconcileReport report;
  for (const auto& adapter : targets) {
    for (const auto& zone : adapter->Zones()) {
      std::vector<provider::ProviderInstance> servers;
      auto                                    res = adapter->ListInstances(zone, servers);
      if (!res) {
        FLEET_LOG_WARN("provider listing failed", {StringField("provider", adapter->Code()), StringField("zone", zone),
                                                   StringField("error", res.message)});
        continue;
      }

      for (const auto& server : servers) {
        ++report.seen;

        std::optional<db::model::InstanceRecord> row;
        {
          auto tx = repository_->Begin();
          row     = repository_->FindInstanceByProviderId(*tx, adapter->Code(), server.provider_instance_id);
        }

        if (!row) {
          ++report.untracked;
          FLEET_LOG_WARN("untracked provider server", {StringField("provider", adapter->Code()), StringField("zone", zone),
                                                       StringField("server_id", server.provider_instance_id),
                                                       StringField("name", server.name)});
          continue;
        }

        // Rows never come back to life; a terminal row with a live server is a zombie.
        if (!fleet::model::IsTerminal(row->status)) continue;

        ++report.zombies;
        auto del = adapter->DeleteInstance(zone, server.provider_instance_id);
        if (!del && del.code != ProviderCode::kNotFound) {
          FLEET_LOG_ERROR("zombie server delete failed", {StringField("instance_id", row->id),
                                                          StringField("server_id", server.provider_instance_id),
                                                          StringField("error", del.message)});
        } else {
          FLEET_LOG_WARN("zombie server deleted", {StringField("instance_id", row->id),
                                                   StringField("server_id", server.provider_instance_id)});
        }
      }
    }
  }
  return report;
}

} // namespace fleet::core
