#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using fleet::db::ClaimQuery;
using fleet::db::ErrorCode;
using fleet::db::LeaseColumn;
using fleet::db::memory::MemoryRepository;
using fleet::db::model::InstanceRecord;
using fleet::model::InstanceStatus;

InstanceRecord Row(const std::string& id, InstanceStatus status, std::int64_t created_at_ms) {
  InstanceRecord record;
  record.id            = id;
  record.provider_code = "mock";
  record.zone          = "mock-zone-1";
  record.instance_type = "MOCK-GPU-S";
  record.status        = status;
  record.created_at_ms = created_at_ms;
  return record;
}

void Insert(MemoryRepository& repo, const InstanceRecord& record) {
  auto tx = repo.Begin();
  assert(repo.InsertInstance(*tx, record));
  tx->Commit();
}

std::vector<InstanceRecord> Claim(MemoryRepository& repo, const ClaimQuery& query) {
  auto tx   = repo.Begin();
  auto rows = repo.ClaimInstances(*tx, query);
  tx->Commit();
  return rows;
}

void TestClaimSkipsFreshLeasesAndStampsClaimed() {
  MemoryRepository repo;
  Insert(repo, Row("a", InstanceStatus::kBooting, 1));
  Insert(repo, Row("b", InstanceStatus::kReady, 2));

  ClaimQuery query;
  query.statuses                = {InstanceStatus::kBooting};
  query.lease                   = LeaseColumn::kLastHealthCheck;
  query.now_ms                  = 100'000;
  query.lease_expired_before_ms = 90'000;

  auto first = Claim(repo, query);
  assert(first.size() == 1 && first[0].id == "a");
  assert(first[0].last_health_check_ms == 100'000);

  // second claimer inside the lease window gets nothing
  query.now_ms                  = 105'000;
  query.lease_expired_before_ms = 95'000;
  assert(Claim(repo, query).empty());

  // expired lease is claimable again
  query.now_ms                  = 200'000;
  query.lease_expired_before_ms = 190'000;
  assert(Claim(repo, query).size() == 1);
}

void TestClaimFiltersAndLimit() {
  MemoryRepository repo;
  for (int i = 0; i < 5; ++i) {
    auto row        = Row("p" + std::to_string(i), InstanceStatus::kProvisioning, 1'000 + i);
    row.retry_count = i;
    Insert(repo, row);
  }

  ClaimQuery query;
  query.statuses                = {InstanceStatus::kProvisioning};
  query.now_ms                  = 10'000;
  query.lease_expired_before_ms = 10'000;
  query.created_before_ms       = 1'004;
  query.retry_count_below       = 3;
  query.increment_retry_count   = true;
  query.limit                   = 2;

  auto rows = Claim(repo, query);
  assert(rows.size() == 2);
  assert(rows[0].id == "p0" && rows[0].retry_count == 1);
  assert(rows[1].id == "p1" && rows[1].retry_count == 2);

  // p2 is the only row left under the retry ceiling and creation cutoff
  rows = Claim(repo, query);
  assert(rows.size() == 1 && rows[0].id == "p2");
}

void TestClaimRequiresProviderId() {
  MemoryRepository repo;
  auto with                 = Row("with", InstanceStatus::kReady, 1);
  with.provider_instance_id = "srv-1";
  Insert(repo, with);
  Insert(repo, Row("without", InstanceStatus::kReady, 2));

  ClaimQuery query;
  query.statuses                     = {InstanceStatus::kReady};
  query.now_ms                       = 10;
  query.lease_expired_before_ms      = 10;
  query.require_provider_instance_id = true;

  auto rows = Claim(repo, query);
  assert(rows.size() == 1 && rows[0].id == "with");
}

void TestGuardedUpdateAndArchivedRows() {
  MemoryRepository repo;
  Insert(repo, Row("a", InstanceStatus::kBooting, 1));

  auto tx  = repo.Begin();
  auto row = *repo.GetInstance(*tx, "a");
  row.error_message = "x";
  assert(repo.UpdateInstance(*tx, row, InstanceStatus::kProvisioning).code == ErrorCode::Conflict);

  row.status      = InstanceStatus::kArchived;
  row.is_archived = true;
  assert(repo.UpdateInstance(*tx, row, InstanceStatus::kBooting));
  row.error_message = "y";
  assert(repo.UpdateInstance(*tx, row, InstanceStatus::kArchived).code == ErrorCode::Immutable);
  tx->Commit();
}

void TestWorkerColumnsHaveSeparateWriter() {
  MemoryRepository repo;
  Insert(repo, Row("a", InstanceStatus::kReady, 1));

  {
    auto                            tx = repo.Begin();
    fleet::db::model::WorkerFields fields;
    fields.status            = "ready";
    fields.last_heartbeat_ms = 42;
    assert(repo.UpdateWorkerFields(*tx, "a", fields));
    tx->Commit();
  }
  {
    // a lifecycle write built from a stale read must not clobber worker columns
    auto tx = repo.Begin();
    auto row = Row("a", InstanceStatus::kReady, 1);
    row.error_message = "lifecycle";
    assert(repo.UpdateInstance(*tx, row, InstanceStatus::kReady));
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto row = *repo.GetInstance(*tx, "a");
  assert(row.worker.status == "ready");
  assert(row.worker.last_heartbeat_ms == 42);
  assert(row.error_message == "lifecycle");
}

void TestOneActiveInstancePerIpAndPort() {
  MemoryRepository repo;
  auto a                = Row("a", InstanceStatus::kReady, 1);
  a.ip_address          = "10.0.0.1";
  a.worker.health_port  = 8080;
  Insert(repo, a);

  auto b               = Row("b", InstanceStatus::kBooting, 2);
  b.ip_address         = "10.0.0.1";
  b.worker.health_port = 8080;
  auto tx              = repo.Begin();
  assert(repo.InsertInstance(*tx, b).code == ErrorCode::ConstraintViolation);

  // a terminated holder frees the slot
  b.status = InstanceStatus::kTerminated;
  assert(repo.InsertInstance(*tx, b));
  tx->Commit();
}

void TestVolumesUniqueWhileLive() {
  MemoryRepository repo;
  Insert(repo, Row("a", InstanceStatus::kReady, 1));

  fleet::db::model::VolumeRecord volume;
  volume.id                 = "v1";
  volume.instance_id        = "a";
  volume.provider_volume_id = "vol-1";

  auto tx = repo.Begin();
  assert(repo.InsertVolume(*tx, volume));
  volume.id = "v2";
  assert(repo.InsertVolume(*tx, volume).code == ErrorCode::AlreadyExists);

  assert(repo.UpdateVolumeStatus(*tx, "v1", fleet::model::VolumeStatus::kAttached, fleet::model::VolumeStatus::kDeleting, 5, {}));
  assert(repo.UpdateVolumeStatus(*tx, "v1", fleet::model::VolumeStatus::kAttached, fleet::model::VolumeStatus::kDeleted, 6, {}).code ==
         ErrorCode::Conflict);
  assert(repo.UpdateVolumeStatus(*tx, "v1", fleet::model::VolumeStatus::kDeleting, fleet::model::VolumeStatus::kDeleted, 7, {}));

  // deleted rows no longer hold the provider id
  assert(repo.InsertVolume(*tx, volume));
  tx->Commit();
}

void TestWorkerTokenOncePerInstance() {
  MemoryRepository repo;
  Insert(repo, Row("a", InstanceStatus::kReady, 1));

  fleet::db::model::WorkerTokenRecord token;
  token.instance_id  = "a";
  token.token_hash   = "abc";
  token.token_prefix = "wk_123456789";

  auto tx = repo.Begin();
  assert(repo.InsertWorkerToken(*tx, token));
  assert(repo.InsertWorkerToken(*tx, token).code == ErrorCode::AlreadyExists);
  assert(repo.RevokeWorkerToken(*tx, "a", 99));
  assert(repo.GetWorkerToken(*tx, "a")->revoked_at_ms == 99);
  assert(repo.RevokeWorkerToken(*tx, "missing", 99).code == ErrorCode::NotFound);
  tx->Commit();
}

void TestDroppedTransactionRollsBack() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.InsertInstance(*tx, Row("a", InstanceStatus::kProvisioning, 1)));
  }
  auto tx = repo.Begin();
  assert(!repo.GetInstance(*tx, "a"));
}

} // namespace

int main() {
  TestClaimSkipsFreshLeasesAndStampsClaimed();
  TestClaimFiltersAndLimit();
  TestClaimRequiresProviderId();
  TestGuardedUpdateAndArchivedRows();
  TestWorkerColumnsHaveSeparateWriter();
  TestOneActiveInstancePerIpAndPort();
  TestVolumesUniqueWhileLive();
  TestWorkerTokenOncePerInstance();
  TestDroppedTransactionRollsBack();

  std::cout << "fleet_unit_memory_repository: pass\n";
  return 0;
}
