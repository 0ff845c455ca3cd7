#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/core/action_recorder.hpp"
#include "internal/core/instance_workflows.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/jobs/provisioning_requeue_job.hpp"
#include "internal/jobs/terminator_job.hpp"
#include "internal/lifecycle/state_machine.hpp"
#include "internal/provider/mock_provider.hpp"
#include "internal/provider/provider_registry.hpp"
#include "tests/support/fleet_test_env.hpp"

#if FLEET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using fleet::config::JobSettings;
using fleet::db::ClaimQuery;
using fleet::db::LeaseColumn;
using fleet::db::Repository;
using fleet::db::model::InstanceRecord;
using fleet::model::InstanceStatus;

constexpr int          kRows    = 12;
constexpr std::int64_t kStartMs = 1'700'000'000'000;

struct Backend {
  std::string                                  name;
  std::function<std::shared_ptr<Repository>()> make;
  std::function<void()>                        cleanup;
};

// Full job wiring over an arbitrary store, clock frozen unless advanced.
struct Harness {
  explicit Harness(std::shared_ptr<Repository> repo) : repository(std::move(repo)) {
    auto state = now;
    clock      = [state] { return state->load(); };

    lifecycle.provisioning_ip_attempts    = 1;
    lifecycle.provisioning_ip_interval_ms = 0;

    state_machine = std::make_shared<fleet::lifecycle::InstanceStateMachine>(repository, clock);
    recorder      = std::make_shared<fleet::core::ActionRecorder>(repository, clock);
    mock          = std::make_shared<fleet::provider::MockProvider>();
    providers     = std::make_shared<fleet::provider::ProviderRegistry>();
    providers->Register(mock);
    workflows = std::make_shared<fleet::core::InstanceWorkflows>(repository, state_machine, recorder, providers, lifecycle,
                                                                 clock, [](std::int64_t) {});
  }

  fleet::jobs::JobContext Context() const {
    fleet::jobs::JobContext ctx;
    ctx.repository    = repository;
    ctx.state_machine = state_machine;
    ctx.recorder      = recorder;
    ctx.workflows     = workflows;
    ctx.providers     = providers;
    ctx.probe         = std::make_shared<fleet::testing::ScriptedProbe>();
    ctx.lifecycle     = lifecycle;
    ctx.clock         = clock;
    return ctx;
  }

  InstanceRecord Get(const std::string& id) {
    auto tx = repository->Begin();
    return repository->GetInstance(*tx, id).value();
  }

  void Insert(const InstanceRecord& record) {
    auto tx = repository->Begin();
    assert(repository->InsertInstance(*tx, record));
    tx->Commit();
  }

  // Each (from, to) pair at most once, and `edge` exactly once.
  void ExpectSingleEdge(const std::string& id, InstanceStatus from, InstanceStatus to) {
    auto tx      = repository->Begin();
    auto history = repository->ListStateHistory(*tx, id);

    std::set<std::pair<InstanceStatus, InstanceStatus>> seen;
    int                                                 hits = 0;
    for (const auto& entry : history) {
      assert(seen.insert({entry.from_status, entry.to_status}).second);
      if (entry.from_status == from && entry.to_status == to) ++hits;
    }
    assert(hits == 1);
  }

  std::shared_ptr<std::atomic<std::int64_t>> now = std::make_shared<std::atomic<std::int64_t>>(kStartMs);
  fleet::util::MillisClock                   clock;
  fleet::config::LifecycleSettings           lifecycle;

  std::shared_ptr<Repository>                             repository;
  std::shared_ptr<fleet::lifecycle::InstanceStateMachine> state_machine;
  std::shared_ptr<fleet::core::ActionRecorder>            recorder;
  std::shared_ptr<fleet::provider::MockProvider>          mock;
  std::shared_ptr<fleet::provider::ProviderRegistry>      providers;
  std::shared_ptr<fleet::core::InstanceWorkflows>         workflows;
};

InstanceRecord MakeRow(const std::string& id, InstanceStatus status, std::int64_t created_at_ms) {
  InstanceRecord r;
  r.id            = id;
  r.provider_code = "mock";
  r.zone          = "mock-zone-1";
  r.instance_type = "MOCK-GPU-S";
  r.model_id      = "llama";
  r.status        = status;
  r.created_at_ms = created_at_ms;
  return r;
}

// Runs `body` on two threads released together.
void RunPair(const std::function<void(int)>& body) {
  std::atomic<bool> go{false};
  std::thread       a([&] {
    while (!go) std::this_thread::yield();
    body(0);
  });
  std::thread b([&] {
    while (!go) std::this_thread::yield();
    body(1);
  });
  go = true;
  a.join();
  b.join();
}

void VerifyClaimsAreDisjoint(const Backend& backend) {
  auto repo = backend.make();
  for (int i = 0; i < 40; ++i) {
    auto tx = repo->Begin();
    assert(repo->InsertInstance(*tx, MakeRow("claim-" + std::to_string(i), InstanceStatus::kTerminating, kStartMs)));
    tx->Commit();
  }

  std::vector<std::string> claimed[2];
  RunPair([&](int slot) {
    ClaimQuery query;
    query.statuses                = {InstanceStatus::kTerminating};
    query.lease                   = LeaseColumn::kLastReconciliation;
    query.now_ms                  = kStartMs;
    query.lease_expired_before_ms = kStartMs - 30'000;
    query.limit                   = 3;

    for (;;) {
      auto tx    = repo->Begin();
      auto batch = repo->ClaimInstances(*tx, query);
      tx->Commit();
      if (batch.empty()) break;
      for (const auto& row : batch) claimed[slot].push_back(row.id);
    }
  });

  std::set<std::string> all(claimed[0].begin(), claimed[0].end());
  all.insert(claimed[1].begin(), claimed[1].end());
  assert(claimed[0].size() + claimed[1].size() == 40);
  assert(all.size() == 40);
}

void VerifyTerminatorsShareRows(const Backend& backend) {
  Harness h(backend.make());

  std::vector<std::string> ids;
  for (int i = 0; i < kRows; ++i) {
    fleet::provider::CreateInstanceRequest request;
    request.instance_id   = "term-" + std::to_string(i);
    request.zone          = "mock-zone-1";
    request.instance_type = "MOCK-GPU-S";
    request.image_id      = "img";
    std::string server_id;
    assert(h.mock->CreateInstance(request, server_id));
    h.mock->AttachVolume(server_id, 1ull << 30);

    auto row                 = MakeRow(request.instance_id, InstanceStatus::kTerminating, kStartMs - 60'000);
    row.provider_instance_id = server_id;
    h.Insert(row);
    ids.push_back(row.id);
  }

  JobSettings settings;
  settings.batch_size = 2;
  fleet::jobs::TerminatorJob first(h.Context(), settings);
  fleet::jobs::TerminatorJob second(h.Context(), settings);

  RunPair([&](int slot) {
    auto& job = slot == 0 ? first : second;
    for (int tick = 0; tick < 20; ++tick) job.RunOnce();
  });

  std::size_t volumes = 0;
  for (const auto& id : ids) {
    assert(h.Get(id).status == InstanceStatus::kTerminated);
    h.ExpectSingleEdge(id, InstanceStatus::kTerminating, InstanceStatus::kTerminated);

    auto tx = h.repository->Begin();
    for (const auto& volume : h.repository->ListVolumes(*tx, id)) {
      assert(volume.status == fleet::model::VolumeStatus::kDeleted);
      ++volumes;
    }
  }
  assert(volumes >= static_cast<std::size_t>(kRows));
  assert(h.mock->CallCount("delete") == kRows);
  assert(h.mock->CallCount("delete_volume") == static_cast<int>(volumes));
  assert(h.mock->ServerCount() == 0);
}

void VerifyRequeueJobsShareRows(const Backend& backend) {
  Harness h(backend.make());

  std::vector<std::string> ids;
  for (int i = 0; i < kRows; ++i) {
    auto row = MakeRow("requeue-" + std::to_string(i), InstanceStatus::kProvisioning, kStartMs - 60'000);
    h.Insert(row);
    ids.push_back(row.id);
  }

  JobSettings settings;
  settings.batch_size = 2;
  fleet::jobs::ProvisioningRequeueJob first(h.Context(), settings);
  fleet::jobs::ProvisioningRequeueJob second(h.Context(), settings);

  RunPair([&](int slot) {
    auto& job = slot == 0 ? first : second;
    for (int tick = 0; tick < 20; ++tick) job.RunOnce();
  });

  for (const auto& id : ids) {
    auto row = h.Get(id);
    assert(row.status == InstanceStatus::kBooting);
    assert(row.retry_count == 1);
    assert(h.mock->ServerExists(row.provider_instance_id));
    h.ExpectSingleEdge(id, InstanceStatus::kProvisioning, InstanceStatus::kBooting);
  }
  assert(h.mock->CallCount("create") == kRows);
  assert(h.mock->ServerCount() == static_cast<std::size_t>(kRows));
}

Backend MemoryBackend() {
  return Backend{
      .name    = "memory",
      .make    = [] { return std::make_shared<fleet::db::memory::MemoryRepository>(); },
      .cleanup = [] {},
  };
}

#if FLEET_DB_SQLITE
Backend SqliteBackend() {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto dir   = std::filesystem::temp_directory_path() / ("fleet_orchestrator_concurrency_" + std::to_string(stamp));
  std::filesystem::create_directories(dir);

  auto counter = std::make_shared<int>(0);
  return Backend{
      .name = "sqlite",
      .make =
          [dir, counter]() -> std::shared_ptr<Repository> {
            const auto path = (dir / ("store-" + std::to_string(++*counter) + ".db")).string();
            auto       db   = std::make_shared<fleet::db::sqlite::SqliteDB>(path);
            fleet::db::sqlite::ApplySchema(*db);
            return std::make_shared<fleet::db::sqlite::SqliteRepository>(std::move(db));
          },
      .cleanup = [dir] { std::filesystem::remove_all(dir); },
  };
}
#endif

} // namespace

int main() {
  std::vector<Backend> backends;
  backends.push_back(MemoryBackend());
#if FLEET_DB_SQLITE
  backends.push_back(SqliteBackend());
#endif

  for (const auto& backend : backends) {
    std::cout << "running concurrency suite: " << backend.name << "\n";
    VerifyClaimsAreDisjoint(backend);
    VerifyTerminatorsShareRows(backend);
    VerifyRequeueJobsShareRows(backend);
    backend.cleanup();
  }

  std::cout << "fleet_integration_job_concurrency: pass\n";
  return 0;
}
