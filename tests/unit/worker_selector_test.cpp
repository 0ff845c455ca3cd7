#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/routing/worker_selector.hpp"
#include "internal/util/errors.hpp"

namespace {

using fleet::db::model::InstanceRecord;
using fleet::model::InstanceStatus;
using fleet::routing::WorkerSelector;

constexpr std::int64_t kNow = 10'000'000;

struct Fixture {
  std::shared_ptr<fleet::db::memory::MemoryRepository> repository = std::make_shared<fleet::db::memory::MemoryRepository>();
  std::int64_t                                         now        = kNow;
  WorkerSelector selector{repository, fleet::config::RoutingSettings{300}, 8000, [this] { return now; }};

  InstanceRecord& Add(const std::string& id, const std::string& ip, std::int64_t heartbeat_ms) {
    InstanceRecord record;
    record.id                       = id;
    record.provider_code            = "mock";
    record.zone                     = "mock-zone-1";
    record.instance_type            = "MOCK-GPU-S";
    record.status                   = InstanceStatus::kReady;
    record.ip_address               = ip;
    record.created_at_ms            = 1'000;
    record.worker.status            = "ready";
    record.worker.model_id          = "llama";
    record.worker.last_heartbeat_ms = heartbeat_ms;
    pending                         = record;
    return pending;
  }

  void Commit() {
    auto tx = repository->Begin();
    assert(repository->InsertInstance(*tx, pending));
    tx->Commit();
  }

  InstanceRecord pending;
};

void TestNoCandidatesThrowsNoReadyWorker() {
  Fixture f;
  bool    threw = false;
  try {
    f.selector.SelectWorker("llama");
  } catch (const fleet::util::NoReadyWorker&) {
    threw = true;
  }
  assert(threw);
}

void TestFiltersStaleWrongModelAndNotReady() {
  Fixture f;
  f.Add("stale", "10.0.0.1", kNow - 301'000);
  f.Commit();
  f.Add("other-model", "10.0.0.2", kNow).worker.model_id = "mistral";
  f.Commit();
  f.Add("worker-draining", "10.0.0.3", kNow).worker.status = "draining";
  f.Commit();
  f.Add("no-ip", "", kNow);
  f.Commit();
  f.Add("booting", "10.0.0.5", kNow).status = InstanceStatus::kBooting;
  f.Commit();
  f.Add("good", "10.0.0.6", kNow - 1'000);
  f.Commit();

  auto candidates = f.selector.Candidates("llama");
  assert(candidates.size() == 1);
  assert(candidates[0].instance.id == "good");

  auto handle = f.selector.SelectWorker("llama");
  assert(handle.instance_id == "good");
  assert(handle.endpoint == "http://10.0.0.6:8000");
}

void TestHealthCheckCountsAsFreshness() {
  Fixture f;
  f.Add("probed", "10.0.0.1", 0).last_health_check_ms = kNow - 5'000;
  f.Commit();

  auto candidates = f.selector.Candidates("llama");
  assert(candidates.size() == 1);
  assert(candidates[0].freshness_ms == kNow - 5'000);
}

void TestEmptyModelMatchesAnyAndNullWorkerStatus() {
  Fixture f;
  auto& row          = f.Add("fresh", "10.0.0.1", kNow);
  row.worker.status  = "";
  row.worker.model_id = "whatever";
  f.Commit();

  assert(f.selector.Candidates("").size() == 1);
  assert(f.selector.Candidates("llama").empty());
}

void TestRankingByQueueDepthThenFreshness() {
  Fixture f;
  f.Add("unknown-depth", "10.0.0.1", kNow);
  f.Commit();
  f.Add("busy", "10.0.0.2", kNow).worker.queue_depth = 9;
  f.Commit();
  f.Add("idle-older", "10.0.0.3", kNow - 20'000).worker.queue_depth = 0;
  f.Commit();
  f.Add("idle-fresh", "10.0.0.4", kNow - 1'000).worker.queue_depth = 0;
  f.Commit();

  auto candidates = f.selector.Candidates("llama");
  assert(candidates.size() == 4);
  assert(candidates[0].instance.id == "idle-fresh");
  assert(candidates[1].instance.id == "idle-older");
  assert(candidates[2].instance.id == "busy");
  assert(candidates[3].instance.id == "unknown-depth");
}

void TestStickyKeyIsStableAndUsesVllmPort() {
  Fixture f;
  for (int i = 0; i < 4; ++i) {
    f.Add("w" + std::to_string(i), "10.0.0." + std::to_string(i + 1), kNow).worker.vllm_port = 9000;
    f.Commit();
  }

  const auto first = f.selector.SelectWorker("llama", "session-42");
  for (int i = 0; i < 10; ++i) {
    f.now += 1'000;
    assert(f.selector.SelectWorker("llama", "session-42").instance_id == first.instance_id);
  }
  assert(first.endpoint.find(":9000") != std::string::npos);

  std::set<std::string> spread;
  for (int i = 0; i < 64; ++i) {
    spread.insert(f.selector.SelectWorker("llama", "key-" + std::to_string(i)).instance_id);
  }
  assert(spread.size() > 1);
}

void TestFnv1aKnownValues() {
  assert(WorkerSelector::Fnv1a64("") == 14695981039346656037ull);
  assert(WorkerSelector::Fnv1a64("a") == 0xaf63dc4c8601ec8cull);
}

} // namespace

int main() {
  TestNoCandidatesThrowsNoReadyWorker();
  TestFiltersStaleWrongModelAndNotReady();
  TestHealthCheckCountsAsFreshness();
  TestEmptyModelMatchesAnyAndNullWorkerStatus();
  TestRankingByQueueDepthThenFreshness();
  TestStickyKeyIsStableAndUsesVllmPort();
  TestFnv1aKnownValues();

  std::cout << "fleet_unit_worker_selector: pass\n";
  return 0;
}
