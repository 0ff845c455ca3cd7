#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"
#include "internal/worker/heartbeat_service.hpp"
#include "internal/worker/worker_auth.hpp"

namespace {

using fleet::db::model::InstanceRecord;
using fleet::model::InstanceStatus;
using fleet::worker::HeartbeatReport;
using fleet::worker::HeartbeatService;
using fleet::worker::RegisterRequest;
using fleet::worker::WorkerAuth;

struct Fixture {
  explicit Fixture(bool require_auth = false)
      : auth(std::make_shared<WorkerAuth>(repository, [this] { return now; })),
        service(repository, auth, [this] { return now; }, require_auth) {
  }

  void Insert(const std::string& id, const std::string& provider, const std::string& ip, InstanceStatus status) {
    InstanceRecord record;
    record.id            = id;
    record.provider_code = provider;
    record.zone          = "z";
    record.instance_type = "t";
    record.ip_address    = ip;
    record.status        = status;
    record.is_archived   = status == InstanceStatus::kArchived;
    auto tx              = repository->Begin();
    assert(repository->InsertInstance(*tx, record));
    tx->Commit();
  }

  InstanceRecord Get(const std::string& id) {
    auto tx = repository->Begin();
    return repository->GetInstance(*tx, id).value();
  }

  std::int64_t                                         now        = 50'000;
  std::shared_ptr<fleet::db::memory::MemoryRepository> repository = std::make_shared<fleet::db::memory::MemoryRepository>();
  std::shared_ptr<WorkerAuth>                          auth;
  HeartbeatService                                     service;
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestHeartbeatUpdatesWorkerColumnsOnly() {
  Fixture f;
  f.Insert("i-1", "mock", "10.0.0.1", InstanceStatus::kStarting);

  HeartbeatReport report;
  report.instance_id     = "i-1";
  report.status          = "READY";
  report.model_id        = "llama";
  report.queue_depth     = 3;
  report.gpu_utilization = 0.5;
  report.metadata_json   = R"({"vllm":"0.6"})";
  assert(f.service.ReportHeartbeat(report) == 50'000);

  auto row = f.Get("i-1");
  assert(row.status == InstanceStatus::kStarting);
  assert(row.worker.status == "ready");
  assert(row.worker.model_id == "llama");
  assert(row.worker.queue_depth && *row.worker.queue_depth == 3);
  assert(row.worker.last_heartbeat_ms == 50'000);

  // empty model keeps the stored one; absent gauges are kept
  f.now = 60'000;
  HeartbeatReport next;
  next.instance_id = "i-1";
  next.status      = "ready";
  f.service.ReportHeartbeat(next);
  row = f.Get("i-1");
  assert(row.worker.model_id == "llama");
  assert(row.worker.queue_depth && *row.worker.queue_depth == 3);
  assert(row.worker.last_heartbeat_ms == 60'000);
}

void TestHeartbeatRejections() {
  Fixture f;
  f.Insert("i-1", "mock", "10.0.0.1", InstanceStatus::kReady);
  f.Insert("old", "mock", "", InstanceStatus::kArchived);

  HeartbeatReport report;
  report.instance_id = "missing";
  report.status      = "ready";
  assert(Throws<fleet::util::NotFound>([&] { f.service.ReportHeartbeat(report); }));

  report.instance_id = "old";
  assert(Throws<fleet::util::InvalidState>([&] { f.service.ReportHeartbeat(report); }));

  report.instance_id = "i-1";
  report.status      = "running";
  assert(Throws<fleet::util::InvalidArgument>([&] { f.service.ReportHeartbeat(report); }));

  report.status        = "ready";
  report.metadata_json = "[1,2]";
  assert(Throws<fleet::util::InvalidArgument>([&] { f.service.ReportHeartbeat(report); }));
}

void TestRegisterBootstrapsOnceForMock() {
  Fixture f;
  f.Insert("i-1", "mock", "", InstanceStatus::kBooting);

  RegisterRequest request;
  request.instance_id = "i-1";
  request.client_ip   = "192.168.1.9";
  request.health_port = 8081;
  request.vllm_port   = 8001;
  request.model_id    = "llama";

  auto first = f.service.RegisterWorker(request);
  assert(first.issued);
  assert(first.issued->token.rfind("wk_", 0) == 0);
  assert(first.issued->token.size() == 3 + 2 * WorkerAuth::kSecretBytes);
  assert(first.issued->prefix == first.issued->token.substr(0, WorkerAuth::kPrefixLength));

  {
    auto tx     = f.repository->Begin();
    auto stored = f.repository->GetWorkerToken(*tx, "i-1").value();
    assert(stored.token_hash == fleet::util::Sha256Hex(first.issued->token));
    assert(stored.token_hash != first.issued->token);
  }

  auto row = f.Get("i-1");
  assert(row.worker.status == "starting");
  assert(row.worker.health_port == 8081 && row.worker.vllm_port == 8001);

  // no second token: a bearer is now required
  assert(Throws<fleet::util::Unauthenticated>([&] { f.service.RegisterWorker(request); }));

  request.bearer = first.issued->token;
  auto again     = f.service.RegisterWorker(request);
  assert(!again.issued);
}

void TestRegisterRequiresMatchingIpForRealProviders() {
  Fixture f;
  f.Insert("i-1", "scaleway", "51.15.0.7", InstanceStatus::kBooting);

  RegisterRequest request;
  request.instance_id = "i-1";
  request.client_ip   = "51.15.0.8";
  assert(Throws<fleet::util::Unauthenticated>([&] { f.service.RegisterWorker(request); }));

  request.client_ip = "51.15.0.7";
  assert(f.service.RegisterWorker(request).issued);
}

void TestRegisterRefusedForTerminalInstance() {
  Fixture f;
  f.Insert("i-1", "mock", "", InstanceStatus::kTerminated);

  RegisterRequest request;
  request.instance_id = "i-1";
  assert(Throws<fleet::util::Unauthenticated>([&] { f.service.RegisterWorker(request); }));
}

void TestRequiredAuthAndRevocation() {
  Fixture f(true);
  f.Insert("i-1", "mock", "", InstanceStatus::kReady);

  RegisterRequest request;
  request.instance_id = "i-1";
  const auto token    = f.service.RegisterWorker(request).issued.value().token;

  HeartbeatReport report;
  report.instance_id = "i-1";
  report.status      = "ready";
  assert(Throws<fleet::util::Unauthenticated>([&] { f.service.ReportHeartbeat(report); }));
  assert(Throws<fleet::util::Unauthenticated>([&] { f.service.ReportHeartbeat(report, token + "x"); }));
  f.service.ReportHeartbeat(report, token);

  {
    auto tx = f.repository->Begin();
    f.auth->Revoke(*tx, "i-1");
    tx->Commit();
  }
  assert(Throws<fleet::util::Unauthenticated>([&] { f.service.ReportHeartbeat(report, token); }));
  assert(!f.auth->Verify("i-1", token));
}

void TestBootstrapAllowedIgnoresCidrSuffix() {
  InstanceRecord instance;
  instance.provider_code = "scaleway";
  instance.ip_address    = "10.1.2.3/32";
  assert(WorkerAuth::BootstrapAllowed(instance, "10.1.2.3"));
  assert(!WorkerAuth::BootstrapAllowed(instance, ""));
  instance.ip_address.clear();
  assert(!WorkerAuth::BootstrapAllowed(instance, "10.1.2.3"));
}

} // namespace

int main() {
  TestHeartbeatUpdatesWorkerColumnsOnly();
  TestHeartbeatRejections();
  TestRegisterBootstrapsOnceForMock();
  TestRegisterRequiresMatchingIpForRealProviders();
  TestRegisterRefusedForTerminalInstance();
  TestRequiredAuthAndRevocation();
  TestBootstrapAllowedIgnoresCidrSuffix();

  std::cout << "fleet_unit_heartbeat_service: pass\n";
  return 0;
}
