#include <cassert>
#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/provider/scaleway_provider.hpp"
#include "internal/util/json.hpp"

namespace {

using fleet::provider::ProviderCode;
using fleet::provider::ScalewayProvider;
using fleet::util::HttpRequest;
using fleet::util::HttpResponse;

// Replays queued responses and keeps every request it was sent.
class FakeHttp final : public fleet::util::HttpClient {
 public:
  std::vector<HttpRequest> requests;

  void Reply(long status, std::string body = {}) {
    HttpResponse response;
    response.transport_ok = true;
    response.status       = status;
    response.body         = std::move(body);
    responses_.push_back(std::move(response));
  }

  void ReplyTransportError(std::string error) {
    HttpResponse response;
    response.error = std::move(error);
    responses_.push_back(std::move(response));
  }

  HttpResponse Send(const HttpRequest& request) override {
    requests.push_back(request);
    assert(!responses_.empty());
    auto response = responses_.front();
    responses_.pop_front();
    return response;
  }

  bool CanConnect(const std::string&, int, long) override {
    return false;
  }

 private:
  std::deque<HttpResponse> responses_;
};

struct Fixture {
  Fixture() {
    fleet::runtime::config::ProviderConfig config;
    config.set_code("scaleway");
    config.add_zones("fr-par-2");
    config.set_api_url("https://api.test");
    config.set_project_id("proj-1");
    provider = std::make_unique<ScalewayProvider>(config, "secret", http);
  }

  std::shared_ptr<FakeHttp>         http = std::make_shared<FakeHttp>();
  std::unique_ptr<ScalewayProvider> provider;
};

HttpResponse Response(long status, std::string body = {}) {
  HttpResponse response;
  response.transport_ok = true;
  response.status       = status;
  response.body         = std::move(body);
  return response;
}

void TestClassify() {
  assert(ScalewayProvider::Classify(Response(200)));
  assert(ScalewayProvider::Classify(Response(204)));

  HttpResponse transport;
  transport.error = "connect timeout";
  assert(ScalewayProvider::Classify(transport).code == ProviderCode::kTransient);

  assert(ScalewayProvider::Classify(Response(404)).code == ProviderCode::kNotFound);
  assert(ScalewayProvider::Classify(Response(401)).code == ProviderCode::kUnauthorized);
  assert(ScalewayProvider::Classify(Response(403)).code == ProviderCode::kUnauthorized);
  assert(ScalewayProvider::Classify(Response(429)).code == ProviderCode::kRateLimited);
  assert(ScalewayProvider::Classify(Response(503)).code == ProviderCode::kTransient);
  assert(ScalewayProvider::Classify(Response(403, R"({"type":"quotas_exceeded"})")).code == ProviderCode::kUnauthorized);
  assert(ScalewayProvider::Classify(Response(400, R"({"message":"Quota exceeded for GPU"})")).code == ProviderCode::kQuotaExceeded);
  assert(ScalewayProvider::Classify(Response(412, R"({"message":"out of stock"})")).code == ProviderCode::kOutOfStock);
  assert(ScalewayProvider::Classify(Response(400, R"({"message":"image abc not found"})")).code == ProviderCode::kImageNotFound);
  assert(ScalewayProvider::Classify(Response(409, R"({"type":"conflict"})")).code == ProviderCode::kTransient);
  assert(ScalewayProvider::Classify(Response(400, R"({"type":"resource_still_in_use"})")).code == ProviderCode::kTransient);
  assert(ScalewayProvider::Classify(Response(400, R"({"message":"bad commercial type"})")).code == ProviderCode::kInvalidConfig);
}

void TestCreateSendsServerRequest() {
  Fixture f;
  f.http->Reply(201, R"({"server":{"id":"srv-1","state":"stopped"}})");

  fleet::provider::CreateInstanceRequest request;
  request.instance_id    = "i-1";
  request.zone           = "fr-par-2";
  request.instance_type  = "GPU-3070-S";
  request.image_id       = "img-1";
  request.data_volume_gb = 100;

  std::string id;
  assert(f.provider->CreateInstance(request, id));
  assert(id == "srv-1");

  const auto& sent = f.http->requests.at(0);
  assert(sent.method == "POST");
  assert(sent.url == "https://api.test/instance/v1/zones/fr-par-2/servers");
  assert(sent.headers.at(0).first == "X-Auth-Token" && sent.headers.at(0).second == "secret");

  auto body = fleet::util::ParseJsonObject(sent.body).value();
  assert(fleet::util::StringAt(body, "name") == "fleet-i-1");
  assert(fleet::util::StringAt(body, "commercial_type") == "GPU-3070-S");
  assert(fleet::util::StringAt(body, "project") == "proj-1");
  assert(fleet::util::BoolAt(body, "dynamic_ip_required"));
  assert(fleet::util::NumberAt(body, "volumes.1.size") == 100e9);
}

void TestCreateDisklessGpuSkipsDataVolume() {
  Fixture f;
  f.http->Reply(201, R"({"server":{"id":"srv-2"}})");

  fleet::provider::CreateInstanceRequest request;
  request.instance_id    = "i-2";
  request.zone           = "fr-par-2";
  request.instance_type  = "L4-1-24G";
  request.image_id       = "img";
  request.data_volume_gb = 100;

  std::string id;
  assert(f.provider->CreateInstance(request, id));
  auto body = fleet::util::ParseJsonObject(f.http->requests.at(0).body).value();
  assert(fleet::util::StringAt(body, "boot_type") == "local");
  assert(!fleet::util::FindPath(body, "volumes"));
}

void TestCreateErrors() {
  Fixture f;
  f.http->Reply(404, R"({"message":"unknown zone"})");
  f.http->Reply(200, R"({"server":{}})");

  fleet::provider::CreateInstanceRequest request;
  request.instance_id = "i-3";
  request.zone        = "xx-yyy-9";

  std::string id;
  assert(f.provider->CreateInstance(request, id).code == ProviderCode::kInvalidConfig);
  assert(f.provider->CreateInstance(request, id).code == ProviderCode::kInternal);
}

void TestGetIp() {
  Fixture f;
  f.http->Reply(200, R"({"server":{"id":"s","public_ip":null}})");
  f.http->Reply(200, R"({"server":{"id":"s","public_ip":{"address":"51.15.1.2"}}})");
  f.http->Reply(404);

  std::optional<std::string> ip = std::string("stale");
  assert(f.provider->GetIp("fr-par-2", "s", ip));
  assert(!ip);
  assert(f.provider->GetIp("fr-par-2", "s", ip));
  assert(ip && *ip == "51.15.1.2");
  assert(f.provider->GetIp("fr-par-2", "s", ip).code == ProviderCode::kNotFound);
  assert(f.http->requests.at(0).url == "https://api.test/instance/v1/zones/fr-par-2/servers/s");
}

void TestStartTreatsRunningAsDone() {
  Fixture f;
  f.http->Reply(400, R"({"message":"server should be stopped, current state is running"})");
  assert(f.provider->StartInstance("fr-par-2", "s"));

  const auto& sent = f.http->requests.at(0);
  assert(sent.url == "https://api.test/instance/v1/zones/fr-par-2/servers/s/action");
  assert(fleet::util::StringAt(fleet::util::ParseJsonObject(sent.body).value(), "action") == "poweron");
}

void TestDeletePowersOffRunningServer() {
  Fixture f;
  f.http->Reply(200, R"({"server":{"id":"s","state":"running"}})");
  f.http->Reply(202, R"({"task":{}})");
  assert(f.provider->DeleteInstance("fr-par-2", "s"));
  assert(f.http->requests.at(1).method == "POST");
  assert(fleet::util::StringAt(fleet::util::ParseJsonObject(f.http->requests.at(1).body).value(), "action") == "terminate");

  Fixture stopped;
  stopped.http->Reply(200, R"({"server":{"id":"s","state":"stopped"}})");
  stopped.http->Reply(204);
  assert(stopped.provider->DeleteInstance("fr-par-2", "s"));
  assert(stopped.http->requests.at(1).method == "DELETE");

  Fixture gone;
  gone.http->Reply(404);
  assert(gone.provider->DeleteInstance("fr-par-2", "s").code == ProviderCode::kNotFound);
}

void TestInstanceExists() {
  Fixture f;
  f.http->Reply(200, R"({"server":{"id":"s"}})");
  f.http->Reply(404);
  f.http->ReplyTransportError("timeout");

  bool exists = false;
  assert(f.provider->InstanceExists("fr-par-2", "s", exists) && exists);
  assert(f.provider->InstanceExists("fr-par-2", "s", exists) && !exists);
  assert(f.provider->InstanceExists("fr-par-2", "s", exists).code == ProviderCode::kTransient);
}

void TestListAttachedVolumesAcceptsBothShapes() {
  Fixture f;
  f.http->Reply(200, R"({"server":{"volumes":{"0":{"id":"v0","name":"boot","size":20000000000,"boot":true,"volume_type":"l_ssd"},
                                               "1":{"id":"v1","size":100000000000}}}})");
  f.http->Reply(200, R"({"server":{"volumes":[{"id":"v2","volume_type":"sbs_volume"}]}})");

  std::vector<fleet::provider::AttachedVolume> volumes;
  assert(f.provider->ListAttachedVolumes("fr-par-2", "s", volumes));
  assert(volumes.size() == 2);
  for (const auto& volume : volumes) {
    if (volume.provider_volume_id == "v0") {
      assert(volume.is_boot);
      assert(volume.size_bytes == 20'000'000'000ull);
      assert(volume.volume_type == "l_ssd");
    } else {
      assert(volume.provider_volume_id == "v1");
      assert(volume.volume_type == "unknown");
    }
  }

  assert(f.provider->ListAttachedVolumes("fr-par-2", "s", volumes));
  assert(volumes.size() == 1 && volumes[0].provider_volume_id == "v2");
}

void TestDeleteVolumeFallsBackToBlockApi() {
  Fixture f;
  f.http->Reply(404);
  f.http->Reply(204);
  assert(f.provider->DeleteVolume("fr-par-2", "v1"));
  assert(f.http->requests.at(1).url == "https://api.test/block/v1/zones/fr-par-2/volumes/v1");

  Fixture gone;
  gone.http->Reply(404);
  gone.http->Reply(404);
  assert(gone.provider->DeleteVolume("fr-par-2", "v1").code == ProviderCode::kNotFound);

  Fixture direct;
  direct.http->Reply(204);
  assert(direct.provider->DeleteVolume("fr-par-2", "v1"));
  assert(direct.http->requests.size() == 1);
}

void TestResolveBootImage() {
  Fixture     f;
  std::string image = "previous";
  assert(f.provider->ResolveBootImage("fr-par-2", "H100-1-80G", image));
  assert(!image.empty());
  assert(f.provider->ResolveBootImage("fr-par-2", "DEV1-S", image));
  assert(image.empty());
  assert(f.http->requests.empty());
}

void TestFetchCatalog() {
  Fixture f;
  f.http->Reply(200, R"({"servers":{
    "L4-1-24G":{"hourly_price":0.75,"ncpus":8,"ram":48000000000,"gpu":1,"gpu_info":{"gpu_memory":24000000000},
                "network":{"sum_internal_bandwidth":2500000000}},
    "DEV1-S":{"hourly_price":0.01,"ncpus":2,"ram":2000000000}}})");

  std::vector<fleet::provider::CatalogEntry> entries;
  assert(f.provider->FetchCatalog("fr-par-2", entries));
  assert(entries.size() == 2);
  assert(entries[0].code == "DEV1-S");
  assert(entries[1].code == "L4-1-24G");
  assert(entries[1].gpu_count == 1);
  assert(entries[1].vram_per_gpu_gb == 24);
  assert(entries[1].ram_gb == 48);
  assert(entries[1].bandwidth_bps == 2'500'000'000ull);
}

void TestListInstances() {
  Fixture f;
  f.http->Reply(200, R"({"servers":[{"id":"a","name":"fleet-1","state":"running"},{"id":"b","name":"other","zone":"fr-par-2"}]})");

  std::vector<fleet::provider::ProviderInstance> instances;
  assert(f.provider->ListInstances("fr-par-2", instances));
  assert(instances.size() == 2);
  assert(instances[0].zone == "fr-par-2");
  assert(instances[0].state == "running");
  assert(f.http->requests.at(0).url == "https://api.test/instance/v1/zones/fr-par-2/servers?per_page=100&page=1");
}

} // namespace

int main() {
  TestClassify();
  TestCreateSendsServerRequest();
  TestCreateDisklessGpuSkipsDataVolume();
  TestCreateErrors();
  TestGetIp();
  TestStartTreatsRunningAsDone();
  TestDeletePowersOffRunningServer();
  TestInstanceExists();
  TestListAttachedVolumesAcceptsBothShapes();
  TestDeleteVolumeFallsBackToBlockApi();
  TestResolveBootImage();
  TestFetchCatalog();
  TestListInstances();

  std::cout << "fleet_unit_scaleway_provider: pass\n";
  return 0;
}
