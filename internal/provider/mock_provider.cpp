#include "mock_provider.hpp"

#include <fmt/format.h>

namespace fleet::provider {

namespace {

constexpr std::uint64_t kGiB = 1024ull * 1024ull * 1024ull;

} // namespace

MockProvider::MockProvider(std::string code, std::vector<std::string> zones) : code_(std::move(code)), zones_(std::move(zones)) {
}

ProviderResult MockProvider::Enter(std::string_view op) {
  const std::string key(op);
  ++calls_[key];

  auto it = faults_.find(key);
  if (it == faults_.end() || it->second.remaining == 0) {
    return ProviderResult::Ok();
  }
  --it->second.remaining;
  return ProviderResult::Err(it->second.code, "injected " + key + " failure");
}

std::string MockProvider::NextId(std::string_view prefix) {
  return fmt::format("{}-{:06d}", prefix, next_id_++);
}

ProviderResult MockProvider::CreateInstance(const CreateInstanceRequest& request, std::string& provider_instance_id) {
  std::lock_guard lock(mutex_);
  if (auto res = Enter("create"); !res) return res;
  if (request.image_id.empty()) return ProviderResult::Err(ProviderCode::kImageNotFound, "no image");

  provider_instance_id = NextId("srv");

  Server server;
  server.zone          = request.zone;
  server.name          = request.instance_id;
  server.instance_type = request.instance_type;
  server.image_id      = request.image_id;
  servers_[provider_instance_id] = server;

  Volume boot{provider_instance_id, {NextId("vol"), request.instance_id + "-boot", "b_ssd", 20 * kGiB, true}};
  volumes_[boot.info.provider_volume_id] = boot;

  if (request.data_volume_gb > 0) {
    Volume data{provider_instance_id,
                {NextId("vol"), request.instance_id + "-data", "sbs_volume", request.data_volume_gb * kGiB, false}};
    volumes_[data.info.provider_volume_id] = data;
  }
  return ProviderResult::Ok();
}

ProviderResult MockProvider::StartInstance(const std::string&, const std::string& provider_instance_id) {
  std::lock_guard lock(mutex_);
  if (auto res = Enter("start"); !res) return res;

  auto it = servers_.find(provider_instance_id);
  if (it == servers_.end()) return ProviderResult::Err(ProviderCode::kNotFound, provider_instance_id);
  it->second.running = true;
  return ProviderResult::Ok();
}

ProviderResult MockProvider::GetIp(const std::string&, const std::string& provider_instance_id, std::optional<std::string>& ip) {
  std::lock_guard lock(mutex_);
  if (auto res = Enter("get_ip"); !res) return res;

  auto it = servers_.find(provider_instance_id);
  if (it == servers_.end()) return ProviderResult::Err(ProviderCode::kNotFound, provider_instance_id);

  auto& server = it->second;
  if (!server.running || server.ip_polls++ < ip_delay_polls_) {
    ip.reset();
    return ProviderResult::Ok();
  }
  if (server.ip.empty()) {
    const auto n = next_ip_++;
    server.ip    = fmt::format("10.42.{}.{}", (n >> 8) & 0xff, n & 0xff);
  }
  ip = server.ip;
  return ProviderResult::Ok();
}

ProviderResult MockProvider::DeleteInstance(const std::string&, const std::string& provider_instance_id) {
  std::lock_guard lock(mutex_);
  if (auto res = Enter("delete"); !res) return res;

  // volumes outlive the server until deleted explicitly
  if (servers_.erase(provider_instance_id) == 0) {
    return ProviderResult::Err(ProviderCode::kNotFound, provider_instance_id);
  }
  return ProviderResult::Ok();
}

ProviderResult MockProvider::InstanceExists(const std::string&, const std::string& provider_instance_id, bool& exists) {
  std::lock_guard lock(mutex_);
  if (auto res = Enter("exists"); !res) return res;
  exists = servers_.contains(provider_instance_id);
  return ProviderResult::Ok();
}

ProviderResult MockProvider::ListAttachedVolumes(const std::string&, const std::string& provider_instance_id,
                                                 std::vector<AttachedVolume>& volumes) {
  std::lock_guard lock(mutex_);
  if (auto res = Enter("list_volumes"); !res) return res;
  if (!servers_.contains(provider_instance_id)) return ProviderResult::Err(ProviderCode::kNotFound, provider_instance_id);

  volumes.clear();
  for (const auto& [_, volume] : volumes_) {
    if (volume.server_id == provider_instance_id) volumes.push_back(volume.info);
  }
  return ProviderResult::Ok();
}

ProviderResult MockProvider::DeleteVolume(const std::string&, const std::string& provider_volume_id) {
  std::lock_guard lock(mutex_);
  if (auto res = Enter("delete_volume"); !res) return res;
  if (volumes_.erase(provider_volume_id) == 0) return ProviderResult::Err(ProviderCode::kNotFound, provider_volume_id);
  return ProviderResult::Ok();
}

ProviderResult MockProvider::ResolveBootImage(const std::string&, const std::string&, std::string& image_id) {
  std::lock_guard lock(mutex_);
  if (auto res = Enter("resolve_image"); !res) return res;
  image_id = boot_image_;
  return ProviderResult::Ok();
}

ProviderResult MockProvider::ListInstances(const std::string& zone, std::vector<ProviderInstance>& instances) {
  std::lock_guard lock(mutex_);
  if (auto res = Enter("list"); !res) return res;

  instances.clear();
  for (const auto& [id, server] : servers_) {
    if (server.zone != zone) continue;
    instances.push_back({id, server.name, server.zone, server.running ? "running" : "stopped"});
  }
  return ProviderResult::Ok();
}

ProviderResult MockProvider::FetchCatalog(const std::string&, std::vector<CatalogEntry>& entries) {
  std::lock_guard lock(mutex_);
  if (auto res = Enter("catalog"); !res) return res;

  entries = {
      {"MOCK-GPU-S", "Mock single L4", 0.85, 8, 48, 1, 24, 2'500'000'000ull},
      {"MOCK-GPU-L", "Mock 2x H100", 5.60, 48, 480, 2, 80, 20'000'000'000ull},
  };
  return ProviderResult::Ok();
}

void MockProvider::FailNext(std::string_view op, ProviderCode code, int times) {
  std::lock_guard lock(mutex_);
  faults_[std::string(op)] = Fault{code, times};
}

void MockProvider::SetIpDelayPolls(int polls) {
  std::lock_guard lock(mutex_);
  ip_delay_polls_ = polls;
}

void MockProvider::SetBootImage(std::string image_id) {
  std::lock_guard lock(mutex_);
  boot_image_ = std::move(image_id);
}

void MockProvider::DeleteOutOfBand(const std::string& provider_instance_id) {
  std::lock_guard lock(mutex_);
  servers_.erase(provider_instance_id);
}

std::string MockProvider::AttachVolume(const std::string& provider_instance_id, std::uint64_t size_bytes, bool is_boot) {
  std::lock_guard lock(mutex_);
  Volume volume{provider_instance_id, {NextId("vol"), "extra", "sbs_volume", size_bytes, is_boot}};
  const auto id = volume.info.provider_volume_id;
  volumes_[id]  = volume;
  return id;
}

bool MockProvider::ServerExists(const std::string& provider_instance_id) const {
  std::lock_guard lock(mutex_);
  return servers_.contains(provider_instance_id);
}

bool MockProvider::VolumeExists(const std::string& provider_volume_id) const {
  std::lock_guard lock(mutex_);
  return volumes_.contains(provider_volume_id);
}

std::size_t MockProvider::ServerCount() const {
  std::lock_guard lock(mutex_);
  return servers_.size();
}

int MockProvider::CallCount(std::string_view op) const {
  std::lock_guard lock(mutex_);
  auto it = calls_.find(std::string(op));
  return it == calls_.end() ? 0 : it->second;
}

} // namespace fleet::provider
