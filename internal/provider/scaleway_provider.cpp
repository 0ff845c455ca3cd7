#include "scaleway_provider.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/json.hpp"

namespace fleet::provider {

namespace {

constexpr const char* kDefaultApiUrl = "https://api.scaleway.com";

// Ubuntu GPU image validated for diskless-boot GPU types.
constexpr const char* kGpuBootImage = "5c3d28db-33ce-4997-8572-f49506339283";

constexpr std::uint64_t kGB = 1000ull * 1000ull * 1000ull;

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

bool StartsWith(const std::string& value, std::string_view prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

bool IsGpuType(const std::string& instance_type) {
  const auto upper = Upper(instance_type);
  return StartsWith(upper, "RENDER-") || StartsWith(upper, "L4-") || StartsWith(upper, "L40S-") || StartsWith(upper, "H100-") ||
         upper.find("GPU") != std::string::npos;
}

// L4 / L40S / H100 refuse local volumes; the API creates a block boot volume itself.
bool RequiresDisklessBoot(const std::string& instance_type) {
  const auto upper = Upper(instance_type);
  return StartsWith(upper, "L4-") || StartsWith(upper, "L40S-") || StartsWith(upper, "H100-");
}

void SetString(google::protobuf::Struct& object, const std::string& key, const std::string& value) {
  (*object.mutable_fields())[key].set_string_value(value);
}

std::string ActionBody(std::string_view action) {
  google::protobuf::Struct body;
  SetString(body, "action", std::string(action));
  return util::ToJson(body);
}

AttachedVolume ToAttachedVolume(const google::protobuf::Struct& volume) {
  AttachedVolume out;
  out.provider_volume_id = util::StringAt(volume, "id");
  out.name               = util::StringAt(volume, "name");
  out.volume_type        = util::StringAt(volume, "volume_type", "unknown");
  out.size_bytes         = static_cast<std::uint64_t>(util::NumberAt(volume, "size"));
  out.is_boot            = util::BoolAt(volume, "boot");
  return out;
}

} // namespace

ScalewayProvider::ScalewayProvider(const fleet::runtime::config::ProviderConfig& config, std::string secret_key,
                                   std::shared_ptr<util::HttpClient> http)
    : code_(config.code()),
      zones_(config.zones().begin(), config.zones().end()),
      api_url_(config.api_url().empty() ? kDefaultApiUrl : config.api_url()),
      project_id_(config.project_id()),
      secret_key_(std::move(secret_key)),
      timeout_ms_(config.request_timeout_ms() == 0 ? 15000 : static_cast<long>(config.request_timeout_ms())),
      http_(std::move(http)) {
}

ProviderResult ScalewayProvider::Classify(const util::HttpResponse& response) {
  if (!response.transport_ok) {
    return ProviderResult::Err(ProviderCode::kTransient, response.error.empty() ? "transport failure" : response.error);
  }
  if (response.Ok()) {
    return ProviderResult::Ok();
  }

  const auto message = fmt::format("status={} body={}", response.status, response.body);
  const auto body    = Lower(response.body);

  switch (response.status) {
    case 404:
      return ProviderResult::Err(ProviderCode::kNotFound, message);
    case 401:
    case 403:
      return ProviderResult::Err(ProviderCode::kUnauthorized, message);
    case 429:
      return ProviderResult::Err(ProviderCode::kRateLimited, message);
    default:
      break;
  }

  if (response.status >= 500) {
    return ProviderResult::Err(ProviderCode::kTransient, message);
  }
  if (body.find("quota") != std::string::npos) {
    return ProviderResult::Err(ProviderCode::kQuotaExceeded, message);
  }
  if (body.find("out of stock") != std::string::npos || body.find("out_of_stock") != std::string::npos) {
    return ProviderResult::Err(ProviderCode::kOutOfStock, message);
  }
  if (body.find("image") != std::string::npos && body.find("not found") != std::string::npos) {
    return ProviderResult::Err(ProviderCode::kImageNotFound, message);
  }
  // 409 "resource_still_in_use" and friends clear up on their own.
  if (response.status == 409 || body.find("still_in_use") != std::string::npos) {
    return ProviderResult::Err(ProviderCode::kTransient, message);
  }
  return ProviderResult::Err(ProviderCode::kInvalidConfig, message);
}

util::HttpResponse ScalewayProvider::Call(std::string_view op, const std::string& method, const std::string& path,
                                          const std::string& body) {
  util::HttpRequest request;
  request.method     = method;
  request.url        = api_url_ + path;
  request.body       = body;
  request.timeout_ms = timeout_ms_;
  request.headers.emplace_back("X-Auth-Token", secret_key_);
  if (!body.empty()) {
    request.headers.emplace_back("Content-Type", "application/json");
  }

  const auto start    = std::chrono::steady_clock::now();
  auto       response = http_->Send(request);
  const auto elapsed  = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

  const bool success = response.transport_ok && response.status < 500;
  observability::Metrics::Instance().ObserveProviderCallMs(code_, op, elapsed, success);

  if (!response.Ok() && response.status != 404) {
    FLEET_LOG_WARN("provider call failed",
                   {observability::StringField("provider", code_), observability::StringField("op", op),
                    observability::StringField("method", method), observability::StringField("path", path),
                    observability::IntField("status", response.status),
                    observability::StringField("error", response.error)});
  }
  return response;
}

std::string ScalewayProvider::ServerPath(const std::string& zone, const std::string& provider_instance_id) const {
  if (provider_instance_id.empty()) {
    return fmt::format("/instance/v1/zones/{}/servers", zone);
  }
  return fmt::format("/instance/v1/zones/{}/servers/{}", zone, provider_instance_id);
}

ProviderResult ScalewayProvider::GetServer(const std::string& zone, const std::string& provider_instance_id,
                                           google::protobuf::Struct& server) {
  auto response = Call("get_server", "GET", ServerPath(zone, provider_instance_id));
  if (auto res = Classify(response); !res) {
    return res;
  }

  auto parsed = util::ParseJsonObject(response.body);
  const auto* value = parsed ? util::FindPath(*parsed, "server") : nullptr;
  if (!value || value->kind_case() != google::protobuf::Value::kStructValue) {
    return ProviderResult::Err(ProviderCode::kInternal, "malformed server response");
  }
  server = value->struct_value();
  return ProviderResult::Ok();
}

ProviderResult ScalewayProvider::CreateInstance(const CreateInstanceRequest& request, std::string& provider_instance_id) {
  google::protobuf::Struct body;
  SetString(body, "name", "fleet-" + request.instance_id);
  SetString(body, "commercial_type", request.instance_type);
  SetString(body, "image", request.image_id);
  SetString(body, "project", project_id_);
  (*body.mutable_fields())["dynamic_ip_required"].set_bool_value(true);

  auto* tags = (*body.mutable_fields())["tags"].mutable_list_value();
  tags->add_values()->set_string_value("fleet-orchestrator");
  tags->add_values()->set_string_value("instance:" + request.instance_id);

  if (RequiresDisklessBoot(request.instance_type)) {
    SetString(body, "boot_type", "local");
  } else if (request.data_volume_gb > 0) {
    google::protobuf::Struct data;
    SetString(data, "name", request.instance_id + "-data");
    SetString(data, "volume_type", "sbs_volume");
    (*data.mutable_fields())["size"].set_number_value(static_cast<double>(request.data_volume_gb * kGB));

    google::protobuf::Struct volumes;
    *(*volumes.mutable_fields())["1"].mutable_struct_value() = data;
    *(*body.mutable_fields())["volumes"].mutable_struct_value() = volumes;
  }

  auto response = Call("create", "POST", ServerPath(request.zone), util::ToJson(body));
  if (auto res = Classify(response); !res) {
    // a 404 on create means the zone or type is unknown, not that something is gone
    if (res.code == ProviderCode::kNotFound) res.code = ProviderCode::kInvalidConfig;
    return res;
  }

  auto parsed = util::ParseJsonObject(response.body);
  provider_instance_id = parsed ? util::StringAt(*parsed, "server.id") : std::string{};
  if (provider_instance_id.empty()) {
    return ProviderResult::Err(ProviderCode::kInternal, "no server id in create response");
  }

  FLEET_LOG_INFO("scaleway server created", {observability::StringField("instance_id", request.instance_id),
                                             observability::StringField("server_id", provider_instance_id),
                                             observability::StringField("zone", request.zone),
                                             observability::StringField("type", request.instance_type)});
  return ProviderResult::Ok();
}

ProviderResult ScalewayProvider::StartInstance(const std::string& zone, const std::string& provider_instance_id) {
  auto response = Call("start", "POST", ServerPath(zone, provider_instance_id) + "/action", ActionBody("poweron"));
  auto res      = Classify(response);

  // poweron on a running server is rejected; treat it as done
  if (res.code == ProviderCode::kInvalidConfig && Lower(response.body).find("running") != std::string::npos) {
    return ProviderResult::Ok();
  }
  return res;
}

ProviderResult ScalewayProvider::GetIp(const std::string& zone, const std::string& provider_instance_id,
                                       std::optional<std::string>& ip) {
  google::protobuf::Struct server;
  if (auto res = GetServer(zone, provider_instance_id, server); !res) {
    return res;
  }

  // dynamic IPs are only assigned once the server is running
  auto address = util::StringAt(server, "public_ip.address");
  if (address.empty() || address == "null") {
    ip.reset();
  } else {
    ip = std::move(address);
  }
  return ProviderResult::Ok();
}

ProviderResult ScalewayProvider::DeleteInstance(const std::string& zone, const std::string& provider_instance_id) {
  google::protobuf::Struct server;
  if (auto res = GetServer(zone, provider_instance_id, server); !res) {
    return res;
  }

  const auto state = Lower(util::StringAt(server, "state"));
  if (state != "stopped" && state != "stopped in place" && state != "stopped_in_place") {
    // The terminate action powers off and then removes the server.
    auto response = Call("delete", "POST", ServerPath(zone, provider_instance_id) + "/action", ActionBody("terminate"));
    return Classify(response);
  }

  auto response = Call("delete", "DELETE", ServerPath(zone, provider_instance_id));
  return Classify(response);
}

ProviderResult ScalewayProvider::InstanceExists(const std::string& zone, const std::string& provider_instance_id, bool& exists) {
  auto response = Call("exists", "GET", ServerPath(zone, provider_instance_id));
  auto res      = Classify(response);
  if (res.code == ProviderCode::kNotFound) {
    exists = false;
    return ProviderResult::Ok();
  }
  if (!res) {
    return res;
  }
  exists = true;
  return ProviderResult::Ok();
}

ProviderResult ScalewayProvider::ListAttachedVolumes(const std::string& zone, const std::string& provider_instance_id,
                                                     std::vector<AttachedVolume>& volumes) {
  google::protobuf::Struct server;
  if (auto res = GetServer(zone, provider_instance_id, server); !res) {
    return res;
  }

  volumes.clear();
  const auto* value = util::FindPath(server, "volumes");
  if (!value) {
    return ProviderResult::Ok();
  }

  // Either a list or an object keyed "0", "1", ... depending on the server type.
  if (value->kind_case() == google::protobuf::Value::kListValue) {
    for (const auto& item : value->list_value().values()) {
      if (item.kind_case() == google::protobuf::Value::kStructValue) {
        auto volume = ToAttachedVolume(item.struct_value());
        if (!volume.provider_volume_id.empty()) volumes.push_back(std::move(volume));
      }
    }
  } else if (value->kind_case() == google::protobuf::Value::kStructValue) {
    for (const auto& [key, item] : value->struct_value().fields()) {
      if (item.kind_case() == google::protobuf::Value::kStructValue) {
        auto volume = ToAttachedVolume(item.struct_value());
        if (!volume.provider_volume_id.empty()) volumes.push_back(std::move(volume));
      }
    }
  }
  return ProviderResult::Ok();
}

ProviderResult ScalewayProvider::DeleteVolume(const std::string& zone, const std::string& provider_volume_id) {
  auto instance_api = Call("delete_volume", "DELETE", fmt::format("/instance/v1/zones/{}/volumes/{}", zone, provider_volume_id));
  if (instance_api.Ok()) {
    return ProviderResult::Ok();
  }

  // SBS volumes only exist on the block API.
  auto block_api = Call("delete_volume", "DELETE", fmt::format("/block/v1/zones/{}/volumes/{}", zone, provider_volume_id));
  auto res       = Classify(block_api);
  if (res || res.code != ProviderCode::kNotFound) {
    return res;
  }

  // Gone from both APIs.
  if (Classify(instance_api).code == ProviderCode::kNotFound) {
    return ProviderResult::Err(ProviderCode::kNotFound, provider_volume_id);
  }
  return Classify(instance_api);
}

ProviderResult ScalewayProvider::ResolveBootImage(const std::string&, const std::string& instance_type, std::string& image_id) {
  if (IsGpuType(instance_type)) {
    image_id = kGpuBootImage;
  } else {
    image_id.clear();
  }
  return ProviderResult::Ok();
}

ProviderResult ScalewayProvider::ListInstances(const std::string& zone, std::vector<ProviderInstance>& instances) {
  instances.clear();

  for (int page = 1;; ++page) {
    auto response = Call("list", "GET", ServerPath(zone) + fmt::format("?per_page=100&page={}", page));
    if (auto res = Classify(response); !res) {
      return res;
    }

    auto parsed = util::ParseJsonObject(response.body);
    const auto* servers = parsed ? util::FindPath(*parsed, "servers") : nullptr;
    if (!servers || servers->kind_case() != google::protobuf::Value::kListValue) {
      return ProviderResult::Ok();
    }

    for (const auto& item : servers->list_value().values()) {
      if (item.kind_case() != google::protobuf::Value::kStructValue) continue;
      const auto& server = item.struct_value();

      ProviderInstance instance;
      instance.provider_instance_id = util::StringAt(server, "id");
      instance.name                 = util::StringAt(server, "name");
      instance.zone                 = util::StringAt(server, "zone", zone);
      instance.state                = util::StringAt(server, "state");
      if (!instance.provider_instance_id.empty()) instances.push_back(std::move(instance));
    }

    if (servers->list_value().values_size() < 100) {
      return ProviderResult::Ok();
    }
  }
}

ProviderResult ScalewayProvider::FetchCatalog(const std::string& zone, std::vector<CatalogEntry>& entries) {
  auto response = Call("catalog", "GET", fmt::format("/instance/v1/zones/{}/products/servers?per_page=100", zone));
  if (auto res = Classify(response); !res) {
    return res;
  }

  entries.clear();
  auto parsed = util::ParseJsonObject(response.body);
  const auto* servers = parsed ? util::FindPath(*parsed, "servers") : nullptr;
  if (!servers || servers->kind_case() != google::protobuf::Value::kStructValue) {
    return ProviderResult::Err(ProviderCode::kInternal, "malformed catalog response");
  }

  for (const auto& [code, item] : servers->struct_value().fields()) {
    if (item.kind_case() != google::protobuf::Value::kStructValue) continue;
    const auto& product = item.struct_value();

    CatalogEntry entry;
    entry.code            = code;
    entry.name            = code;
    entry.cost_per_hour   = util::NumberAt(product, "hourly_price");
    entry.cpu_count       = static_cast<std::uint32_t>(util::NumberAt(product, "ncpus"));
    entry.ram_gb          = static_cast<std::uint32_t>(util::NumberAt(product, "ram") / static_cast<double>(kGB));
    entry.gpu_count       = static_cast<std::uint32_t>(util::NumberAt(product, "gpu"));
    entry.vram_per_gpu_gb = static_cast<std::uint32_t>(util::NumberAt(product, "gpu_info.gpu_memory") / static_cast<double>(kGB));
    entry.bandwidth_bps   = static_cast<std::uint64_t>(util::NumberAt(product, "network.sum_internal_bandwidth"));
    entries.push_back(std::move(entry));
  }

  std::sort(entries.begin(), entries.end(), [](const CatalogEntry& a, const CatalogEntry& b) { return a.code < b.code; });
  return ProviderResult::Ok();
}

} // namespace fleet::provider
