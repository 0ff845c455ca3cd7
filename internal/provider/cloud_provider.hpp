#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet::provider {

enum class ProviderCode {
  kOk = 0,

  // resource does not exist; success during teardown
  kNotFound,

  // retryable
  kTransient,
  kRateLimited,

  // permanent
  kQuotaExceeded,
  kInvalidConfig,
  kImageNotFound,
  kOutOfStock,
  kUnauthorized,

  kUnsupported,
  kInternal,
};

constexpr bool IsPermanent(ProviderCode code) {
  return code == ProviderCode::kQuotaExceeded || code == ProviderCode::kInvalidConfig || code == ProviderCode::kImageNotFound ||
         code == ProviderCode::kOutOfStock || code == ProviderCode::kUnauthorized || code == ProviderCode::kUnsupported;
}

std::string_view ToString(ProviderCode code);

struct ProviderResult {
  ProviderCode code = ProviderCode::kOk;
  std::string  message;

  static ProviderResult Ok() {
    return {};
  }

  static ProviderResult Err(ProviderCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ProviderCode::kOk;
  }
};

struct CreateInstanceRequest {
  std::string   instance_id; // our id, used as the server name
  std::string   zone;
  std::string   instance_type;
  std::string   image_id;
  std::uint32_t data_volume_gb = 0;
};

struct AttachedVolume {
  std::string   provider_volume_id;
  std::string   name;
  std::string   volume_type;
  std::uint64_t size_bytes = 0;
  bool          is_boot    = false;
};

struct ProviderInstance {
  std::string provider_instance_id;
  std::string name;
  std::string zone;
  std::string state;
};

struct CatalogEntry {
  std::string   code;
  std::string   name;
  double        cost_per_hour   = 0;
  std::uint32_t cpu_count       = 0;
  std::uint32_t ram_gb          = 0;
  std::uint32_t gpu_count       = 0;
  std::uint32_t vram_per_gpu_gb = 0;
  std::uint64_t bandwidth_bps   = 0;
};

/*
  CloudProvider

  One adapter per provider API. Calls are blocking and never run inside
  a store transaction. Results carry a ProviderCode so callers can tell
  "already gone", retryable and permanent failures apart.

  Implementations must be thread-safe: the dispatcher and every job call
  into the same instance concurrently.
*/
class CloudProvider {
 public:
  virtual ~CloudProvider() = default;

  // Provider code stored on instance rows ("scaleway", "mock").
  virtual const std::string& Code() const = 0;

  virtual ProviderResult CreateInstance(const CreateInstanceRequest& request, std::string& provider_instance_id) = 0;
  virtual ProviderResult StartInstance(const std::string& zone, const std::string& provider_instance_id) = 0;

  // ip stays empty while the provider has not assigned one yet.
  virtual ProviderResult GetIp(const std::string& zone, const std::string& provider_instance_id, std::optional<std::string>& ip) = 0;

  virtual ProviderResult DeleteInstance(const std::string& zone, const std::string& provider_instance_id) = 0;
  virtual ProviderResult InstanceExists(const std::string& zone, const std::string& provider_instance_id, bool& exists) = 0;

  virtual ProviderResult ListAttachedVolumes(const std::string& zone, const std::string& provider_instance_id,
                                             std::vector<AttachedVolume>& volumes) = 0;
  virtual ProviderResult DeleteVolume(const std::string& zone, const std::string& provider_volume_id) = 0;

  // Empty image_id means the provider has no opinion; callers fall back.
  virtual ProviderResult ResolveBootImage(const std::string& zone, const std::string& instance_type, std::string& image_id) = 0;

  virtual ProviderResult ListInstances(const std::string& zone, std::vector<ProviderInstance>& instances) = 0;
  virtual ProviderResult FetchCatalog(const std::string& zone, std::vector<CatalogEntry>& entries) = 0;

  virtual const std::vector<std::string>& Zones() const = 0;
};

} // namespace fleet::provider
