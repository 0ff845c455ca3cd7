#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cloud_provider.hpp"

namespace fleet::provider {

/*
  In-process provider used by local runs and tests.

  Servers and volumes live in memory. Tests can inject failures per
  operation, delay IP assignment, and delete servers out of band to
  simulate provider-side drift.

  Operation names used for fault injection and call counters:
    create, start, get_ip, delete, exists, list_volumes,
    delete_volume, resolve_image, list, catalog
*/
class MockProvider final : public CloudProvider {
 public:
  explicit MockProvider(std::string code = "mock", std::vector<std::string> zones = {"mock-zone-1"});

  const std::string& Code() const override {
    return code_;
  }

  const std::vector<std::string>& Zones() const override {
    return zones_;
  }

  ProviderResult CreateInstance(const CreateInstanceRequest& request, std::string& provider_instance_id) override;
  ProviderResult StartInstance(const std::string& zone, const std::string& provider_instance_id) override;
  ProviderResult GetIp(const std::string& zone, const std::string& provider_instance_id, std::optional<std::string>& ip) override;
  ProviderResult DeleteInstance(const std::string& zone, const std::string& provider_instance_id) override;
  ProviderResult InstanceExists(const std::string& zone, const std::string& provider_instance_id, bool& exists) override;
  ProviderResult ListAttachedVolumes(const std::string& zone, const std::string& provider_instance_id,
                                     std::vector<AttachedVolume>& volumes) override;
  ProviderResult DeleteVolume(const std::string& zone, const std::string& provider_volume_id) override;
  ProviderResult ResolveBootImage(const std::string& zone, const std::string& instance_type, std::string& image_id) override;
  ProviderResult ListInstances(const std::string& zone, std::vector<ProviderInstance>& instances) override;
  ProviderResult FetchCatalog(const std::string& zone, std::vector<CatalogEntry>& entries) override;

  // --- test hooks -------------------------------------------------------

  // The next `times` calls of `op` fail with `code`.
  void FailNext(std::string_view op, ProviderCode code, int times = 1);

  // GetIp returns no address for the first `polls` calls per server.
  void SetIpDelayPolls(int polls);

  void SetBootImage(std::string image_id);

  // Removes the server as if someone deleted it in the provider console.
  void DeleteOutOfBand(const std::string& provider_instance_id);

  // Attaches an extra volume to a server.
  std::string AttachVolume(const std::string& provider_instance_id, std::uint64_t size_bytes, bool is_boot = false);

  bool ServerExists(const std::string& provider_instance_id) const;
  bool VolumeExists(const std::string& provider_volume_id) const;
  std::size_t ServerCount() const;

  int CallCount(std::string_view op) const;

 private:
  struct Server {
    std::string                zone;
    std::string                name;
    std::string                instance_type;
    std::string                image_id;
    bool                       running  = false;
    int                        ip_polls = 0;
    std::string                ip;
  };

  struct Volume {
    std::string    server_id;
    AttachedVolume info;
  };

  struct Fault {
    ProviderCode code      = ProviderCode::kOk;
    int          remaining = 0;
  };

  // Counts the call and consumes an injected fault. Caller holds mutex_.
  ProviderResult Enter(std::string_view op);

  std::string NextId(std::string_view prefix);

  const std::string              code_;
  const std::vector<std::string> zones_;

  mutable std::mutex                      mutex_;
  std::map<std::string, Server>           servers_;
  std::map<std::string, Volume>           volumes_;
  std::unordered_map<std::string, Fault>  faults_;
  std::unordered_map<std::string, int>    calls_;
  int                                     ip_delay_polls_ = 0;
  std::string                             boot_image_     = "mock-ubuntu-22.04-cuda";
  std::uint64_t                           next_id_        = 1;
  std::uint32_t                           next_ip_        = 10;
};

} // namespace fleet::provider
