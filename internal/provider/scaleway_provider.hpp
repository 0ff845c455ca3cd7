#pragma once

#include <google/protobuf/struct.pb.h>

#include <memory>
#include <string>
#include <vector>

#include "cloud_provider.hpp"
#include "config/config.pb.h"
#include "internal/util/http_client.hpp"

namespace fleet::provider {

/*
  Scaleway Instance API adapter (HTTP/JSON over util::HttpClient).

  Endpoints, relative to api_url (default https://api.scaleway.com):
    servers   /instance/v1/zones/{zone}/servers[/{id}[/action]]
    volumes   /instance/v1/zones/{zone}/volumes/{id}
              /block/v1/zones/{zone}/volumes/{id}   (SBS fallback)
    catalog   /instance/v1/zones/{zone}/products/servers

  Calls never sleep or poll. Multi-step operations (power off before
  delete) return kTransient while the provider works, and the caller's
  next tick continues.
*/
class ScalewayProvider final : public CloudProvider {
 public:
  ScalewayProvider(const fleet::runtime::config::ProviderConfig& config, std::string secret_key,
                   std::shared_ptr<util::HttpClient> http);

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

  // Maps an HTTP outcome to a provider code. Exposed for tests.
  static ProviderResult Classify(const util::HttpResponse& response);

 private:
  util::HttpResponse Call(std::string_view op, const std::string& method, const std::string& path, const std::string& body = {});

  std::string ServerPath(const std::string& zone, const std::string& provider_instance_id = {}) const;

  // GET server; kNotFound when it is gone.
  ProviderResult GetServer(const std::string& zone, const std::string& provider_instance_id, google::protobuf::Struct& server);

  const std::string              code_;
  const std::vector<std::string> zones_;
  const std::string              api_url_;
  const std::string              project_id_;
  const std::string              secret_key_;
  const long                     timeout_ms_;

  std::shared_ptr<util::HttpClient> http_;
};

} // namespace fleet::provider
