#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cloud_provider.hpp"
#include "internal/config/settings.hpp"
#include "internal/util/http_client.hpp"

namespace fleet::provider {

/*
  Provider code -> adapter.

  Built once at startup and read-only afterwards, so lookups need no
  locking.
*/
class ProviderRegistry {
 public:
  ProviderRegistry() = default;

  // Builds one adapter per configured provider. Scaleway secrets are read
  // from the environment variable named in the config.
  static std::shared_ptr<ProviderRegistry> FromSettings(const config::Settings& settings, std::shared_ptr<util::HttpClient> http);

  // AlreadyExists when the code is taken.
  void Register(std::shared_ptr<CloudProvider> provider, std::string default_image_id = {});

  // nullptr when the code is not configured.
  std::shared_ptr<CloudProvider> Find(const std::string& code) const;

  // Configured fallback image, empty when none.
  std::string DefaultImage(const std::string& code) const;

  std::vector<std::shared_ptr<CloudProvider>> All() const;

 private:
  struct Entry {
    std::shared_ptr<CloudProvider> provider;
    std::string                    default_image_id;
  };

  std::map<std::string, Entry> providers_;
};

} // namespace fleet::provider
