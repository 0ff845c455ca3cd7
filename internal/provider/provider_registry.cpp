#include "provider_registry.hpp"

#include <cstdlib>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "mock_provider.hpp"
#include "scaleway_provider.hpp"

namespace fleet::provider {

std::shared_ptr<ProviderRegistry> ProviderRegistry::FromSettings(const config::Settings& settings,
                                                                 std::shared_ptr<util::HttpClient> http) {
  auto registry = std::make_shared<ProviderRegistry>();

  for (const auto& cfg : settings.providers) {
    switch (cfg.kind()) {
      case fleet::runtime::config::PROVIDER_KIND_MOCK: {
        std::vector<std::string> zones(cfg.zones().begin(), cfg.zones().end());
        if (zones.empty()) zones.push_back("mock-zone-1");
        registry->Register(std::make_shared<MockProvider>(cfg.code(), std::move(zones)), cfg.default_image_id());
        break;
      }

      case fleet::runtime::config::PROVIDER_KIND_SCALEWAY: {
        std::string secret;
        if (!cfg.secret_key_env().empty()) {
          if (const char* value = std::getenv(cfg.secret_key_env().c_str())) secret = value;
        }
        if (secret.empty()) {
          FLEET_LOG_WARN("provider secret not set, calls will be rejected",
                         {observability::StringField("provider", cfg.code()),
                          observability::StringField("env", cfg.secret_key_env())});
        }
        registry->Register(std::make_shared<ScalewayProvider>(cfg, std::move(secret), http), cfg.default_image_id());
        break;
      }

      default:
        throw util::InvalidArgument("unsupported provider kind for " + cfg.code());
    }

    FLEET_LOG_INFO("provider registered", {observability::StringField("provider", cfg.code()),
                                           observability::IntField("zones", cfg.zones_size())});
  }
  return registry;
}

void ProviderRegistry::Register(std::shared_ptr<CloudProvider> provider, std::string default_image_id) {
  const auto code = provider->Code();
  if (!providers_.emplace(code, Entry{std::move(provider), std::move(default_image_id)}).second) {
    throw util::AlreadyExists("provider already registered: " + code);
  }
}

std::shared_ptr<CloudProvider> ProviderRegistry::Find(const std::string& code) const {
  auto it = providers_.find(code);
  return it == providers_.end() ? nullptr : it->second.provider;
}

std::string ProviderRegistry::DefaultImage(const std::string& code) const {
  auto it = providers_.find(code);
  return it == providers_.end() ? std::string{} : it->second.default_image_id;
}

std::vector<std::shared_ptr<CloudProvider>> ProviderRegistry::All() const {
  std::vector<std::shared_ptr<CloudProvider>> out;
  out.reserve(providers_.size());
  for (const auto& [code, entry] : providers_) {
    out.push_back(entry.provider);
  }
  return out;
}

} // namespace fleet::provider
