#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/provider/cloud_provider.hpp"
#include "internal/provider/mock_provider.hpp"

namespace fleet::testing {

/*
  Delegates to a MockProvider and lets a test run code around create.

  before_create runs on every create, on the calling thread. after_create
  runs once, after the next successful create, and is cleared before it
  runs so it may create again.
*/
class HookedProvider final : public provider::CloudProvider {
 public:
  explicit HookedProvider(std::shared_ptr<provider::MockProvider> inner) : inner_(std::move(inner)) {
  }

  std::function<void()> before_create;
  std::function<void()> after_create;

  const std::string& Code() const override {
    return inner_->Code();
  }
  const std::vector<std::string>& Zones() const override {
    return inner_->Zones();
  }
  provider::ProviderResult CreateInstance(const provider::CreateInstanceRequest& request, std::string& id) override {
    if (before_create) before_create();
    auto res = inner_->CreateInstance(request, id);
    if (res && after_create) {
      auto hook = std::move(after_create);
      after_create = nullptr;
      hook();
    }
    return res;
  }
  provider::ProviderResult StartInstance(const std::string& zone, const std::string& id) override {
    return inner_->StartInstance(zone, id);
  }
  provider::ProviderResult GetIp(const std::string& zone, const std::string& id, std::optional<std::string>& ip) override {
    return inner_->GetIp(zone, id, ip);
  }
  provider::ProviderResult DeleteInstance(const std::string& zone, const std::string& id) override {
    return inner_->DeleteInstance(zone, id);
  }
  provider::ProviderResult InstanceExists(const std::string& zone, const std::string& id, bool& exists) override {
    return inner_->InstanceExists(zone, id, exists);
  }
  provider::ProviderResult ListAttachedVolumes(const std::string& zone, const std::string& id,
                                               std::vector<provider::AttachedVolume>& volumes) override {
    return inner_->ListAttachedVolumes(zone, id, volumes);
  }
  provider::ProviderResult DeleteVolume(const std::string& zone, const std::string& id) override {
    return inner_->DeleteVolume(zone, id);
  }
  provider::ProviderResult ResolveBootImage(const std::string& zone, const std::string& type, std::string& image) override {
    return inner_->ResolveBootImage(zone, type, image);
  }
  provider::ProviderResult ListInstances(const std::string& zone, std::vector<provider::ProviderInstance>& instances) override {
    return inner_->ListInstances(zone, instances);
  }
  provider::ProviderResult FetchCatalog(const std::string& zone, std::vector<provider::CatalogEntry>& entries) override {
    return inner_->FetchCatalog(zone, entries);
  }

 private:
  std::shared_ptr<provider::MockProvider> inner_;
};

} // namespace fleet::testing
