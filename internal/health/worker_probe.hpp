#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/util/http_client.hpp"

namespace fleet::health {

/*
  Active checks against a coming-up worker, one per install phase:

    booting    -> host answers on the reachability port
    installing -> worker agent answers /readyz on its health port
    starting   -> vLLM lists the expected model on /v1/models
*/
class WorkerProbe {
 public:
  virtual ~WorkerProbe() = default;

  virtual bool Reachable(const std::string& ip, std::uint32_t port) = 0;
  virtual bool ReadyzOk(const std::string& ip, std::uint32_t health_port) = 0;

  // An empty model_id accepts any listed model.
  virtual bool ModelListed(const std::string& ip, std::uint32_t vllm_port, const std::string& model_id) = 0;
};

class HttpWorkerProbe final : public WorkerProbe {
 public:
  HttpWorkerProbe(std::shared_ptr<util::HttpClient> http, std::int64_t timeout_ms);

  bool Reachable(const std::string& ip, std::uint32_t port) override;
  bool ReadyzOk(const std::string& ip, std::uint32_t health_port) override;
  bool ModelListed(const std::string& ip, std::uint32_t vllm_port, const std::string& model_id) override;

 private:
  std::shared_ptr<util::HttpClient> http_;
  long                              timeout_ms_;
};

} // namespace fleet::health
