#include "worker_probe.hpp"

#include <fmt/format.h>

#include "internal/util/json.hpp"

namespace fleet::health {

HttpWorkerProbe::HttpWorkerProbe(std::shared_ptr<util::HttpClient> http, std::int64_t timeout_ms)
    : http_(std::move(http)), timeout_ms_(static_cast<long>(timeout_ms)) {
}

bool HttpWorkerProbe::Reachable(const std::string& ip, std::uint32_t port) {
  return http_->CanConnect(ip, static_cast<int>(port), timeout_ms_);
}

bool HttpWorkerProbe::ReadyzOk(const std::string& ip, std::uint32_t health_port) {
  util::HttpRequest request;
  request.url        = fmt::format("http://{}:{}/readyz", ip, health_port);
  request.timeout_ms = timeout_ms_;
  return http_->Send(request).Ok();
}

bool HttpWorkerProbe::ModelListed(const std::string& ip, std::uint32_t vllm_port, const std::string& model_id) {
  util::HttpRequest request;
  request.url        = fmt::format("http://{}:{}/v1/models", ip, vllm_port);
  request.timeout_ms = timeout_ms_;

  auto response = http_->Send(request);
  if (!response.Ok()) {
    return false;
  }

  // OpenAI-style listing: {"object":"list","data":[{"id":"<model>"}, ...]}
  auto parsed = util::ParseJsonObject(response.body);
  const auto* data = parsed ? util::FindPath(*parsed, "data") : nullptr;
  if (!data || data->kind_case() != google::protobuf::Value::kListValue) {
    return false;
  }

  for (const auto& item : data->list_value().values()) {
    if (item.kind_case() != google::protobuf::Value::kStructValue) continue;
    const auto id = util::StringAt(item.struct_value(), "id");
    if (!id.empty() && (model_id.empty() || id == model_id)) {
      return true;
    }
  }
  return false;
}

} // namespace fleet::health
