#include "worker_selector.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace fleet::routing {

using fleet::model::InstanceStatus;

WorkerSelector::WorkerSelector(std::shared_ptr<db::Repository> repository, config::RoutingSettings routing,
                               std::uint32_t default_vllm_port, util::MillisClock clock)
    : repository_(std::move(repository)),
      routing_(routing),
      default_vllm_port_(default_vllm_port == 0 ? 8000 : default_vllm_port),
      clock_(std::move(clock)) {
}

std::uint64_t WorkerSelector::Fnv1a64(std::string_view data) {
  std::uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

std::vector<Candidate> WorkerSelector::Candidates(const std::string& model_id) {
  std::vector<db::model::InstanceRecord> ready;
  {
    auto tx = repository_->Begin();
    ready   = repository_->ListInstancesByStatus(*tx, {InstanceStatus::kReady});
  }

  const auto now          = clock_();
  const auto stale_before = now - util::SecondsToMillis(routing_.worker_stale_seconds);

  std::vector<Candidate> out;
  for (auto& instance : ready) {
    if (instance.ip_address.empty() || instance.is_archived) continue;

    const auto& worker = instance.worker;
    if (!worker.status.empty() && worker.status != "ready") continue;
    if (!model_id.empty() && worker.model_id != model_id) continue;

    const auto freshness = std::max(worker.last_heartbeat_ms, instance.last_health_check_ms);
    if (freshness == 0 || freshness < stale_before) continue;

    out.push_back(Candidate{std::move(instance), freshness});
  }

  std::sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
    const auto& qa = a.instance.worker.queue_depth;
    const auto& qb = b.instance.worker.queue_depth;
    if (qa.has_value() != qb.has_value()) return qa.has_value(); // unknown depth ranks last
    if (qa && *qa != *qb) return *qa < *qb;
    if (a.freshness_ms != b.freshness_ms) return a.freshness_ms > b.freshness_ms;
    if (a.instance.created_at_ms != b.instance.created_at_ms) return a.instance.created_at_ms > b.instance.created_at_ms;
    return a.instance.id < b.instance.id;
  });
  return out;
}

WorkerHandle WorkerSelector::ToHandle(const db::model::InstanceRecord& instance) const {
  const auto port = instance.worker.vllm_port != 0 ? instance.worker.vllm_port : default_vllm_port_;
  return WorkerHandle{instance.id, instance.ip_address, fmt::format("http://{}:{}", instance.ip_address, port)};
}

WorkerHandle WorkerSelector::SelectWorker(const std::string& model_id, const std::string& sticky_key) {
  auto candidates = Candidates(model_id);
  if (candidates.empty()) {
    observability::Metrics::Instance().RecordRouting("no_worker");
    throw util::NoReadyWorker("no ready worker for model '" + model_id + "'");
  }

  if (sticky_key.empty()) {
    observability::Metrics::Instance().RecordRouting("selected");
    return ToHandle(candidates.front().instance);
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const Candidate& a, const Candidate& b) { return a.instance.id < b.instance.id; });
  const auto index = Fnv1a64(sticky_key) % candidates.size();

  observability::Metrics::Instance().RecordRouting("sticky");
  FLEET_LOG_DEBUG("sticky route", {observability::StringField("model", model_id),
                                   observability::StringField("instance_id", candidates[index].instance.id),
                                   observability::IntField("candidates", static_cast<std::int64_t>(candidates.size()))});
  return ToHandle(candidates[index].instance);
}

} // namespace fleet::routing
