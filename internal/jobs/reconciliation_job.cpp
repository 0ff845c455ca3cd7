#include "reconciliation_job.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"

namespace fleet::jobs {

using observability::IntField;
using observability::StringField;

ReconciliationJob::ReconciliationJob(std::string name, JobContext context, config::JobSettings settings)
    : context_(std::move(context)), settings_(settings), name_(std::move(name)) {
}

ReconciliationJob::~ReconciliationJob() {
  Stop();
}

void ReconciliationJob::Start() {
  if (!settings_.enabled) {
    FLEET_LOG_INFO("job disabled", {StringField("job", name_)});
    return;
  }
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ReconciliationJob::Loop, this);
}

void ReconciliationJob::Stop() {
  {
    std::lock_guard lock(wait_mutex_);
    running_ = false;
  }
  wait_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::vector<db::model::InstanceRecord> ReconciliationJob::ClaimBatch(const db::ClaimQuery& query) {
  auto tx      = context_.repository->Begin();
  auto claimed = context_.repository->ClaimInstances(*tx, query);
  tx->Commit();
  return claimed;
}

void ReconciliationJob::ReleaseLease(const std::string& instance_id, db::LeaseColumn lease) {
  auto tx  = context_.repository->Begin();
  auto res = context_.repository->ReleaseLease(*tx, instance_id, lease);
  if (res) {
    tx->Commit();
    return;
  }
  FLEET_LOG_WARN("lease release failed", {StringField("job", name_), StringField("instance_id", instance_id),
                                          StringField("error", res.message)});
}

std::size_t ReconciliationJob::RunOnce() {
  observability::SpanScope span("job." + name_);
  const auto               start = std::chrono::steady_clock::now();

  std::vector<db::model::InstanceRecord> batch;
  try {
    batch = Claim();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    FLEET_LOG_ERROR("job claim failed", {StringField("job", name_), StringField("error", e.what())});
    return 0;
  }

  std::size_t processed = 0;
  for (const auto& instance : batch) {
    observability::ScopedLogContext log_context({StringField("job", name_), StringField("instance_id", instance.id)});
    try {
      Process(instance);
      ++processed;
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("job item failed", {StringField("error", e.what())});
    }
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  observability::Metrics::Instance().ObserveJobTickMs(name_, elapsed);
  observability::Metrics::Instance().RecordJobItems(name_, batch.size());
  span.SetAttribute("claimed", static_cast<std::int64_t>(batch.size()));

  if (!batch.empty()) {
    FLEET_LOG_DEBUG("job tick", {StringField("job", name_), IntField("claimed", static_cast<std::int64_t>(batch.size())),
                                 IntField("processed", static_cast<std::int64_t>(processed))});
  }
  return processed;
}

void ReconciliationJob::Loop() {
  FLEET_LOG_INFO("job started", {StringField("job", name_), IntField("interval_ms", settings_.interval_ms)});

  while (running_) {
    RunOnce();

    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(settings_.interval_ms), [&] { return !running_; });
  }

  FLEET_LOG_INFO("job stopped", {StringField("job", name_)});
}

} // namespace fleet::jobs
