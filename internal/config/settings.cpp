#include "settings.hpp"

#include <algorithm>
#include <set>

#include "internal/util/errors.hpp"

namespace fleet::config {

namespace {

template <typename T, typename U>
void Override(T& target, U value) {
  if (value != 0) {
    target = static_cast<T>(value);
  }
}

JobSettings ResolveJob(const fleet::runtime::config::JobConfig& job, std::int64_t default_interval_ms) {
  JobSettings out;
  out.enabled     = !job.disabled();
  out.interval_ms = default_interval_ms;
  Override(out.interval_ms, job.interval_ms());
  Override(out.batch_size, job.batch_size());
  return out;
}

} // namespace

Settings ResolveSettings(const fleet::runtime::config::RuntimeConfig& config) {
  Settings out;

  if (!config.server().bind_address().empty()) {
    out.bind_address = config.server().bind_address();
  }

  const auto& jobs         = config.jobs();
  out.health_check         = ResolveJob(jobs.health_check(), 10'000);
  out.terminator           = ResolveJob(jobs.terminator(), 10'000);
  out.watch_dog            = ResolveJob(jobs.watch_dog(), 10'000);
  out.provisioning_requeue = ResolveJob(jobs.provisioning_requeue(), 10'000);
  out.recovery_job         = ResolveJob(jobs.recovery(), 30'000);

  // requeue claims smaller batches, each item re-runs a full provision
  if (jobs.provisioning_requeue().batch_size() == 0) {
    out.provisioning_requeue.batch_size = 25;
  }

  const auto& lc = config.lifecycle();
  auto&       l  = out.lifecycle;
  Override(l.heartbeat_trust_seconds, lc.heartbeat_trust_seconds());
  Override(l.boot_timeout_seconds, lc.boot_timeout_seconds());
  Override(l.model_load_timeout_seconds, lc.model_load_timeout_seconds());
  Override(l.health_check_lease_seconds, lc.health_check_lease_seconds());
  Override(l.reconciliation_lease_seconds, lc.reconciliation_lease_seconds());
  Override(l.watch_dog_recheck_seconds, lc.watch_dog_recheck_seconds());
  Override(l.provisioning_requeue_after_seconds, lc.provisioning_requeue_after_seconds());
  Override(l.provisioning_max_retries, lc.provisioning_max_retries());
  Override(l.provisioning_ip_attempts, lc.provisioning_ip_attempts());
  Override(l.provisioning_ip_interval_ms, lc.provisioning_ip_interval_ms());
  Override(l.startup_recovery_max_attempts, lc.startup_recovery_max_attempts());
  Override(l.terminate_max_attempts, lc.terminate_max_attempts());
  Override(l.health_check_max_failures, lc.health_check_max_failures());

  const auto& rc = lc.recovery();
  Override(l.recovery.provisioning_seconds, rc.provisioning_seconds());
  Override(l.recovery.booting_seconds, rc.booting_seconds());
  Override(l.recovery.installing_seconds, rc.installing_seconds());
  Override(l.recovery.starting_seconds, rc.starting_seconds());
  Override(l.recovery.draining_seconds, rc.draining_seconds());
  Override(l.recovery.terminating_seconds, rc.terminating_seconds());

  Override(out.routing.worker_stale_seconds, config.routing().worker_stale_seconds());
  out.routing.worker_stale_seconds = std::clamp<std::int64_t>(out.routing.worker_stale_seconds, 10, 86'400);

  const auto& w = config.worker();
  Override(out.worker.health_port, w.health_port());
  Override(out.worker.vllm_port, w.vllm_port());
  Override(out.worker.reachability_port, w.reachability_port());
  Override(out.worker.probe_timeout_ms, w.probe_timeout_ms());
  out.worker.require_worker_auth = w.require_worker_auth();

  Override(out.bus_capacity, config.bus().capacity());
  Override(out.bus_max_in_flight, config.bus().max_in_flight());

  std::set<std::string> codes;
  for (const auto& provider : config.providers()) {
    if (provider.code().empty()) {
      throw util::InvalidArgument("provider entry without code");
    }
    if (provider.kind() == fleet::runtime::config::PROVIDER_KIND_UNSPECIFIED) {
      throw util::InvalidArgument("provider " + provider.code() + " has no kind");
    }
    if (!codes.insert(provider.code()).second) {
      throw util::InvalidArgument("duplicate provider code " + provider.code());
    }
    out.providers.push_back(provider);
  }

  return out;
}

} // namespace fleet::config
