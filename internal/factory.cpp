#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/action_recorder.hpp"
#include "internal/core/instance_workflows.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/command_bus.hpp"
#include "internal/grpc/orchestrator_server.hpp"
#include "internal/health/worker_probe.hpp"
#include "internal/jobs/health_check_job.hpp"
#include "internal/jobs/provisioning_requeue_job.hpp"
#include "internal/jobs/recovery_job.hpp"
#include "internal/jobs/terminator_job.hpp"
#include "internal/jobs/watch_dog_job.hpp"
#include "internal/lifecycle/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/provider/provider_registry.hpp"
#include "internal/routing/worker_selector.hpp"
#include "internal/service/orchestrator_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/http_client.hpp"
#include "internal/worker/heartbeat_service.hpp"
#include "internal/worker/worker_auth.hpp"
#if FLEET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FLEET_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace fleet::factory {

using namespace fleet;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const fleet::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FLEET_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.path     = database.sqlite().path().empty() ? "fleet-orchestrator.db" : database.sqlite().path();
    options.wal_mode = database.sqlite().wal_mode();
    auto sqlite_db   = std::make_shared<db::sqlite::SqliteDB>(options);
    db::sqlite::ApplySchema(*sqlite_db);
    FLEET_LOG_INFO("store: sqlite", {StringField("path", sqlite_db->Path()), BoolField("wal", options.wal_mode)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FLEET_DB_POSTGRES
    const auto pool_size = database.postgres().pool_size() != 0 ? database.postgres().pool_size() : 16u;
    auto       pool      = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), pool_size);
    db::postgres::ApplySchema(*pool);
    FLEET_LOG_INFO("store: postgres", {IntField("pool_size", pool_size)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  FLEET_LOG_WARN("store: in-memory, state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

void Application::StopBackground() {
  if (dispatcher) dispatcher->Stop();
  for (auto& job : jobs) {
    job->Stop();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config) {
  Application app;
  app.settings         = config::ResolveSettings(config);
  const auto& settings = app.settings;
  const auto  clock    = util::SystemMillisClock();

  // ------------------------------------------------------------------
  // Store and lifecycle core
  // ------------------------------------------------------------------
  auto repository    = BuildRepository(config);
  auto state_machine = std::make_shared<lifecycle::InstanceStateMachine>(repository, clock);
  auto recorder      = std::make_shared<core::ActionRecorder>(repository, clock);
  app.repository     = repository;

  // ------------------------------------------------------------------
  // Providers
  // ------------------------------------------------------------------
  std::shared_ptr<util::HttpClient> http = std::make_shared<util::CurlHttpClient>();
  auto providers = provider::ProviderRegistry::FromSettings(settings, http);

  auto workflows = std::make_shared<core::InstanceWorkflows>(repository, state_machine, recorder, providers, settings.lifecycle, clock);

  // ------------------------------------------------------------------
  // Command bus
  // ------------------------------------------------------------------
  auto bus       = std::make_shared<dispatch::CommandBus>(settings.bus_capacity);
  app.dispatcher = std::make_shared<dispatch::CommandDispatcher>(bus, workflows, settings.bus_max_in_flight);

  // ------------------------------------------------------------------
  // Reconciliation jobs
  // ------------------------------------------------------------------
  jobs::JobContext job_ctx;
  job_ctx.repository    = repository;
  job_ctx.state_machine = state_machine;
  job_ctx.recorder      = recorder;
  job_ctx.workflows     = workflows;
  job_ctx.providers     = providers;
  job_ctx.probe         = std::make_shared<health::HttpWorkerProbe>(http, settings.worker.probe_timeout_ms);
  job_ctx.lifecycle     = settings.lifecycle;
  job_ctx.worker        = settings.worker;
  job_ctx.clock         = clock;

  app.jobs.push_back(std::make_shared<jobs::HealthCheckJob>(job_ctx, settings.health_check));
  app.jobs.push_back(std::make_shared<jobs::TerminatorJob>(job_ctx, settings.terminator));
  app.jobs.push_back(std::make_shared<jobs::WatchDogJob>(job_ctx, settings.watch_dog));
  app.jobs.push_back(std::make_shared<jobs::ProvisioningRequeueJob>(job_ctx, settings.provisioning_requeue));
  app.jobs.push_back(std::make_shared<jobs::RecoveryJob>(job_ctx, settings.recovery_job));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto auth = std::make_shared<worker::WorkerAuth>(repository, clock);

  service::ServiceContext ctx;
  ctx.repository    = repository;
  ctx.state_machine = state_machine;
  ctx.recorder      = recorder;
  ctx.workflows     = workflows;
  ctx.bus           = bus;
  ctx.heartbeats    = std::make_shared<worker::HeartbeatService>(repository, auth, clock, settings.worker.require_worker_auth);
  ctx.selector      = std::make_shared<routing::WorkerSelector>(repository, settings.routing, settings.worker.vllm_port, clock);

  auto orchestrator = std::make_shared<service::OrchestratorService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::OrchestratorServer>(orchestrator));

  // ------------------------------------------------------------------
  // Background loops
  // ------------------------------------------------------------------
  app.dispatcher->Start();
  for (auto& job : app.jobs) {
    job->Start();
  }

  FLEET_LOG_INFO("orchestrator assembled", {IntField("providers", static_cast<std::int64_t>(providers->All().size())),
                                            IntField("jobs", static_cast<std::int64_t>(app.jobs.size()))});
  return app;
}

} // namespace fleet::factory
