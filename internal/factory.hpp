#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/jobs/reconciliation_job.hpp"

namespace fleet::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  config::Settings settings;

  std::shared_ptr<db::Repository> repository;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<dispatch::CommandDispatcher>          dispatcher;
  std::vector<std::shared_ptr<jobs::ReconciliationJob>> jobs;

  // Stops the dispatcher first so no command races the job shutdown.
  void StopBackground();
};

/*
  Build

  Constructs the entire backend from the runtime config and starts the
  dispatcher loop and the reconciliation jobs.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and provider types.
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config);

// Store selected by config.database, schema applied.
std::shared_ptr<db::Repository> BuildRepository(const fleet::runtime::config::RuntimeConfig& config);

} // namespace fleet::factory
