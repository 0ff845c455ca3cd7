#pragma once

#include <string>

#include "fleet/orchestrator/v1/orchestrator_service.pb.h"
#include "service_context.hpp"

namespace fleet::service {

/*
  Transport-independent request handling for the orchestrator API.

  Errors are thrown as util exceptions and mapped to status codes by the
  gRPC adapter.
*/
class OrchestratorService {
 public:
  explicit OrchestratorService(ServiceContext ctx);

  // Validates and enqueues a command. PROVISION creates its row first so
  // the caller can poll it even if the bus drops the message.
  fleet::orchestrator::v1::PublishCommandResponse PublishCommand(const fleet::orchestrator::v1::PublishCommandRequest& req);

  fleet::orchestrator::v1::ReportHeartbeatResponse ReportHeartbeat(const fleet::orchestrator::v1::ReportHeartbeatRequest& req,
                                                                   const std::string& bearer);

  fleet::orchestrator::v1::RegisterWorkerResponse RegisterWorker(const fleet::orchestrator::v1::RegisterWorkerRequest& req,
                                                                 const std::string& client_ip, const std::string& bearer);

  fleet::orchestrator::v1::SelectWorkerResponse SelectWorker(const fleet::orchestrator::v1::SelectWorkerRequest& req);

  fleet::orchestrator::v1::GetInstanceResponse GetInstance(const fleet::orchestrator::v1::GetInstanceRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace fleet::service
