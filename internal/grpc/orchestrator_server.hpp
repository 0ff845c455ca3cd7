#pragma once

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "fleet/orchestrator/v1/orchestrator_service.grpc.pb.h"
#include "internal/service/orchestrator_service.hpp"

namespace fleet::grpc {

class OrchestratorServer final : public fleet::orchestrator::v1::OrchestratorService::Service {
 public:
  explicit OrchestratorServer(std::shared_ptr<fleet::service::OrchestratorService> svc);

  ::grpc::Status PublishCommand(::grpc::ServerContext*, const fleet::orchestrator::v1::PublishCommandRequest*,
                                fleet::orchestrator::v1::PublishCommandResponse*) override;

  ::grpc::Status ReportHeartbeat(::grpc::ServerContext*, const fleet::orchestrator::v1::ReportHeartbeatRequest*,
                                 fleet::orchestrator::v1::ReportHeartbeatResponse*) override;

  ::grpc::Status RegisterWorker(::grpc::ServerContext*, const fleet::orchestrator::v1::RegisterWorkerRequest*,
                                fleet::orchestrator::v1::RegisterWorkerResponse*) override;

  ::grpc::Status SelectWorker(::grpc::ServerContext*, const fleet::orchestrator::v1::SelectWorkerRequest*,
                              fleet::orchestrator::v1::SelectWorkerResponse*) override;

  ::grpc::Status GetInstance(::grpc::ServerContext*, const fleet::orchestrator::v1::GetInstanceRequest*,
                             fleet::orchestrator::v1::GetInstanceResponse*) override;

  // "ipv4:10.0.0.5:41234" -> "10.0.0.5", "ipv6:[::1]:5000" -> "::1".
  static std::string PeerAddress(const std::string& peer);

  // Token from the request field, else from an "authorization: Bearer" header.
  static std::string BearerToken(const ::grpc::ServerContext* context, const std::string& field);

 private:
  std::shared_ptr<fleet::service::OrchestratorService> service_;
};

} // namespace fleet::grpc
