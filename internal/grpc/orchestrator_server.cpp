#include "orchestrator_server.hpp"

#include "grpc_error.hpp"

namespace fleet::grpc {

using namespace fleet::orchestrator::v1;

OrchestratorServer::OrchestratorServer(std::shared_ptr<fleet::service::OrchestratorService> svc) : service_(std::move(svc)) {
}

std::string OrchestratorServer::PeerAddress(const std::string& peer) {
  auto rest = peer;
  if (rest.rfind("ipv4:", 0) == 0) {
    rest = rest.substr(5);
    return rest.substr(0, rest.rfind(':'));
  }
  if (rest.rfind("ipv6:", 0) == 0) {
    rest            = rest.substr(5);
    const auto open = rest.find('[');
    const auto end  = rest.find(']');
    if (open != std::string::npos && end != std::string::npos && end > open) {
      rest = rest.substr(open + 1, end - open - 1);
    }
    // percent-encoded zone id
    if (auto pct = rest.find('%'); pct != std::string::npos) rest = rest.substr(0, pct);
    return rest;
  }
  return {};
}

std::string OrchestratorServer::BearerToken(const ::grpc::ServerContext* context, const std::string& field) {
  if (!field.empty() || context == nullptr) {
    return field;
  }
  const auto& metadata = context->client_metadata();
  auto        it       = metadata.find("authorization");
  if (it == metadata.end()) {
    return {};
  }
  std::string value(it->second.data(), it->second.size());
  constexpr std::string_view kScheme = "Bearer ";
  if (value.size() > kScheme.size() && value.compare(0, kScheme.size(), kScheme) == 0) {
    return value.substr(kScheme.size());
  }
  return {};
}

::grpc::Status OrchestratorServer::PublishCommand(::grpc::ServerContext*, const PublishCommandRequest* req,
                                                  PublishCommandResponse* resp) {
  try {
    *resp = service_->PublishCommand(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::ReportHeartbeat(::grpc::ServerContext* context, const ReportHeartbeatRequest* req,
                                                   ReportHeartbeatResponse* resp) {
  try {
    *resp = service_->ReportHeartbeat(*req, BearerToken(context, req->worker_token()));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::RegisterWorker(::grpc::ServerContext* context, const RegisterWorkerRequest* req,
                                                  RegisterWorkerResponse* resp) {
  try {
    *resp = service_->RegisterWorker(*req, PeerAddress(context->peer()), BearerToken(context, req->worker_token()));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::SelectWorker(::grpc::ServerContext*, const SelectWorkerRequest* req, SelectWorkerResponse* resp) {
  try {
    *resp = service_->SelectWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::GetInstance(::grpc::ServerContext*, const GetInstanceRequest* req, GetInstanceResponse* resp) {
  try {
    *resp = service_->GetInstance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace fleet::grpc
