#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "worker_auth.hpp"

namespace fleet::worker {

struct HeartbeatReport {
  std::string                 instance_id;
  std::string                 status; // starting | ready | draining | error
  std::string                 model_id;
  std::optional<std::int32_t> queue_depth;
  std::optional<double>       gpu_utilization;
  std::string                 metadata_json;
};

struct RegisterRequest {
  std::string   instance_id;
  std::string   client_ip;
  std::string   bearer;
  std::string   model_id;
  std::uint32_t health_port = 0;
  std::uint32_t vllm_port   = 0;
  std::string   metadata_json;
};

struct RegisterResult {
  // Set only when this call bootstrapped the worker.
  std::optional<IssuedToken> issued;
};

/*
  Worker-reported state ingestion.

  Writes the worker_* columns only; lifecycle status is left to the
  state machine. Errors are thrown as util exceptions:
    NotFound         unknown instance
    InvalidState     archived instance
    InvalidArgument  bad status string or metadata
    Unauthenticated  token missing or wrong
*/
class HeartbeatService {
 public:
  HeartbeatService(std::shared_ptr<db::Repository> repository, std::shared_ptr<WorkerAuth> auth, util::MillisClock clock,
                   bool require_auth);

  static bool IsValidWorkerStatus(const std::string& status);

  // Returns the receive timestamp stored as worker_last_heartbeat.
  std::int64_t ReportHeartbeat(const HeartbeatReport& report, const std::string& bearer = {});

  RegisterResult RegisterWorker(const RegisterRequest& request);

 private:
  db::model::InstanceRecord LoadWritable(db::Transaction& tx, const std::string& instance_id);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<WorkerAuth>     auth_;
  util::MillisClock               clock_;
  bool                            require_auth_;
};

} // namespace fleet::worker
