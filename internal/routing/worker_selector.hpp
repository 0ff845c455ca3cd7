#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace fleet::routing {

struct WorkerHandle {
  std::string instance_id;
  std::string ip_address;
  std::string endpoint; // http://ip:vllm_port
};

struct Candidate {
  db::model::InstanceRecord instance;
  std::int64_t              freshness_ms = 0; // max(heartbeat, health check)
};

/*
  Picks one routable worker per inference request.

  Candidates are ready instances with an IP whose worker serves the
  model and has been seen within the staleness window. Without a sticky
  key the least loaded, freshest, newest worker wins. A sticky key maps
  onto the id-ordered candidate list through FNV-1a, so the same key
  keeps hitting the same worker while the candidate set is stable.
*/
class WorkerSelector {
 public:
  WorkerSelector(std::shared_ptr<db::Repository> repository, config::RoutingSettings routing, std::uint32_t default_vllm_port,
                 util::MillisClock clock);

  // Throws util::NoReadyWorker when nothing qualifies.
  WorkerHandle SelectWorker(const std::string& model_id, const std::string& sticky_key = {});

  // Ranked candidate list, best first.
  std::vector<Candidate> Candidates(const std::string& model_id);

  static std::uint64_t Fnv1a64(std::string_view data);

 private:
  WorkerHandle ToHandle(const db::model::InstanceRecord& instance) const;

  std::shared_ptr<db::Repository> repository_;
  config::RoutingSettings         routing_;
  std::uint32_t                   default_vllm_port_;
  util::MillisClock               clock_;
};

} // namespace fleet::routing
