#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/instance_status.hpp"
#include "internal/util/time.hpp"

namespace fleet::lifecycle {

enum class TransitionOutcome {
  kApplied,
  // the row was no longer in the expected state; nothing written
  kAlreadyApplied,
  kNotFound,
};

struct TransitionRequest {
  std::string                 instance_id;
  fleet::model::InstanceStatus from = fleet::model::InstanceStatus::kProvisioning;
  fleet::model::InstanceStatus to   = fleet::model::InstanceStatus::kProvisioning;

  std::string reason;
  std::string metadata_json;

  // Copied onto the row when non-empty.
  std::string error_code;
  std::string error_message;

  // Extra lifecycle column writes applied in the same guarded update.
  std::function<void(db::model::InstanceRecord&)> mutate;
};

/*
  InstanceStateMachine

  The only writer of instances.status.

  A transition is one guarded update (status = from) plus one history row,
  in one transaction. Entering a state stamps its *_at column.
  Edges outside CanTransition() throw util::InvalidState.
*/
class InstanceStateMachine {
 public:
  InstanceStateMachine(std::shared_ptr<db::Repository> repository, util::MillisClock clock);

  TransitionOutcome Transition(const TransitionRequest& request);

  // Runs inside the caller's transaction so other writes commit atomically with it.
  TransitionOutcome Transition(db::Transaction& tx, const TransitionRequest& request);

  // terminated / failure states -> archived. Archived rows never change again.
  TransitionOutcome Archive(const std::string& instance_id, const std::string& reason);

  std::vector<db::model::StateHistoryRecord> History(const std::string& instance_id);

  std::int64_t NowMs() const {
    return clock_();
  }

 private:
  void ApplyEntry(db::model::InstanceRecord& record, const TransitionRequest& request, std::int64_t now_ms) const;

  std::shared_ptr<db::Repository> repository_;
  util::MillisClock               clock_;
};

} // namespace fleet::lifecycle
