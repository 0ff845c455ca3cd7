#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace fleet::core {

// An in-flight action log row.
struct ActionHandle {
  std::string  id;
  std::string  instance_id;
  std::string  action_type;
  std::int64_t started_at_ms = 0;
};

/*
  Audit trail of provider calls and install milestones.

  Writes are best effort: a failed audit write is logged and never fails
  the workflow that produced it.
*/
class ActionRecorder {
 public:
  ActionRecorder(std::shared_ptr<db::Repository> repository, util::MillisClock clock);

  ActionHandle Begin(const std::string& instance_id, std::string_view action_type, const std::string& metadata_json = {});

  void Succeed(const ActionHandle& handle, const std::string& metadata_json = {});
  void Fail(const ActionHandle& handle, const std::string& error_message);

  // One-shot success entry (milestones observed rather than performed).
  void RecordSuccess(const std::string& instance_id, std::string_view action_type, const std::string& metadata_json = {});

  // Types of every successful action of the instance, oldest first.
  std::vector<std::string> CompletedActions(const std::string& instance_id);

 private:
  void Complete(const ActionHandle& handle, fleet::model::ActionStatus status, const std::string& error_message,
                const std::string& metadata_json);

  std::shared_ptr<db::Repository> repository_;
  util::MillisClock               clock_;
};

} // namespace fleet::core
