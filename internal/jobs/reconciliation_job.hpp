#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/db/api/claim.hpp"
#include "job_context.hpp"

namespace fleet::jobs {

/*
  ReconciliationJob

  Loop shape shared by all background jobs:

    every interval:
      claim a bounded batch (row locks + lease timestamp, short tx)
      process each row outside any transaction
      persist results through guarded updates

  A failure on one row is logged and never aborts the batch. RunOnce()
  is public so tests can drive ticks deterministically.
*/
class ReconciliationJob {
 public:
  ReconciliationJob(std::string name, JobContext context, config::JobSettings settings);
  virtual ~ReconciliationJob();

  ReconciliationJob(const ReconciliationJob&)            = delete;
  ReconciliationJob& operator=(const ReconciliationJob&) = delete;

  void Start();
  void Stop();

  // One tick. Returns the number of rows processed.
  std::size_t RunOnce();

  const std::string& Name() const {
    return name_;
  }

 protected:
  virtual std::vector<db::model::InstanceRecord> Claim() = 0;
  virtual void                                   Process(const db::model::InstanceRecord& instance) = 0;

  // Claims in its own committed transaction.
  std::vector<db::model::InstanceRecord> ClaimBatch(const db::ClaimQuery& query);

  // Lets the next tick retry the row.
  void ReleaseLease(const std::string& instance_id, db::LeaseColumn lease);

  std::int64_t NowMs() const {
    return context_.clock();
  }

  JobContext          context_;
  config::JobSettings settings_;

 private:
  void Loop();

  const std::string name_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
};

} // namespace fleet::jobs
