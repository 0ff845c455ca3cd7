#pragma once

#include <string>
#include <vector>

#include "internal/db/model/action_log_record.hpp"
#include "internal/db/model/catalog_record.hpp"
#include "internal/db/model/instance_record.hpp"
#include "internal/db/model/state_history_record.hpp"
#include "internal/db/model/volume_record.hpp"
#include "internal/db/model/worker_token_record.hpp"
#include "sql_params.hpp"
#include "sql_row.hpp"

namespace fleet::db::sql {

/*
  Record <-> SQL column mapping shared by the SQL backends.

  Param lists follow the column order of schema.hpp; readers take the
  index of the first column so they work on joined/RETURNING rows too.
*/

Params InstanceParams(const model::InstanceRecord& record);
Params WorkerParams(const model::WorkerFields& worker);
Params VolumeParams(const model::VolumeRecord& record);

model::InstanceRecord            ReadInstance(const Row& row, int first_col = 0);
model::VolumeRecord              ReadVolume(const Row& row, int first_col = 0);
model::StateHistoryRecord        ReadStateHistory(const Row& row);
model::WorkerTokenRecord         ReadWorkerToken(const Row& row);
model::ActionLogRecord           ReadActionLog(const Row& row);
model::CatalogInstanceTypeRecord ReadCatalogInstanceType(const Row& row);

// Column names of schema.hpp's kInstanceColumns, in order.
const std::vector<std::string>& InstanceColumnNames();

} // namespace fleet::db::sql
