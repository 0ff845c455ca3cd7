#pragma once

#include <cstdint>
#include <string>

namespace fleet::db::model {

struct WorkerTokenRecord {
  std::string  instance_id;
  std::string  token_hash; // sha256 hex of the plaintext token
  std::string  token_prefix;
  std::int64_t created_at_ms   = 0;
  std::int64_t last_seen_at_ms = 0;
  std::int64_t revoked_at_ms   = 0; // 0 = active
};

} // namespace fleet::db::model
