#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace fleet::worker {

struct IssuedToken {
  std::string token; // plaintext, returned to the worker exactly once
  std::string prefix;
};

/*
  Per-instance worker credentials.

  Tokens look like wk_<64 hex chars>. Only the SHA-256 hex digest and the
  first 12 characters are stored. One token per instance, never reissued;
  revoked when the instance terminates.
*/
class WorkerAuth {
 public:
  static constexpr std::size_t kPrefixLength = 12;
  static constexpr std::size_t kSecretBytes  = 32;

  WorkerAuth(std::shared_ptr<db::Repository> repository, util::MillisClock clock);

  static std::string GenerateToken();
  static std::string Prefix(const std::string& token);

  // Mock instances bootstrap from anywhere; real ones only from their own IP.
  static bool BootstrapAllowed(const db::model::InstanceRecord& instance, const std::string& client_ip);

  // Throws util::AlreadyExists when the instance already has a token.
  IssuedToken Issue(db::Transaction& tx, const std::string& instance_id);

  // Hash match on an unrevoked token; touches last_seen_at on success.
  bool Verify(db::Transaction& tx, const std::string& instance_id, const std::string& bearer);
  bool Verify(const std::string& instance_id, const std::string& bearer);

  // Missing token is not an error.
  void Revoke(db::Transaction& tx, const std::string& instance_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::MillisClock               clock_;
};

} // namespace fleet::worker
