#include "worker_auth.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/util/sha256.hpp"
#include "internal/util/uuid.hpp"

namespace fleet::worker {

namespace {

// Strips a CIDR suffix ("10.0.0.1/32").
std::string HostPart(const std::string& ip) {
  return ip.substr(0, ip.find('/'));
}

} // namespace

WorkerAuth::WorkerAuth(std::shared_ptr<db::Repository> repository, util::MillisClock clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

std::string WorkerAuth::GenerateToken() {
  return "wk_" + util::RandomHex(kSecretBytes);
}

std::string WorkerAuth::Prefix(const std::string& token) {
  return token.substr(0, kPrefixLength);
}

bool WorkerAuth::BootstrapAllowed(const db::model::InstanceRecord& instance, const std::string& client_ip) {
  if (instance.provider_code == "mock") {
    return true;
  }
  return !instance.ip_address.empty() && !client_ip.empty() && HostPart(instance.ip_address) == HostPart(client_ip);
}

IssuedToken WorkerAuth::Issue(db::Transaction& tx, const std::string& instance_id) {
  IssuedToken issued;
  issued.token  = GenerateToken();
  issued.prefix = Prefix(issued.token);

  db::model::WorkerTokenRecord record;
  record.instance_id     = instance_id;
  record.token_hash      = util::Sha256Hex(issued.token);
  record.token_prefix    = issued.prefix;
  record.created_at_ms   = clock_();
  record.last_seen_at_ms = record.created_at_ms;

  core::ThrowIfDbError(repository_->InsertWorkerToken(tx, record), "issue worker token");
  return issued;
}

bool WorkerAuth::Verify(db::Transaction& tx, const std::string& instance_id, const std::string& bearer) {
  if (bearer.empty()) {
    return false;
  }

  auto record = repository_->GetWorkerToken(tx, instance_id);
  if (!record || record->revoked_at_ms != 0 || record->token_hash != util::Sha256Hex(bearer)) {
    return false;
  }

  core::ThrowIfDbError(repository_->TouchWorkerToken(tx, instance_id, clock_()), "touch worker token");
  return true;
}

bool WorkerAuth::Verify(const std::string& instance_id, const std::string& bearer) {
  auto tx = repository_->Begin();
  const bool ok = Verify(*tx, instance_id, bearer);
  if (ok) {
    tx->Commit();
  }
  return ok;
}

void WorkerAuth::Revoke(db::Transaction& tx, const std::string& instance_id) {
  auto result = repository_->RevokeWorkerToken(tx, instance_id, clock_());
  if (result.code == db::ErrorCode::NotFound) {
    return;
  }
  core::ThrowIfDbError(result, "revoke worker token");
}

} // namespace fleet::worker
