#include "cloud_provider.hpp"

namespace fleet::provider {

std::string_view ToString(ProviderCode code) {
  switch (code) {
    case ProviderCode::kOk:
      return "OK";
    case ProviderCode::kNotFound:
      return "NOT_FOUND";
    case ProviderCode::kTransient:
      return "PROVIDER_TRANSIENT";
    case ProviderCode::kRateLimited:
      return "PROVIDER_RATE_LIMITED";
    case ProviderCode::kQuotaExceeded:
      return "QUOTA_EXCEEDED";
    case ProviderCode::kInvalidConfig:
      return "PROVIDER_INVALID_CONFIG";
    case ProviderCode::kImageNotFound:
      return "IMAGE_NOT_FOUND";
    case ProviderCode::kOutOfStock:
      return "OUT_OF_STOCK";
    case ProviderCode::kUnauthorized:
      return "PROVIDER_UNAUTHORIZED";
    case ProviderCode::kUnsupported:
      return "PROVIDER_UNSUPPORTED";
    case ProviderCode::kInternal:
      return "PROVIDER_INTERNAL";
  }
  return "PROVIDER_INTERNAL";
}

} // namespace fleet::provider
