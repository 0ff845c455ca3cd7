#pragma once

#include <cstdint>
#include <string>

namespace fleet::db::model {

// One instance type offered by a provider in a zone, keyed by
// (provider_code, zone, code).
struct CatalogInstanceTypeRecord {
  std::string   provider_code;
  std::string   zone;
  std::string   code;
  std::string   name;
  double        cost_per_hour   = 0;
  std::uint32_t cpu_count       = 0;
  std::uint32_t ram_gb          = 0;
  std::uint32_t gpu_count       = 0;
  std::uint32_t vram_per_gpu_gb = 0;
  std::uint64_t bandwidth_bps   = 0;
  std::int64_t  updated_at_ms   = 0;
};

} // namespace fleet::db::model
