#pragma once
#include <cstdint>
#include <string>

namespace sysmaint::model {

struct VolumeUsage {
  std::string mountpoint;  // e.g., /
  uint64_t total_bytes{};
  uint64_t used_bytes{};   // (f_blocks - f_bfree) * f_frsize
  uint64_t free_bytes{};   // f_bavail * f_frsize
  double   used_pct{};     // used / (used + free) * 100
};

} // namespace sysmaint::model
