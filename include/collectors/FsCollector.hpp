#pragma once
#include "model/Fs.hpp"
#include <cstdint>
#include <string>

namespace sysmaint::collectors {

class FsCollector {
public:
  // statvfs() the volume holding `path`. Returns false on failure.
  bool sample(const std::string& path, sysmaint::model::VolumeUsage& out) const;
};

// used / (used + free) * 100, 0 when both are 0
[[nodiscard]] double volume_used_pct(uint64_t used_bytes, uint64_t free_bytes);

} // namespace sysmaint::collectors
