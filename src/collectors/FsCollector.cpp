#include "collectors/FsCollector.hpp"

#include <sys/statvfs.h>

namespace sysmaint::collectors {

static uint64_t to_bytes(unsigned long long v) { return static_cast<uint64_t>(v); }

double volume_used_pct(uint64_t used_bytes, uint64_t free_bytes) {
  uint64_t denom = used_bytes + free_bytes;
  if (denom == 0) return 0.0;
  return 100.0 * static_cast<double>(used_bytes) / static_cast<double>(denom);
}

bool FsCollector::sample(const std::string& path, sysmaint::model::VolumeUsage& out) const {
  struct statvfs vfs{};
  if (::statvfs(path.c_str(), &vfs) != 0) return false;
  uint64_t total = to_bytes(vfs.f_blocks) * vfs.f_frsize;
  uint64_t bfree = to_bytes(vfs.f_bfree) * vfs.f_frsize;
  uint64_t avail = to_bytes(vfs.f_bavail) * vfs.f_frsize;
  out.mountpoint = path;
  out.total_bytes = total;
  out.used_bytes = (total > bfree) ? (total - bfree) : 0ULL;
  out.free_bytes = avail;
  out.used_pct = volume_used_pct(out.used_bytes, out.free_bytes);
  return true;
}

} // namespace sysmaint::collectors
