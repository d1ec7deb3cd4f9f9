#pragma once
#include "collectors/IResourceProbe.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/FsCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "model/Config.hpp"

namespace sysmaint::collectors {

// Reads /proc/stat twice, cpu_sample_interval apart, plus /proc/meminfo
// and statvfs(disk_path).
class HostResourceProbe final : public IResourceProbe {
public:
  explicit HostResourceProbe(sysmaint::model::ResourceSettings settings);

  [[nodiscard]] sysmaint::model::ResourceSnapshot sample() override;

private:
  sysmaint::model::ResourceSettings settings_;
  CpuCollector cpu_;
  MemoryCollector mem_;
  FsCollector fs_;
};

} // namespace sysmaint::collectors
