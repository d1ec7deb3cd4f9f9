#include "collectors/HostResourceProbe.hpp"

#include <thread>
#include <utility>

namespace sysmaint::collectors {

HostResourceProbe::HostResourceProbe(sysmaint::model::ResourceSettings settings)
    : settings_(std::move(settings)) {}

sysmaint::model::ResourceSnapshot HostResourceProbe::sample() {
  sysmaint::model::ResourceSnapshot s{};

  sysmaint::model::CpuSnapshot cpu{};
  bool cpu_ok = cpu_.sample(cpu);
  if (cpu_ok) {
    std::this_thread::sleep_for(settings_.cpu_sample_interval);
    cpu_ok = cpu_.sample(cpu);
  }
  s.cpu_ok = cpu_ok;
  s.cpu_pct = cpu_ok ? cpu.usage_pct : 0.0;

  sysmaint::model::Memory mem{};
  s.mem_ok = mem_.sample(mem);
  s.mem_pct = s.mem_ok ? mem.used_pct : 0.0;

  sysmaint::model::VolumeUsage vol{};
  s.disk_ok = fs_.sample(settings_.disk_path, vol);
  s.disk_pct = s.disk_ok ? vol.used_pct : 0.0;
  return s;
}

} // namespace sysmaint::collectors
