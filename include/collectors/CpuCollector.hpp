#pragma once
#include "model/Cpu.hpp"

namespace sysmaint::collectors {

// Aggregate CPU busy percentage from /proc/stat deltas. The first sample
// only primes the baseline and reports 0.
class CpuCollector {
public:
  CpuCollector() = default;
  bool sample(sysmaint::model::CpuSnapshot& out);
private:
  sysmaint::model::CpuTimes last_total_{};
  bool has_last_{false};
};

} // namespace sysmaint::collectors
