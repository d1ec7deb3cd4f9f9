#pragma once
#include <cstdint>

namespace sysmaint::model {

struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

struct CpuSnapshot {
  double usage_pct{};   // aggregate percent 0..100, 0 until a second sample exists
};

} // namespace sysmaint::model
