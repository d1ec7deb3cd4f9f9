#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "model/Cpu.hpp"
#include "model/Fs.hpp"

namespace sysmaint::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t free_kb{};  // MemAvailable, or MemFree+Buffers+Cached on old kernels
  double   used_pct{}; // (1 - free/total) * 100, two decimals
};

// One reading of the three watched metrics. A metric that could not be
// read stays 0 and its *_ok flag is false.
struct ResourceSnapshot {
  double cpu_pct{};
  double mem_pct{};
  double disk_pct{};
  bool cpu_ok{true};
  bool mem_ok{true};
  bool disk_ok{true};
};

struct ServiceCheckResult {
  std::string name;
  bool was_running{false};
  bool restart_attempted{false};
  bool restart_succeeded{false};
  std::string error; // start failure reason
};

struct PurgeStats {
  std::size_t scanned{};  // regular files visited
  std::size_t expired{};  // older than the age limit, deletion attempted
  std::size_t removed{};
  std::size_t failed{};
};

struct LogScanResult {
  std::size_t failed_logins{};
  std::size_t errors{};
};

} // namespace sysmaint::model
