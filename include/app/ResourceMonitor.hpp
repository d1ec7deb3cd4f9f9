#pragma once
#include <string>
#include <vector>
#include "app/Logger.hpp"
#include "collectors/IResourceProbe.hpp"
#include "model/Config.hpp"
#include "model/Snapshot.hpp"

namespace sysmaint::app {

struct ThresholdBreach {
  std::string metric; // "CPU" | "memory" | "disk"
  double value{};
  double threshold{};
};

// Metrics strictly above their threshold, in CPU, memory, disk order.
// Unreadable metrics never breach.
[[nodiscard]] std::vector<ThresholdBreach> evaluate_thresholds(const sysmaint::model::ResourceSnapshot& s,
                                                               const sysmaint::model::Thresholds& t);

// Sample once, log the summary line and one warning per breach.
sysmaint::model::ResourceSnapshot check_resources(const sysmaint::model::MaintenanceConfig& cfg,
                                                  sysmaint::collectors::IResourceProbe& probe,
                                                  Logger& log);

} // namespace sysmaint::app
