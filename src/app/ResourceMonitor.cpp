#include "app/ResourceMonitor.hpp"
#include "util/Format.hpp"

namespace sysmaint::app {

using sysmaint::util::format_pct;

// Widen the value until it no longer prints the same as its threshold.
static std::string breach_value(double value, double threshold) {
  int decimals = 2;
  while (decimals < 9 && format_pct(value, decimals) == format_pct(threshold, decimals)) ++decimals;
  return format_pct(value, decimals);
}

std::vector<ThresholdBreach> evaluate_thresholds(const sysmaint::model::ResourceSnapshot& s,
                                                 const sysmaint::model::Thresholds& t) {
  std::vector<ThresholdBreach> out;
  if (s.cpu_ok && s.cpu_pct > t.cpu_pct) out.push_back({"CPU", s.cpu_pct, t.cpu_pct});
  if (s.mem_ok && s.mem_pct > t.mem_pct) out.push_back({"memory", s.mem_pct, t.mem_pct});
  if (s.disk_ok && s.disk_pct > t.disk_pct) out.push_back({"disk", s.disk_pct, t.disk_pct});
  return out;
}

sysmaint::model::ResourceSnapshot check_resources(const sysmaint::model::MaintenanceConfig& cfg,
                                                  sysmaint::collectors::IResourceProbe& probe,
                                                  Logger& log) {
  auto s = probe.sample();

  if (!s.cpu_ok)  log.log("⚠️ CPU usage unavailable, reporting 0");
  if (!s.mem_ok)  log.log("⚠️ Memory usage unavailable, reporting 0");
  if (!s.disk_ok) log.log("⚠️ Disk usage unavailable for " + cfg.resources.disk_path + ", reporting 0");

  log.log("📊 CPU Usage: " + format_pct(s.cpu_pct) + "% | Memory Usage: " + format_pct(s.mem_pct) +
          "% | Disk Usage: " + format_pct(s.disk_pct) + "%");

  for (const auto& b : evaluate_thresholds(s, cfg.thresholds)) {
    log.log("⚠️ High " + b.metric + " usage detected: " + breach_value(b.value, b.threshold) +
            "% (threshold " + format_pct(b.threshold) + "%)");
  }
  return s;
}

} // namespace sysmaint::app
