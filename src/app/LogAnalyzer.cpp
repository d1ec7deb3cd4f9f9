#include "app/LogAnalyzer.hpp"
#include "util/BoyerMoore.hpp"

#include <fstream>
#include <stdexcept>

namespace sysmaint::app {

std::size_t count_matching_lines(const std::string& path, const std::string& pattern) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("cannot open log file " + path);
  sysmaint::util::BoyerMooreSearch bm(pattern);
  std::size_t count = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (bm.found_in(line)) ++count;
  }
  if (in.bad()) throw std::runtime_error("error reading log file " + path);
  return count;
}

sysmaint::model::LogScanResult analyze_logs(const sysmaint::model::MaintenanceConfig& cfg, Logger& log) {
  sysmaint::model::LogScanResult r{};
  r.failed_logins = count_matching_lines(cfg.logs.auth, cfg.logs.auth_pattern);
  r.errors        = count_matching_lines(cfg.logs.system, cfg.logs.system_pattern);

  log.log("🔍 Failed login attempts: " + std::to_string(r.failed_logins) +
          " | System errors: " + std::to_string(r.errors));

  if (r.failed_logins > static_cast<std::size_t>(cfg.thresholds.failed_logins)) {
    log.log("🚨 Security alert: multiple failed login attempts detected (" +
            std::to_string(r.failed_logins) + ")");
  }
  if (r.errors > static_cast<std::size_t>(cfg.thresholds.errors)) {
    log.log("⚠️ High number of system errors detected (" + std::to_string(r.errors) + ")");
  }
  return r;
}

} // namespace sysmaint::app
