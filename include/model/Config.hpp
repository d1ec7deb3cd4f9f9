#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace sysmaint::model {

struct Thresholds {
  double cpu_pct  = 85.0;
  double mem_pct  = 85.0;
  double disk_pct = 80.0;
  int failed_logins = 5;  // warn when count exceeds this
  int errors        = 10;
};

struct LogPaths {
  std::string dir  = "logs";
  std::string file = "maintenance.log";
  std::string auth   = "logs/auth.log";
  std::string system = "logs/system.log";
  std::string auth_pattern   = "Failed password";
  std::string system_pattern = "error";
};

struct CleanupSettings {
  std::string temp_dir;  // resolved at load time: TMPDIR, else /tmp
  std::chrono::hours max_age = std::chrono::hours(24 * 7);
};

struct ResourceSettings {
  std::string disk_path = "/";
  std::chrono::milliseconds cpu_sample_interval = std::chrono::milliseconds(1000);
};

// Immutable run configuration, built once by app::load_config().
struct MaintenanceConfig {
  std::vector<std::string> critical_services{"ssh", "cron", "rsyslog"};
  Thresholds thresholds;
  LogPaths logs;
  CleanupSettings cleanup;
  ResourceSettings resources;
};

} // namespace sysmaint::model
