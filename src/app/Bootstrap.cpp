#include "app/Bootstrap.hpp"

#include <fstream>
#include <stdexcept>

namespace sysmaint::app {

namespace fs = std::filesystem;

bool ensure_log_dir(const sysmaint::model::MaintenanceConfig& cfg) {
  std::error_code ec;
  if (fs::is_directory(cfg.logs.dir, ec)) return false;
  fs::create_directories(cfg.logs.dir, ec);
  if (ec) {
    throw std::runtime_error("cannot create log directory " + cfg.logs.dir + ": " + ec.message());
  }
  return true;
}

fs::path log_file_path(const sysmaint::model::MaintenanceConfig& cfg) {
  return fs::path(cfg.logs.dir) / cfg.logs.file;
}

static void ensure_placeholder(const std::string& path, Logger& log) {
  std::error_code ec;
  if (fs::exists(path, ec)) return;
  fs::path p(path);
  if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
  std::ofstream out(p, std::ios::app);
  if (!out) throw std::runtime_error("cannot create placeholder log " + path);
  log.log("ℹ️ Created placeholder log file: " + path);
}

void ensure_input_logs(const sysmaint::model::MaintenanceConfig& cfg, Logger& log) {
  ensure_placeholder(cfg.logs.auth, log);
  ensure_placeholder(cfg.logs.system, log);
}

} // namespace sysmaint::app
