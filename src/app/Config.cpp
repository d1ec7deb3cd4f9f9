#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace sysmaint::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("SYSMAINT_", 0) == 0) {
    alt = std::string("sysmaint_") + n.substr(9);
  } else if (n.rfind("sysmaint_", 0) == 0) {
    alt = std::string("SYSMAINT_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stod(v); } catch(...) { return defv; }
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/sysmaint/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/sysmaint/config.toml";
  return {};
}

static std::string default_temp_dir() {
  if (const char* t = std::getenv("TMPDIR"); t && *t) return std::string(t);
  return "/tmp";
}

static double clamp_pct(double v) { return std::clamp(v, 0.0, 100.0); }

static std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t end = s.find(',', start);
    std::string item = s.substr(start, end == std::string::npos ? std::string::npos : end - start);
    while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) item.erase(item.begin());
    while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) item.pop_back();
    if (!item.empty()) out.push_back(item);
    if (end == std::string::npos) break;
    start = end + 1;
  }
  return out;
}

// Resolve a percentage from TOML -> env -> compiled default
static double resolve_pct(const sysmaint::util::TomlReader& toml, bool have_toml,
                          const char* key, const char* env_name, double def) {
  double v = def;
  if (have_toml && toml.has("thresholds", key))
    v = toml.get_double("thresholds", key, def);
  else if (env_name)
    v = getenv_double(env_name, def);
  return clamp_pct(v);
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const sysmaint::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

sysmaint::model::MaintenanceConfig load_config(const std::string& path) {
  sysmaint::model::MaintenanceConfig c{};
  sysmaint::util::TomlReader toml;
  bool have_toml = false;
  if (!path.empty()) {
    have_toml = toml.load(path);
    if (!have_toml) throw std::runtime_error("cannot read config file " + path);
  } else {
    auto def_path = config_file_path();
    have_toml = !def_path.empty() && toml.load(def_path);
  }

  // --- [thresholds] ---
  c.thresholds.cpu_pct  = resolve_pct(toml, have_toml, "cpu_pct",  "SYSMAINT_CPU_THRESHOLD",  c.thresholds.cpu_pct);
  c.thresholds.mem_pct  = resolve_pct(toml, have_toml, "mem_pct",  "SYSMAINT_MEM_THRESHOLD",  c.thresholds.mem_pct);
  c.thresholds.disk_pct = resolve_pct(toml, have_toml, "disk_pct", "SYSMAINT_DISK_THRESHOLD", c.thresholds.disk_pct);
  if (have_toml) {
    c.thresholds.failed_logins = std::max(0, toml.get_int("thresholds", "failed_logins", c.thresholds.failed_logins));
    c.thresholds.errors        = std::max(0, toml.get_int("thresholds", "errors", c.thresholds.errors));
  }

  // --- [services] ---
  if (have_toml && toml.has("services", "critical")) {
    c.critical_services = toml.get_string_list("services", "critical");
  } else if (const char* v = getenv_compat("SYSMAINT_SERVICES")) {
    c.critical_services = split_csv(v);
  }

  // --- [logs] ---
  c.logs.dir    = resolve_string(toml, have_toml, "logs", "dir",  "SYSMAINT_LOG_DIR", c.logs.dir);
  c.logs.file   = resolve_string(toml, have_toml, "logs", "file", nullptr, c.logs.file);
  // input logs default to living beside the run log
  c.logs.auth   = resolve_string(toml, have_toml, "logs", "auth",   nullptr, c.logs.dir + "/auth.log");
  c.logs.system = resolve_string(toml, have_toml, "logs", "system", nullptr, c.logs.dir + "/system.log");
  c.logs.auth_pattern   = resolve_string(toml, have_toml, "logs", "auth_pattern",   nullptr, c.logs.auth_pattern);
  c.logs.system_pattern = resolve_string(toml, have_toml, "logs", "system_pattern", nullptr, c.logs.system_pattern);

  // --- [cleanup] ---
  c.cleanup.temp_dir = resolve_string(toml, have_toml, "cleanup", "temp_dir", "SYSMAINT_TEMP_DIR", default_temp_dir());
  if (have_toml && toml.has("cleanup", "max_age_days")) {
    int days = std::max(0, toml.get_int("cleanup", "max_age_days", 7));
    c.cleanup.max_age = std::chrono::hours(24 * days);
  }

  // --- [resources] ---
  c.resources.disk_path = resolve_string(toml, have_toml, "resources", "disk_path", nullptr, c.resources.disk_path);
  if (have_toml && toml.has("resources", "cpu_sample_ms")) {
    int ms = std::max(0, toml.get_int("resources", "cpu_sample_ms", 1000));
    c.resources.cpu_sample_interval = std::chrono::milliseconds(ms);
  }

  return c;
}

} // namespace sysmaint::app
