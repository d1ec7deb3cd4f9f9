#include "app/Cleaner.hpp"

#include <sys/stat.h>

#include <exception>
#include <system_error>
#include <utility>

namespace sysmaint::app {

namespace fs = std::filesystem;

static std::chrono::system_clock::time_point access_time(const struct stat& st) {
  auto since_epoch = std::chrono::seconds(st.st_atim.tv_sec) + std::chrono::nanoseconds(st.st_atim.tv_nsec);
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

sysmaint::model::PurgeStats purge_temp_files(const fs::path& dir,
                                             std::chrono::hours max_age,
                                             std::chrono::system_clock::time_point now) {
  sysmaint::model::PurgeStats stats{};
  const auto cutoff = now - max_age;

  // Collect first so each expired file is removed at most once and no
  // directory is read while we mutate it. Pending directories are kept as
  // paths, so only one directory handle is open at a time, and a directory
  // that cannot be read costs only its own subtree.
  std::vector<fs::path> expired;
  std::vector<fs::path> pending{dir};
  while (!pending.empty()) {
    fs::path cur = std::move(pending.back());
    pending.pop_back();
    std::error_code ec;
    fs::directory_iterator it(cur, ec);
    if (ec) {
      // a missing temp root is not an error of the purge
      if (cur != dir) ++stats.failed;
      continue;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
      struct stat st{};
      if (::lstat(it->path().c_str(), &st) != 0) continue;
      if (S_ISDIR(st.st_mode)) { pending.push_back(it->path()); continue; }
      if (!S_ISREG(st.st_mode)) continue;
      ++stats.scanned;
      if (access_time(st) < cutoff) expired.push_back(it->path());
    }
    // a failed read ends this directory's listing only
    if (ec) ++stats.failed;
  }

  stats.expired = expired.size();
  for (const auto& p : expired) {
    std::error_code rm_ec;
    if (fs::remove(p, rm_ec) && !rm_ec) ++stats.removed;
    else ++stats.failed;
  }
  return stats;
}

std::vector<sysmaint::model::ServiceCheckResult> supervise_services(const sysmaint::model::MaintenanceConfig& cfg,
                                                                    sysmaint::host::IServiceControl& services,
                                                                    Logger& log) {
  std::vector<sysmaint::model::ServiceCheckResult> results;
  results.reserve(cfg.critical_services.size());
  for (const auto& name : cfg.critical_services) {
    sysmaint::model::ServiceCheckResult r;
    r.name = name;
    r.was_running = services.is_running(name);
    if (r.was_running) {
      log.log("✅ Service " + name + " is running");
      results.push_back(std::move(r));
      continue;
    }
    log.log("⚠️ Service " + name + " is not running");
    log.log("🔄 Attempting to start service " + name);
    r.restart_attempted = true;
    try {
      services.start(name);
      r.restart_succeeded = true;
      log.log("✅ Service " + name + " started successfully");
    } catch (const std::exception& e) {
      r.error = e.what();
      log.log("❌ Failed to start service " + name + ": " + r.error);
    }
    results.push_back(std::move(r));
  }
  return results;
}

void optimize_performance(const sysmaint::model::MaintenanceConfig& cfg,
                          sysmaint::host::IServiceControl& services,
                          Logger& log,
                          std::chrono::system_clock::time_point now) {
  auto stats = purge_temp_files(cfg.cleanup.temp_dir, cfg.cleanup.max_age, now);
  log.log("🧹 Temporary files older than " + std::to_string(cfg.cleanup.max_age.count() / 24) +
          " days cleaned from " + cfg.cleanup.temp_dir + " (" + std::to_string(stats.removed) +
          " removed, " + std::to_string(stats.failed) + " skipped)");
  supervise_services(cfg, services, log);
}

} // namespace sysmaint::app
