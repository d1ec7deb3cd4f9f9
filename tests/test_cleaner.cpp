#include "minitest.hpp"
#include "fakes.hpp"
#include "app/Cleaner.hpp"
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>
#include <chrono>
#include <fstream>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

static void touch_with_atime(const fs::path& p, std::chrono::system_clock::time_point atime) {
  std::ofstream(p) << "x";
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(atime.time_since_epoch()).count();
  struct timespec times[2];
  times[0].tv_sec = static_cast<time_t>(secs);
  times[0].tv_nsec = 0;
  times[1].tv_sec = 0;
  times[1].tv_nsec = UTIME_OMIT;
  ASSERT_EQ(::utimensat(AT_FDCWD, p.c_str(), times, 0), 0);
}

TEST(purge_removes_only_expired_files) {
  auto dir = fakes::scratch_dir("purge");
  auto now = std::chrono::system_clock::now();
  fs::create_directories(dir / "nested" / "deeper");
  touch_with_atime(dir / "old.tmp", now - 8 * 24h);
  touch_with_atime(dir / "nested" / "deeper" / "old2.tmp", now - 30 * 24h);
  touch_with_atime(dir / "fresh.tmp", now - 6 * 24h);
  touch_with_atime(dir / "nested" / "fresh2.tmp", now - 1h);

  auto stats = sysmaint::app::purge_temp_files(dir, std::chrono::hours(24 * 7), now);
  ASSERT_EQ(stats.scanned, 4u);
  ASSERT_EQ(stats.expired, 2u);
  ASSERT_EQ(stats.removed, 2u);
  ASSERT_EQ(stats.failed, 0u);
  ASSERT_TRUE(!fs::exists(dir / "old.tmp"));
  ASSERT_TRUE(!fs::exists(dir / "nested" / "deeper" / "old2.tmp"));
  ASSERT_TRUE(fs::exists(dir / "fresh.tmp"));
  ASSERT_TRUE(fs::exists(dir / "nested" / "fresh2.tmp"));
  // directories are left in place
  ASSERT_TRUE(fs::is_directory(dir / "nested" / "deeper"));
  fs::remove_all(dir);
}

TEST(purge_boundary_is_strict) {
  auto dir = fakes::scratch_dir("purge_boundary");
  // whole seconds so the stored atime equals the cutoff exactly
  std::chrono::system_clock::time_point now =
      std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
  touch_with_atime(dir / "at_cutoff.tmp", now - 7 * 24h);
  touch_with_atime(dir / "past_cutoff.tmp", now - 7 * 24h - 1s);

  auto stats = sysmaint::app::purge_temp_files(dir, std::chrono::hours(24 * 7), now);
  ASSERT_EQ(stats.expired, 1u);
  ASSERT_EQ(stats.removed, 1u);
  ASSERT_TRUE(fs::exists(dir / "at_cutoff.tmp"));
  ASSERT_TRUE(!fs::exists(dir / "past_cutoff.tmp"));
  fs::remove_all(dir);
}

TEST(purge_continues_past_unreadable_dir) {
  // permission bits do not stop root
  if (::geteuid() == 0) return;
  auto dir = fakes::scratch_dir("purge_locked");
  auto now = std::chrono::system_clock::now();
  fs::create_directories(dir / "a");
  fs::create_directories(dir / "locked");
  fs::create_directories(dir / "z");
  touch_with_atime(dir / "a" / "old.tmp", now - 30 * 24h);
  touch_with_atime(dir / "locked" / "old.tmp", now - 30 * 24h);
  touch_with_atime(dir / "z" / "old.tmp", now - 30 * 24h);
  fs::permissions(dir / "locked", fs::perms::none);

  auto stats = sysmaint::app::purge_temp_files(dir, std::chrono::hours(24 * 7), now);
  fs::permissions(dir / "locked", fs::perms::owner_all);
  ASSERT_EQ(stats.expired, 2u);
  ASSERT_EQ(stats.removed, 2u);
  ASSERT_EQ(stats.failed, 1u);
  ASSERT_TRUE(!fs::exists(dir / "a" / "old.tmp"));
  ASSERT_TRUE(!fs::exists(dir / "z" / "old.tmp"));
  ASSERT_TRUE(fs::exists(dir / "locked" / "old.tmp"));
  fs::remove_all(dir);
}

TEST(purge_reaches_every_dir_under_low_fd_limit) {
  auto dir = fakes::scratch_dir("purge_fds");
  auto now = std::chrono::system_clock::now();
  fs::path chain = dir / "chain";
  for (int i = 0; i < 30; ++i) chain /= "d" + std::to_string(i);
  fs::create_directories(chain);
  touch_with_atime(chain / "old.tmp", now - 30 * 24h);
  for (int i = 0; i < 40; ++i) {
    auto sib = dir / ("s" + std::to_string(i));
    fs::create_directory(sib);
    touch_with_atime(sib / "old.tmp", now - 30 * 24h);
  }

  struct rlimit saved{};
  ASSERT_EQ(::getrlimit(RLIMIT_NOFILE, &saved), 0);
  struct rlimit low = saved;
  low.rlim_cur = 20;
  ASSERT_EQ(::setrlimit(RLIMIT_NOFILE, &low), 0);
  auto stats = sysmaint::app::purge_temp_files(dir, std::chrono::hours(24 * 7), now);
  ::setrlimit(RLIMIT_NOFILE, &saved);

  ASSERT_EQ(stats.expired, 41u);
  ASSERT_EQ(stats.removed, 41u);
  ASSERT_EQ(stats.failed, 0u);
  ASSERT_TRUE(!fs::exists(chain / "old.tmp"));
  fs::remove_all(dir);
}

TEST(purge_does_not_follow_symlinks) {
  auto dir = fakes::scratch_dir("purge_links");
  auto outside = fakes::scratch_dir("purge_outside");
  auto now = std::chrono::system_clock::now();
  touch_with_atime(outside / "keep.dat", now - 60 * 24h);
  fs::create_directory_symlink(outside, dir / "linkdir");
  fs::create_symlink(outside / "keep.dat", dir / "link.dat");

  auto stats = sysmaint::app::purge_temp_files(dir, std::chrono::hours(24 * 7), now);
  ASSERT_EQ(stats.expired, 0u);
  ASSERT_TRUE(fs::exists(outside / "keep.dat"));
  fs::remove_all(dir);
  fs::remove_all(outside);
}

TEST(purge_missing_dir_is_quiet) {
  auto stats = sysmaint::app::purge_temp_files("/nonexistent/sysmaint/tmp", std::chrono::hours(24 * 7),
                                               std::chrono::system_clock::now());
  ASSERT_EQ(stats.scanned, 0u);
  ASSERT_EQ(stats.failed, 0u);
}

TEST(services_one_line_each_in_order) {
  sysmaint::model::MaintenanceConfig cfg;
  cfg.critical_services = {"alpha", "beta", "gamma"};
  fakes::FakeServices svc;
  svc.running = {"alpha", "beta", "gamma"};
  sysmaint::app::MemoryLogSink sink;
  sysmaint::app::Logger log(sink);
  auto results = sysmaint::app::supervise_services(cfg, svc, log);
  ASSERT_EQ(results.size(), 3u);
  ASSERT_EQ(sink.lines().size(), 3u);
  ASSERT_CONTAINS(sink.lines()[0], "Service alpha is running");
  ASSERT_CONTAINS(sink.lines()[1], "Service beta is running");
  ASSERT_CONTAINS(sink.lines()[2], "Service gamma is running");
  ASSERT_TRUE(svc.started.empty());
  ASSERT_EQ(svc.queried, cfg.critical_services);
}

TEST(services_stopped_then_started) {
  sysmaint::model::MaintenanceConfig cfg;
  cfg.critical_services = {"cron"};
  fakes::FakeServices svc;
  sysmaint::app::MemoryLogSink sink;
  sysmaint::app::Logger log(sink);
  auto results = sysmaint::app::supervise_services(cfg, svc, log);
  ASSERT_EQ(sink.lines().size(), 3u);
  ASSERT_CONTAINS(sink.lines()[0], "Service cron is not running");
  ASSERT_CONTAINS(sink.lines()[1], "Attempting to start service cron");
  ASSERT_CONTAINS(sink.lines()[2], "Service cron started successfully");
  ASSERT_TRUE(!results[0].was_running);
  ASSERT_TRUE(results[0].restart_attempted);
  ASSERT_TRUE(results[0].restart_succeeded);
  ASSERT_EQ(svc.started.size(), 1u);
}

TEST(services_start_failure_continues) {
  sysmaint::model::MaintenanceConfig cfg;
  cfg.critical_services = {"broken", "ssh"};
  fakes::FakeServices svc;
  svc.broken = {"broken"};
  svc.running = {"ssh"};
  sysmaint::app::MemoryLogSink sink;
  sysmaint::app::Logger log(sink);
  auto results = sysmaint::app::supervise_services(cfg, svc, log);
  ASSERT_EQ(results.size(), 2u);
  ASSERT_TRUE(!results[0].restart_succeeded);
  ASSERT_EQ(results[0].error, "unit broken failed to start");
  ASSERT_EQ(sink.lines().size(), 4u);
  ASSERT_CONTAINS(sink.lines()[2], "Failed to start service broken: unit broken failed to start");
  ASSERT_CONTAINS(sink.lines()[3], "Service ssh is running");
}

TEST(optimize_logs_purge_summary_before_services) {
  auto dir = fakes::scratch_dir("optimize");
  sysmaint::model::MaintenanceConfig cfg;
  cfg.cleanup.temp_dir = dir.string();
  cfg.critical_services = {"ssh"};
  fakes::FakeServices svc;
  svc.running = {"ssh"};
  sysmaint::app::MemoryLogSink sink;
  sysmaint::app::Logger log(sink);
  sysmaint::app::optimize_performance(cfg, svc, log);
  ASSERT_EQ(sink.lines().size(), 2u);
  ASSERT_CONTAINS(sink.lines()[0], "Temporary files older than 7 days cleaned");
  ASSERT_CONTAINS(sink.lines()[1], "Service ssh is running");
  fs::remove_all(dir);
}
