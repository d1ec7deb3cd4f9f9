#include "minitest.hpp"
#include "fakes.hpp"
#include "app/ResourceMonitor.hpp"

using sysmaint::model::ResourceSnapshot;

static ResourceSnapshot snap(double cpu, double mem, double disk) {
  ResourceSnapshot s{};
  s.cpu_pct = cpu; s.mem_pct = mem; s.disk_pct = disk;
  return s;
}

static int count_containing(const std::vector<std::string>& lines, const std::string& needle) {
  int n = 0;
  for (const auto& l : lines) if (l.find(needle) != std::string::npos) ++n;
  return n;
}

TEST(thresholds_are_strict) {
  sysmaint::model::Thresholds t; // 85 / 85 / 80
  ASSERT_TRUE(sysmaint::app::evaluate_thresholds(snap(85.0, 85.0, 80.0), t).empty());
  auto over = sysmaint::app::evaluate_thresholds(snap(85.01, 85.01, 80.01), t);
  ASSERT_EQ(over.size(), 3u);
  ASSERT_EQ(over[0].metric, "CPU");
  ASSERT_EQ(over[1].metric, "memory");
  ASSERT_EQ(over[2].metric, "disk");
}

TEST(thresholds_each_metric_independent) {
  sysmaint::model::Thresholds t;
  t.cpu_pct = 50; t.mem_pct = 50; t.disk_pct = 50;
  auto b = sysmaint::app::evaluate_thresholds(snap(10, 60, 10), t);
  ASSERT_EQ(b.size(), 1u);
  ASSERT_EQ(b[0].metric, "memory");
  ASSERT_EQ(b[0].value, 60.0);
}

TEST(unreadable_metric_never_breaches) {
  sysmaint::model::Thresholds t;
  t.disk_pct = 0;
  auto s = snap(0, 0, 0);
  s.disk_ok = false;
  ASSERT_TRUE(sysmaint::app::evaluate_thresholds(s, t).empty());
}

TEST(check_resources_logs_summary_only_when_healthy) {
  sysmaint::model::MaintenanceConfig cfg;
  fakes::FixedProbe probe(snap(12.5, 40, 33.333));
  sysmaint::app::MemoryLogSink sink;
  sysmaint::app::Logger log(sink);
  sysmaint::app::check_resources(cfg, probe, log);
  ASSERT_EQ(probe.calls, 1);
  ASSERT_EQ(sink.lines().size(), 1u);
  auto msg = sysmaint::app::message_of(sink.lines()[0]);
  ASSERT_CONTAINS(msg, "CPU Usage: 12.5%");
  ASSERT_CONTAINS(msg, "Memory Usage: 40%");
  ASSERT_CONTAINS(msg, "Disk Usage: 33.33%");
}

TEST(check_resources_disk_85_over_80) {
  sysmaint::model::MaintenanceConfig cfg;
  cfg.thresholds.disk_pct = 80;
  fakes::FixedProbe probe(snap(10, 10, 85));
  sysmaint::app::MemoryLogSink sink;
  sysmaint::app::Logger log(sink);
  sysmaint::app::check_resources(cfg, probe, log);
  ASSERT_EQ(sink.lines().size(), 2u);
  ASSERT_EQ(count_containing(sink.lines(), "High disk usage"), 1);
  ASSERT_CONTAINS(sink.lines()[1], "High disk usage detected: 85%");
  ASSERT_EQ(count_containing(sink.lines(), "High CPU"), 0);
  ASSERT_EQ(count_containing(sink.lines(), "High memory"), 0);
}

TEST(check_resources_reports_unavailable_metric) {
  sysmaint::model::MaintenanceConfig cfg;
  auto s = snap(5, 5, 0);
  s.disk_ok = false;
  fakes::FixedProbe probe(s);
  sysmaint::app::MemoryLogSink sink;
  sysmaint::app::Logger log(sink);
  sysmaint::app::check_resources(cfg, probe, log);
  ASSERT_EQ(sink.lines().size(), 2u);
  ASSERT_CONTAINS(sink.lines()[0], "Disk usage unavailable");
  ASSERT_CONTAINS(sink.lines()[1], "Disk Usage: 0%");
}

TEST(check_resources_breach_never_prints_equal_to_threshold) {
  sysmaint::model::MaintenanceConfig cfg;
  cfg.thresholds.disk_pct = 80;
  fakes::FixedProbe probe(snap(10, 10, 80.004));
  sysmaint::app::MemoryLogSink sink;
  sysmaint::app::Logger log(sink);
  sysmaint::app::check_resources(cfg, probe, log);
  ASSERT_EQ(sink.lines().size(), 2u);
  ASSERT_CONTAINS(sink.lines()[0], "Disk Usage: 80%");
  ASSERT_CONTAINS(sink.lines()[1], "High disk usage detected: 80.004% (threshold 80%)");
}
