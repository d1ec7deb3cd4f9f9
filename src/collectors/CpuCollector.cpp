#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string>
#include <string_view>

namespace sysmaint::collectors {

static void parse_cpu_line(std::string_view line, sysmaint::model::CpuTimes& out) {
  // line starts with 'cpu' or 'cpuN'; skip the label
  size_t pos = line.find(' ');
  if (pos == std::string_view::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) {
      std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    }
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

bool CpuCollector::sample(sysmaint::model::CpuSnapshot& out) {
  auto txt_opt = sysmaint::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  sysmaint::model::CpuTimes agg{};
  bool have_agg = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); have_agg = true; break; }
    start = end + 1;
  }
  if (!have_agg) return false;

  double usage = 0.0;
  if (has_last_) {
    // counters only grow; a reset (e.g. remapped root) reads as idle
    if (agg.total() > last_total_.total() && agg.work() >= last_total_.work()) {
      auto td = agg.total() - last_total_.total();
      auto wd = agg.work()  - last_total_.work();
      usage = 100.0 * static_cast<double>(wd) / static_cast<double>(td);
      if (usage > 100.0) usage = 100.0;
    }
  }
  last_total_ = agg; has_last_ = true;
  out.usage_pct = usage;
  return true;
}

} // namespace sysmaint::collectors
