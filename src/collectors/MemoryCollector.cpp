#include "collectors/MemoryCollector.hpp"
#include "util/Format.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string_view>

namespace sysmaint::collectors {

static inline uint64_t parse_u64(std::string_view s) {
  uint64_t v = 0;
  // strip non-digits on right (e.g., kB)
  while (!s.empty() && (s.back() < '0' || s.back() > '9')) s.remove_suffix(1);
  // strip spaces on left
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

bool MemoryCollector::sample(sysmaint::model::Memory& out) const {
  auto txt_opt = sysmaint::util::read_file_string("/proc/meminfo");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;

  uint64_t mem_total = 0, mem_free = 0, mem_avail = 0, buffers = 0, cached = 0;
  bool have_avail = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("MemTotal:")) mem_total = parse_u64(line.substr(9));
    else if (line.starts_with("MemFree:")) mem_free = parse_u64(line.substr(8));
    else if (line.starts_with("MemAvailable:")) { mem_avail = parse_u64(line.substr(13)); have_avail = true; }
    else if (line.starts_with("Buffers:")) buffers = parse_u64(line.substr(8));
    else if (line.starts_with("Cached:")) cached = parse_u64(line.substr(7));
    start = end + 1;
  }
  if (mem_total == 0) return false;

  uint64_t free_kb = have_avail ? mem_avail : (mem_free + buffers + cached);
  if (free_kb > mem_total) free_kb = mem_total;
  out.total_kb = mem_total;
  out.free_kb = free_kb;
  out.used_pct = sysmaint::util::round2(
      (1.0 - static_cast<double>(free_kb) / static_cast<double>(mem_total)) * 100.0);
  return true;
}

} // namespace sysmaint::collectors
