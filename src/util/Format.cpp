#include "util/Format.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>

namespace sysmaint::util {

double round2(double v) {
  return std::round(v * 100.0) / 100.0;
}

std::string format_pct(double v, int decimals) {
  const double scale = std::pow(10.0, decimals);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, std::round(v * scale) / scale);
  std::string s(buf);
  while (!s.empty() && s.back() == '0') s.pop_back();
  if (!s.empty() && s.back() == '.') s.pop_back();
  if (s == "-0") s = "0";
  return s;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm lt{};
  ::localtime_r(&t, &lt);
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &lt) == 0) return std::string();
  return std::string(buf);
}

} // namespace sysmaint::util
