#pragma once

#include <chrono>
#include <string>

namespace sysmaint::util {

// Round to `decimals` places and drop trailing zeros: 85.0 -> "85", 85.50 -> "85.5".
std::string format_pct(double v, int decimals = 2);

// Round half away from zero to two decimals.
double round2(double v);

// "YYYY-MM-DD HH:MM:SS" in local time.
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace sysmaint::util
