#pragma once
#include <string>

namespace sysmaint::app {

struct CliOptions {
  std::string config_path;  // empty: default location
  bool help{false};
  std::string error;        // set when argv is unusable
};

// sysmaint [--config PATH] [-h|--help]
CliOptions parse_args(int argc, const char* const* argv);

} // namespace sysmaint::app
