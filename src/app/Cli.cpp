#include "app/Cli.hpp"

namespace sysmaint::app {

CliOptions parse_args(int argc, const char* const* argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config") {
      if (i + 1 >= argc) { opts.error = "--config requires a path"; return opts; }
      opts.config_path = argv[++i];
    } else if (a == "-h" || a == "--help") {
      opts.help = true;
      return opts;
    } else {
      opts.error = "unknown argument: " + a;
      return opts;
    }
  }
  return opts;
}

} // namespace sysmaint::app
