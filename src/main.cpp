#include "app/Bootstrap.hpp"
#include "app/Cli.hpp"
#include "app/Config.hpp"
#include "app/Logger.hpp"
#include "app/MaintenanceRunner.hpp"
#include "collectors/HostResourceProbe.hpp"
#include "host/PackageUpdateControl.hpp"
#include "host/SystemdServiceControl.hpp"

#include <cstdio>
#include <exception>
#include <iostream>
#include <string>

static void print_usage(std::ostream& os) {
  os << "Usage: sysmaint [--config PATH]\n"
        "  Checks CPU/memory/disk usage, scans auth/system logs, purges old temp\n"
        "  files, starts stopped critical services and installs updates (root only).\n"
        "  Default config: $XDG_CONFIG_HOME/sysmaint/config.toml\n";
}

int main(int argc, char** argv) {
  const auto opts = sysmaint::app::parse_args(argc, argv);
  if (opts.help) {
    print_usage(std::cout);
    return 0;
  }
  if (!opts.error.empty()) {
    std::fprintf(stderr, "sysmaint: %s\n", opts.error.c_str());
    print_usage(std::cerr);
    return 2;
  }

  try {
    const auto cfg = sysmaint::app::load_config(opts.config_path);

    // The directory has to exist before the sink can open the run log.
    bool created_dir = sysmaint::app::ensure_log_dir(cfg);
    sysmaint::app::FileLogSink sink(sysmaint::app::log_file_path(cfg));
    sysmaint::app::Logger log(sink);
    if (created_dir) log.log("ℹ️ Created log directory: " + cfg.logs.dir);
    sysmaint::app::ensure_input_logs(cfg, log);

    sysmaint::collectors::HostResourceProbe probe(cfg.resources);
    sysmaint::host::SystemdServiceControl services;
    sysmaint::host::PackageUpdateControl updates;
    sysmaint::app::MaintenanceRunner runner(cfg, log, probe, services, updates);
    runner.run();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "sysmaint: fatal: %s\n", e.what());
    return 1;
  }
  return 0;
}
