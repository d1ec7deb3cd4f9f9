#include "app/MaintenanceRunner.hpp"
#include "app/Cleaner.hpp"
#include "app/LogAnalyzer.hpp"
#include "app/ResourceMonitor.hpp"
#include "app/Updater.hpp"

namespace sysmaint::app {

MaintenanceRunner::MaintenanceRunner(const sysmaint::model::MaintenanceConfig& cfg,
                                     Logger& log,
                                     sysmaint::collectors::IResourceProbe& probe,
                                     sysmaint::host::IServiceControl& services,
                                     sysmaint::host::IUpdateControl& updates)
    : cfg_(cfg), log_(log), probe_(probe), services_(services), updates_(updates) {}

void MaintenanceRunner::run() {
  log_.log("🚀 Starting system maintenance");
  check_resources(cfg_, probe_, log_);
  analyze_logs(cfg_, log_);
  optimize_performance(cfg_, services_, log_);
  apply_updates(updates_, log_);
  log_.log("🏁 System maintenance completed");
}

} // namespace sysmaint::app
