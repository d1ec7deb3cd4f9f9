#pragma once
#include "app/Logger.hpp"
#include "collectors/IResourceProbe.hpp"
#include "host/IServiceControl.hpp"
#include "host/IUpdateControl.hpp"
#include "model/Config.hpp"

namespace sysmaint::app {

// Runs the maintenance steps once, strictly in order:
// resources, logs, cleanup + services, updates.
class MaintenanceRunner {
public:
  MaintenanceRunner(const sysmaint::model::MaintenanceConfig& cfg,
                    Logger& log,
                    sysmaint::collectors::IResourceProbe& probe,
                    sysmaint::host::IServiceControl& services,
                    sysmaint::host::IUpdateControl& updates);
  MaintenanceRunner(const MaintenanceRunner&) = delete;
  MaintenanceRunner& operator=(const MaintenanceRunner&) = delete;

  // Log analysis errors (unreadable input logs) propagate as
  // std::runtime_error; everything else is logged and the run continues.
  void run();

private:
  const sysmaint::model::MaintenanceConfig& cfg_;
  Logger& log_;
  sysmaint::collectors::IResourceProbe& probe_;
  sysmaint::host::IServiceControl& services_;
  sysmaint::host::IUpdateControl& updates_;
};

} // namespace sysmaint::app
