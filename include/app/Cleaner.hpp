#pragma once
#include <chrono>
#include <filesystem>
#include <vector>
#include "app/Logger.hpp"
#include "host/IServiceControl.hpp"
#include "model/Config.hpp"
#include "model/Snapshot.hpp"

namespace sysmaint::app {

// Delete every regular file under `dir` (recursively) whose last-access time
// is older than now - max_age. Symlinks are not followed. Enumeration and
// deletion errors are counted, never raised.
sysmaint::model::PurgeStats purge_temp_files(const std::filesystem::path& dir,
                                             std::chrono::hours max_age,
                                             std::chrono::system_clock::time_point now);

// Check each configured service in order and start the stopped ones once.
std::vector<sysmaint::model::ServiceCheckResult> supervise_services(const sysmaint::model::MaintenanceConfig& cfg,
                                                                    sysmaint::host::IServiceControl& services,
                                                                    Logger& log);

// Temp purge (one summary line) followed by service supervision.
void optimize_performance(const sysmaint::model::MaintenanceConfig& cfg,
                          sysmaint::host::IServiceControl& services,
                          Logger& log,
                          std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

} // namespace sysmaint::app
