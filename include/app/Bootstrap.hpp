#pragma once

#include <filesystem>
#include "app/Logger.hpp"
#include "model/Config.hpp"

namespace sysmaint::app {

// Create the log directory if missing. Runs before any sink is opened, so
// it only reports whether it had to create it. Throws std::runtime_error
// when the directory cannot be created.
bool ensure_log_dir(const sysmaint::model::MaintenanceConfig& cfg);

// <log_dir>/<log_file>
[[nodiscard]] std::filesystem::path log_file_path(const sysmaint::model::MaintenanceConfig& cfg);

// Create empty placeholders for the auth and system logs when absent,
// logging one line per file created. Throws std::runtime_error when a
// placeholder cannot be created.
void ensure_input_logs(const sysmaint::model::MaintenanceConfig& cfg, Logger& log);

} // namespace sysmaint::app
