#pragma once
#include <cstddef>
#include <string>
#include "app/Logger.hpp"
#include "model/Config.hpp"
#include "model/Snapshot.hpp"

namespace sysmaint::app {

// Number of lines in `path` containing `pattern` (case-sensitive).
// Throws std::runtime_error if the file cannot be opened or read.
[[nodiscard]] std::size_t count_matching_lines(const std::string& path, const std::string& pattern);

// Count auth failures and system errors, log the counts and any warnings.
sysmaint::model::LogScanResult analyze_logs(const sysmaint::model::MaintenanceConfig& cfg, Logger& log);

} // namespace sysmaint::app
