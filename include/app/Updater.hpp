#pragma once
#include "app/Logger.hpp"
#include "host/IUpdateControl.hpp"

namespace sysmaint::app {

enum class UpdateOutcome { SkippedNotElevated, Installed, Failed };

// Skip with one warning unless elevated; otherwise install and log the
// outcome. Never throws for installation failures.
UpdateOutcome apply_updates(sysmaint::host::IUpdateControl& updates, Logger& log);

} // namespace sysmaint::app
