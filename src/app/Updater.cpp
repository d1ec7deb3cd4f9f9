#include "app/Updater.hpp"

#include <exception>

namespace sysmaint::app {

UpdateOutcome apply_updates(sysmaint::host::IUpdateControl& updates, Logger& log) {
  if (!updates.is_elevated()) {
    log.log("⚠️ Not running as root, skipping system updates");
    return UpdateOutcome::SkippedNotElevated;
  }
  log.log("⬆️ Installing available system updates (no reboot)");
  try {
    updates.install_updates();
  } catch (const std::exception& e) {
    log.log(std::string("❌ System update failed: ") + e.what());
    return UpdateOutcome::Failed;
  }
  log.log("✅ System updates installed");
  return UpdateOutcome::Installed;
}

} // namespace sysmaint::app
