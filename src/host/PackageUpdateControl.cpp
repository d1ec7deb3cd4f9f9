#include "host/PackageUpdateControl.hpp"
#include "util/Command.hpp"

#include <unistd.h>

#include <stdexcept>

namespace sysmaint::host {

const std::vector<PackageManager>& known_package_managers() {
  static const std::vector<PackageManager> table = {
    {"apt-get", "DEBIAN_FRONTEND=noninteractive apt-get -q update && "
                "DEBIAN_FRONTEND=noninteractive apt-get -q -y -o Dpkg::Options::=--force-confold upgrade"},
    {"dnf",     "dnf -y -q upgrade"},
    {"zypper",  "zypper --non-interactive --quiet update --auto-agree-with-licenses"},
    {"pacman",  "pacman -Syu --noconfirm"},
  };
  return table;
}

bool PackageUpdateControl::is_elevated() const {
  return ::geteuid() == 0;
}

void PackageUpdateControl::install_updates() {
  for (const auto& pm : known_package_managers()) {
    if (sysmaint::util::find_in_path(pm.binary).empty()) continue;
    auto r = sysmaint::util::run_command(pm.upgrade);
    if (!r) throw std::runtime_error(std::string("could not run ") + pm.binary);
    if (r->exit_code != 0) {
      std::string msg = std::string(pm.binary) + " exited with status " + std::to_string(r->exit_code);
      // last line of output usually carries the reason
      if (!r->output.empty()) {
        auto nl = r->output.rfind('\n');
        msg += ": " + (nl == std::string::npos ? r->output : r->output.substr(nl + 1));
      }
      throw std::runtime_error(msg);
    }
    return;
  }
  throw std::runtime_error("no supported package manager found on PATH");
}

} // namespace sysmaint::host
