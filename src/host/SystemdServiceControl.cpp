#include "host/SystemdServiceControl.hpp"
#include "util/Command.hpp"

#include <stdexcept>
#include <utility>

namespace sysmaint::host {

SystemdServiceControl::SystemdServiceControl(std::string systemctl)
    : systemctl_(std::move(systemctl)) {}

bool SystemdServiceControl::is_running(const std::string& name) {
  auto r = sysmaint::util::run_command(sysmaint::util::shell_quote(systemctl_) + " is-active --quiet " + sysmaint::util::shell_quote(name));
  return r && r->exit_code == 0;
}

void SystemdServiceControl::start(const std::string& name) {
  auto r = sysmaint::util::run_command(sysmaint::util::shell_quote(systemctl_) + " start " + sysmaint::util::shell_quote(name));
  if (!r) throw std::runtime_error("could not run " + systemctl_);
  if (r->exit_code != 0) {
    if (!r->output.empty()) throw std::runtime_error(r->output);
    throw std::runtime_error(systemctl_ + " start exited with status " + std::to_string(r->exit_code));
  }
}

} // namespace sysmaint::host
