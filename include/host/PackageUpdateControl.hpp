#pragma once
#include "host/IUpdateControl.hpp"
#include <string>
#include <vector>

namespace sysmaint::host {

struct PackageManager {
  const char* binary;   // looked up on PATH
  const char* upgrade;  // full non-interactive command line
};

// Built-in table in probe order: apt-get, dnf, zypper, pacman.
const std::vector<PackageManager>& known_package_managers();

// Uses the first package manager from known_package_managers() found on PATH.
class PackageUpdateControl final : public IUpdateControl {
public:
  [[nodiscard]] bool is_elevated() const override;
  void install_updates() override;
};

} // namespace sysmaint::host
