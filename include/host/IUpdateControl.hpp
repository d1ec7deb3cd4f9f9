#pragma once

namespace sysmaint::host {

class IUpdateControl {
public:
  virtual ~IUpdateControl() = default;

  // Whether the process may install updates (root on Linux).
  [[nodiscard]] virtual bool is_elevated() const = 0;

  // Install every available update without prompting and without
  // rebooting. Throws std::runtime_error on failure.
  virtual void install_updates() = 0;
};

} // namespace sysmaint::host
