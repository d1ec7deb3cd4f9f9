#pragma once
#include "host/IServiceControl.hpp"

namespace sysmaint::host {

class SystemdServiceControl final : public IServiceControl {
public:
  explicit SystemdServiceControl(std::string systemctl = "systemctl");

  [[nodiscard]] bool is_running(const std::string& name) override;
  void start(const std::string& name) override;

private:
  std::string systemctl_;
};

} // namespace sysmaint::host
