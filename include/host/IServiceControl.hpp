#pragma once
#include <string>

namespace sysmaint::host {

// Query and start OS-managed services by name.
class IServiceControl {
public:
  virtual ~IServiceControl() = default;

  // True if the service is currently running. Unknown services read as
  // not running.
  [[nodiscard]] virtual bool is_running(const std::string& name) = 0;

  // Start the service. Throws std::runtime_error describing the failure.
  virtual void start(const std::string& name) = 0;
};

} // namespace sysmaint::host
