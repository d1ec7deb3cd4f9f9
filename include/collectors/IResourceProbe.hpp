#pragma once
#include "model/Snapshot.hpp"

namespace sysmaint::collectors {

// Source of CPU/memory/disk utilization so the resource check can run
// against the live host or a fixed reading.
class IResourceProbe {
public:
  virtual ~IResourceProbe() = default;

  // Take one reading. Metrics that cannot be read come back 0 with their
  // *_ok flag cleared.
  [[nodiscard]] virtual sysmaint::model::ResourceSnapshot sample() = 0;
};

} // namespace sysmaint::collectors
