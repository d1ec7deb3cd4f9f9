#pragma once
#include "model/Snapshot.hpp"

namespace sysmaint::collectors {

class MemoryCollector {
public:
  bool sample(sysmaint::model::Memory& out) const; // returns true on success
};

} // namespace sysmaint::collectors
