#pragma once
#include "model/Snapshot.hpp"

namespace hostwatch::collectors {

class MemoryCollector {
public:
  bool sample(hostwatch::model::Memory& out) const; // returns true on success
};

} // namespace hostwatch::collectors
