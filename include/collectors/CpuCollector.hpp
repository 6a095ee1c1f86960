#pragma once
#include "model/Cpu.hpp"

namespace hostwatch::collectors {

// Computes CPU utilization from the delta between consecutive /proc/stat reads.
// The first sample after construction (or reset()) only primes the baseline and reports 0%.
class CpuCollector {
public:
  CpuCollector() = default;
  bool sample(hostwatch::model::CpuSnapshot& out);
  void reset() { has_last_ = false; }
private:
  hostwatch::model::CpuTimes last_total_{};
  bool has_last_{false};
};

} // namespace hostwatch::collectors
