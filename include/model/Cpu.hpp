#pragma once
#include <cstdint>

namespace hostwatch::model {

// Jiffy counters from the aggregate /proc/stat "cpu" line
struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

struct CpuSnapshot {
  CpuTimes total_times{};
  double usage_pct{}; // system-wide percent 0..100
};

} // namespace hostwatch::model
