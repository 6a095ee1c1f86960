#pragma once
#include <cstdint>
#include <string>
#include "model/Cpu.hpp"

namespace hostwatch::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t used_kb{};
  uint64_t available_kb{};
  double   used_pct{}; // 0..100
  uint64_t total_bytes() const { return total_kb * 1024ull; }
  uint64_t used_bytes()  const { return used_kb * 1024ull; }
};

// One monitor cycle worth of figures. Built fresh each cycle and dropped after printing.
struct Sample {
  std::string timestamp;          // YYYY-MM-DD HH:MM:SS, local time
  double   cpu_percent{};         // 0..100
  double   memory_percent{};      // 0..100
  uint64_t memory_used_bytes{};
  uint64_t memory_total_bytes{};
};

} // namespace hostwatch::model
