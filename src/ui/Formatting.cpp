#include "ui/Formatting.hpp"

#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace hostwatch::ui {

std::string format_bytes(double bytes, std::string_view suffix) {
  if (!std::isfinite(bytes) || bytes < 0.0) {
    throw std::invalid_argument("format_bytes: byte count must be a non-negative finite number");
  }
  static constexpr const char* kScales[] = {"", "K", "M", "G", "T", "P"};
  constexpr size_t kLast = sizeof(kScales) / sizeof(kScales[0]) - 1;
  // promote once the two-decimal rendering would read 1024.00
  constexpr double kPromoteAt = 1023.995;
  size_t idx = 0;
  while (bytes >= kPromoteAt && idx < kLast) {
    bytes /= 1024.0;
    ++idx;
  }
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f%s", bytes, kScales[idx]);
  std::string out(buf);
  out.append(suffix);
  return out;
}

std::string format_percent(double pct) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", pct);
  return std::string(buf);
}

std::string format_timestamp(std::time_t t) {
  std::tm lt{};
  localtime_r(&t, &lt);
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &lt) == 0) return std::string();
  return std::string(buf);
}

std::string format_timestamp_now() {
  return format_timestamp(std::time(nullptr));
}

} // namespace hostwatch::ui
