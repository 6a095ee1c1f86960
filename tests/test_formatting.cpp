#include "minitest.hpp"
#include "ui/Formatting.hpp"
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <limits>
#include <stdexcept>
#include <string>

using hostwatch::ui::format_bytes;

TEST(format_bytes_known_values) {
  ASSERT_EQ(format_bytes(0), "0.00B");
  ASSERT_EQ(format_bytes(1024), "1.00KB");
  ASSERT_EQ(format_bytes(1253656), "1.20MB");
  ASSERT_EQ(format_bytes(1253656678), "1.17GB");
  ASSERT_EQ(format_bytes(1023), "1023.00B");
}

TEST(format_bytes_power_boundary_promotes_scale) {
  ASSERT_EQ(format_bytes(1048576), "1.00MB");
  ASSERT_EQ(format_bytes(1073741824.0), "1.00GB");
  ASSERT_EQ(format_bytes(1099511627776.0), "1.00TB");
  ASSERT_EQ(format_bytes(1125899906842624.0), "1.00PB");
}

TEST(format_bytes_stays_in_petabytes_past_last_scale) {
  double two_k_pb = 2048.0 * 1125899906842624.0;
  ASSERT_EQ(format_bytes(two_k_pb), "2048.00PB");
  std::string max_u64 = format_bytes(static_cast<double>(std::numeric_limits<uint64_t>::max()));
  ASSERT_EQ(max_u64, "16384.00PB");
}

TEST(format_bytes_rounding_never_prints_1024) {
  ASSERT_EQ(format_bytes(1048575), "1.00MB");
  ASSERT_EQ(format_bytes(1023.996), "1.00KB");
  ASSERT_EQ(format_bytes(1023.99), "1023.99B");
  ASSERT_EQ(format_bytes(1073741823), "1.00GB");
  ASSERT_EQ(format_bytes(1048063), "1023.50KB");
}

TEST(format_bytes_custom_suffix) {
  ASSERT_EQ(format_bytes(2048, "/s"), "2.00K/s");
  ASSERT_EQ(format_bytes(512, ""), "512.00");
}

TEST(format_bytes_numeric_part_below_1024_until_petabytes) {
  double v = 1.0;
  while (v < 1024.0 * 1125899906842624.0) {
    std::string s = format_bytes(v);
    double num = std::strtod(s.c_str(), nullptr);
    ASSERT_TRUE(num >= 0.0 && num < 1024.0);
    v = v * 3.7 + 11.0;
  }
  // one byte short of every scale boundary up to P
  for (double edge = 1024.0; edge <= 1125899906842624.0; edge *= 1024.0) {
    double num = std::strtod(format_bytes(edge - 1.0).c_str(), nullptr);
    ASSERT_TRUE(num >= 0.0 && num < 1024.0);
  }
}

TEST(format_bytes_is_pure) {
  ASSERT_EQ(format_bytes(987654321), format_bytes(987654321));
  ASSERT_EQ(format_bytes(0), format_bytes(0));
}

TEST(format_bytes_rejects_negative_and_nan) {
  ASSERT_THROWS((void)format_bytes(-1.0), std::invalid_argument);
  ASSERT_THROWS((void)format_bytes(std::nan("")), std::invalid_argument);
  ASSERT_THROWS((void)format_bytes(std::numeric_limits<double>::infinity()), std::invalid_argument);
}

TEST(format_percent_one_decimal) {
  ASSERT_EQ(hostwatch::ui::format_percent(0.0), "0.0%");
  ASSERT_EQ(hostwatch::ui::format_percent(12.34), "12.3%");
  ASSERT_EQ(hostwatch::ui::format_percent(100.0), "100.0%");
}

TEST(format_timestamp_layout) {
  setenv("TZ", "UTC", 1);
  tzset();
  ASSERT_EQ(hostwatch::ui::format_timestamp(0), "1970-01-01 00:00:00");
  ASSERT_EQ(hostwatch::ui::format_timestamp(1700000000), "2023-11-14 22:13:20");
  auto now = hostwatch::ui::format_timestamp_now();
  ASSERT_EQ(now.size(), 19u);
  ASSERT_EQ(now[4], '-');
  ASSERT_EQ(now[10], ' ');
  ASSERT_EQ(now[13], ':');
}
