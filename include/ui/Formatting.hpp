#pragma once

#include <ctime>
#include <string>
#include <string_view>

namespace hostwatch::ui {

// Scale a byte count by powers of 1024 and render it with two decimals:
// 1253656 -> "1.20MB". Values past the petabyte scale stay in "P".
// Throws std::invalid_argument for negative or non-finite input.
std::string format_bytes(double bytes, std::string_view suffix = "B");

// One decimal place with a trailing '%'
std::string format_percent(double pct);

// Date/time formatting (local time, YYYY-MM-DD HH:MM:SS)
std::string format_timestamp(std::time_t t);
std::string format_timestamp_now();

} // namespace hostwatch::ui
