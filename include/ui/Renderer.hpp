#pragma once

#include <string>
#include <vector>
#include "model/Snapshot.hpp"

namespace hostwatch::ui {

inline constexpr int kRuleWidth = 40;
inline constexpr const char* kInstructionLine = "Press Ctrl+C to exit";
inline constexpr const char* kFarewellLine = "Monitor stopped.";

// Fixed layout, top to bottom: '=' rule, header with timestamp, CPU and memory
// percentages, used and total memory, '-' rule, instruction line.
std::vector<std::string> report_lines(const hostwatch::model::Sample& s);

// report_lines joined with '\n', including the trailing newline
std::string render_report(const hostwatch::model::Sample& s);

} // namespace hostwatch::ui
