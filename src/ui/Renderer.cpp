#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"

namespace hostwatch::ui {

std::vector<std::string> report_lines(const hostwatch::model::Sample& s) {
  std::vector<std::string> lines;
  lines.reserve(8);
  lines.emplace_back(kRuleWidth, '=');
  lines.push_back("  SYSTEM MONITORING - " + s.timestamp);
  lines.push_back("CPU Usage:      " + format_percent(s.cpu_percent));
  lines.push_back("Memory Usage:   " + format_percent(s.memory_percent));
  lines.push_back("Memory Used:    " + format_bytes(static_cast<double>(s.memory_used_bytes)));
  lines.push_back("Memory Total:   " + format_bytes(static_cast<double>(s.memory_total_bytes)));
  lines.emplace_back(kRuleWidth, '-');
  lines.emplace_back(kInstructionLine);
  return lines;
}

std::string render_report(const hostwatch::model::Sample& s) {
  std::string out;
  for (const auto& l : report_lines(s)) {
    out += l;
    out += '\n';
  }
  return out;
}

} // namespace hostwatch::ui
