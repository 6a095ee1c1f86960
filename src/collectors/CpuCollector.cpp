#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <charconv>
#include <string>
#include <string_view>

namespace hostwatch::collectors {

static void parse_cpu_line(std::string_view line, hostwatch::model::CpuTimes& out) {
  // skip the "cpu"/"cpuN" label
  size_t pos = line.find(' ');
  if (pos == std::string_view::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) {
      std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    }
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

static double busy_pct(const hostwatch::model::CpuTimes& now, const hostwatch::model::CpuTimes& before) {
  // counters can step backwards after CPU hotplug; treat that as no data
  if (now.total() <= before.total() || now.work() < before.work()) return 0.0;
  auto td = now.total() - before.total();
  auto wd = now.work() - before.work();
  return std::clamp(100.0 * static_cast<double>(wd) / static_cast<double>(td), 0.0, 100.0);
}

bool CpuCollector::sample(hostwatch::model::CpuSnapshot& out) {
  auto txt_opt = hostwatch::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  hostwatch::model::CpuTimes agg{};
  bool found_total = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); found_total = true; break; }
    start = end + 1;
  }
  if (!found_total) return false;

  out.usage_pct = has_last_ ? busy_pct(agg, last_total_) : 0.0;
  out.total_times = agg;
  last_total_ = agg; has_last_ = true;
  return true;
}

} // namespace hostwatch::collectors
