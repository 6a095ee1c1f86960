#include "app/Monitor.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

using namespace std::chrono;

namespace hostwatch::app {

static constexpr milliseconds kStopPollSlice{50};

Monitor::Monitor(std::ostream& out, hostwatch::ui::ScreenClearer& clearer, const std::atomic<bool>& stop,
                 milliseconds window)
    : out_(out), clearer_(clearer), stop_(stop), window_(window) {}

bool Monitor::stop_requested() {
  if (state_ == MonitorState::Running && stop_.load()) state_ = MonitorState::Stopped;
  return state_ == MonitorState::Stopped;
}

// Sleep out the sampling window in short slices; false if interrupted
bool Monitor::wait_window() {
  auto deadline = steady_clock::now() + window_;
  for (;;) {
    if (stop_requested()) return false;
    auto now = steady_clock::now();
    if (now >= deadline) return true;
    std::this_thread::sleep_for(std::min(kStopPollSlice, duration_cast<milliseconds>(deadline - now) + milliseconds(1)));
  }
}

double Monitor::sample_cpu() {
  hostwatch::model::CpuSnapshot snap{};
  if (!cpu_.sample(snap)) throw std::runtime_error("cannot read CPU counters from /proc/stat");
  return snap.usage_pct;
}

hostwatch::model::Memory Monitor::sample_memory() const {
  hostwatch::model::Memory m{};
  if (!mem_.sample(m)) throw std::runtime_error("cannot read memory statistics from /proc/meminfo");
  return m;
}

bool Monitor::step() {
  if (stop_requested()) return false;

  hostwatch::model::Sample s{};
  s.timestamp = hostwatch::ui::format_timestamp_now();

  // utilization over exactly this cycle's window: fresh baseline, wait, delta
  cpu_.reset();
  sample_cpu();
  if (!wait_window()) return false;
  s.cpu_percent = sample_cpu();
  if (stop_requested()) return false;

  auto mem = sample_memory();
  s.memory_percent = mem.used_pct;
  s.memory_used_bytes = mem.used_bytes();
  s.memory_total_bytes = mem.total_bytes();
  if (stop_requested()) return false;

  clearer_.clear(out_);
  out_ << hostwatch::ui::render_report(s) << std::flush;
  ++cycles_;
  return true;
}

void Monitor::farewell() {
  if (said_farewell_) return;
  out_ << '\n' << hostwatch::ui::kFarewellLine << '\n' << std::flush;
  said_farewell_ = true;
}

void Monitor::run() {
  while (step()) {}
  farewell();
}

} // namespace hostwatch::app
