#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ostream>
#include "collectors/CpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "model/Snapshot.hpp"
#include "ui/Terminal.hpp"

namespace hostwatch::app {

enum class MonitorState { Running, Stopped };

// Sample -> clear -> print loop. Single-threaded; the only suspension point is
// the CPU sampling window, which is sliced so the stop flag is seen promptly.
class Monitor {
public:
  Monitor(std::ostream& out, hostwatch::ui::ScreenClearer& clearer, const std::atomic<bool>& stop,
          std::chrono::milliseconds window = std::chrono::seconds(1));
  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  // Cycles until the stop flag is observed, then prints the farewell line once.
  // Throws std::runtime_error when /proc/stat or /proc/meminfo cannot be read.
  void run();

  // One full cycle. Returns false, leaving the monitor Stopped, if the stop flag
  // was observed before the report went out; no partial report is ever printed.
  bool step();

  [[nodiscard]] MonitorState state() const { return state_; }
  [[nodiscard]] uint64_t cycles() const { return cycles_; }

private:
  bool stop_requested();
  bool wait_window();
  double sample_cpu();
  hostwatch::model::Memory sample_memory() const;
  void farewell();

  std::ostream& out_;
  hostwatch::ui::ScreenClearer& clearer_;
  const std::atomic<bool>& stop_;
  std::chrono::milliseconds window_;
  MonitorState state_{MonitorState::Running};
  uint64_t cycles_{0};
  bool said_farewell_{false};
  hostwatch::collectors::CpuCollector cpu_{};
  hostwatch::collectors::MemoryCollector mem_{};
};

} // namespace hostwatch::app
