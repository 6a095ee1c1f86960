#pragma once

#include <atomic>
#include <ostream>
#include <string>
#include <string_view>

namespace hostwatch::ui {

// Set by the SIGINT/SIGTERM handler; the monitor polls it between steps
extern std::atomic<bool> g_stop;

void on_stop_signal(int);
void install_stop_handlers();

// ---- Screen clearing ----

enum class ClearMethod { Ansi, Command, None };

struct ClearCapability {
  ClearMethod method{ClearMethod::None};
  std::string command; // only meaningful for ClearMethod::Command
};

// Compile-time host identity: "linux", "darwin", "freebsd", "windows" or "unknown"
[[nodiscard]] std::string_view current_platform();

// Platform table lookup; unknown platforms fall back to running `clear`
[[nodiscard]] ClearCapability clear_capability_for(std::string_view platform);

// Resolve a configured mode ("auto", "ansi", "command", "none") against the
// platform table. A non-empty command_override replaces the table's command.
[[nodiscard]] ClearCapability select_clear_capability(std::string_view mode,
                                                      std::string_view command_override,
                                                      std::string_view platform);

class ScreenClearer {
public:
  explicit ScreenClearer(ClearCapability cap);

  // Never throws; a failing clear command is reported once on stderr
  void clear(std::ostream& out);

  [[nodiscard]] ClearMethod method() const { return cap_.method; }
  [[nodiscard]] const std::string& command() const { return cap_.command; }

private:
  ClearCapability cap_;
  bool warned_{false};
};

} // namespace hostwatch::ui
