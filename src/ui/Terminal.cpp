#include "ui/Terminal.hpp"

#include <csignal>
#include <cstdio>
#include <cerrno>
#include <utility>
#include <sys/wait.h>
#include <unistd.h>

namespace hostwatch::ui {

std::atomic<bool> g_stop{false};

void on_stop_signal(int) { g_stop.store(true); }

void install_stop_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; // no SA_RESTART: let blocking calls return early
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
}

std::string_view current_platform() {
#if defined(__linux__)
  return "linux";
#elif defined(__APPLE__)
  return "darwin";
#elif defined(__FreeBSD__)
  return "freebsd";
#elif defined(_WIN32)
  return "windows";
#else
  return "unknown";
#endif
}

namespace {

struct PlatformClear { std::string_view platform; ClearMethod method; const char* command; };

constexpr PlatformClear kClearTable[] = {
  {"linux",   ClearMethod::Ansi,    ""},
  {"darwin",  ClearMethod::Ansi,    ""},
  {"freebsd", ClearMethod::Ansi,    ""},
  {"windows", ClearMethod::Command, "cls"},
};

constexpr const char* kFallbackCommand = "clear";
constexpr char kAnsiClear[] = "\x1B[2J\x1B[H";

// Run `sh -c cmd` and wait for it. Unlike std::system this leaves the parent's
// SIGINT/SIGTERM handlers active, so an interrupt during the clear reaches g_stop.
// Returns the waitpid status, or -1 if the child could not be started.
int run_shell(const std::string& cmd) {
  pid_t pid = ::fork();
  if (pid < 0) return -1;
  if (pid == 0) {
    ::execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char*>(nullptr));
    ::_exit(127);
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return -1;
  }
  return status;
}

} // namespace

ClearCapability clear_capability_for(std::string_view platform) {
  for (const auto& row : kClearTable) {
    if (row.platform == platform) return ClearCapability{row.method, row.command};
  }
  return ClearCapability{ClearMethod::Command, kFallbackCommand};
}

ClearCapability select_clear_capability(std::string_view mode, std::string_view command_override,
                                        std::string_view platform) {
  ClearCapability table = clear_capability_for(platform);
  ClearCapability out;
  if (mode == "ansi") {
    out.method = ClearMethod::Ansi;
  } else if (mode == "none") {
    out.method = ClearMethod::None;
  } else if (mode == "command") {
    out.method = ClearMethod::Command;
    out.command = table.method == ClearMethod::Command ? table.command : std::string(kFallbackCommand);
  } else {
    out = table;
  }
  if (!command_override.empty() && (out.method == ClearMethod::Command || mode == "auto" || mode.empty())) {
    out.method = ClearMethod::Command;
    out.command = std::string(command_override);
  }
  return out;
}

ScreenClearer::ScreenClearer(ClearCapability cap) : cap_(std::move(cap)) {
  if (cap_.method == ClearMethod::Command && cap_.command.empty()) cap_.method = ClearMethod::None;
}

void ScreenClearer::clear(std::ostream& out) {
  switch (cap_.method) {
    case ClearMethod::None:
      return;
    case ClearMethod::Ansi:
      out << kAnsiClear;
      return;
    case ClearMethod::Command: {
      // the child writes straight to the tty; anything we buffered must land first
      out.flush();
      std::fflush(stdout);
      int rc = run_shell(cap_.command);
      if (rc != -1 && WIFSIGNALED(rc) && (WTERMSIG(rc) == SIGINT || WTERMSIG(rc) == SIGTERM)) {
        // Ctrl+C reaches the whole foreground group; the child dying of it is our stop request too
        g_stop.store(true);
        return;
      }
      bool ok = rc != -1 && WIFEXITED(rc) && WEXITSTATUS(rc) == 0;
      if (!ok && !warned_) {
        std::fprintf(stderr, "hostwatch: ScreenClearer: '%s' failed (status %d); screen will not be cleared\n",
                     cap_.command.c_str(), rc);
        warned_ = true;
      }
      return;
    }
  }
}

} // namespace hostwatch::ui
