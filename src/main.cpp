#include "app/Monitor.hpp"
#include "ui/Config.hpp"
#include "ui/Terminal.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

using namespace hostwatch::ui;

static void print_usage() {
  std::cout << "Usage: hostwatch\n";
  std::cout << "Samples CPU and memory usage once per second and redraws the report until Ctrl+C.\n";
  std::cout << "Config: " << config_file_path() << " ([ui] clear, clear_command)\n";
  std::cout << "Env: HOSTWATCH_CLEAR=auto|ansi|command|none  HOSTWATCH_CLEAR_COMMAND=<cmd>\n";
}

int main(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") {
      print_usage();
      return 0;
    }
    std::fprintf(stderr, "hostwatch: unknown argument '%s' (try --help)\n", argv[i]);
    return 2;
  }

  install_stop_handlers();

  // Clear mechanism is chosen once; the loop never re-inspects the platform
  const auto& cfg = config();
  ScreenClearer clearer(select_clear_capability(cfg.ui.clear, cfg.ui.clear_command, current_platform()));

  hostwatch::app::Monitor monitor(std::cout, clearer, g_stop);
  try {
    monitor.run();
  } catch (const std::exception& e) {
    std::cout.flush();
    std::fprintf(stderr, "hostwatch: error: %s\n", e.what());
    return 1;
  }
  return 0;
}
