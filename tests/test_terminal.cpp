#include "minitest.hpp"
#include "ui/Terminal.hpp"
#include <csignal>
#include <sstream>

using namespace hostwatch::ui;

TEST(clear_table_lookup) {
  ASSERT_TRUE(clear_capability_for("linux").method == ClearMethod::Ansi);
  ASSERT_TRUE(clear_capability_for("darwin").method == ClearMethod::Ansi);
  auto win = clear_capability_for("windows");
  ASSERT_TRUE(win.method == ClearMethod::Command);
  ASSERT_EQ(win.command, "cls");
  auto other = clear_capability_for("plan9");
  ASSERT_TRUE(other.method == ClearMethod::Command);
  ASSERT_EQ(other.command, "clear");
}

TEST(current_platform_is_in_table_on_linux) {
#ifdef __linux__
  ASSERT_EQ(current_platform(), "linux");
  ASSERT_TRUE(clear_capability_for(current_platform()).method == ClearMethod::Ansi);
#endif
}

TEST(select_clear_capability_modes) {
  ASSERT_TRUE(select_clear_capability("auto", "", "linux").method == ClearMethod::Ansi);
  ASSERT_TRUE(select_clear_capability("none", "", "linux").method == ClearMethod::None);
  ASSERT_TRUE(select_clear_capability("ansi", "", "windows").method == ClearMethod::Ansi);
  auto cmd = select_clear_capability("command", "", "linux");
  ASSERT_TRUE(cmd.method == ClearMethod::Command);
  ASSERT_EQ(cmd.command, "clear");
  ASSERT_EQ(select_clear_capability("command", "", "windows").command, "cls");
}

TEST(select_clear_capability_command_override) {
  auto c = select_clear_capability("auto", "tput clear", "linux");
  ASSERT_TRUE(c.method == ClearMethod::Command);
  ASSERT_EQ(c.command, "tput clear");
  ASSERT_EQ(select_clear_capability("command", "tput clear", "windows").command, "tput clear");
  // an explicit non-command mode wins over the override
  ASSERT_TRUE(select_clear_capability("none", "tput clear", "linux").method == ClearMethod::None);
}

TEST(screen_clearer_ansi_writes_escape) {
  ScreenClearer c(ClearCapability{ClearMethod::Ansi, ""});
  std::ostringstream os;
  c.clear(os);
  ASSERT_EQ(os.str(), "\x1B[2J\x1B[H");
}

TEST(screen_clearer_none_is_silent) {
  ScreenClearer c(ClearCapability{ClearMethod::None, ""});
  std::ostringstream os;
  c.clear(os);
  ASSERT_TRUE(os.str().empty());
}

TEST(screen_clearer_command_failure_is_not_fatal) {
  ScreenClearer ok(ClearCapability{ClearMethod::Command, "true"});
  ScreenClearer bad(ClearCapability{ClearMethod::Command, "false"});
  std::ostringstream os;
  os << "pending";
  ok.clear(os);
  bad.clear(os);
  bad.clear(os);
  ASSERT_EQ(os.str(), "pending");
}

TEST(screen_clearer_empty_command_degrades_to_none) {
  ScreenClearer c(ClearCapability{ClearMethod::Command, ""});
  ASSERT_TRUE(c.method() == ClearMethod::None);
}

TEST(stop_signal_sets_flag) {
  g_stop.store(false);
  install_stop_handlers();
  std::raise(SIGINT);
  ASSERT_TRUE(g_stop.load());
  g_stop.store(false);
  std::raise(SIGTERM);
  ASSERT_TRUE(g_stop.load());
  g_stop.store(false);
}

TEST(interrupt_while_clear_command_runs_sets_stop) {
  g_stop.store(false);
  install_stop_handlers();
  ScreenClearer c(ClearCapability{ClearMethod::Command, "kill -INT $PPID; sleep 0.2"});
  std::ostringstream os;
  c.clear(os);
  ASSERT_TRUE(g_stop.load());
  g_stop.store(false);
}

TEST(clear_command_killed_by_interrupt_sets_stop) {
  g_stop.store(false);
  install_stop_handlers();
  ScreenClearer c(ClearCapability{ClearMethod::Command, "kill -INT $$"});
  std::ostringstream os;
  c.clear(os);
  ASSERT_TRUE(g_stop.load());
  g_stop.store(false);
}
