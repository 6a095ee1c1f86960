#pragma once

#include <string>

namespace hostwatch::ui {

struct Config {
  struct UI {
    std::string clear{"auto"};     // auto | ansi | command | none
    std::string clear_command;     // empty: use the platform table
  } ui;
};

// Process-wide configuration, resolved once (TOML -> env -> compiled default)
const Config& config();

// Resolve configuration from an explicit TOML path. A missing file is not an error.
Config load_config(const std::string& path);

// $XDG_CONFIG_HOME/hostwatch/config.toml, else ~/.config/hostwatch/config.toml
std::string config_file_path();

// Environment variable helpers
const char* getenv_compat(const char* name);

} // namespace hostwatch::ui
