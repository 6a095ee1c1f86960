#include "ui/Config.hpp"
#include "util/TomlReader.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <string>

namespace hostwatch::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("HOSTWATCH_", 0) == 0) {
    alt = std::string("hostwatch_") + n.substr(10);
  } else if (n.rfind("hostwatch_", 0) == 0) {
    alt = std::string("HOSTWATCH_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/hostwatch/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/hostwatch/config.toml";
  return {};
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const hostwatch::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

// Like resolve_string, restricted to a fixed set of lower-case words
static std::string resolve_choice(const hostwatch::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key, const char* env_name,
                                  std::initializer_list<const char*> allowed, const std::string& def) {
  std::string v = resolve_string(toml, have_toml, section, key, env_name, def);
  for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  for (const char* a : allowed) {
    if (v == a) return v;
  }
  std::fprintf(stderr, "hostwatch: Config: invalid %s.%s value '%s', using '%s'\n",
               section, key, v.c_str(), def.c_str());
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  hostwatch::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [ui] ---
  c.ui.clear         = resolve_choice(toml, have_toml, "ui", "clear", "HOSTWATCH_CLEAR",
                                      {"auto", "ansi", "command", "none"}, "auto");
  c.ui.clear_command = resolve_string(toml, have_toml, "ui", "clear_command", "HOSTWATCH_CLEAR_COMMAND", "");
  return c;
}

const Config& config() {
  static Config cfg = load_config(config_file_path());
  return cfg;
}

} // namespace hostwatch::ui
