#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace hostwatch::util {

// Reads the flat part of TOML that hostwatch's config file needs:
// [section] headers, key = value lines, '#' comments and double-quoted
// strings. Keys before the first header land in section "".
class TomlReader {
public:
  // false if the file cannot be opened; malformed lines are skipped
  bool load(const std::string& path);

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const;
  // true/false/1/0 in any letter case; anything else yields def
  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const;

private:
  using Table = std::map<std::string, std::string, std::less<>>;
  [[nodiscard]] const std::string* lookup(std::string_view section, std::string_view key) const;

  std::map<std::string, Table, std::less<>> tables_;
};

} // namespace hostwatch::util
