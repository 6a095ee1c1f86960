#include "util/TomlReader.hpp"

#include <cctype>
#include <fstream>

namespace hostwatch::util {

namespace {

std::string_view strip(std::string_view sv) {
  size_t b = 0, e = sv.size();
  while (b < e && std::isspace(static_cast<unsigned char>(sv[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(sv[e - 1]))) --e;
  return sv.substr(b, e - b);
}

// Cut at the first '#' that is not inside a double-quoted string
std::string_view uncomment(std::string_view sv) {
  bool quoted = false;
  for (size_t i = 0; i < sv.size(); ++i) {
    if (sv[i] == '"') quoted = !quoted;
    else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
  }
  return sv;
}

std::string unquote(std::string_view v) {
  if (v.size() >= 2 && v.front() == '"' && v.back() == '"') v = v.substr(1, v.size() - 2);
  return std::string(v);
}

} // namespace

bool TomlReader::load(const std::string& path) {
  tables_.clear();
  std::ifstream in(path);
  if (!in) return false;
  Table* table = &tables_[""];
  std::string raw;
  while (std::getline(in, raw)) {
    std::string_view line = strip(uncomment(raw));
    if (line.empty()) continue;
    if (line.front() == '[') {
      if (line.back() != ']') continue;
      table = &tables_[std::string(strip(line.substr(1, line.size() - 2)))];
      continue;
    }
    auto eq = line.find('=');
    if (eq == std::string_view::npos) continue;
    auto key = strip(line.substr(0, eq));
    if (key.empty()) continue;
    (*table)[std::string(key)] = unquote(strip(line.substr(eq + 1)));
  }
  return true;
}

const std::string* TomlReader::lookup(std::string_view section, std::string_view key) const {
  auto t = tables_.find(section);
  if (t == tables_.end()) return nullptr;
  auto kv = t->second.find(key);
  return kv == t->second.end() ? nullptr : &kv->second;
}

bool TomlReader::has(std::string_view section, std::string_view key) const {
  return lookup(section, key) != nullptr;
}

std::string TomlReader::get_string(std::string_view section, std::string_view key,
                                   const std::string& def) const {
  const auto* v = lookup(section, key);
  return v ? *v : def;
}

bool TomlReader::get_bool(std::string_view section, std::string_view key, bool def) const {
  const auto* v = lookup(section, key);
  if (!v) return def;
  std::string lower;
  for (char c : *v) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower == "true" || lower == "1") return true;
  if (lower == "false" || lower == "0") return false;
  return def;
}

} // namespace hostwatch::util
