#pragma once

#include <cctype>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace procsnap::util {

// Reads the flat subset of TOML used by config.toml: [section] headers and
// key = value pairs with bare, "double" or 'single' quoted values.
// Lines it cannot understand are skipped and remembered in bad_lines().
class TomlReader {
public:
  bool load(const std::string& path) {
    entries_.clear(); bad_lines_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string section;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
      ++lineno;
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[') {
        if (sv.back() != ']' || sv.size() < 3) { bad_lines_.push_back(lineno); continue; }
        section = std::string(trim(sv.substr(1, sv.size() - 2)));
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos || eq == 0) { bad_lines_.push_back(lineno); continue; }
      auto key = trim(sv.substr(0, eq));
      auto val = trim(sv.substr(eq + 1));
      if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front())
        val = val.substr(1, val.size() - 2);
      put(section, std::string(key), std::string(val));
    }
    return true;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* e = find(section, key);
    return e ? e->value : def;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* e = find(section, key);
    if (!e) return def;
    const auto& v = e->value;
    if (v == "true" || v == "True" || v == "TRUE" || v == "1") return true;
    if (v == "false" || v == "False" || v == "FALSE" || v == "0") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find(section, key) != nullptr;
  }

  // 1-based line numbers that were neither a section, a pair, nor a comment
  [[nodiscard]] const std::vector<int>& bad_lines() const { return bad_lines_; }

private:
  struct Entry { std::string section; std::string key; std::string value; };
  std::vector<Entry> entries_;
  std::vector<int> bad_lines_;

  void put(const std::string& section, std::string key, std::string value) {
    for (auto& e : entries_) {
      if (e.section == section && e.key == key) { e.value = std::move(value); return; }
    }
    entries_.push_back(Entry{section, std::move(key), std::move(value)});
  }

  [[nodiscard]] const Entry* find(std::string_view section, std::string_view key) const {
    for (const auto& e : entries_)
      if (e.section == section && e.key == key) return &e;
    return nullptr;
  }

  // Drop a trailing '# ...' that is not inside quotes
  static std::string_view strip_comment(std::string_view sv) {
    char quote = 0;
    for (size_t i = 0; i < sv.size(); ++i) {
      char c = sv[i];
      if (quote) { if (c == quote) quote = 0; continue; }
      if (c == '"' || c == '\'') quote = c;
      else if (c == '#') return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace procsnap::util
