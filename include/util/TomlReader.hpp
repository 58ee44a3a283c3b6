#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace gadgetimg::util {

// Flat TOML subset: [section] headers and key = value lines. Values are kept
// as strings; quoted values may carry \" \\ \n escapes. Used for the user
// config file and for the pipeline checkpoint.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    load_string(ss.str());
    return true;
  }

  void load_string(std::string_view text) {
    sections_.clear();
    std::string current_section;
    ensure_section(current_section);
    while (!text.empty()) {
      auto nl = text.find('\n');
      std::string_view line = text.substr(0, nl);
      text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      auto raw = trim(sv.substr(eq + 1));
      std::string val;
      if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"')
        val = unescape(raw.substr(1, raw.size() - 2));
      else
        val = std::string(raw);
      ensure_section(current_section).set(key, val);
    }
  }

  bool save(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) return false;
    out << to_string();
    out.flush();
    return out.good();
  }

  [[nodiscard]] std::string to_string() const {
    std::ostringstream out;
    bool first = true;
    for (const auto& [name, sec] : sections_) {
      if (name.empty() && sec.entries.empty()) continue;
      if (!first) out << '\n';
      first = false;
      if (!name.empty()) out << '[' << name << "]\n";
      for (const auto& [k, v] : sec.entries) {
        if (needs_quoting(v))
          out << k << " = \"" << escape(v) << "\"\n";
        else
          out << k << " = " << v << '\n';
      }
    }
    return out.str();
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    int out = 0;
    auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), out);
    if (ec != std::errc{} || ptr != val.data() + val.size()) return def;
    return out;
  }

  [[nodiscard]] uint64_t get_u64(std::string_view section, std::string_view key, uint64_t def = 0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    uint64_t out = 0;
    auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), out);
    if (ec != std::errc{} || ptr != val.data() + val.size()) return def;
    return out;
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    try {
      size_t used = 0;
      double out = std::stod(val, &used);
      return used == val.size() ? out : def;
    } catch (const std::exception&) {
      return def;
    }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  void set(const std::string& section, const std::string& key, const std::string& value) {
    ensure_section(section).set(key, value);
  }

  void set_u64(const std::string& section, const std::string& key, uint64_t value) {
    ensure_section(section).set(key, std::to_string(value));
  }

  void set_bool(const std::string& section, const std::string& key, bool value) {
    ensure_section(section).set(key, value ? "true" : "false");
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

  [[nodiscard]] bool has_section(std::string_view section) const {
    return find_section(section) != nullptr;
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  static std::string escape(const std::string& val) {
    std::string out;
    out.reserve(val.size());
    for (char c : val) {
      if (c == '"' || c == '\\') { out += '\\'; out += c; }
      else if (c == '\n') out += "\\n";
      else out += c;
    }
    return out;
  }

  static std::string unescape(std::string_view val) {
    std::string out;
    out.reserve(val.size());
    for (size_t i = 0; i < val.size(); ++i) {
      if (val[i] == '\\' && i + 1 < val.size()) {
        char n = val[++i];
        out += (n == 'n') ? '\n' : n;
      } else {
        out += val[i];
      }
    }
    return out;
  }

  static bool needs_quoting(const std::string& val) {
    if (val.empty()) return true;
    if (val == "true" || val == "false") return false;
    size_t start = (val[0] == '-') ? 1 : 0;
    bool all_digits = (start < val.size());
    for (size_t i = start; i < val.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(val[i]))) { all_digits = false; break; }
    }
    return !all_digits;
  }
};

} // namespace gadgetimg::util
