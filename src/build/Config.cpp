#include "build/Config.hpp"
#include "util/TomlReader.hpp"

#include <cstdlib>
#include <string>

namespace gadgetimg::build {

static const char* getenv_nonempty(const char* name) {
  const char* v = std::getenv(name);
  return (v && *v) ? v : nullptr;
}

std::string config_file_path() {
  if (const char* explicit_path = getenv_nonempty("GADGETIMG_CONFIG"))
    return explicit_path;
  if (const char* xdg = getenv_nonempty("XDG_CONFIG_HOME"))
    return std::string(xdg) + "/gadgetimg/config.toml";
  if (const char* home = getenv_nonempty("HOME"))
    return std::string(home) + "/.config/gadgetimg/config.toml";
  return {};
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    if (const char* v = getenv_nonempty(env_name)) return v;
  }
  return def;
}

// Sizes accept the layout suffixes ("4G", "4096").
static uint64_t resolve_size(const util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, uint64_t def) {
  std::string text = resolve_string(toml, have_toml, section, key, env_name, "");
  if (text.empty()) return def;
  return util::parse_size(text).value_or(def);
}

static double resolve_double(const util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  if (env_name) {
    if (const char* v = getenv_nonempty(env_name)) {
      char* end = nullptr;
      double d = std::strtod(v, &end);
      if (end && *end == '\0') return d;
    }
  }
  return def;
}

static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name) {
    if (const char* v = getenv_nonempty(env_name))
      return !(v[0] == '0' || v[0] == 'f' || v[0] == 'F' || v[0] == 'n' || v[0] == 'N');
  }
  return def;
}

BuildConfig load_build_config(const std::string& path) {
  BuildConfig c{};
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [image] ---
  c.total_image_size = resolve_size(toml, have_toml, "image", "total_size", "GADGETIMG_TOTAL_SIZE", c.total_image_size);
  c.reserved_tail    = resolve_size(toml, have_toml, "image", "reserved_tail", "GADGETIMG_RESERVED_TAIL", c.reserved_tail);
  c.fudge_factor     = resolve_double(toml, have_toml, "image", "fudge_factor", "GADGETIMG_FUDGE_FACTOR", c.fudge_factor);
  if (c.fudge_factor < 1.0) c.fudge_factor = 1.0;

  // --- [tools] ---
  c.sudo = resolve_string(toml, have_toml, "tools", "sudo", "GADGETIMG_SUDO", c.sudo);
  if (c.sudo == "none") c.sudo.clear();

  // --- [build] ---
  c.channel    = resolve_string(toml, have_toml, "build", "channel", "GADGETIMG_CHANNEL", c.channel);
  c.root_label = resolve_string(toml, have_toml, "build", "root_label", nullptr, c.root_label);
  c.debug      = resolve_bool(toml, have_toml, "build", "debug", "GADGETIMG_DEBUG", c.debug);

  return c;
}

} // namespace gadgetimg::build
