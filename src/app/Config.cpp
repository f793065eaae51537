#include "app/Config.hpp"
#include "util/Procfs.hpp"
#include "util/TomlReader.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

namespace procsnap::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("PROCSNAP_", 0) == 0) {
    alt = std::string("procsnap_") + n.substr(9);
  } else if (n.rfind("procsnap_", 0) == 0) {
    alt = std::string("PROCSNAP_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

const char* usage() {
  return "Usage: procsnap [--proc-root DIR] [--config FILE] [--header|--no-header] [--quiet]\n"
         "Prints one line per running process: PID, owner, cmdline, binary path, start time, state.\n";
}

ParseResult parse_args(int argc, char** argv, CliOptions& opts, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") return ParseResult::Help;
    else if (a == "--header") opts.header = true;
    else if (a == "--no-header") opts.header = false;
    else if (a == "-q" || a == "--quiet") opts.diagnostics = false;
    else if ((a == "--proc-root" || a == "--config") && i + 1 < argc) {
      if (a == "--proc-root") opts.proc_root = argv[++i];
      else opts.config_path = argv[++i];
    }
    else if (a == "--proc-root" || a == "--config") {
      err = "missing value for " + a;
      return ParseResult::Error;
    }
    else {
      err = "unknown argument: " + a;
      return ParseResult::Error;
    }
  }
  return ParseResult::Ok;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/procsnap/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/procsnap/config.toml";
  return {};
}

// TOML value if present, else env, else compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  return env_flag(env_name, def);
}

static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
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

Config resolve_config(const CliOptions& opts) {
  Config cfg;
  util::TomlReader toml;
  std::string path = opts.config_path ? *opts.config_path : config_file_path();
  bool have_toml = !path.empty() && toml.load(path);
  if (opts.config_path && !have_toml) {
    std::fprintf(stderr, "procsnap: Config: cannot read %s, using defaults\n", path.c_str());
  }
  if (have_toml) {
    for (int line : toml.bad_lines())
      std::fprintf(stderr, "procsnap: Config: %s:%d: ignoring malformed line\n", path.c_str(), line);
  }

  // [procfs] root names the proc directory itself; PROCSNAP_PROC_ROOT names a
  // fixture root that contains proc/ (see util::default_proc_root)
  if (have_toml && toml.has("procfs", "root")) cfg.proc_root = toml.get_string("procfs", "root");
  else cfg.proc_root = util::default_proc_root();

  cfg.header = resolve_bool(toml, have_toml, "output", "header", "PROCSNAP_HEADER", cfg.header);
  cfg.diagnostics = resolve_bool(toml, have_toml, "diagnostics", "enabled", "PROCSNAP_DIAGNOSTICS", cfg.diagnostics);
  cfg.placeholder = resolve_string(toml, have_toml, "output", "placeholder", nullptr, cfg.placeholder);
  cfg.time_placeholder = resolve_string(toml, have_toml, "output", "time_placeholder", nullptr, cfg.time_placeholder);

  if (opts.proc_root) cfg.proc_root = *opts.proc_root;
  if (opts.header) cfg.header = *opts.header;
  if (opts.diagnostics) cfg.diagnostics = *opts.diagnostics;
  return cfg;
}

} // namespace procsnap::app
