#pragma once

#include <optional>
#include <string>

namespace procsnap::app {

// Effective settings for one run, resolved CLI -> TOML -> env -> compiled default.
struct Config {
  std::string proc_root;                   // default: util::default_proc_root()
  bool header{true};
  bool diagnostics{true};                  // per-process start-time diagnostics on stderr
  std::string placeholder{"-"};            // missing text fields
  std::string time_placeholder{"unknown"}; // missing start time
};

// Flags given on the command line; unset means "not specified".
struct CliOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> proc_root;
  std::optional<bool> header;
  std::optional<bool> diagnostics;
};

enum class ParseResult { Ok, Help, Error };

// Parse argv into opts. On Error, err holds a message for stderr.
[[nodiscard]] ParseResult parse_args(int argc, char** argv, CliOptions& opts, std::string& err);

// $XDG_CONFIG_HOME/procsnap/config.toml, else ~/.config/procsnap/config.toml, else empty.
[[nodiscard]] std::string config_file_path();

// Merge the layers. A missing config file is not an error.
[[nodiscard]] Config resolve_config(const CliOptions& opts);

[[nodiscard]] const char* usage();

// getenv that also accepts the lower-case "procsnap_" spelling of PROCSNAP_ names
const char* getenv_compat(const char* name);

} // namespace procsnap::app
