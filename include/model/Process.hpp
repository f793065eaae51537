#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace procsnap::model {

// One process as seen at snapshot time. Only pid is guaranteed; every other
// field is filled independently and may be missing (process exited, access denied).
struct ProcessRecord {
  int32_t pid{};
  std::optional<std::string> command_line;    // raw /proc/<pid>/cmdline, NUL separators kept
  std::optional<std::string> executable_path; // target of /proc/<pid>/exe
  std::optional<std::string> owner;           // user name, or decimal uid when unresolved
  std::optional<std::time_t> start_time;      // seconds since epoch, whole-second precision
  std::optional<std::string> state;           // e.g. "S (sleeping)"
};

enum class EnumerationErrorKind {
  None,
  ClockRateUnavailable, // sysconf(_SC_CLK_TCK) failed
  ListingFailed         // proc root could not be listed
};

struct EnumerationError {
  EnumerationErrorKind kind{EnumerationErrorKind::None};
  int code{0};       // platform errno for the failing call
  std::string path;  // listing root, when relevant
};

// Point-in-time snapshot. Order is directory-enumeration order and carries no meaning.
struct ProcessTable {
  std::vector<ProcessRecord> records;
  size_t listed{};   // numeric directory entries seen in the listing
  size_t vanished{}; // listed but gone before extraction finished
  long tick_rate{};  // clock ticks per second used for start times
};

} // namespace procsnap::model
