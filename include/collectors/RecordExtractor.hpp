#pragma once
#include "collectors/HostQueries.hpp"
#include "model/Process.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <unordered_map>

namespace procsnap::collectors {

enum class StartTimeError {
  None,
  UptimeUnreadable,
  UptimeMalformed,
  StatUnreadable,
  StatMalformed,
  ClockUnavailable,
  OutOfRange
};

[[nodiscard]] const char* describe(StartTimeError e);

// Builds one ProcessRecord from <proc_root>/<pid>/. Every field is read on its
// own; a failed read leaves only that field empty.
class RecordExtractor {
public:
  RecordExtractor(std::string proc_root, IHostQueries& host, bool diagnostics = true);

  // std::nullopt means the process directory no longer exists (exited after
  // being listed or while its files were read). Any other outcome yields a record, possibly with pid only.
  [[nodiscard]] std::optional<model::ProcessRecord> extract(int32_t pid, long tick_rate);

  // Start-time diagnostics raised so far (counted even when printing is off).
  [[nodiscard]] size_t diagnostics_emitted() const { return diagnostics_emitted_; }

private:
  std::optional<std::time_t> read_start_time(const std::string& pid_dir, long tick_rate, StartTimeError& err);
  std::string resolve_owner(unsigned uid);
  void note_start_time_failure(int32_t pid, StartTimeError err);

  std::string proc_root_;
  IHostQueries& host_;
  bool diagnostics_{true};
  size_t diagnostics_emitted_{0};
  std::unordered_map<unsigned, std::string> owner_cache_{}; // uid -> name or decimal uid
};

} // namespace procsnap::collectors
