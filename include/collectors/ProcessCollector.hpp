#pragma once
#include "collectors/HostQueries.hpp"
#include "model/Process.hpp"
#include <string>

namespace procsnap::collectors {

// Walks the proc root once and extracts a record for every process directory.
class ProcessCollector {
public:
  ProcessCollector(std::string proc_root, IHostQueries& host, bool diagnostics = true);

  // Fill out with a fresh snapshot. Returns false only when the clock tick
  // rate is unavailable or the proc root cannot be listed; out.records is
  // then empty and last_error() says why.
  [[nodiscard]] bool enumerate(model::ProcessTable& out);

  [[nodiscard]] const model::EnumerationError& last_error() const { return last_error_; }

private:
  std::string proc_root_;
  IHostQueries& host_;
  bool diagnostics_{true};
  model::EnumerationError last_error_{};

  static bool parse_pid(const std::string& name, int32_t& pid);
};

// One-line human readable description of a fatal enumeration error.
[[nodiscard]] std::string describe(const model::EnumerationError& e);

} // namespace procsnap::collectors
