#include "collectors/ProcessCollector.hpp"
#include "collectors/RecordExtractor.hpp"
#include "util/Procfs.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <vector>

namespace procsnap::collectors {

ProcessCollector::ProcessCollector(std::string proc_root, IHostQueries& host, bool diagnostics)
  : proc_root_(std::move(proc_root)), host_(host), diagnostics_(diagnostics) {}

bool ProcessCollector::parse_pid(const std::string& name, int32_t& pid) {
  if (name.empty()) return false;
  // "007" would be read back as /proc/7; the kernel never names a pid that way
  if (name.size() > 1 && name[0] == '0') return false;
  for (char c : name) if (c < '0' || c > '9') return false;
  auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
  return ec == std::errc() && ptr == name.data() + name.size();
}

bool ProcessCollector::enumerate(model::ProcessTable& out) {
  out.records.clear(); out.listed = 0; out.vanished = 0; out.tick_rate = 0;
  last_error_ = model::EnumerationError{};

  // Needed by every start time; without it no row can be right
  long tick_rate = 0; int err = 0;
  if (!host_.clock_ticks_per_second(tick_rate, err)) {
    last_error_ = model::EnumerationError{model::EnumerationErrorKind::ClockRateUnavailable, err, {}};
    return false;
  }
  if (tick_rate <= 0) {
    last_error_ = model::EnumerationError{model::EnumerationErrorKind::ClockRateUnavailable, EINVAL, {}};
    return false;
  }

  std::vector<util::DirEntry> entries;
  if (!util::list_dir(proc_root_, entries, err)) {
    last_error_ = model::EnumerationError{model::EnumerationErrorKind::ListingFailed, err, proc_root_};
    return false;
  }

  out.tick_rate = tick_rate;
  out.records.reserve(entries.size());
  RecordExtractor extractor(proc_root_, host_, diagnostics_);
  for (const auto& ent : entries) {
    if (!ent.is_dir) continue; // uptime, meminfo, ...
    int32_t pid = 0;
    if (!parse_pid(ent.name, pid)) continue; // self, sys, net, ...
    ++out.listed;
    auto rec = extractor.extract(pid, tick_rate);
    if (!rec) { ++out.vanished; continue; }
    out.records.push_back(std::move(*rec));
  }
  return true;
}

std::string describe(const model::EnumerationError& e) {
  switch (e.kind) {
    case model::EnumerationErrorKind::None:
      return "no error";
    case model::EnumerationErrorKind::ClockRateUnavailable:
      return "failed to get system clock tick rate: " + std::string(std::strerror(e.code)) +
             " (code " + std::to_string(e.code) + ")";
    case model::EnumerationErrorKind::ListingFailed:
      return "failed to list " + e.path + ": " + std::string(std::strerror(e.code));
  }
  return "unknown error";
}

} // namespace procsnap::collectors
