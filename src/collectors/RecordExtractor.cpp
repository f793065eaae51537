#include "collectors/RecordExtractor.hpp"
#include "util/ProcParse.hpp"
#include "util/Procfs.hpp"

#include <cerrno>
#include <cstdio>

namespace procsnap::collectors {

const char* describe(StartTimeError e) {
  switch (e) {
    case StartTimeError::None: return "ok";
    case StartTimeError::UptimeUnreadable: return "failed to read uptime";
    case StartTimeError::UptimeMalformed: return "failed to parse uptime";
    case StartTimeError::StatUnreadable: return "failed to read stat";
    case StartTimeError::StatMalformed: return "failed to parse starttime from stat";
    case StartTimeError::ClockUnavailable: return "failed to get system time";
    case StartTimeError::OutOfRange: return "start time out of range";
  }
  return "unknown error";
}

static bool gone(int err) { return err == ENOENT || err == ESRCH; }

RecordExtractor::RecordExtractor(std::string proc_root, IHostQueries& host, bool diagnostics)
  : proc_root_(std::move(proc_root)), host_(host), diagnostics_(diagnostics) {}

std::optional<model::ProcessRecord> RecordExtractor::extract(int32_t pid, long tick_rate) {
  auto pid_dir = util::join_path(proc_root_, std::to_string(pid));
  model::ProcessRecord rec;
  rec.pid = pid;

  unsigned uid = 0; int err = 0;
  if (util::owner_uid(pid_dir, uid, err)) {
    rec.owner = resolve_owner(uid);
  } else if (gone(err)) {
    return std::nullopt;
  }

  rec.command_line = util::read_file_string(pid_dir + "/cmdline");
  rec.executable_path = util::read_symlink(pid_dir + "/exe");

  StartTimeError st_err = StartTimeError::None;
  rec.start_time = read_start_time(pid_dir, tick_rate, st_err);

  if (auto status = util::read_file_string(pid_dir + "/status")) {
    rec.state = util::find_state(*status);
  }

  // The process may have exited while its files were being read
  unsigned ignored = 0; int recheck = 0;
  if (!util::owner_uid(pid_dir, ignored, recheck) && gone(recheck)) return std::nullopt;

  if (!rec.start_time) note_start_time_failure(pid, st_err);
  return rec;
}

std::optional<std::time_t> RecordExtractor::read_start_time(const std::string& pid_dir, long tick_rate,
                                                            StartTimeError& err) {
  auto uptime_txt = util::read_file_string(util::join_path(proc_root_, "uptime"));
  if (!uptime_txt) { err = StartTimeError::UptimeUnreadable; return std::nullopt; }
  auto uptime = util::parse_uptime_seconds(*uptime_txt);
  if (!uptime) { err = StartTimeError::UptimeMalformed; return std::nullopt; }

  auto stat_txt = util::read_file_string(pid_dir + "/stat");
  if (!stat_txt) { err = StartTimeError::StatUnreadable; return std::nullopt; }
  auto ticks = util::parse_start_ticks(*stat_txt);
  if (!ticks) { err = StartTimeError::StatMalformed; return std::nullopt; }

  double now = 0.0;
  if (!host_.wall_clock_seconds(now)) { err = StartTimeError::ClockUnavailable; return std::nullopt; }

  auto start = util::compute_start_time(*uptime, *ticks, tick_rate, now);
  if (!start) { err = StartTimeError::OutOfRange; return std::nullopt; }
  return start;
}

std::string RecordExtractor::resolve_owner(unsigned uid) {
  auto it = owner_cache_.find(uid);
  if (it != owner_cache_.end()) return it->second;
  auto name = host_.user_name(uid);
  std::string owner = name ? *name : std::to_string(uid);
  owner_cache_.emplace(uid, owner);
  return owner;
}

void RecordExtractor::note_start_time_failure(int32_t pid, StartTimeError err) {
  ++diagnostics_emitted_;
  if (!diagnostics_) return;
  std::fprintf(stderr, "procsnap: start time for pid %d: %s\n", static_cast<int>(pid), describe(err));
}

} // namespace procsnap::collectors
