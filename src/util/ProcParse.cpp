#include "util/ProcParse.hpp"

#include <charconv>
#include <cmath>
#include <cctype>

namespace procsnap::util {

static bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto find_state(std::string_view status) -> std::optional<std::string> {
  constexpr std::string_view marker = "State:";
  size_t pos = 0;
  while (pos < status.size()) {
    size_t eol = status.find('\n', pos);
    if (eol == std::string_view::npos) eol = status.size();
    auto line = status.substr(pos, eol - pos);
    pos = eol + 1;
    if (!line.starts_with(marker)) continue;
    line.remove_prefix(marker.size());
    while (!line.empty() && is_space(line.front())) line.remove_prefix(1);
    while (!line.empty() && is_space(line.back())) line.remove_suffix(1);
    if (line.empty()) return std::nullopt;
    return std::string(line);
  }
  return std::nullopt;
}

auto parse_uptime_seconds(std::string_view uptime) -> std::optional<double> {
  size_t start = 0;
  while (start < uptime.size() && is_space(uptime[start])) ++start;
  size_t end = start;
  while (end < uptime.size() && !is_space(uptime[end])) ++end;
  if (end == start) return std::nullopt;
  // Plain decimal only: from_chars would also take "inf" and "nan"
  for (size_t i = start; i < end; ++i) {
    char c = uptime[i];
    if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '.')) return std::nullopt;
  }
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(uptime.data() + start, uptime.data() + end, v);
  if (ec != std::errc() || ptr != uptime.data() + end) return std::nullopt;
  return v;
}

auto parse_start_ticks(std::string_view stat) -> std::optional<uint64_t> {
  // pid (comm) state ppid ... ; starttime is the 20th field after ')'
  constexpr size_t kStartTimeAfterComm = 19;
  auto rp = stat.rfind(')');
  if (rp == std::string_view::npos) return std::nullopt;
  auto rest = stat.substr(rp + 1);
  size_t field = 0; size_t i = 0;
  while (i < rest.size()) {
    while (i < rest.size() && is_space(rest[i])) ++i;
    if (i >= rest.size()) break;
    size_t end = i;
    while (end < rest.size() && !is_space(rest[end])) ++end;
    if (field == kStartTimeAfterComm) {
      uint64_t ticks = 0;
      auto [ptr, ec] = std::from_chars(rest.data() + i, rest.data() + end, ticks);
      if (ec != std::errc() || ptr != rest.data() + end) return std::nullopt;
      return ticks;
    }
    ++field;
    i = end;
  }
  return std::nullopt;
}

auto compute_start_time(double host_uptime_seconds, uint64_t process_ticks_since_boot,
                        long tick_rate, double wall_clock_now) -> std::optional<std::time_t> {
  if (tick_rate <= 0) return std::nullopt;
  double boot_time = wall_clock_now - host_uptime_seconds;
  double start_seconds = static_cast<double>(process_ticks_since_boot) / static_cast<double>(tick_rate);
  double start = std::floor(boot_time + start_seconds);
  // 2^63 is exact in double; anything at or past it does not fit
  constexpr double kLimit = 9223372036854775808.0;
  if (!std::isfinite(start) || start >= kLimit || start < -kLimit) return std::nullopt;
  return static_cast<std::time_t>(start);
}

auto format_local_time(std::time_t t) -> std::string {
  std::tm tm{};
  if (::localtime_r(&t, &tm) == nullptr) return std::string();
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0) return std::string();
  return std::string(buf);
}

} // namespace procsnap::util
