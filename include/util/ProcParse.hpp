// Parsers for /proc text records and the boot-relative start time math
#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace procsnap::util {

// Text following the "State:" marker of /proc/<pid>/status, e.g. "S (sleeping)".
[[nodiscard]] auto find_state(std::string_view status) -> std::optional<std::string>;

// First whitespace-delimited field of /proc/uptime (seconds since boot).
[[nodiscard]] auto parse_uptime_seconds(std::string_view uptime) -> std::optional<double>;

// Field 22 (starttime, clock ticks since boot) of /proc/<pid>/stat.
// Fields are counted from the last ')' so a comm containing spaces or
// parentheses cannot shift the position.
[[nodiscard]] auto parse_start_ticks(std::string_view stat) -> std::optional<uint64_t>;

// boot = now - uptime; start = boot + ticks / tick_rate, truncated to whole seconds.
// std::nullopt when tick_rate <= 0 or the result does not fit in time_t.
[[nodiscard]] auto compute_start_time(double host_uptime_seconds, uint64_t process_ticks_since_boot,
                                      long tick_rate, double wall_clock_now) -> std::optional<std::time_t>;

// "YYYY-MM-DD HH:MM:SS" in local time. Empty string if the conversion fails.
[[nodiscard]] auto format_local_time(std::time_t t) -> std::string;

} // namespace procsnap::util
