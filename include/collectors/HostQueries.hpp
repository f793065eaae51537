#pragma once
#include <optional>
#include <string>

namespace procsnap::collectors {

// Host-wide facts the process collector needs besides the proc tree.
// Tests substitute a fake so no live kernel or passwd database is involved.
class IHostQueries {
public:
  virtual ~IHostQueries() = default;

  // Scheduler clock ticks per second. On failure returns false and stores
  // the platform error code in err.
  [[nodiscard]] virtual bool clock_ticks_per_second(long& out, int& err) = 0;

  // Wall clock as seconds since the epoch. Returns false if it cannot be read.
  [[nodiscard]] virtual bool wall_clock_seconds(double& out) = 0;

  // User name for uid, or std::nullopt when the user database has no entry.
  [[nodiscard]] virtual std::optional<std::string> user_name(unsigned uid) = 0;
};

// sysconf(_SC_CLK_TCK), clock_gettime(CLOCK_REALTIME) and getpwuid_r.
class SystemHostQueries : public IHostQueries {
public:
  bool clock_ticks_per_second(long& out, int& err) override;
  bool wall_clock_seconds(double& out) override;
  std::optional<std::string> user_name(unsigned uid) override;
};

} // namespace procsnap::collectors
