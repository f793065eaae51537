#include "collectors/HostQueries.hpp"

#include <pwd.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <cerrno>
#include <vector>

namespace procsnap::collectors {

bool SystemHostQueries::clock_ticks_per_second(long& out, int& err) {
  errno = 0;
  long hz = ::sysconf(_SC_CLK_TCK);
  if (hz <= 0) {
    // -1 with errno untouched means the option is unsupported
    err = (errno != 0) ? errno : EINVAL;
    return false;
  }
  out = hz;
  return true;
}

bool SystemHostQueries::wall_clock_seconds(double& out) {
  struct timespec ts{};
  if (::clock_gettime(CLOCK_REALTIME, &ts) != 0) return false;
  out = static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) / 1e9;
  return true;
}

std::optional<std::string> SystemHostQueries::user_name(unsigned uid) {
  long size_hint = ::sysconf(_SC_GETPW_R_SIZE_MAX);
  std::vector<char> buffer(size_hint > 0 ? static_cast<size_t>(size_hint) : 16384);
  struct passwd pwd{};
  struct passwd* result = nullptr;
  while (true) {
    result = nullptr;
    int rc = ::getpwuid_r(static_cast<uid_t>(uid), &pwd, buffer.data(), buffer.size(), &result);
    if (rc == ERANGE && buffer.size() <= (1u << 20)) {
      buffer.resize(buffer.size() * 2);
      continue;
    }
    if (rc != 0 || result == nullptr || result->pw_name == nullptr) return std::nullopt;
    // pw_name points into buffer; copy before it goes out of scope
    return std::string(result->pw_name);
  }
}

} // namespace procsnap::collectors
