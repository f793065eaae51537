#include "minitest.hpp"
#include "collectors/HostQueries.hpp"
#include <pwd.h>
#include <cmath>
#include <ctime>
#include <string>

using procsnap::collectors::SystemHostQueries;

TEST(host_clock_ticks_available) {
  SystemHostQueries host;
  long hz = 0; int err = 0;
  ASSERT_TRUE(host.clock_ticks_per_second(hz, err));
  ASSERT_TRUE(hz > 0);
}

TEST(host_wall_clock_matches_time) {
  SystemHostQueries host;
  double now = 0.0;
  ASSERT_TRUE(host.wall_clock_seconds(now));
  double ref = static_cast<double>(std::time(nullptr));
  ASSERT_TRUE(std::fabs(now - ref) < 5.0);
}

TEST(host_user_name_for_root) {
  SystemHostQueries host;
  auto name = host.user_name(0);
  struct passwd* pw = ::getpwuid(0);
  if (pw == nullptr) {
    ASSERT_TRUE(!name.has_value());
    return;
  }
  ASSERT_TRUE(name.has_value());
  ASSERT_EQ(*name, std::string(pw->pw_name));
}

TEST(host_user_name_unknown_uid) {
  SystemHostQueries host;
  ASSERT_TRUE(::getpwuid(4000000000u) == nullptr);
  ASSERT_TRUE(!host.user_name(4000000000u).has_value());
}
