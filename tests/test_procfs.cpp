#include "minitest.hpp"
#include "proc_fixture.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <cerrno>
#include <string>
#include <vector>

using procsnap::util::list_dir;
using procsnap::util::read_file_string;

TEST(procfs_read_whole_file) {
  auto proc = make_proc_root("procfs_read");
  std::string big(10000, 'a');
  big += std::string("\0tail", 5);
  write_file(proc / "1/cmdline", big);
  auto txt = read_file_string((proc / "1/cmdline").string());
  ASSERT_TRUE(txt.has_value());
  ASSERT_EQ(*txt, big);
}

TEST(procfs_read_failure_after_open_is_absent) {
  // open(2) on a directory succeeds, read(2) then fails with EISDIR
  auto proc = make_proc_root("procfs_readerr");
  fs::create_directories(proc / "2/task");
  ASSERT_TRUE(!read_file_string((proc / "2/task").string()).has_value());
  ASSERT_TRUE(!read_file_string((proc / "2/missing").string()).has_value());
}

TEST(procfs_read_empty_file_is_present) {
  auto proc = make_proc_root("procfs_empty");
  write_file(proc / "3/cmdline", "");
  auto txt = read_file_string((proc / "3/cmdline").string());
  ASSERT_TRUE(txt.has_value());
  ASSERT_TRUE(txt->empty());
}

TEST(procfs_list_dir_types_and_errors) {
  auto proc = make_proc_root("procfs_list");
  fs::create_directories(proc / "12");
  write_file(proc / "uptime", "1.0 1.0\n");
  std::vector<procsnap::util::DirEntry> entries; int err = 0;
  ASSERT_TRUE(list_dir(proc.string(), entries, err));
  ASSERT_EQ(entries.size(), 2u);
  auto it = std::find_if(entries.begin(), entries.end(), [](const auto& e){ return e.name == "12"; });
  ASSERT_TRUE(it != entries.end() && it->is_dir);
  ASSERT_TRUE(!list_dir((proc / "nope").string(), entries, err));
  ASSERT_EQ(err, ENOENT);
}
