// Fixture proc trees and a scripted host for collector tests
#pragma once
#include "collectors/HostQueries.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

inline fs::path make_proc_root(const char* suffix) {
  auto root = fs::temp_directory_path() / (std::string("procsnap_test_") + suffix + "_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc");
  return root / "proc";
}

inline void write_file(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << content;
}

// /proc/<pid>/stat with the given comm and starttime (field 22)
inline std::string stat_line(int pid, const std::string& comm, unsigned long long starttime) {
  return std::to_string(pid) + " (" + comm + ") S 1 " + std::to_string(pid) + " " + std::to_string(pid) +
         " 0 -1 4194560 1200 0 0 0 3 1 0 0 20 0 1 0 " + std::to_string(starttime) +
         " 10723328 2048 18446744073709551615 1 1 0 0 0 0 0 0 0 0 0 0 17 2 0 0 0 0 0\n";
}

// Complete process directory: cmdline, exe, stat, status
inline void add_process(const fs::path& proc, int pid, const std::string& cmdline,
                        const std::string& exe, unsigned long long starttime, const std::string& state) {
  auto dir = proc / std::to_string(pid);
  fs::create_directories(dir);
  write_file(dir / "cmdline", cmdline);
  fs::create_symlink(exe, dir / "exe");
  write_file(dir / "stat", stat_line(pid, "proc" + std::to_string(pid), starttime));
  write_file(dir / "status", "Name:\tproc" + std::to_string(pid) + "\nUmask:\t0022\nState:\t" + state +
                             "\nTgid:\t" + std::to_string(pid) + "\n");
}

class FakeHostQueries : public procsnap::collectors::IHostQueries {
public:
  bool clock_ok{true};
  long ticks{100};
  int clock_err{0};
  bool wall_ok{true};
  double now{1700048267.42};
  std::map<unsigned, std::string> users;
  int user_lookups{0};

  bool clock_ticks_per_second(long& out, int& err) override {
    if (!clock_ok) { err = clock_err; return false; }
    out = ticks;
    return true;
  }
  bool wall_clock_seconds(double& out) override {
    if (!wall_ok) return false;
    out = now;
    return true;
  }
  std::optional<std::string> user_name(unsigned uid) override {
    ++user_lookups;
    auto it = users.find(uid);
    if (it == users.end()) return std::nullopt;
    return it->second;
  }
};
