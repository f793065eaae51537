#include "util/Procfs.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace procsnap::util {

static std::string proc_root_env() {
  const char* env = std::getenv("PROCSNAP_PROC_ROOT");
  if (env && *env) return std::string(env);
  env = std::getenv("procsnap_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto default_proc_root() -> std::string {
  auto root = proc_root_env();
  if (root.empty()) return "/proc";
  std::filesystem::path p(root);
  p /= "proc";
  return p.string();
}

auto join_path(const std::string& root, const std::string& rel) -> std::string {
  if (root.empty()) return rel;
  if (root.back() == '/') return root + rel;
  return root + "/" + rel;
}

auto read_file_string(const std::string& path) -> std::optional<std::string> {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) return std::nullopt;
  std::string out;
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) { out.append(buf, static_cast<size_t>(n)); continue; }
    if (n == 0) break;
    if (errno == EINTR) continue;
    // ESRCH and friends: the task went away between open and read
    ::close(fd);
    return std::nullopt;
  }
  ::close(fd);
  return out;
}

auto read_symlink(const std::string& path) -> std::optional<std::string> {
  std::error_code ec;
  auto target = std::filesystem::read_symlink(path, ec);
  if (ec) return std::nullopt;
  return target.string();
}

static bool entry_is_dir(const std::string& dir, const struct dirent* ent) {
  if (ent->d_type == DT_DIR) return true;
  if (ent->d_type != DT_LNK && ent->d_type != DT_UNKNOWN) return false;
  struct stat st{};
  auto full = join_path(dir, ent->d_name);
  if (::stat(full.c_str(), &st) != 0) return false;
  return S_ISDIR(st.st_mode);
}

bool list_dir(const std::string& path, std::vector<DirEntry>& out, int& err) {
  out.clear();
  DIR* d = ::opendir(path.c_str());
  if (!d) { err = errno; return false; }
  errno = 0;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) { errno = 0; continue; }
    out.push_back(DirEntry{name, entry_is_dir(path, ent)});
    errno = 0;
  }
  int read_err = errno;
  ::closedir(d);
  if (read_err != 0) { err = read_err; out.clear(); return false; }
  return true;
}

bool owner_uid(const std::string& path, unsigned& uid, int& err) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) { err = errno; return false; }
  uid = static_cast<unsigned>(st.st_uid);
  return true;
}

} // namespace procsnap::util
