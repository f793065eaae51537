// C++23 utility helpers for reading /proc with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace procsnap::util {

// Default proc root: PROCSNAP_PROC_ROOT (if set) joined with "proc", else "/proc".
auto default_proc_root() -> std::string;

// Join a proc root with a relative component ("1234/status").
auto join_path(const std::string& root, const std::string& rel) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& path) -> std::optional<std::string>;

// Read a symlink target. Returns std::nullopt on error.
auto read_symlink(const std::string& path) -> std::optional<std::string>;

struct DirEntry {
  std::string name;
  bool is_dir{false};
};

// List directory entries with their type. Symlinks are followed when deciding
// is_dir. On failure returns false and stores errno in err.
[[nodiscard]] bool list_dir(const std::string& path, std::vector<DirEntry>& out, int& err);

// Owner uid of path (stat, following symlinks). On failure returns false and stores errno.
[[nodiscard]] bool owner_uid(const std::string& path, unsigned& uid, int& err);

} // namespace procsnap::util
