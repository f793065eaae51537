#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>

static std::string tmp_path(const char* suffix) {
  return std::string("/tmp/procsnap_test_toml_") + suffix + ".toml";
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  procsnap::util::TomlReader tr;
  ASSERT_TRUE(!tr.load("/tmp/procsnap_test_toml_nonexistent_file.toml"));
}

TEST(toml_load_basic) {
  auto path = tmp_path("basic");
  write_file(path,
    "# procsnap settings\n"
    "[output]\n"
    "header = true\n"
    "placeholder = \"-\"\n"
    "\n"
    "[procfs]\n"
    "root = '/proc'\n"
  );
  procsnap::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("output", "header", false), true);
  ASSERT_EQ(tr.get_string("output", "placeholder"), "-");
  ASSERT_EQ(tr.get_string("procfs", "root"), "/proc");
  ASSERT_TRUE(tr.bad_lines().empty());
  remove_file(path);
}

TEST(toml_defaults_for_missing_keys) {
  auto path = tmp_path("defaults");
  write_file(path, "[output]\nheader = true\n");
  procsnap::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("output", "missing_key", "fallback"), "fallback");
  ASSERT_EQ(tr.get_bool("output", "missing_bool", true), true);
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  ASSERT_TRUE(!tr.has("nosection", "header"));
  ASSERT_TRUE(tr.has("output", "header"));
  remove_file(path);
}

TEST(toml_bool_variants) {
  auto path = tmp_path("bool");
  write_file(path, "[b]\na = TRUE\nb = 0\nc = maybe\n");
  procsnap::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("b", "a", false), true);
  ASSERT_EQ(tr.get_bool("b", "b", true), false);
  ASSERT_EQ(tr.get_bool("b", "c", true), true);
  ASSERT_EQ(tr.get_bool("b", "c", false), false);
  remove_file(path);
}

TEST(toml_comments_and_quotes) {
  auto path = tmp_path("comments");
  write_file(path,
    "[output]\n"
    "placeholder = \"#\"   # a literal hash\n"
    "time_placeholder = n/a # bare value\n");
  procsnap::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("output", "placeholder"), "#");
  ASSERT_EQ(tr.get_string("output", "time_placeholder"), "n/a");
  remove_file(path);
}

TEST(toml_later_key_wins_and_bad_lines_reported) {
  auto path = tmp_path("bad");
  write_file(path,
    "[output]\n"
    "header = true\n"
    "this line is junk\n"
    "[broken\n"
    "header = false\n");
  procsnap::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("output", "header", true), false);
  ASSERT_EQ(tr.bad_lines().size(), 2u);
  ASSERT_EQ(tr.bad_lines()[0], 3);
  ASSERT_EQ(tr.bad_lines()[1], 4);
  remove_file(path);
}
