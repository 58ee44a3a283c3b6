#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::string tmp_path(const char* suffix) {
  return std::string("/tmp/gadgetimg_test_toml_") + suffix + "_" + std::to_string(::getpid()) + ".toml";
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
  gadgetimg::util::TomlReader tr;
  ASSERT_TRUE(!tr.load("/tmp/gadgetimg_test_toml_nonexistent_file.toml"));
}

TEST(toml_load_basic) {
  auto path = tmp_path("basic");
  write_file(path,
    "# image tunables\n"
    "[image]\n"
    "total_size = \"64M\"\n"
    "reserved_tail = 4096\n"
    "fudge_factor = 1.25\n"
    "\n"
    "[tools]\n"
    "sudo = \"\"\n"
  );
  gadgetimg::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("image", "total_size"), "64M");
  ASSERT_EQ(tr.get_u64("image", "reserved_tail"), 4096u);
  ASSERT_EQ(tr.get_double("image", "fudge_factor"), 1.25);
  ASSERT_TRUE(tr.has("tools", "sudo"));
  ASSERT_EQ(tr.get_string("tools", "sudo", "sudo"), "");
  remove_file(path);
}

TEST(toml_defaults_for_missing_or_bad_keys) {
  gadgetimg::util::TomlReader tr;
  tr.load_string("[image]\nreserved_tail = lots\nfudge_factor = 1.5x\n");
  ASSERT_EQ(tr.get_u64("image", "reserved_tail", 7), 7u);
  ASSERT_EQ(tr.get_double("image", "fudge_factor", 2.0), 2.0);
  ASSERT_EQ(tr.get_int("image", "missing_int", 42), 42);
  ASSERT_EQ(tr.get_bool("image", "missing_bool", true), true);
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  ASSERT_TRUE(!tr.has_section("nosection"));
}

TEST(toml_escaped_strings_survive_save_and_load) {
  gadgetimg::util::TomlReader out;
  out.set("context", "workdir", "/tmp/with \"quotes\" and \\slashes");
  out.set("context", "note", "two\nlines");
  out.set_u64("context", "rootfs_size", 15728640);
  out.set_bool("context", "has_layout", true);
  auto path = tmp_path("escapes");
  ASSERT_TRUE(out.save(path));

  gadgetimg::util::TomlReader in;
  ASSERT_TRUE(in.load(path));
  ASSERT_EQ(in.get_string("context", "workdir"), "/tmp/with \"quotes\" and \\slashes");
  ASSERT_EQ(in.get_string("context", "note"), "two\nlines");
  ASSERT_EQ(in.get_u64("context", "rootfs_size"), 15728640u);
  ASSERT_EQ(in.get_bool("context", "has_layout"), true);
  remove_file(path);
}

TEST(toml_dotted_section_names_are_opaque) {
  gadgetimg::util::TomlReader tr;
  tr.load_string("[volume.0.structure.1]\noffset = 5242880\n");
  ASSERT_TRUE(tr.has_section("volume.0.structure.1"));
  ASSERT_EQ(tr.get_u64("volume.0.structure.1", "offset"), 5242880u);
}
