#include "minitest.hpp"
#include "FakeRunner.hpp"
#include "build/Errors.hpp"
#include "build/FilesystemImager.hpp"
#include "util/Units.hpp"

#include <algorithm>

using namespace gadgetimg;
using testing::FakeRunner;
using testing::read_text;
using testing::ScratchDir;
using testing::write_text;
namespace fs = std::filesystem;

static bool has_arg(const sys::Argv& argv, const std::string& a) {
  return std::find(argv.begin(), argv.end(), a) != argv.end();
}

TEST(imager_allocate_sparse_sets_exact_size) {
  ScratchDir dir("alloc");
  fs::path img = dir.path / "a.img";
  write_text(img, std::string(4096, 'x'));
  build::FilesystemImager::allocate_sparse(img, util::MiB(2));
  ASSERT_EQ(fs::file_size(img), util::MiB(2));
  // Stale bytes from an earlier attempt are gone.
  ASSERT_EQ(read_text(img).substr(0, 4), std::string(4, '\0'));
}

TEST(imager_vfat_formats_then_copies_sorted_entries) {
  ScratchDir dir("vfat");
  write_text(dir.path / "stage" / "b.txt", "B");
  write_text(dir.path / "stage" / "EFI" / "boot" / "x.efi", "X");
  write_text(dir.path / "stage" / "a.txt", "A");
  FakeRunner runner;
  testing::CapturingLog cap;
  build::FilesystemImager imager(runner, "sudo", cap.log);
  fs::path img = dir.path / "p.img";
  imager.make_filesystem_image(img, util::MiB(1), model::FileSystemType::Vfat, dir.path / "stage", "");

  ASSERT_EQ(runner.programs(), (std::vector<std::string>{"mkfs.vfat", "mcopy"}));
  const auto& mcopy = runner.calls[1];
  ASSERT_TRUE(!mcopy.privileged);
  ASSERT_EQ(mcopy.argv[1], "-s");
  ASSERT_EQ(mcopy.argv[3], img.string());
  ASSERT_EQ(mcopy.argv[4], (dir.path / "stage" / "EFI").string());
  ASSERT_EQ(mcopy.argv[5], (dir.path / "stage" / "a.txt").string());
  ASSERT_EQ(mcopy.argv[6], (dir.path / "stage" / "b.txt").string());
  ASSERT_EQ(mcopy.argv.back(), "::");
  ASSERT_TRUE(mcopy.env == (sys::Env{{"MTOOLS_SKIP_CHECK", "1"}}));
  ASSERT_EQ(fs::file_size(img), util::MiB(1));
}

TEST(imager_vfat_with_empty_staging_skips_mcopy) {
  ScratchDir dir("vfat_empty");
  fs::create_directories(dir.path / "stage");
  FakeRunner runner;
  testing::CapturingLog cap;
  build::FilesystemImager imager(runner, "sudo", cap.log);
  imager.make_filesystem_image(dir.path / "p.img", util::MiB(1), model::FileSystemType::Vfat,
                               dir.path / "stage", "");
  ASSERT_EQ(runner.count("mkfs.vfat"), 1);
  ASSERT_EQ(runner.count("mcopy"), 0);
}

TEST(imager_ext4_in_place) {
  ScratchDir dir("ext4");
  write_text(dir.path / "stage" / "f", "data");
  FakeRunner runner;
  testing::CapturingLog cap;
  build::FilesystemImager imager(runner, "sudo", cap.log);
  fs::path img = dir.path / "root.img";
  imager.make_filesystem_image(img, util::MiB(4), model::FileSystemType::Ext4, dir.path / "stage", "writable");

  ASSERT_EQ(runner.programs(), (std::vector<std::string>{"mkfs.ext4"}));
  const auto& argv = runner.calls[0].argv;
  ASSERT_EQ(argv, (sys::Argv{"mkfs.ext4", "-L", "writable", "-O", "-metadata_csum", img.string(),
                             "-d", (dir.path / "stage").string()}));
  ASSERT_EQ(read_text(img).substr(0, 20), std::string("EXT4:writable:f=data"));
  ASSERT_EQ(cap.count(util::LogLevel::Warn), 0);
}

TEST(imager_ext4_falls_back_to_loop_mount) {
  ScratchDir dir("ext4_fallback");
  write_text(dir.path / "stage" / "etc" / "hostname", "gadget");
  FakeRunner runner;
  runner.ext4_supports_d = false;
  testing::CapturingLog cap;
  build::FilesystemImager imager(runner, "sudo", cap.log);
  fs::path img = dir.path / "root.img";
  imager.make_filesystem_image(img, util::MiB(4), model::FileSystemType::Ext4, dir.path / "stage", "writable");

  ASSERT_EQ(runner.programs(),
            (std::vector<std::string>{"mkfs.ext4", "mkfs.ext4", "mount", "cp", "umount"}));
  ASSERT_TRUE(!has_arg(runner.calls[1].argv, "-d"));
  ASSERT_TRUE(has_arg(runner.calls[1].argv, "writable"));
  ASSERT_TRUE(runner.calls[2].privileged);
  ASSERT_TRUE(runner.calls[3].privileged);
  ASSERT_TRUE(runner.calls[4].privileged);
  ASSERT_TRUE(has_arg(runner.calls[2].argv, "loop"));
  ASSERT_EQ(runner.calls[3].argv[3], (dir.path / "stage" / ".").string());

  fs::path mountpoint = runner.calls[2].argv.back();
  ASSERT_EQ(runner.calls[3].argv.back(), mountpoint.string());
  ASSERT_EQ(runner.calls[4].argv.back(), mountpoint.string());
  ASSERT_TRUE(!fs::exists(mountpoint));
  ASSERT_EQ(cap.count(util::LogLevel::Warn), 1);
  ASSERT_TRUE(read_text(img).find("CP:etc/;etc/hostname=gadget;") != std::string::npos);
}

TEST(imager_unmounts_when_copy_fails) {
  ScratchDir dir("ext4_cp_fail");
  fs::create_directories(dir.path / "stage");
  FakeRunner runner;
  runner.ext4_supports_d = false;
  runner.fail("cp", 1, "cp: No space left on device");
  testing::CapturingLog cap;
  build::FilesystemImager imager(runner, "sudo", cap.log);
  try {
    imager.populate_ext4_by_mount(dir.path / "root.img", dir.path / "stage", "writable");
    throw mini::AssertionError("cp failure swallowed");
  } catch (const build::ExternalToolFailure& e) {
    ASSERT_EQ(e.argv()[1], "cp");
    ASSERT_EQ(e.status(), 1);
    ASSERT_TRUE(std::string(e.what()).find("No space left") != std::string::npos);
  }
  ASSERT_EQ(runner.count("umount"), 1);
  ASSERT_TRUE(!fs::exists(runner.invocations("mount")[0].back()));
}

TEST(imager_throwing_unmount_does_not_mask_copy_failure) {
  ScratchDir dir("umount_throws");
  fs::create_directories(dir.path / "stage");
  FakeRunner runner;
  runner.ext4_supports_d = false;
  runner.fail("cp", 1, "cp: No space left on device");
  runner.handlers["umount"] = [](const sys::Argv&, const sys::Env&) -> sys::CommandResult {
    throw std::runtime_error("runner gone");
  };
  testing::CapturingLog cap;
  build::FilesystemImager imager(runner, "sudo", cap.log);
  ASSERT_THROWS(imager.populate_ext4_by_mount(dir.path / "root.img", dir.path / "stage", "writable"),
                build::ExternalToolFailure);
  ASSERT_EQ(runner.count("umount"), 1);
  ASSERT_EQ(cap.count(util::LogLevel::Error), 1);
  // Still considered mounted, so the mountpoint is left alone.
  fs::path mountpoint = runner.invocations("mount")[0].back();
  ASSERT_TRUE(fs::exists(mountpoint));
  fs::remove(mountpoint);
}

TEST(imager_failed_mount_leaves_no_mountpoint) {
  ScratchDir dir("mount_fail");
  fs::create_directories(dir.path / "stage");
  FakeRunner runner;
  runner.fail("mount", 32, "mount: permission denied");
  testing::CapturingLog cap;
  build::FilesystemImager imager(runner, "", cap.log);
  ASSERT_THROWS(imager.populate_ext4_by_mount(dir.path / "root.img", dir.path / "stage", ""),
                build::ExternalToolFailure);
  ASSERT_EQ(runner.count("cp"), 0);
  ASSERT_EQ(runner.count("umount"), 0);
  ASSERT_TRUE(!runner.calls.back().privileged);
  ASSERT_TRUE(!fs::exists(runner.invocations("mount")[0].back()));
}

TEST(imager_none_creates_nothing_to_run) {
  ScratchDir dir("none");
  FakeRunner runner;
  testing::CapturingLog cap;
  build::FilesystemImager imager(runner, "sudo", cap.log);
  imager.populate(dir.path / "x.img", model::FileSystemType::None, dir.path, "");
  ASSERT_TRUE(runner.calls.empty());
}
