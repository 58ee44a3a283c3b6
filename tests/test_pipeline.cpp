#include "minitest.hpp"
#include "PipelineFixture.hpp"
#include "build/BuildPipeline.hpp"
#include "build/Errors.hpp"

using namespace gadgetimg;
using build::Step;
using testing::FakeRunner;
using testing::read_text;
using testing::ScratchDir;
using testing::write_text;
namespace fs = std::filesystem;

// Adds `bytes` of root filesystem content on top of what snap unpacks.
static void grow_rootfs(FakeRunner& runner, uint64_t bytes) {
  auto base = runner.handlers["snap"];
  runner.handlers["snap"] = [base, bytes](const sys::Argv& a, const sys::Env& e) {
    auto r = base(a, e);
    write_text(fs::path(a.back()) / "image" / "var" / "lib" / "snapd" / "snaps" / "core.snap",
               std::string(bytes, 'c'));
    return r;
  };
}

TEST(pipeline_full_run_drives_tools_in_order) {
  ScratchDir dir("pipe_full");
  FakeRunner runner;
  testing::use_example_gadget(runner);
  testing::CapturingLog cap;
  auto cfg = testing::example_config(dir, "full");
  {
    build::BuildPipeline p(cfg, runner, cap.log);
    ASSERT_TRUE(p.next_step() == Step::MakeTempDirs);
    ASSERT_TRUE(fs::exists(p.checkpoint_path()));
    p.run();
    ASSERT_TRUE(p.closed());
    ASSERT_TRUE(!fs::exists(p.checkpoint_path()));
  }

  ASSERT_EQ(runner.calls[0].argv, (sys::Argv{"snap", "prepare-image", "--channel", "stable",
                                            cfg.model_assertion, (cfg.workdir / "unpack").string()}));
  ASSERT_TRUE(runner.calls[0].privileged);
  ASSERT_EQ(runner.count("snap"), 1);
  ASSERT_EQ(runner.count("mkfs.vfat"), 1);
  ASSERT_EQ(runner.count("mcopy"), 1);
  // Only the root image: the size-0 ext4 structure has no image of its own.
  ASSERT_EQ(runner.count("mkfs.ext4"), 1);
  ASSERT_EQ(runner.invocations("mkfs.ext4")[0][2], "writable");

  auto sgdisk = runner.invocations("sgdisk");
  ASSERT_EQ(sgdisk.size(), 6u);
  ASSERT_EQ(sgdisk[0][1], "--new=1:2048:10239");
  ASSERT_EQ(sgdisk[2][1], "--change-name=1:system-boot");
  // (64MiB - 5MiB - 4096) floored to 58MiB, starting at 5MiB.
  ASSERT_EQ(sgdisk[3][1], "--new=2:10240:129023");
  ASSERT_EQ(sgdisk[5][1], "--change-name=2:writable");

  ASSERT_TRUE(fs::exists(cfg.output));
  ASSERT_TRUE(!fs::exists(cfg.workdir / ".images" / "disk.img"));
  std::string disk = read_text(cfg.output);
  ASSERT_EQ(disk.size(), util::MiB(64));
  ASSERT_EQ(disk.substr(util::MiB(1), 4), "FAT:");
  ASSERT_TRUE(disk.find("grubx64.efi=GRUB-EFI", util::MiB(1)) < util::MiB(5));
  ASSERT_TRUE(disk.find("ubuntu/grub.cfg=set default=0", util::MiB(1)) < util::MiB(5));
  ASSERT_EQ(disk.substr(util::MiB(5), 14), "EXT4:writable:");
  ASSERT_TRUE(disk.find("system-data/boot/;", util::MiB(5)) != std::string::npos);
  ASSERT_TRUE(disk.find("system-data/var/lib/snapd/state.json=", util::MiB(5)) != std::string::npos);
}

TEST(pipeline_resume_after_bootfs_sizing_matches_uninterrupted_run) {
  ScratchDir dir("pipe_resume");
  testing::CapturingLog cap;

  auto straight_cfg = testing::example_config(dir, "straight");
  {
    FakeRunner runner;
    testing::use_example_gadget(runner);
    build::BuildPipeline p(straight_cfg, runner, cap.log);
    p.run();
  }

  auto cfg = testing::example_config(dir, "resumed");
  fs::path checkpoint;
  {
    FakeRunner first;
    testing::use_example_gadget(first);
    build::BuildPipeline p(cfg, first, cap.log);
    p.run_thru(Step::CalculateBootfsSize);
    ASSERT_TRUE(p.next_step() == Step::PrepareFilesystems);
    checkpoint = p.checkpoint_path();
  }  // the process "dies" here; the workdir and checkpoint remain

  FakeRunner second;
  auto p = build::BuildPipeline::resume(cfg, second, cap.log, checkpoint);
  ASSERT_TRUE(p->next_step() == Step::PrepareFilesystems);
  p->run();
  ASSERT_TRUE(p->closed());
  ASSERT_EQ(second.count("snap"), 0);
  ASSERT_EQ(second.programs().front(), "mkfs.vfat");
  ASSERT_TRUE(!fs::exists(checkpoint));

  ASSERT_TRUE(read_text(cfg.output) == read_text(straight_cfg.output));
}

TEST(pipeline_failed_step_keeps_cursor_and_checkpoint) {
  ScratchDir dir("pipe_fail");
  testing::CapturingLog cap;
  auto cfg = testing::example_config(dir, "fail");
  fs::path checkpoint;
  {
    FakeRunner runner;
    testing::use_example_gadget(runner);
    runner.fail("mkfs.vfat", 1, "mkfs.vfat: unable to open");
    build::BuildPipeline p(cfg, runner, cap.log);
    ASSERT_THROWS(p.run(), build::ExternalToolFailure);
    ASSERT_TRUE(p.next_step() == Step::PrepareFilesystems);
    checkpoint = p.checkpoint_path();
    ASSERT_TRUE(build::load_checkpoint(checkpoint)->next == Step::PrepareFilesystems);
  }

  FakeRunner retry;
  auto p = build::BuildPipeline::resume(cfg, retry, cap.log, checkpoint);
  p->run();
  ASSERT_EQ(retry.count("snap"), 0);
  ASSERT_EQ(retry.count("mkfs.vfat"), 1);
  ASSERT_TRUE(fs::exists(cfg.output));
}

TEST(pipeline_unwritable_checkpoint_keeps_cursor) {
  ScratchDir dir("pipe_ckpt_fail");
  FakeRunner runner;
  testing::use_example_gadget(runner);
  testing::CapturingLog cap;
  build::BuildPipeline p(testing::example_config(dir, "ckpt"), runner, cap.log);
  // A non-empty directory where the checkpoint goes makes the rename fail.
  fs::remove(p.checkpoint_path());
  write_text(p.checkpoint_path() / "blocker", "x");
  ASSERT_THROWS(p.step(), build::BuildError);
  ASSERT_TRUE(p.next_step() == Step::MakeTempDirs);

  fs::remove_all(p.checkpoint_path());
  ASSERT_TRUE(p.step());
  ASSERT_TRUE(p.next_step() == Step::PrepareImage);
  ASSERT_TRUE(build::load_checkpoint(p.checkpoint_path())->next == Step::PrepareImage);
}

TEST(pipeline_run_until_and_run_thru) {
  ScratchDir dir("pipe_partial");
  FakeRunner runner;
  testing::use_example_gadget(runner);
  testing::CapturingLog cap;
  build::BuildPipeline p(testing::example_config(dir, "partial"), runner, cap.log);
  p.run_until(Step::LoadLayoutSpec);
  ASSERT_TRUE(p.next_step() == Step::LoadLayoutSpec);
  ASSERT_EQ(runner.count("snap"), 1);
  ASSERT_TRUE(!p.context().layout);

  p.run_thru(Step::LoadLayoutSpec);
  ASSERT_TRUE(p.next_step() == Step::PopulateRootfsContents);
  ASSERT_TRUE(p.context().layout.has_value());

  // Already past: nothing runs.
  p.run_thru(Step::MakeTempDirs);
  ASSERT_TRUE(p.next_step() == Step::PopulateRootfsContents);
}

TEST(pipeline_insufficient_space_before_any_image) {
  ScratchDir dir("pipe_space");
  FakeRunner runner;
  testing::use_example_gadget(runner);
  grow_rootfs(runner, util::MiB(10));
  testing::CapturingLog cap;
  auto cfg = testing::example_config(dir, "space");
  // 5MiB of structures, 15MiB left: a 15MiB estimate does not fit.
  cfg.total_image_size = util::MiB(20) + 4096;
  build::BuildPipeline p(cfg, runner, cap.log);
  try {
    p.run();
    throw mini::AssertionError("no InsufficientSpace");
  } catch (const build::InsufficientSpace& e) {
    ASSERT_TRUE(e.required() >= util::MiB(15));
    ASSERT_EQ(e.available(), util::MiB(15));
  }
  ASSERT_TRUE(p.next_step() == Step::PrepareFilesystems);
  ASSERT_TRUE(!fs::exists(cfg.workdir / ".images"));
  ASSERT_EQ(runner.count("mkfs.vfat"), 0);
}

TEST(pipeline_boot_content_above_fudged_size_still_builds) {
  ScratchDir dir("pipe_bootfit");
  FakeRunner runner;
  testing::use_example_gadget(runner);
  auto base = runner.handlers["snap"];
  runner.handlers["snap"] = [base](const sys::Argv& a, const sys::Env& e) {
    auto r = base(a, e);
    write_text(fs::path(a.back()) / "gadget" / "grubx64.efi", std::string(util::MiB(3), 'g'));
    return r;
  };
  testing::CapturingLog cap;
  auto cfg = testing::example_config(dir, "bootfit");
  build::BuildPipeline p(cfg, runner, cap.log);
  p.run_thru(Step::PrepareFilesystems);
  // 3MiB fudged to 4.5MiB exceeds the 4MiB structure; the raw content fits.
  ASSERT_TRUE(p.context().bootfs_sizes.at("part0") > util::MiB(4));
  ASSERT_TRUE(p.next_step() == Step::PopulateFilesystems);
  ASSERT_EQ(runner.count("mkfs.vfat"), 1);
  p.run();
  ASSERT_TRUE(p.closed());
  ASSERT_EQ(runner.count("mcopy"), 1);
}

TEST(pipeline_example_layout_with_ten_mib_root) {
  ScratchDir dir("pipe_example");
  FakeRunner runner;
  testing::use_example_gadget(runner);
  grow_rootfs(runner, util::MiB(10));
  testing::CapturingLog cap;
  auto cfg = testing::example_config(dir, "example");
  cfg.total_image_size = util::MiB(21) + 4096;
  build::BuildPipeline p(cfg, runner, cap.log);
  p.run();
  ASSERT_TRUE(p.closed());
  auto sgdisk = runner.invocations("sgdisk");
  ASSERT_EQ(sgdisk[0][1], "--new=1:2048:10239");
  // 16MiB writable partition at 5MiB.
  ASSERT_EQ(sgdisk[3][1], "--new=2:10240:43007");
  ASSERT_EQ(fs::file_size(cfg.output), util::MiB(21) + 4096);
}

TEST(pipeline_rejects_multi_volume_gadget) {
  ScratchDir dir("pipe_multi");
  FakeRunner runner;
  runner.gadget_yaml =
    "volumes:\n"
    "  a:\n    structure:\n      - offset: 1M\n        size: 1M\n        type: 83\n"
    "  b:\n    structure:\n      - offset: 1M\n        size: 1M\n        type: 83\n";
  testing::CapturingLog cap;
  build::BuildPipeline p(testing::example_config(dir, "multi"), runner, cap.log);
  ASSERT_THROWS(p.run(), build::FilesystemAssumptionViolation);
  ASSERT_TRUE(p.next_step() == Step::LoadLayoutSpec);
}

TEST(pipeline_owns_temporary_workdir) {
  ScratchDir dir("pipe_tmp");
  FakeRunner runner;
  testing::use_example_gadget(runner);
  testing::CapturingLog cap;
  auto cfg = testing::example_config(dir, "tmp");
  cfg.workdir.clear();
  fs::path workdir;
  {
    build::BuildPipeline p(cfg, runner, cap.log);
    workdir = p.context().workdir;
    ASSERT_TRUE(fs::is_directory(workdir));
    p.run();
  }
  ASSERT_TRUE(!fs::exists(workdir));
  ASSERT_TRUE(fs::exists(cfg.output));
}

TEST(pipeline_resume_without_checkpoint_fails) {
  ScratchDir dir("pipe_nocp");
  FakeRunner runner;
  testing::CapturingLog cap;
  ASSERT_THROWS((void)build::BuildPipeline::resume(testing::example_config(dir, "x"), runner, cap.log,
                                                   dir.path / build::kCheckpointName),
                build::BuildError);
}

TEST(pipeline_ext4_fallback_inside_pipeline) {
  ScratchDir dir("pipe_fallback");
  FakeRunner runner;
  testing::use_example_gadget(runner);
  runner.ext4_supports_d = false;
  testing::CapturingLog cap;
  auto cfg = testing::example_config(dir, "fallback");
  build::BuildPipeline p(cfg, runner, cap.log);
  p.run();
  ASSERT_EQ(runner.count("mount"), 1);
  ASSERT_EQ(runner.count("umount"), 1);
  std::string disk = read_text(cfg.output);
  ASSERT_TRUE(disk.find("CP:system-data/;", util::MiB(5)) != std::string::npos);
}
