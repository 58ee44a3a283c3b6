#pragma once
#include "build/Checkpoint.hpp"
#include "build/Config.hpp"
#include "build/Steps.hpp"
#include "model/BuildContext.hpp"
#include "sys/CommandRunner.hpp"
#include "util/Log.hpp"

#include <filesystem>
#include <memory>

namespace gadgetimg::build {

// Ordered, resumable build. Each call to step() runs the state under the
// cursor; on success the cursor advances and a checkpoint is written to the
// workdir, on failure the exception escapes with cursor and checkpoint
// untouched so the same step can be retried after a resume.
class BuildPipeline {
public:
  // Performs Init: fixes the workdir (a private temporary one when the config
  // names none) and output, and schedules MakeTempDirs.
  BuildPipeline(BuildConfig config, sys::CommandRunner& runner, util::Logger& log);
  ~BuildPipeline();
  BuildPipeline(const BuildPipeline&) = delete;
  BuildPipeline& operator=(const BuildPipeline&) = delete;

  // Continue from the checkpoint at `checkpoint`. Tunables (sizes, fudge,
  // tools) come from `config`; the context comes from the checkpoint.
  // Throws BuildError when there is no checkpoint to resume.
  static std::unique_ptr<BuildPipeline> resume(BuildConfig config, sys::CommandRunner& runner,
                                               util::Logger& log,
                                               const std::filesystem::path& checkpoint);

  // Run the next step. Returns false once the pipeline is closed.
  bool step();

  void run();
  // Stop after `last` has run.
  void run_thru(Step last);
  // Stop before `first` would run.
  void run_until(Step first);

  [[nodiscard]] Step next_step() const { return next_; }
  [[nodiscard]] bool closed() const { return next_ == Step::Closed; }
  [[nodiscard]] const model::BuildContext& context() const { return ctx_; }
  [[nodiscard]] const BuildConfig& config() const { return config_; }
  [[nodiscard]] std::filesystem::path checkpoint_path() const;

private:
  BuildPipeline(BuildConfig config, sys::CommandRunner& runner, util::Logger& log, Checkpoint cp);

  // Checkpoint with `next` as the cursor; Closed removes the checkpoint.
  void persist(Step next);
  [[nodiscard]] const model::Volume& volume() const;

  void init();
  void make_temp_dirs();
  void prepare_image();
  void load_layout_spec();
  void populate_rootfs_contents();
  void calculate_rootfs_size();
  void pre_stage_bootfs();
  void stage_bootfs_contents();
  void calculate_bootfs_size();
  void prepare_filesystems();
  void populate_filesystems();
  void assemble_disk();
  void finish();

  BuildConfig config_;
  sys::CommandRunner& runner_;
  util::Logger& log_;
  model::BuildContext ctx_;
  Step next_{Step::Init};
  bool owns_workdir_{false};
};

} // namespace gadgetimg::build
