#include "build/BuildPipeline.hpp"
#include "build/DiskAssembler.hpp"
#include "build/Errors.hpp"
#include "build/FilesystemImager.hpp"
#include "build/LayoutParser.hpp"
#include "build/SizeEstimator.hpp"
#include "build/StagingAssembler.hpp"
#include "util/Files.hpp"
#include "util/Units.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace gadgetimg::build {

namespace fs = std::filesystem;

static std::string part_key(size_t index) { return "part" + std::to_string(index); }

BuildPipeline::BuildPipeline(BuildConfig config, sys::CommandRunner& runner, util::Logger& log)
    : config_(std::move(config)), runner_(runner), log_(log) {
  init();
  try {
    persist(successor(Step::Init));
  } catch (const std::exception&) {
    if (owns_workdir_) {
      std::error_code ec;
      fs::remove_all(ctx_.workdir, ec);
    }
    throw;
  }
  next_ = successor(Step::Init);
}

BuildPipeline::BuildPipeline(BuildConfig config, sys::CommandRunner& runner, util::Logger& log,
                             Checkpoint cp)
    : config_(std::move(config)), runner_(runner), log_(log),
      ctx_(std::move(cp.context)), next_(cp.next) {}

BuildPipeline::~BuildPipeline() {
  if (!owns_workdir_) return;
  std::error_code ec;
  fs::remove_all(ctx_.workdir, ec);
  if (ec) log_.warn("could not remove %s: %s", ctx_.workdir.c_str(), ec.message().c_str());
}

std::unique_ptr<BuildPipeline> BuildPipeline::resume(BuildConfig config, sys::CommandRunner& runner,
                                                     util::Logger& log, const fs::path& checkpoint) {
  auto cp = load_checkpoint(checkpoint);
  if (!cp) throw BuildError("nothing to resume: no checkpoint at " + checkpoint.string());
  log.info("resuming at %s", to_string(cp->next));
  return std::unique_ptr<BuildPipeline>(
      new BuildPipeline(std::move(config), runner, log, std::move(*cp)));
}

fs::path BuildPipeline::checkpoint_path() const { return ctx_.workdir / kCheckpointName; }

void BuildPipeline::persist(Step next) {
  if (next == Step::Closed) {
    std::error_code ec;
    fs::remove(checkpoint_path(), ec);
    if (ec) log_.warn("could not remove checkpoint: %s", ec.message().c_str());
    return;
  }
  save_checkpoint(checkpoint_path(), Checkpoint{next, ctx_});
}

const model::Volume& BuildPipeline::volume() const {
  if (!ctx_.layout) throw BuildError("layout not loaded");
  return ctx_.layout->sole_volume();
}

bool BuildPipeline::step() {
  if (next_ == Step::Closed) return false;
  log_.debug("step: %s", to_string(next_));
  switch (next_) {
    case Step::Init:                   init(); break;
    case Step::MakeTempDirs:           make_temp_dirs(); break;
    case Step::PrepareImage:           prepare_image(); break;
    case Step::LoadLayoutSpec:         load_layout_spec(); break;
    case Step::PopulateRootfsContents: populate_rootfs_contents(); break;
    case Step::CalculateRootfsSize:    calculate_rootfs_size(); break;
    case Step::PreStageBootfs:         pre_stage_bootfs(); break;
    case Step::StageBootfsContents:    stage_bootfs_contents(); break;
    case Step::CalculateBootfsSize:    calculate_bootfs_size(); break;
    case Step::PrepareFilesystems:     prepare_filesystems(); break;
    case Step::PopulateFilesystems:    populate_filesystems(); break;
    case Step::AssembleDisk:           assemble_disk(); break;
    case Step::Finish:                 finish(); break;
    case Step::Closed:                 return false;
  }
  // The cursor moves only once the checkpoint naming it is written.
  Step next = successor(next_);
  persist(next);
  next_ = next;
  return next_ != Step::Closed;
}

void BuildPipeline::run() {
  while (step()) {}
}

void BuildPipeline::run_thru(Step last) {
  while (next_ != Step::Closed && next_ <= last) step();
}

void BuildPipeline::run_until(Step first) {
  while (next_ != Step::Closed && next_ < first) step();
}

// --- steps ---

void BuildPipeline::init() {
  if (config_.workdir.empty()) {
    ctx_.workdir = util::make_temp_dir(fs::temp_directory_path(), "gadgetimg-");
    owns_workdir_ = true;
  } else {
    ctx_.workdir = fs::absolute(config_.workdir);
    fs::create_directories(ctx_.workdir);
  }
  if (!config_.output.empty())
    ctx_.output = fs::absolute(config_.output);
  else if (owns_workdir_)
    ctx_.output = fs::current_path() / "disk.img";
  else
    ctx_.output = ctx_.workdir / "disk.img";
  ctx_.model_assertion = config_.model_assertion;
  ctx_.channel = config_.channel;
  log_.debug("workdir %s, output %s", ctx_.workdir.c_str(), ctx_.output.c_str());
}

void BuildPipeline::make_temp_dirs() {
  ctx_.rootfs = ctx_.workdir / "root";
  ctx_.unpackdir = ctx_.workdir / "unpack";
  fs::create_directories(ctx_.rootfs);
}

void BuildPipeline::prepare_image() {
  log_.info("preparing image from %s (channel %s)", ctx_.model_assertion.c_str(), ctx_.channel.c_str());
  sys::run_checked(runner_, sys::privileged(config_.sudo, {"snap", "prepare-image", "--channel",
                                                          ctx_.channel, ctx_.model_assertion,
                                                          ctx_.unpackdir.string()}));
}

void BuildPipeline::load_layout_spec() {
  fs::path yaml = ctx_.unpackdir / "gadget" / "meta" / "gadget.yaml";
  auto text = util::read_file_string(yaml);
  if (!text) throw ParseError("cannot read " + yaml.string());
  model::LayoutSpec layout = parse_layout(*text);
  const auto& vol = layout.sole_volume();
  log_.info("layout: volume '%s', %zu structures", vol.name.c_str(), vol.structures.size());
  ctx_.layout = std::move(layout);
}

void BuildPipeline::populate_rootfs_contents() {
  StagingAssembler(log_).populate_rootfs(ctx_.unpackdir, ctx_.rootfs);
}

void BuildPipeline::calculate_rootfs_size() {
  ctx_.rootfs_size = estimate_directory_size(ctx_.rootfs, config_.fudge_factor);
  log_.debug("root filesystem estimate %s", util::human_bytes(ctx_.rootfs_size).c_str());
}

void BuildPipeline::pre_stage_bootfs() {
  ctx_.part_dirs = StagingAssembler(log_).pre_stage(volume(), ctx_.workdir);
}

void BuildPipeline::stage_bootfs_contents() {
  ctx_.bootfs = StagingAssembler(log_).stage(volume(), ctx_.workdir, ctx_.unpackdir);
  if (ctx_.bootfs.empty()) log_.warn("no '%s' structure in layout", kSystemBootLabel);
}

void BuildPipeline::calculate_bootfs_size() {
  const auto& vol = volume();
  ctx_.bootfs_sizes.clear();
  for (size_t i = 0; i < vol.structures.size(); ++i) {
    if (!vol.structures[i].has_filesystem()) continue;
    ctx_.bootfs_sizes[part_key(i)] = estimate_directory_size(ctx_.part_dirs.at(i), config_.fudge_factor);
  }
}

void BuildPipeline::prepare_filesystems() {
  const auto& vol = volume();

  // The space check happens before the first image file exists.
  uint64_t avail_mib = available_root_space_mib(vol, config_.total_image_size, config_.reserved_tail);
  require_root_space(ctx_.rootfs_size, avail_mib);

  ctx_.images_dir = ctx_.workdir / ".images";
  fs::create_directories(ctx_.images_dir);
  FilesystemImager imager(runner_, config_.sudo, log_);
  ctx_.part_images.assign(vol.structures.size(), fs::path{});
  for (size_t i = 0; i < vol.structures.size(); ++i) {
    const auto& s = vol.structures[i];
    if (s.size == 0 || !s.has_filesystem()) continue;
    fs::path image = ctx_.images_dir / (part_key(i) + ".img");
    imager.prepare(image, s.size, s.filesystem);
    ctx_.part_images[i] = std::move(image);
  }

  // The root image is formatted while populating (mkfs.ext4 -d).
  ctx_.rootfs_space_mib = avail_mib;
  ctx_.root_image = ctx_.images_dir / "root.img";
  FilesystemImager::allocate_sparse(ctx_.root_image, util::MiB(avail_mib));
  log_.info("writable partition: %llu MiB", static_cast<unsigned long long>(avail_mib));
}

void BuildPipeline::populate_filesystems() {
  const auto& vol = volume();
  FilesystemImager imager(runner_, config_.sudo, log_);
  for (size_t i = 0; i < vol.structures.size(); ++i) {
    if (i >= ctx_.part_images.size() || ctx_.part_images[i].empty()) continue;
    const auto& s = vol.structures[i];
    imager.populate(ctx_.part_images[i], s.filesystem, ctx_.part_dirs.at(i),
                    s.filesystem_label.value_or(""));
  }
  imager.populate(ctx_.root_image, model::FileSystemType::Ext4, ctx_.rootfs, config_.root_label);
}

void BuildPipeline::assemble_disk() {
  ctx_.disk_image = ctx_.images_dir / "disk.img";
  DiskImage disk(runner_, log_, ctx_.disk_image, config_.total_image_size);
  auto placed = DiskAssembler(disk).assemble(volume(), ctx_.part_images, ctx_.root_image,
                                             ctx_.rootfs_space_mib);
  for (const auto& p : placed) {
    log_.info("partition %d: %s at %s%s%s", p.number, util::human_bytes(p.size).c_str(),
              util::human_bytes(p.offset).c_str(), p.name.empty() ? "" : ", ", p.name.c_str());
  }
}

void BuildPipeline::finish() {
  if (ctx_.output.has_parent_path()) fs::create_directories(ctx_.output.parent_path());
  util::move_path(ctx_.disk_image, ctx_.output);
  log_.info("wrote %s", ctx_.output.c_str());
}

} // namespace gadgetimg::build
