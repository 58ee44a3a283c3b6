#include "build/StagingAssembler.hpp"
#include "util/Files.hpp"

namespace gadgetimg::build {

namespace fs = std::filesystem;

fs::path StagingAssembler::part_dir(const fs::path& workdir, size_t index) {
  return workdir / ("part" + std::to_string(index));
}

std::vector<fs::path> StagingAssembler::pre_stage(const model::Volume& volume, const fs::path& workdir) {
  std::vector<fs::path> dirs;
  dirs.reserve(volume.structures.size());
  for (size_t i = 0; i < volume.structures.size(); ++i) {
    fs::path dir = part_dir(workdir, i);
    fs::create_directories(dir);
    dirs.push_back(std::move(dir));
  }
  return dirs;
}

void StagingAssembler::copy_content(const fs::path& src, const fs::path& root, const std::string& target) {
  fs::path dst = root / target;
  if (fs::is_directory(src)) {
    fs::create_directories(dst);
    fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::overwrite_existing |
                           fs::copy_options::copy_symlinks);
  } else {
    // A target naming a directory receives the file under its own name.
    if ((!target.empty() && target.back() == '/') || fs::is_directory(dst)) {
      fs::create_directories(dst);
      dst /= src.filename();
    } else if (dst.has_parent_path()) {
      fs::create_directories(dst.parent_path());
    }
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
  }
  log_.debug("staged %s -> %s", src.c_str(), dst.c_str());
}

fs::path StagingAssembler::stage(const model::Volume& volume, const fs::path& workdir,
                                 const fs::path& unpackdir) {
  const fs::path grub = unpackdir / "image" / "boot" / "grub";
  const fs::path gadget = unpackdir / "gadget";
  fs::path bootfs;

  for (size_t i = 0; i < volume.structures.size(); ++i) {
    const auto& s = volume.structures[i];
    fs::path target_dir = part_dir(workdir, i);

    if (s.filesystem_label && *s.filesystem_label == kSystemBootLabel) {
      // The signed bootloader has EFI/ubuntu baked in.
      bootfs = target_dir;
      fs::path ubuntu = target_dir / "EFI" / "ubuntu";
      fs::create_directories(ubuntu);
      for (const auto& name : util::list_dir(grub))
        util::move_path(grub / name, ubuntu / name);
      log_.debug("moved %s into %s", grub.c_str(), ubuntu.c_str());
    }

    if (!s.has_filesystem()) continue;
    for (const auto& c : s.content)
      copy_content(gadget / c.source, target_dir, c.target);
  }
  return bootfs;
}

void StagingAssembler::populate_rootfs(const fs::path& unpackdir, const fs::path& rootfs) {
  fs::path data = rootfs / "system-data";
  fs::create_directories(data);
  util::move_path(unpackdir / "image" / "var", data / "var");
  fs::create_directories(data / "boot");
}

} // namespace gadgetimg::build
