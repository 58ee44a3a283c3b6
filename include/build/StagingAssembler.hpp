#pragma once
#include "model/Layout.hpp"
#include "util/Log.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace gadgetimg::build {

// Structure carrying the bootloader, identified by its filesystem label.
inline constexpr const char* kSystemBootLabel = "system-boot";

// Lays out the per-structure staging directories that become partition
// contents, and the writable root tree.
class StagingAssembler {
public:
  explicit StagingAssembler(util::Logger& log) : log_(log) {}

  // "<workdir>/part<N>"
  [[nodiscard]] static std::filesystem::path part_dir(const std::filesystem::path& workdir, size_t index);

  // Create part<N> for every structure. Returns them in declaration order.
  std::vector<std::filesystem::path> pre_stage(const model::Volume& volume,
                                               const std::filesystem::path& workdir);

  // Copy gadget content into the staging dirs of formatted structures and
  // move the grub tree from the unpacked image into system-boot's EFI/ubuntu.
  // Moving is destructive: call once per build. Returns the system-boot
  // staging directory, or an empty path when no structure carries the label.
  std::filesystem::path stage(const model::Volume& volume,
                              const std::filesystem::path& workdir,
                              const std::filesystem::path& unpackdir);

  // <unpack>/image/var -> <rootfs>/system-data/var, plus the empty
  // system-data/boot mount point.
  void populate_rootfs(const std::filesystem::path& unpackdir, const std::filesystem::path& rootfs);

private:
  void copy_content(const std::filesystem::path& src, const std::filesystem::path& root,
                    const std::string& target);

  util::Logger& log_;
};

} // namespace gadgetimg::build
