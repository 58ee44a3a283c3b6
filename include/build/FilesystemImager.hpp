#pragma once
#include "model/Layout.hpp"
#include "sys/CommandRunner.hpp"
#include "util/Log.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

namespace gadgetimg::build {

// Creates partition images and fills them from staging directories with
// mkfs.vfat/mcopy or mkfs.ext4.
class FilesystemImager {
public:
  FilesystemImager(sys::CommandRunner& runner, std::string sudo, util::Logger& log)
      : runner_(runner), sudo_(std::move(sudo)), log_(log) {}

  // Create or resize `path` to exactly `size` zero bytes, sparsely.
  static void allocate_sparse(const std::filesystem::path& path, uint64_t size);

  // Allocate the image and, for vfat, format it. ext4 is formatted while
  // populating since mkfs.ext4 -d does both at once.
  void prepare(const std::filesystem::path& image, uint64_t size, model::FileSystemType type);

  // Fill a prepared image from `staging`. No-op for FileSystemType::None.
  void populate(const std::filesystem::path& image, model::FileSystemType type,
                const std::filesystem::path& staging, const std::string& label);

  // prepare() followed by populate().
  void make_filesystem_image(const std::filesystem::path& image, uint64_t size,
                             model::FileSystemType type, const std::filesystem::path& staging,
                             const std::string& label);

  // mkfs.ext4 -d: format and copy in one pass. Returns false when this
  // e2fsprogs cannot (pre-1.43 has no -d), so the caller can fall back.
  [[nodiscard]] bool populate_ext4_in_place(const std::filesystem::path& image,
                                            const std::filesystem::path& staging,
                                            const std::string& label);

  // Format empty, loop-mount, copy the tree in with cp, unmount.
  void populate_ext4_by_mount(const std::filesystem::path& image,
                              const std::filesystem::path& staging,
                              const std::string& label);

private:
  void populate_vfat(const std::filesystem::path& image, const std::filesystem::path& staging);
  void populate_ext4(const std::filesystem::path& image, const std::filesystem::path& staging,
                     const std::string& label);

  sys::CommandRunner& runner_;
  std::string sudo_;
  util::Logger& log_;
};

} // namespace gadgetimg::build
