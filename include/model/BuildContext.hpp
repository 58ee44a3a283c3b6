#pragma once
#include "model/Layout.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gadgetimg::model {

// State threaded through the pipeline. Each field is written by exactly one
// step and read only by the steps after it; the owning step is noted.
struct BuildContext {
  // Init
  std::filesystem::path workdir;
  std::filesystem::path output;
  std::string model_assertion;
  std::string channel;

  // MakeTempDirs
  std::filesystem::path rootfs;     // <workdir>/root
  std::filesystem::path unpackdir;  // <workdir>/unpack

  // LoadLayoutSpec
  std::optional<LayoutSpec> layout;

  // CalculateRootfsSize: estimated bytes, fudge factor applied
  uint64_t rootfs_size{};

  // PreStageBootfs: <workdir>/part<N>, one per structure
  std::vector<std::filesystem::path> part_dirs;

  // StageBootfsContents: staging dir of the system-boot structure, if any
  std::filesystem::path bootfs;

  // CalculateBootfsSize: "part<N>" -> estimated bytes, formatted structures only
  std::map<std::string, uint64_t> bootfs_sizes;

  // PrepareFilesystems
  std::filesystem::path images_dir;                  // <workdir>/.images
  std::vector<std::filesystem::path> part_images;    // empty path: no image
  std::filesystem::path root_image;
  uint64_t rootfs_space_mib{};                       // writable partition size

  // AssembleDisk
  std::filesystem::path disk_image;
};

} // namespace gadgetimg::model
