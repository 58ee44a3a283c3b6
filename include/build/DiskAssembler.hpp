#pragma once
#include "model/Layout.hpp"
#include "sys/CommandRunner.hpp"
#include "util/Log.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gadgetimg::build {

inline constexpr const char* kLinuxDataTypeGuid = "0FC63DAF-8483-4772-8E79-3D69D8477DE4";
inline constexpr const char* kWritableName = "writable";

// A sparse disk file plus the GPT edits sgdisk applies to it.
class DiskImage {
public:
  DiskImage(sys::CommandRunner& runner, util::Logger& log, std::filesystem::path path, uint64_t size);

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }
  [[nodiscard]] uint64_t size() const { return size_; }

  // Sectors are 512 bytes; last_sector is inclusive.
  void partition_new(int number, uint64_t first_sector, uint64_t last_sector);
  void set_typecode(int number, const std::string& code);
  void set_name(int number, const std::string& name);

  // Write up to `length` bytes of `src` at byte `offset`, leaving the rest
  // of the disk untouched.
  void copy_blob(const std::filesystem::path& src, uint64_t offset, uint64_t length);

private:
  void sgdisk(const std::string& option);

  sys::CommandRunner& runner_;
  util::Logger& log_;
  std::filesystem::path path_;
  uint64_t size_;
};

struct PlacedPartition {
  int number{};
  uint64_t offset{};
  uint64_t size{};
  std::string name;
};

class DiskAssembler {
public:
  explicit DiskAssembler(DiskImage& disk) : disk_(disk) {}

  // Write the structures in ascending offset order, numbering table entries
  // from 1 and skipping the mbr placeholder, then append the writable
  // partition at the rounded-up layout end. `images` is indexed by
  // declaration order; an empty path means the structure has no image.
  std::vector<PlacedPartition> assemble(const model::Volume& volume,
                                        const std::vector<std::filesystem::path>& images,
                                        const std::filesystem::path& root_image,
                                        uint64_t root_size_mib);

private:
  DiskImage& disk_;
};

} // namespace gadgetimg::build
