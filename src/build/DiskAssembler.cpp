#include "build/DiskAssembler.hpp"
#include "build/Errors.hpp"
#include "build/FilesystemImager.hpp"
#include "build/SizeEstimator.hpp"
#include "sys/BlobCopy.hpp"
#include "util/Units.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace gadgetimg::build {

namespace fs = std::filesystem;

DiskImage::DiskImage(sys::CommandRunner& runner, util::Logger& log, fs::path path, uint64_t size)
    : runner_(runner), log_(log), path_(std::move(path)), size_(size) {
  FilesystemImager::allocate_sparse(path_, size_);
}

void DiskImage::sgdisk(const std::string& option) {
  sys::run_checked(runner_, {"sgdisk", option, path_.string()});
}

void DiskImage::partition_new(int number, uint64_t first_sector, uint64_t last_sector) {
  sgdisk("--new=" + std::to_string(number) + ":" + std::to_string(first_sector) + ":" +
         std::to_string(last_sector));
}

void DiskImage::set_typecode(int number, const std::string& code) {
  sgdisk("--typecode=" + std::to_string(number) + ":" + code);
}

void DiskImage::set_name(int number, const std::string& name) {
  sgdisk("--change-name=" + std::to_string(number) + ":" + name);
}

void DiskImage::copy_blob(const fs::path& src, uint64_t offset, uint64_t length) {
  if (offset + length > size_)
    throw InsufficientSpace("blob " + src.string(), offset + length, size_);
  uint64_t n = sys::copy_blob(src, path_, offset, length, log_);
  log_.debug("copied %s of %s at offset %llu", util::human_bytes(n).c_str(), src.c_str(),
             static_cast<unsigned long long>(offset));
}

static uint64_t first_sector(uint64_t offset) { return offset / util::kSectorSize; }

static uint64_t last_sector(uint64_t offset, uint64_t size) {
  return (offset + size + util::kSectorSize - 1) / util::kSectorSize - 1;
}

std::vector<PlacedPartition> DiskAssembler::assemble(const model::Volume& volume,
                                                     const std::vector<fs::path>& images,
                                                     const fs::path& root_image,
                                                     uint64_t root_size_mib) {
  std::vector<size_t> order(volume.structures.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return volume.structures[a].offset < volume.structures[b].offset;
  });

  std::vector<PlacedPartition> placed;
  int part_id = 1;
  for (size_t idx : order) {
    const auto& s = volume.structures[idx];
    if (s.size == 0) continue;
    if (idx < images.size() && !images[idx].empty())
      disk_.copy_blob(images[idx], s.offset, s.size);
    if (s.type.is_mbr()) continue;

    disk_.partition_new(part_id, first_sector(s.offset), last_sector(s.offset, s.size));
    disk_.set_typecode(part_id, s.type.gpt_code());
    if (s.name) disk_.set_name(part_id, *s.name);
    placed.push_back(PlacedPartition{part_id, s.offset, s.size, s.name.value_or("")});
    ++part_id;
  }

  uint64_t root_offset = layout_end(volume);
  uint64_t root_size = util::MiB(root_size_mib);
  disk_.partition_new(part_id, first_sector(root_offset), last_sector(root_offset, root_size));
  disk_.set_typecode(part_id, kLinuxDataTypeGuid);
  disk_.set_name(part_id, kWritableName);
  disk_.copy_blob(root_image, root_offset, root_size);
  placed.push_back(PlacedPartition{part_id, root_offset, root_size, kWritableName});
  return placed;
}

} // namespace gadgetimg::build
