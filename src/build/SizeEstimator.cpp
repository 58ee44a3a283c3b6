#include "build/SizeEstimator.hpp"
#include "build/Errors.hpp"
#include "util/Units.hpp"

#include <algorithm>
#include <cmath>
#include <system_error>

namespace gadgetimg::build {

namespace fs = std::filesystem;

uint64_t raw_directory_size(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_directory(path, ec)) return 0;
  uint64_t total = 0;
  fs::recursive_directory_iterator it(path, fs::directory_options::none, ec);
  if (ec) throw fs::filesystem_error("cannot walk directory", path, ec);
  for (const auto& entry : it) {
    if (!entry.is_regular_file(ec) || entry.is_symlink(ec)) continue;
    uint64_t sz = entry.file_size(ec);
    if (ec) throw fs::filesystem_error("cannot stat file", entry.path(), ec);
    total += sz;
  }
  return total;
}

uint64_t apply_fudge(uint64_t raw, double fudge) {
  return static_cast<uint64_t>(std::floor(static_cast<long double>(raw) * fudge));
}

uint64_t estimate_directory_size(const fs::path& path, double fudge) {
  return apply_fudge(raw_directory_size(path), fudge);
}

uint64_t layout_end(const model::Volume& volume) {
  uint64_t end = 0;
  for (const auto& s : volume.structures) end = std::max(end, s.end());
  return util::round_up_mib(end);
}

uint64_t available_root_space_mib(const model::Volume& volume, uint64_t total_image_size,
                                  uint64_t reserved_tail) {
  uint64_t used = layout_end(volume) + reserved_tail;
  if (used >= total_image_size)
    throw InsufficientSpace("partition layout", used, total_image_size);
  return (total_image_size - used) / util::MiB(1);
}

void require_root_space(uint64_t estimated_root_bytes, uint64_t available_mib) {
  uint64_t available = util::MiB(available_mib);
  if (estimated_root_bytes >= available)
    throw InsufficientSpace("root filesystem", estimated_root_bytes, available);
}

} // namespace gadgetimg::build
