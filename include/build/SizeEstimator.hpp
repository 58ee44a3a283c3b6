#pragma once
#include "model/Layout.hpp"

#include <cstdint>
#include <filesystem>

namespace gadgetimg::build {

// Sum of regular file sizes below `path`, recursively. Symlinks are not
// followed. A missing directory counts as empty.
[[nodiscard]] uint64_t raw_directory_size(const std::filesystem::path& path);

// floor(raw * fudge)
[[nodiscard]] uint64_t apply_fudge(uint64_t raw, double fudge);

// Rough du(1): raw_directory_size() scaled once by the fudge factor to cover
// filesystem metadata the formatter will add.
[[nodiscard]] uint64_t estimate_directory_size(const std::filesystem::path& path, double fudge);

// End of the furthest structure, rounded up to a MiB boundary. The writable
// partition starts here.
[[nodiscard]] uint64_t layout_end(const model::Volume& volume);

// Whole MiB left for the writable partition once the structures and the
// reserved tail are taken out of the image. Throws InsufficientSpace when
// they do not fit at all.
[[nodiscard]] uint64_t available_root_space_mib(const model::Volume& volume,
                                                uint64_t total_image_size,
                                                uint64_t reserved_tail);

// Throws InsufficientSpace unless the estimate is strictly below the space.
void require_root_space(uint64_t estimated_root_bytes, uint64_t available_mib);

} // namespace gadgetimg::build
