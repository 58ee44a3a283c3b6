#pragma once
#include "util/Log.hpp"

#include <cstdint>
#include <filesystem>

namespace gadgetimg::sys {

// Copy at most `length` bytes from the start of `src` into `dst` at byte
// `offset`, in 1MiB chunks, without truncating `dst` (dd conv=notrunc).
// Stops early at the end of `src`. Returns the number of bytes copied.
// Uses io_uring; falls back to pread/pwrite when the kernel refuses a ring.
// Throws build::ExternalToolFailure on I/O errors.
uint64_t copy_blob(const std::filesystem::path& src, const std::filesystem::path& dst,
                   uint64_t offset, uint64_t length, util::Logger& log);

} // namespace gadgetimg::sys
