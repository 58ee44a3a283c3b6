#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gadgetimg::util {

constexpr uint64_t KiB(uint64_t n) { return n << 10; }
constexpr uint64_t MiB(uint64_t n) { return n << 20; }
constexpr uint64_t GiB(uint64_t n) { return n << 30; }

constexpr uint64_t kSectorSize = 512;

constexpr bool is_mib_aligned(uint64_t bytes) { return bytes % MiB(1) == 0; }

constexpr uint64_t round_up_mib(uint64_t bytes) {
  return (bytes + MiB(1) - 1) / MiB(1) * MiB(1);
}

// Parse a byte count with an optional K/M/G suffix (binary multiples),
// e.g. "440", "1M", "50M", "4G". Returns std::nullopt on malformed input
// or overflow.
[[nodiscard]] std::optional<uint64_t> parse_size(std::string_view text);

// Short human form for log lines: "440B", "4.0MiB", "3.9GiB".
[[nodiscard]] std::string human_bytes(uint64_t bytes);

} // namespace gadgetimg::util
