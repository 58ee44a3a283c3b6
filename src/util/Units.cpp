#include "util/Units.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <limits>

namespace gadgetimg::util {

std::optional<uint64_t> parse_size(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  if (text.empty()) return std::nullopt;

  unsigned shift = 0;
  switch (text.back()) {
    case 'K': case 'k': shift = 10; break;
    case 'M': case 'm': shift = 20; break;
    case 'G': case 'g': shift = 30; break;
    default: break;
  }
  if (shift) text.remove_suffix(1);
  if (text.empty()) return std::nullopt;

  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
  if (shift && value > (std::numeric_limits<uint64_t>::max() >> shift)) return std::nullopt;
  return value << shift;
}

std::string human_bytes(uint64_t bytes) {
  char buf[32];
  if (bytes >= GiB(1)) {
    std::snprintf(buf, sizeof(buf), "%.1fGiB", static_cast<double>(bytes) / static_cast<double>(GiB(1)));
  } else if (bytes >= MiB(1)) {
    std::snprintf(buf, sizeof(buf), "%.1fMiB", static_cast<double>(bytes) / static_cast<double>(MiB(1)));
  } else if (bytes >= KiB(1)) {
    std::snprintf(buf, sizeof(buf), "%.1fKiB", static_cast<double>(bytes) / static_cast<double>(KiB(1)));
  } else {
    std::snprintf(buf, sizeof(buf), "%lluB", static_cast<unsigned long long>(bytes));
  }
  return buf;
}

} // namespace gadgetimg::util
