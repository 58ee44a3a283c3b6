#include "model/Layout.hpp"
#include "build/Errors.hpp"

#include <algorithm>
#include <cctype>

namespace gadgetimg::model {

const char* to_string(FileSystemType fs) {
  switch (fs) {
    case FileSystemType::None: return "none";
    case FileSystemType::Vfat: return "vfat";
    case FileSystemType::Ext4: return "ext4";
  }
  return "none";
}

std::optional<FileSystemType> filesystem_from_string(std::string_view s) {
  if (s.empty() || s == "none") return FileSystemType::None;
  if (s == "vfat") return FileSystemType::Vfat;
  if (s == "ext4") return FileSystemType::Ext4;
  return std::nullopt;
}

static bool is_hex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

static std::string upper(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  return out;
}

bool is_guid(std::string_view s) {
  if (s.size() != 36) return false;
  for (size_t i = 0; i < s.size(); ++i) {
    bool dash = (i == 8 || i == 13 || i == 18 || i == 23);
    if (dash ? s[i] != '-' : !is_hex(s[i])) return false;
  }
  return true;
}

static bool is_legacy_code(std::string_view s) {
  return s.size() == 2 && is_hex(s[0]) && is_hex(s[1]);
}

std::optional<TypeCode> parse_type_code(std::string_view s) {
  TypeCode tc;
  if (s == "mbr") {
    tc.mbr = true;
    return tc;
  }
  auto comma = s.find(',');
  if (comma != std::string_view::npos) {
    auto code = s.substr(0, comma);
    auto guid = s.substr(comma + 1);
    if (!is_legacy_code(code) || !is_guid(guid)) return std::nullopt;
    tc.legacy = upper(code);
    tc.guid = upper(guid);
    return tc;
  }
  if (is_guid(s)) { tc.guid = upper(s); return tc; }
  if (is_legacy_code(s)) { tc.legacy = upper(s); return tc; }
  return std::nullopt;
}

std::string TypeCode::gpt_code() const {
  if (!guid.empty()) return guid;
  return legacy + "00";
}

std::string TypeCode::to_string() const {
  if (mbr) return "mbr";
  if (!legacy.empty() && !guid.empty()) return legacy + "," + guid;
  return guid.empty() ? legacy : guid;
}

const Volume& LayoutSpec::sole_volume() const {
  if (volumes.size() != 1) {
    throw build::FilesystemAssumptionViolation(
        "exactly one volume is supported, layout declares " + std::to_string(volumes.size()),
        -1, volumes.size());
  }
  return volumes.front();
}

} // namespace gadgetimg::model
