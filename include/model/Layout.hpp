#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gadgetimg::model {

enum class FileSystemType { None, Vfat, Ext4 };

[[nodiscard]] const char* to_string(FileSystemType fs);
[[nodiscard]] std::optional<FileSystemType> filesystem_from_string(std::string_view s);

// Partition type as written in the layout: the "mbr" placeholder, a GPT type
// GUID, a two-digit MBR code, or both ("EF,C12A7328-...").
struct TypeCode {
  bool mbr{false};
  std::string legacy;  // e.g. "EF"
  std::string guid;    // upper-case canonical form

  [[nodiscard]] bool is_mbr() const { return mbr; }
  // Type code handed to sgdisk: the GUID when known, otherwise the MBR code
  // widened the way sgdisk spells it ("EF" -> "EF00").
  [[nodiscard]] std::string gpt_code() const;
  // Canonical layout spelling; parse_type_code(to_string()) round-trips.
  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] std::optional<TypeCode> parse_type_code(std::string_view s);
[[nodiscard]] bool is_guid(std::string_view s);

struct ContentMapping {
  std::string source;  // relative to <unpack>/gadget
  std::string target;  // relative to the partition root
};

struct Structure {
  std::optional<std::string> name;
  uint64_t offset{};
  uint64_t size{};     // 0: no space of its own (implicit remainder)
  FileSystemType filesystem{FileSystemType::None};
  std::optional<std::string> filesystem_label;
  TypeCode type;
  std::vector<ContentMapping> content;

  [[nodiscard]] uint64_t end() const { return offset + size; }
  [[nodiscard]] bool has_filesystem() const { return filesystem != FileSystemType::None; }
};

struct Volume {
  std::string name;
  std::string schema{"gpt"};
  std::string bootloader;
  std::vector<Structure> structures;  // declaration order
};

struct LayoutSpec {
  std::vector<Volume> volumes;

  // The single volume this tool builds. Throws FilesystemAssumptionViolation
  // when the layout declares more than one.
  [[nodiscard]] const Volume& sole_volume() const;
};

} // namespace gadgetimg::model
