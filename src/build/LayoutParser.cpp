#include "build/LayoutParser.hpp"
#include "build/Errors.hpp"
#include "util/Units.hpp"
#include "util/YamlReader.hpp"

#include <algorithm>
#include <filesystem>
#include <numeric>

namespace gadgetimg::build {

using model::Structure;
using model::Volume;
using util::YamlNode;

static constexpr uint64_t kMbrMaxSize = 440;

static const std::string& scalar_or_throw(const YamlNode& node, const char* key, int index) {
  if (!node.is_scalar())
    throw ParseError(std::string("'") + key + "' must be a scalar (line " + std::to_string(node.line()) + ")", index);
  return node.scalar();
}

static std::optional<std::string> optional_string(const YamlNode& map, const char* key, int index) {
  const YamlNode* n = map.find(key);
  if (!n || n->is_null()) return std::nullopt;
  return scalar_or_throw(*n, key, index);
}

static uint64_t parse_bytes(const YamlNode& node, const char* key, int index) {
  const std::string& text = scalar_or_throw(node, key, index);
  if (!text.empty() && text.front() == '-')
    throw ParseError(std::string("'") + key + "' must not be negative: " + text, index);
  auto value = util::parse_size(text);
  if (!value) throw ParseError(std::string("invalid ") + key + " '" + text + "'", index);
  return *value;
}

static std::vector<model::ContentMapping> parse_content(const YamlNode& node, int index) {
  std::vector<model::ContentMapping> out;
  if (node.is_null()) return out;
  if (!node.is_seq()) throw ParseError("'content' must be a list", index);
  for (const auto& item : node.items()) {
    if (!item.is_map()) throw ParseError("content entries must be mappings", index);
    auto source = optional_string(item, "source", index);
    auto target = optional_string(item, "target", index);
    if (!source || !target || source->empty() || target->empty())
      throw ParseError("content entry at line " + std::to_string(item.line()) +
                       " needs both 'source' and 'target'", index);
    std::filesystem::path rel(*target);
    if (rel.is_absolute())
      throw ParseError("content target must be relative: " + *target, index);
    auto normal = rel.lexically_normal();
    if (!normal.empty() && *normal.begin() == "..")
      throw ParseError("content target escapes the structure: " + *target, index);
    out.push_back(model::ContentMapping{*source, *target});
  }
  return out;
}

static Structure parse_structure(const YamlNode& node, int index) {
  if (!node.is_map()) throw ParseError("structure must be a mapping", index);
  Structure s;

  s.name = optional_string(node, "name", index);

  auto type = optional_string(node, "type", index);
  if (!type) throw ParseError("missing 'type'", index);
  auto tc = model::parse_type_code(*type);
  if (!tc) throw ParseError("invalid type '" + *type + "'", index);
  s.type = *tc;

  if (const YamlNode* off = node.find("offset"); off && !off->is_null()) {
    s.offset = parse_bytes(*off, "offset", index);
  } else if (!s.type.is_mbr()) {
    throw ParseError("missing 'offset'", index);
  }

  if (const YamlNode* sz = node.find("size"); sz && !sz->is_null())
    s.size = parse_bytes(*sz, "size", index);

  auto fs = optional_string(node, "filesystem", index);
  auto fs_type = model::filesystem_from_string(fs.value_or(""));
  if (!fs_type) throw ParseError("unsupported filesystem '" + *fs + "'", index);
  s.filesystem = *fs_type;

  s.filesystem_label = optional_string(node, "filesystem-label", index);

  if (const YamlNode* content = node.find("content"))
    s.content = parse_content(*content, index);

  return s;
}

void validate_volume(const Volume& volume) {
  if (volume.structures.empty())
    throw ParseError("volume '" + volume.name + "' declares no structures");
  if (volume.schema != "gpt")
    throw ParseError("volume '" + volume.name + "': unsupported schema '" + volume.schema + "'");

  for (size_t i = 0; i < volume.structures.size(); ++i) {
    const Structure& s = volume.structures[i];
    int index = static_cast<int>(i);
    if (!util::is_mib_aligned(s.offset)) {
      throw FilesystemAssumptionViolation(
          "offset " + std::to_string(s.offset) + " is not a multiple of 1MiB", index, s.offset);
    }
    if (s.type.is_mbr()) {
      if (s.offset != 0) throw ParseError("mbr structure must sit at offset 0", index);
      if (s.size > kMbrMaxSize)
        throw ParseError("mbr structure is larger than " + std::to_string(kMbrMaxSize) + " bytes", index);
    }
    if (s.end() < s.offset) throw ParseError("offset + size overflows", index);
  }

  // Walk the structures by offset; a structure overlaps if it starts before
  // the furthest end seen so far. Zero-sized structures occupy nothing.
  std::vector<size_t> order(volume.structures.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return volume.structures[a].offset < volume.structures[b].offset;
  });
  uint64_t furthest_end = 0;
  size_t furthest = 0;
  bool any = false;
  for (size_t idx : order) {
    const Structure& cur = volume.structures[idx];
    if (cur.size == 0) continue;
    if (any && cur.offset < furthest_end) {
      size_t later = std::max(furthest, idx);
      size_t earlier = std::min(furthest, idx);
      throw ParseError("overlaps structure #" + std::to_string(earlier), static_cast<int>(later));
    }
    if (!any || cur.end() > furthest_end) {
      furthest_end = cur.end();
      furthest = idx;
    }
    any = true;
  }
}

model::LayoutSpec parse_layout(std::string_view text) {
  util::YamlReader reader;
  if (!reader.parse(text)) throw ParseError("malformed layout: " + reader.error());

  const YamlNode& root = reader.root();
  if (!root.is_map()) throw ParseError("layout must be a mapping with a 'volumes' key");
  const YamlNode* volumes = root.find("volumes");
  if (!volumes || !volumes->is_map() || volumes->entries().empty())
    throw ParseError("layout declares no volumes");

  model::LayoutSpec spec;
  for (const auto& [name, vnode] : volumes->entries()) {
    if (!vnode.is_map()) throw ParseError("volume '" + name + "' must be a mapping");
    Volume volume;
    volume.name = name;
    if (auto schema = optional_string(vnode, "schema", -1)) volume.schema = *schema;
    volume.bootloader = optional_string(vnode, "bootloader", -1).value_or("");

    const YamlNode* structures = vnode.find("structure");
    if (!structures || structures->is_null())
      throw ParseError("volume '" + name + "' declares no structures");
    if (!structures->is_seq()) throw ParseError("volume '" + name + "': 'structure' must be a list");
    int index = 0;
    for (const auto& snode : structures->items())
      volume.structures.push_back(parse_structure(snode, index++));

    validate_volume(volume);
    spec.volumes.push_back(std::move(volume));
  }
  return spec;
}

} // namespace gadgetimg::build
