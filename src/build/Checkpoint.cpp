#include "build/Checkpoint.hpp"
#include "build/Errors.hpp"
#include "util/Files.hpp"
#include "util/TomlReader.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

namespace gadgetimg::build {

namespace fs = std::filesystem;

static constexpr int kFormatVersion = 1;

static std::string idx(size_t i) { return std::to_string(i); }

static void save_layout(util::TomlReader& toml, const model::LayoutSpec& layout) {
  toml.set_u64("layout", "volumes", layout.volumes.size());
  for (size_t v = 0; v < layout.volumes.size(); ++v) {
    const auto& vol = layout.volumes[v];
    std::string vsec = "volume." + idx(v);
    toml.set(vsec, "name", vol.name);
    toml.set(vsec, "schema", vol.schema);
    toml.set(vsec, "bootloader", vol.bootloader);
    toml.set_u64(vsec, "structures", vol.structures.size());
    for (size_t s = 0; s < vol.structures.size(); ++s) {
      const auto& st = vol.structures[s];
      std::string ssec = vsec + ".structure." + idx(s);
      if (st.name) toml.set(ssec, "name", *st.name);
      toml.set_u64(ssec, "offset", st.offset);
      toml.set_u64(ssec, "size", st.size);
      toml.set(ssec, "filesystem", model::to_string(st.filesystem));
      if (st.filesystem_label) toml.set(ssec, "filesystem_label", *st.filesystem_label);
      toml.set(ssec, "type", st.type.to_string());
      toml.set_u64(ssec, "content", st.content.size());
      for (size_t c = 0; c < st.content.size(); ++c) {
        toml.set(ssec, "content." + idx(c) + ".source", st.content[c].source);
        toml.set(ssec, "content." + idx(c) + ".target", st.content[c].target);
      }
    }
  }
}

void save_checkpoint(const fs::path& path, const Checkpoint& cp) {
  const auto& c = cp.context;
  util::TomlReader toml;
  toml.set_u64("checkpoint", "version", kFormatVersion);
  toml.set("checkpoint", "next", to_string(cp.next));

  toml.set("context", "workdir", c.workdir.string());
  toml.set("context", "output", c.output.string());
  toml.set("context", "model_assertion", c.model_assertion);
  toml.set("context", "channel", c.channel);
  toml.set("context", "rootfs", c.rootfs.string());
  toml.set("context", "unpackdir", c.unpackdir.string());
  toml.set_u64("context", "rootfs_size", c.rootfs_size);
  toml.set("context", "bootfs", c.bootfs.string());
  toml.set("context", "images_dir", c.images_dir.string());
  toml.set("context", "root_image", c.root_image.string());
  toml.set_u64("context", "rootfs_space_mib", c.rootfs_space_mib);
  toml.set("context", "disk_image", c.disk_image.string());
  toml.set_bool("context", "has_layout", c.layout.has_value());

  toml.set_u64("context", "part_dirs", c.part_dirs.size());
  for (size_t i = 0; i < c.part_dirs.size(); ++i) toml.set("part_dirs", idx(i), c.part_dirs[i].string());
  toml.set_u64("context", "part_images", c.part_images.size());
  for (size_t i = 0; i < c.part_images.size(); ++i) toml.set("part_images", idx(i), c.part_images[i].string());
  for (const auto& [name, size] : c.bootfs_sizes) toml.set_u64("bootfs_sizes", name, size);

  if (c.layout) save_layout(toml, *c.layout);

  if (!util::write_file_atomic(path, toml.to_string()))
    throw BuildError("cannot write checkpoint " + path.string() + ": " + std::strerror(errno));
}

namespace {

// Strict accessors: a checkpoint missing a key is corrupt, not defaulted.
class Fields {
public:
  Fields(const util::TomlReader& toml, const fs::path& path) : toml_(toml), path_(path) {}

  [[nodiscard]] std::string str(const std::string& section, const std::string& key) const {
    if (!toml_.has(section, key)) missing(section, key);
    return toml_.get_string(section, key);
  }

  [[nodiscard]] uint64_t u64(const std::string& section, const std::string& key) const {
    if (!toml_.has(section, key)) missing(section, key);
    // Any valid value round-trips, so a changed default means a bad value.
    uint64_t a = toml_.get_u64(section, key, 0);
    uint64_t b = toml_.get_u64(section, key, 1);
    if (a != b) corrupt(section + "." + key + " is not a number");
    return a;
  }

  [[nodiscard]] bool has(const std::string& section, const std::string& key) const {
    return toml_.has(section, key);
  }

  [[noreturn]] void corrupt(const std::string& what) const {
    throw BuildError("corrupt checkpoint " + path_.string() + ": " + what);
  }

private:
  [[noreturn]] void missing(const std::string& section, const std::string& key) const {
    corrupt("missing " + section + "." + key);
  }

  const util::TomlReader& toml_;
  const fs::path& path_;
};

} // namespace

static model::LayoutSpec load_layout(const Fields& f) {
  model::LayoutSpec layout;
  uint64_t nvol = f.u64("layout", "volumes");
  for (uint64_t v = 0; v < nvol; ++v) {
    std::string vsec = "volume." + idx(v);
    model::Volume vol;
    vol.name = f.str(vsec, "name");
    vol.schema = f.str(vsec, "schema");
    vol.bootloader = f.str(vsec, "bootloader");
    uint64_t nstruct = f.u64(vsec, "structures");
    for (uint64_t s = 0; s < nstruct; ++s) {
      std::string ssec = vsec + ".structure." + idx(s);
      model::Structure st;
      if (f.has(ssec, "name")) st.name = f.str(ssec, "name");
      st.offset = f.u64(ssec, "offset");
      st.size = f.u64(ssec, "size");
      auto fs_type = model::filesystem_from_string(f.str(ssec, "filesystem"));
      if (!fs_type) f.corrupt(ssec + ".filesystem");
      st.filesystem = *fs_type;
      if (f.has(ssec, "filesystem_label")) st.filesystem_label = f.str(ssec, "filesystem_label");
      auto type = model::parse_type_code(f.str(ssec, "type"));
      if (!type) f.corrupt(ssec + ".type");
      st.type = *type;
      uint64_t ncontent = f.u64(ssec, "content");
      for (uint64_t c = 0; c < ncontent; ++c) {
        st.content.push_back(model::ContentMapping{f.str(ssec, "content." + idx(c) + ".source"),
                                                   f.str(ssec, "content." + idx(c) + ".target")});
      }
      vol.structures.push_back(std::move(st));
    }
    layout.volumes.push_back(std::move(vol));
  }
  return layout;
}

std::optional<Checkpoint> load_checkpoint(const fs::path& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return std::nullopt;
  auto text = util::read_file_string(path);
  if (!text) throw BuildError("cannot read checkpoint " + path.string());

  util::TomlReader toml;
  toml.load_string(*text);
  Fields f(toml, path);

  if (f.u64("checkpoint", "version") != static_cast<uint64_t>(kFormatVersion))
    f.corrupt("unsupported version");
  Checkpoint cp;
  auto next = step_from_string(f.str("checkpoint", "next"));
  if (!next) f.corrupt("unknown step '" + f.str("checkpoint", "next") + "'");
  cp.next = *next;

  auto& c = cp.context;
  c.workdir = f.str("context", "workdir");
  c.output = f.str("context", "output");
  c.model_assertion = f.str("context", "model_assertion");
  c.channel = f.str("context", "channel");
  c.rootfs = f.str("context", "rootfs");
  c.unpackdir = f.str("context", "unpackdir");
  c.rootfs_size = f.u64("context", "rootfs_size");
  c.bootfs = f.str("context", "bootfs");
  c.images_dir = f.str("context", "images_dir");
  c.root_image = f.str("context", "root_image");
  c.rootfs_space_mib = f.u64("context", "rootfs_space_mib");
  c.disk_image = f.str("context", "disk_image");

  uint64_t ndirs = f.u64("context", "part_dirs");
  for (uint64_t i = 0; i < ndirs; ++i) c.part_dirs.emplace_back(f.str("part_dirs", idx(i)));
  uint64_t nimages = f.u64("context", "part_images");
  for (uint64_t i = 0; i < nimages; ++i) c.part_images.emplace_back(f.str("part_images", idx(i)));
  if (toml.get_bool("context", "has_layout", false)) c.layout = load_layout(f);

  // bootfs_sizes keys are the structure dirs "part<N>"
  for (size_t i = 0; i < c.part_dirs.size(); ++i) {
    std::string key = "part" + idx(i);
    if (f.has("bootfs_sizes", key)) c.bootfs_sizes[key] = f.u64("bootfs_sizes", key);
  }
  return cp;
}

} // namespace gadgetimg::build
