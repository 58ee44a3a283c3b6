#include "build/FilesystemImager.hpp"
#include "sys/ScopedMount.hpp"
#include "util/Files.hpp"
#include "util/Units.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace gadgetimg::build {

namespace fs = std::filesystem;

void FilesystemImager::allocate_sparse(const fs::path& path, uint64_t size) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0)
    throw std::system_error(errno, std::generic_category(), "open(" + path.string() + ")");
  // Shrink first so stale bytes from an earlier attempt never survive.
  if (::ftruncate(fd, 0) != 0 || ::ftruncate(fd, static_cast<off_t>(size)) != 0) {
    int saved = errno;
    ::close(fd);
    throw std::system_error(saved, std::generic_category(), "ftruncate(" + path.string() + ")");
  }
  if (::close(fd) != 0)
    throw std::system_error(errno, std::generic_category(), "close(" + path.string() + ")");
}

void FilesystemImager::prepare(const fs::path& image, uint64_t size, model::FileSystemType type) {
  allocate_sparse(image, size);
  log_.debug("allocated %s (%s)", image.c_str(), util::human_bytes(size).c_str());
  if (type == model::FileSystemType::Vfat)
    sys::run_checked(runner_, {"mkfs.vfat", image.string()});
}

void FilesystemImager::populate(const fs::path& image, model::FileSystemType type,
                                const fs::path& staging, const std::string& label) {
  switch (type) {
    case model::FileSystemType::None: return;
    case model::FileSystemType::Vfat: populate_vfat(image, staging); return;
    case model::FileSystemType::Ext4: populate_ext4(image, staging, label); return;
  }
}

void FilesystemImager::make_filesystem_image(const fs::path& image, uint64_t size,
                                             model::FileSystemType type, const fs::path& staging,
                                             const std::string& label) {
  prepare(image, size, type);
  populate(image, type, staging, label);
}

void FilesystemImager::populate_vfat(const fs::path& image, const fs::path& staging) {
  auto names = util::list_dir(staging);
  if (names.empty()) {
    log_.debug("nothing to copy into %s", image.c_str());
    return;
  }
  sys::Argv argv{"mcopy", "-s", "-i", image.string()};
  for (const auto& n : names) argv.push_back((staging / n).string());
  argv.push_back("::");
  sys::run_checked(runner_, argv, {{"MTOOLS_SKIP_CHECK", "1"}});
}

void FilesystemImager::populate_ext4(const fs::path& image, const fs::path& staging,
                                     const std::string& label) {
  if (populate_ext4_in_place(image, staging, label)) return;
  log_.warn("mkfs.ext4 -d unavailable, populating %s through a loop mount", image.c_str());
  populate_ext4_by_mount(image, staging, label);
}

bool FilesystemImager::populate_ext4_in_place(const fs::path& image, const fs::path& staging,
                                              const std::string& label) {
  sys::Argv argv{"mkfs.ext4"};
  if (!label.empty()) { argv.push_back("-L"); argv.push_back(label); }
  argv.insert(argv.end(), {"-O", "-metadata_csum", image.string(), "-d", staging.string()});
  sys::CommandResult r = runner_.run(argv, {});
  if (!r.ok()) log_.debug("%s exited %d", sys::join_argv(argv).c_str(), r.status);
  return r.ok();
}

void FilesystemImager::populate_ext4_by_mount(const fs::path& image, const fs::path& staging,
                                              const std::string& label) {
  sys::Argv mkfs{"mkfs.ext4"};
  if (!label.empty()) { mkfs.push_back("-L"); mkfs.push_back(label); }
  mkfs.push_back(image.string());
  sys::run_checked(runner_, mkfs);

  sys::ScopedMount mount(runner_, sudo_, image, log_);
  // "dir/." copies the contents, not the directory itself.
  sys::run_checked(runner_, sys::privileged(sudo_, {"cp", "-dR", "--preserve=mode,timestamps",
                                                    (staging / ".").string(),
                                                    mount.path().string()}));
}

} // namespace gadgetimg::build
