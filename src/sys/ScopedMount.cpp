#include "sys/ScopedMount.hpp"
#include "util/Files.hpp"

#include <exception>

namespace gadgetimg::sys {

namespace fs = std::filesystem;

ScopedMount::ScopedMount(CommandRunner& runner, const std::string& sudo,
                         const fs::path& image, util::Logger& log)
    : runner_(runner), sudo_(sudo), log_(log) {
  mountpoint_ = util::make_temp_dir(fs::temp_directory_path(), "gadgetimg-mount-");
  try {
    run_checked(runner_, privileged(sudo_, {"mount", "-o", "loop", image.string(), mountpoint_.string()}));
  } catch (...) {
    std::error_code ec;
    fs::remove(mountpoint_, ec);
    throw;
  }
  log_.debug("mounted %s on %s", image.c_str(), mountpoint_.c_str());
}

ScopedMount::~ScopedMount() {
  try {
    CommandResult r = runner_.run(privileged(sudo_, {"umount", mountpoint_.string()}), {});
    if (!r.ok()) {
      log_.error("umount %s failed with status %d: %s", mountpoint_.c_str(), r.status, r.output.c_str());
      return;  // mountpoint stays while mounted
    }
  } catch (const std::exception& e) {
    log_.error("umount %s failed: %s", mountpoint_.c_str(), e.what());
    return;
  }
  std::error_code ec;
  fs::remove(mountpoint_, ec);
  if (ec) log_.warn("could not remove mountpoint %s: %s", mountpoint_.c_str(), ec.message().c_str());
}

} // namespace gadgetimg::sys
