#pragma once
#include "sys/CommandRunner.hpp"
#include "util/Log.hpp"

#include <filesystem>
#include <string>

namespace gadgetimg::sys {

// Loop-mounts an image file on a private mkdtemp(3) mountpoint for the
// lifetime of the object. The destructor always attempts the unmount and
// removes the mountpoint; failures there are logged, not thrown, so an
// exception already in flight is the one reported.
class ScopedMount {
public:
  ScopedMount(CommandRunner& runner, const std::string& sudo,
              const std::filesystem::path& image, util::Logger& log);
  ~ScopedMount();
  ScopedMount(const ScopedMount&) = delete;
  ScopedMount& operator=(const ScopedMount&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return mountpoint_; }

private:
  CommandRunner& runner_;
  std::string sudo_;
  util::Logger& log_;
  std::filesystem::path mountpoint_;
};

} // namespace gadgetimg::sys
