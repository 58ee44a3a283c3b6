#pragma once
#include "build/Steps.hpp"
#include "model/BuildContext.hpp"

#include <filesystem>
#include <optional>

namespace gadgetimg::build {

inline constexpr const char* kCheckpointName = ".gadgetimg.checkpoint";

// Everything needed to continue a build: the step to run next and the
// context (layout included) produced by the steps before it.
struct Checkpoint {
  Step next{Step::Init};
  model::BuildContext context;
};

// Serialize as TOML and replace `path` atomically. Throws BuildError.
void save_checkpoint(const std::filesystem::path& path, const Checkpoint& cp);

// std::nullopt when `path` does not exist. Throws BuildError when it exists
// but cannot be read back.
[[nodiscard]] std::optional<Checkpoint> load_checkpoint(const std::filesystem::path& path);

} // namespace gadgetimg::build
