#pragma once
#include "util/Units.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace gadgetimg::build {

// Everything the pipeline would otherwise take from module constants or
// globals. Defaults reproduce a stock 4GiB GPT image.
struct BuildConfig {
  std::string model_assertion;
  std::string channel{"edge"};
  std::filesystem::path workdir;   // empty: private temporary directory
  std::filesystem::path output;    // empty: <workdir>/disk.img

  double fudge_factor{1.5};
  uint64_t total_image_size{util::GiB(4)};
  uint64_t reserved_tail{4096};    // kept free after the writable partition

  std::string sudo{"sudo"};        // privilege helper; empty runs tools directly
  std::string root_label{"writable"};
  bool debug{false};
};

// $GADGETIMG_CONFIG, else $XDG_CONFIG_HOME/gadgetimg/config.toml, else
// ~/.config/gadgetimg/config.toml. Empty when none can be derived.
[[nodiscard]] std::string config_file_path();

// Resolve each setting from the TOML file at `path` (if readable), then the
// GADGETIMG_* environment, then the compiled default. Unparseable values
// keep the default.
[[nodiscard]] BuildConfig load_build_config(const std::string& path);

} // namespace gadgetimg::build
