#include "build/Steps.hpp"

#include <array>
#include <cctype>
#include <string>

namespace gadgetimg::build {

static constexpr std::array<const char*, 14> kNames = {
  "Init",
  "MakeTempDirs",
  "PrepareImage",
  "LoadLayoutSpec",
  "PopulateRootfsContents",
  "CalculateRootfsSize",
  "PreStageBootfs",
  "StageBootfsContents",
  "CalculateBootfsSize",
  "PrepareFilesystems",
  "PopulateFilesystems",
  "AssembleDisk",
  "Finish",
  "Closed",
};

const char* to_string(Step step) {
  auto idx = static_cast<size_t>(step);
  return idx < kNames.size() ? kNames[idx] : "?";
}

static std::string snake_case(std::string_view camel) {
  std::string out;
  for (char c : camel) {
    if (std::isupper(static_cast<unsigned char>(c))) {
      if (!out.empty()) out += '_';
      out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    } else {
      out += c;
    }
  }
  return out;
}

std::optional<Step> step_from_string(std::string_view name) {
  for (size_t i = 0; i < kNames.size(); ++i) {
    if (name == kNames[i] || name == snake_case(kNames[i])) return static_cast<Step>(i);
  }
  return std::nullopt;
}

Step successor(Step step) {
  if (step == Step::Closed) return Step::Closed;
  return static_cast<Step>(static_cast<int>(step) + 1);
}

} // namespace gadgetimg::build
