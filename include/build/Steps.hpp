#pragma once
#include <optional>
#include <string_view>

namespace gadgetimg::build {

// Pipeline states in execution order. Each state's successor is the next
// enumerator; Closed is terminal.
enum class Step {
  Init,
  MakeTempDirs,
  PrepareImage,
  LoadLayoutSpec,
  PopulateRootfsContents,
  CalculateRootfsSize,
  PreStageBootfs,
  StageBootfsContents,
  CalculateBootfsSize,
  PrepareFilesystems,
  PopulateFilesystems,
  AssembleDisk,
  Finish,
  Closed,
};

[[nodiscard]] const char* to_string(Step step);
// Accepts the CamelCase name or its snake_case spelling ("load_layout_spec").
[[nodiscard]] std::optional<Step> step_from_string(std::string_view name);
[[nodiscard]] Step successor(Step step);

} // namespace gadgetimg::build
