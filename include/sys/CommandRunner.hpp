#pragma once
#include "util/Log.hpp"

#include <string>
#include <utility>
#include <vector>

namespace gadgetimg::sys {

using Argv = std::vector<std::string>;
using Env = std::vector<std::pair<std::string, std::string>>;

struct CommandResult {
  int status{-1};      // exit status; 128+signal when killed
  std::string output;  // stdout and stderr, interleaved

  [[nodiscard]] bool ok() const { return status == 0; }
};

// Seam between the pipeline and the external tools it drives (snap, mkfs,
// mcopy, mount, cp, sgdisk). Tests substitute a recording fake.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  // Run argv[0] from PATH with `env` added to the inherited environment.
  // Blocks until the tool exits; never throws for a non-zero status.
  [[nodiscard]] virtual CommandResult run(const Argv& argv, const Env& env) = 0;
};

// fork/execvp/waitpid runner with output captured through a pipe.
class ProcessRunner : public CommandRunner {
public:
  explicit ProcessRunner(util::Logger& log) : log_(log) {}

  [[nodiscard]] CommandResult run(const Argv& argv, const Env& env) override;

private:
  util::Logger& log_;
};

// Run and throw build::ExternalToolFailure on a non-zero status.
CommandResult run_checked(CommandRunner& runner, const Argv& argv, const Env& env = {});

// Prefix argv with the privilege helper ("sudo") unless it is empty.
[[nodiscard]] Argv privileged(const std::string& helper, Argv argv);

[[nodiscard]] std::string join_argv(const Argv& argv);

} // namespace gadgetimg::sys
