#include "build/Errors.hpp"
#include "util/Units.hpp"

namespace gadgetimg::build {

static std::string with_index(const std::string& message, int index) {
  if (index < 0) return message;
  return "structure #" + std::to_string(index) + ": " + message;
}

ParseError::ParseError(const std::string& message, int structure_index)
    : BuildError(with_index(message, structure_index)), structure_index_(structure_index) {}

FilesystemAssumptionViolation::FilesystemAssumptionViolation(const std::string& message,
                                                             int structure_index, uint64_t value)
    : ParseError(message, structure_index), value_(value) {}

InsufficientSpace::InsufficientSpace(const std::string& what, uint64_t required, uint64_t available)
    : BuildError(what + ": need " + util::human_bytes(required) + " (" + std::to_string(required) +
                 " bytes), have " + util::human_bytes(available) + " (" +
                 std::to_string(available) + " bytes)"),
      required_(required), available_(available) {}

static std::string describe(const std::vector<std::string>& argv, int status, const std::string& output) {
  std::string cmd;
  for (const auto& a : argv) {
    if (!cmd.empty()) cmd += ' ';
    cmd += a;
  }
  std::string msg = "'" + cmd + "' failed with status " + std::to_string(status);
  if (!output.empty()) {
    std::string tail = output.size() > 512 ? output.substr(output.size() - 512) : output;
    while (!tail.empty() && (tail.back() == '\n' || tail.back() == ' ')) tail.pop_back();
    msg += ": " + tail;
  }
  return msg;
}

ExternalToolFailure::ExternalToolFailure(std::vector<std::string> argv, int status, std::string output)
    : BuildError(describe(argv, status, output)),
      argv_(std::move(argv)), status_(status), output_(std::move(output)) {}

} // namespace gadgetimg::build
