#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace gadgetimg::build {

// Root of every failure the pipeline reports. Anything derived from it is
// fatal to the current step.
struct BuildError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Malformed or invalid layout. structure_index() is the 0-based declaration
// index of the offending structure, or -1 for volume/document level errors.
class ParseError : public BuildError {
public:
  explicit ParseError(const std::string& message, int structure_index = -1);
  [[nodiscard]] int structure_index() const { return structure_index_; }

private:
  int structure_index_;
};

// Layout that is well formed but outside what the builder supports
// (several volumes, offsets not on a MiB boundary).
class FilesystemAssumptionViolation : public ParseError {
public:
  FilesystemAssumptionViolation(const std::string& message, int structure_index, uint64_t value);
  [[nodiscard]] uint64_t value() const { return value_; }

private:
  uint64_t value_;
};

class InsufficientSpace : public BuildError {
public:
  InsufficientSpace(const std::string& what, uint64_t required, uint64_t available);
  [[nodiscard]] uint64_t required() const { return required_; }
  [[nodiscard]] uint64_t available() const { return available_; }

private:
  uint64_t required_;
  uint64_t available_;
};

// An external tool or I/O primitive reported failure.
class ExternalToolFailure : public BuildError {
public:
  ExternalToolFailure(std::vector<std::string> argv, int status, std::string output);
  [[nodiscard]] const std::vector<std::string>& argv() const { return argv_; }
  [[nodiscard]] int status() const { return status_; }
  [[nodiscard]] const std::string& output() const { return output_; }

private:
  std::vector<std::string> argv_;
  int status_;
  std::string output_;
};

} // namespace gadgetimg::build
