#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gadgetimg::util {

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::filesystem::path& path) -> std::optional<std::string>;

// Write `content` to a sibling temp file, then rename it over `path`.
// Returns false (errno preserved) on failure.
auto write_file_atomic(const std::filesystem::path& path, const std::string& content) -> bool;

// Directory entry names, sorted. Returns empty vector on error.
auto list_dir(const std::filesystem::path& path) -> std::vector<std::string>;

// rename(2), falling back to recursive copy + remove across filesystems.
// Throws std::filesystem::filesystem_error.
void move_path(const std::filesystem::path& from, const std::filesystem::path& to);

// Private directory "<parent>/<prefix>XXXXXX" via mkdtemp(3).
// Throws std::system_error.
auto make_temp_dir(const std::filesystem::path& parent, const std::string& prefix) -> std::filesystem::path;

} // namespace gadgetimg::util
