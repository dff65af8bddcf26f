//! # File Operations
//!
//! Filesystem helpers that report failures as `BuildError` values instead of
//! throwing. All of them use the `std::error_code` overloads of
//! `std::filesystem`.

#ifndef TWBUILD_BUILD_FILE_OPS_HPP
#define TWBUILD_BUILD_FILE_OPS_HPP

#include "build/error.hpp"
#include "common.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace twbuild::build {

namespace fs = std::filesystem;

/// Reads a whole file as bytes.
Result<std::string, BuildError> read_text_file(const fs::path& path);

/// Creates or truncates `path` and writes `content`. Returns bytes written.
Result<size_t, BuildError> write_text_file(const fs::path& path, std::string_view content);

/// Copies `from` over `to`, replacing any existing file. Returns bytes copied.
Result<uintmax_t, BuildError> copy_file_over(const fs::path& from, const fs::path& to);

/// Existence check that treats errors (e.g. permission denied) as absent.
bool path_exists(const fs::path& path);

} // namespace twbuild::build

#endif // TWBUILD_BUILD_FILE_OPS_HPP
