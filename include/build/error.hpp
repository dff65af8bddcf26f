//! # Build Errors
//!
//! Every failure the orchestrator can hit is a `BuildError`, returned through
//! `Result<T, BuildError>`. Nothing below the CLI terminates the process; the
//! CLI decides to abort and maps any error to exit code 1.
//!
//! | Kind | Raised when |
//! |------|-------------|
//! | `Io` | A filesystem read, write, copy or canonicalize failed |
//! | `InvalidSrcPath` | The source directory is not valid UTF-8 |
//! | `MissingEnv` | A required environment variable (`OUT_DIR`) is unset |
//! | `MissingStylesheet` | A custom stylesheet path does not exist |
//! | `ToolInstall` | `npm install` could not run or exited non-zero |
//! | `ToolCompile` | `npx tailwindcss` could not run or exited non-zero |
//! | `InvalidConfig` | A `--config` document is not valid JSON |

#ifndef TWBUILD_BUILD_ERROR_HPP
#define TWBUILD_BUILD_ERROR_HPP

#include "common.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace twbuild::build {

namespace fs = std::filesystem;

enum class BuildErrorKind {
    Io,
    InvalidSrcPath,
    MissingEnv,
    MissingStylesheet,
    ToolInstall,
    ToolCompile,
    InvalidConfig,
};

/// Short stable name for an error kind ("io", "tool-install", ...).
const char* error_kind_name(BuildErrorKind kind);

struct BuildError {
    BuildErrorKind kind;
    std::string message;
    fs::path path; ///< File or directory involved, if any

    static BuildError io(std::string what, const fs::path& p, const std::error_code& ec) {
        return BuildError{BuildErrorKind::Io, what + ": " + ec.message(), p};
    }

    static BuildError make(BuildErrorKind kind, std::string msg, fs::path p = {}) {
        return BuildError{kind, std::move(msg), std::move(p)};
    }

    /// "<kind>: <message> (<path>)", path omitted when empty.
    [[nodiscard]] std::string to_string() const;
};

} // namespace twbuild::build

#endif // TWBUILD_BUILD_ERROR_HPP
