//! # Build Command Interface
//!
//! `twbuild build` runs the orchestrator against the captured environment and
//! prints the resulting directives to stdout (or to `--cmake-out`).
//!
//! ## Exit Codes
//!
//! - `0`: Success
//! - `1`: Usage error or any `BuildError`

#pragma once
#include "build/build_config.hpp"
#include "build/directives.hpp"
#include "build/environment.hpp"
#include "build/error.hpp"
#include "build/tool_runner.hpp"
#include "common.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace twbuild::cli {

enum class CommandKind {
    Build,
    Render,
};

// Options shared by `build` and `render`
struct BuildCommandOptions {
    std::optional<std::string> css_path;
    std::optional<std::string> cdn_src;
    std::optional<std::string> config_file;
    std::optional<std::string> src_dir;
    bool always = false;
    build::DirectiveFormat emit = build::DirectiveFormat::Lines;
    std::optional<std::string> cmake_out;
    std::string target = "exports"; // render only
};

/// Parses argv[first..]. Log options are skipped. An unknown flag, a flag
/// without its value, or a flag that `command` does not use is an error
/// message.
Result<BuildCommandOptions, std::string> parse_build_args(int argc, char* argv[], int first,
                                                          CommandKind command);

/// Applies the parsed options to a default BuildConfig, loading `--config`.
Result<build::BuildConfig, build::BuildError> make_build_config(const BuildCommandOptions& opts);

int run_build(int argc, char* argv[], const build::EnvironmentSnapshot& env);

/// Same as `run_build` with an explicit runner and stream.
int run_build_with(const BuildCommandOptions& opts, const build::EnvironmentSnapshot& env,
                   build::ToolRunner& runner, std::ostream& out);

} // namespace twbuild::cli
