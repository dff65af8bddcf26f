//! # Render Command Interface
//!
//! `twbuild render` prints the Tailwind config the build would write, without
//! touching OUT_DIR or running any tool.

#pragma once
#include "build/environment.hpp"
#include "cmd_build.hpp"

#include <iosfwd>

namespace twbuild::cli {

int run_render(int argc, char* argv[], const build::EnvironmentSnapshot& env);

int run_render_with(const BuildCommandOptions& opts, const build::EnvironmentSnapshot& env,
                    std::ostream& out);

} // namespace twbuild::cli
